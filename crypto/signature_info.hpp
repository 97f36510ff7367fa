/* File: signature_info.hpp
Copyright (C) Basealt LLC,  2024
Author: Oleg Proskurin, <proskurinov@basealt.ru>

This program is free software; you can redistribute it and/or
modify it under the terms of the GNU Lesser General Public
License as published by the Free Software Foundation; either
version 3 of the License, or (at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
Lesser General Public License for more details.

You should have received a copy of the GNU Lesser General Public License
along with this program; if not, write to the Free Software Foundation,
Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301, USA.
*/

#pragma once

#include <optional>
#include <vector>

#include "certificate.hpp"
#include "openssl_types.hpp"
#include "utils.hpp"

namespace pdfseal::crypto {

/// @brief data extracted from a CMS SignedData
struct CmsSignatureInfo {
  Certificate signer_cert;
  std::vector<Certificate> certs;
  std::optional<BytesVector> timestamp_token;
  std::optional<TimePoint> signing_time;
};

/**
 * @brief Parse a DER CMS signature
 * @param cms_der trailing zero padding is allowed
 * @throws CryptoError
 */
CmsSignatureInfo ParseCmsSignature(const BytesVector &cms_der);

/**
 * @brief Check the detached signature value over data
 * @details certificate chains are not validated here
 * @return true if the message digest and signature value match
 */
[[nodiscard]] bool VerifyDetachedCms(const BytesVector &cms_der,
                                     const BytesVector &data) noexcept;

}  // namespace pdfseal::crypto
