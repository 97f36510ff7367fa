/* File: cms_signer.hpp
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

#include <functional>
#include <vector>

#include "certificate.hpp"
#include "openssl_types.hpp"

namespace pdfseal::crypto {

/// @brief returns a DER RFC 3161 token over the given bytes
using TimestampFunc = std::function<BytesVector(const BytesVector &)>;

struct CmsSignParams {
  const Certificate *cert = nullptr;
  EVP_PKEY *key = nullptr;
  /// @brief certificates to embed in addition to the signer certificate
  const std::vector<Certificate> *chain = nullptr;
  /// @brief if set, a signature timestamp is added as an unsigned attribute
  TimestampFunc timestamper;
};

/**
 * @brief Create a detached CMS (PKCS#7) SignedData over data
 * @details SHA-256, signing time, ESS signing-certificate-v2 attribute.
 * @param data concatenated bytes covered by the signature
 * @param params signer certificate, key, chain and the timestamp callback
 * @return BytesVector DER encoded ContentInfo
 * @throws CryptoError, propagates exceptions from the timestamper
 */
BytesVector SignDetachedCms(const BytesVector &data,
                            const CmsSignParams &params);

}  // namespace pdfseal::crypto
