/* File: cert_common_info.hpp
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

#include <boost/json.hpp>
#include <boost/json/object.hpp>
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>

#include "openssl_types.hpp"

namespace pdfseal::crypto {

namespace json = boost::json;

/**
 * @brief A structure with common certificate info
 */
struct CertCommonInfo {
  long version = 0;  // NOLINT(google-runtime-int)
  BytesVector serial;
  std::string sig_algo;
  std::string issuer;
  std::string issuer_common_name;
  std::string subject;
  std::string subj_common_name;
  std::optional<std::string> email;
  time_t not_before = 0;
  time_t not_after = 0;
  std::string pub_key_algo;
  std::string fingerprint_sha256;

  CertCommonInfo() = default;

  /// @throws CryptoError
  explicit CertCommonInfo(const X509 *cert);

  [[nodiscard]] json::object ToJson() const noexcept;
};

}  // namespace pdfseal::crypto
