/* File: tst_info.hpp
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
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "certificate.hpp"
#include "utils.hpp"

namespace pdfseal::tsa {

namespace json = boost::json;

/// @brief the content of an RFC 3161 token
struct TstInfo {
  long version = 0;  // NOLINT(google-runtime-int)
  std::string policy;
  uint64_t serial = 0;
  TimePoint gen_time;
  std::string hash_algo;
  BytesVector imprint;
  std::optional<std::string> tsa_name;

  [[nodiscard]] json::object ToJson() const;
};

/**
 * @brief Parse a DER token
 * @throws TsaError
 */
TstInfo ParseTimestampToken(const BytesVector &token_der);

/**
 * @brief Verify the token signature and imprint
 * @param token_der DER ContentInfo
 * @param data timestamped bytes
 * @param trusted certificates that anchor the TSA chain
 * @return true if the token is valid for data
 */
[[nodiscard]] bool VerifyTimestampToken(
  const BytesVector &token_der, const BytesVector &data,
  const std::vector<const crypto::Certificate *> &trusted) noexcept;

}  // namespace pdfseal::tsa
