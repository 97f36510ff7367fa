/* File: timestamp_client.hpp
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

#include <chrono>
#include <memory>

#include "cms_signer.hpp"
#include "timestamp_authority.hpp"

namespace pdfseal::tsa {

/**
 * @brief Obtains RFC 3161 tokens from a timestamp authority
 * @details Each request carries a SHA-256 imprint and a random nonce, the
 * response is checked against both.
 */
class TimestampClient {
 public:
  /// @throws std::invalid_argument
  TimestampClient(std::shared_ptr<ITimestampAuthority> authority,
                  std::chrono::milliseconds timeout);

  /**
   * @brief Timestamp the data
   * @param data bytes to timestamp (the hash is computed here)
   * @return BytesVector DER encoded token (ContentInfo SignedData)
   * @throws TsaTimeoutError if no answer within timeout
   * @throws TsaError on a rejected or inconsistent response
   */
  [[nodiscard]] BytesVector Timestamp(const BytesVector &data) const;

  /// @brief adapter for the CMS signer
  [[nodiscard]] crypto::TimestampFunc AsTimestampFunc() const;

 private:
  std::shared_ptr<ITimestampAuthority> authority_;
  std::chrono::milliseconds timeout_;
};

}  // namespace pdfseal::tsa
