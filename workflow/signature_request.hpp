/* File: signature_request.hpp
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

#include <cstdint>
#include <optional>
#include <string>

#include "signer.hpp"
#include "utils.hpp"

namespace pdfseal::workflow {

/// @brief result of an OTP check
enum class OtpCheck : uint8_t { kValid, kWrongCode, kExpired, kNotIssued };

[[nodiscard]] std::string OtpCheckToString(OtpCheck check) noexcept;

/// @brief one signer of one document
struct SignatureRequest {
  int64_t id = 0;
  std::string document_id;
  int order = 0;  // 1-based
  Signer signer;
  std::string link_token;
  std::optional<std::string> otp_code;
  std::optional<TimePoint> otp_generated_at;
  std::optional<TimePoint> otp_validated_at;
  bool is_signed = false;
  std::optional<TimePoint> signed_at;
  std::optional<TimePoint> cancelled_at;

  [[nodiscard]] bool IsCancelled() const noexcept {
    return cancelled_at.has_value();
  }

  /// @brief signed and cancelled requests never change
  [[nodiscard]] bool IsPending() const noexcept {
    return !is_signed && !IsCancelled();
  }
};

}  // namespace pdfseal::workflow
