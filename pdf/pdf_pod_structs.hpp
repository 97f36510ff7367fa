/* File: pdf_pod_structs.hpp
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

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "pdf_structs.hpp"

namespace pdfseal::pdf {

/// @brief raw 8-bit RGB pixels, row by row
struct RgbImage {
  uint32_t width = 0;
  uint32_t height = 0;
  BytesVector pixels;

  [[nodiscard]] bool IsValid() const noexcept {
    return width > 0 && height > 0 &&
           pixels.size() == static_cast<size_t>(width) * height * 3;
  }
};

enum class SignMode : uint8_t { kCertify, kApprove };

/// @brief parameters of one incremental signing update
struct SignParams {
  SignMode mode = SignMode::kApprove;
  std::string field_name;
  // rewrite the existing unsigned field with this name
  bool use_existing_field = false;
  int page_index = 0;
  // user space, empty for an invisible signature
  BBox stamp_rect;
  std::vector<std::string> stamp_lines;  // utf-8
  std::optional<RgbImage> image;
  std::string signing_time;  // pdf date string
  std::optional<std::string> signer_name;
  std::optional<std::string> reason;
  std::optional<std::string> location;
  std::optional<std::string> contact_info;
  // DER certificates to add to the document security store
  std::vector<BytesVector> dss_certs;
  size_t placeholder_size = 32768;
};

}  // namespace pdfseal::pdf
