/* File: form_x_object.hpp
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
#include <vector>

#include "pdf_structs.hpp"

namespace pdfseal::pdf {

/// @brief image placed inside the stamp
struct StampImagePlacement {
  ObjRawId image_ref;
  uint32_t pix_width = 0;
  uint32_t pix_height = 0;
};

/*
Appearance stream of a signature widget.
Empty for the certification signature, text lines (and an optional image) for
the visual stamp.
*/
struct FormXObject {
  ObjRawId id;
  std::string type = kTagXObject;
  std::string subtype = kTagForm;
  BBox bbox;  // form coordinate system, [0 0 width height]
  int form_type = 1;
  std::string resources_img_tag_name = "/img_sig1";
  std::optional<StampImagePlacement> image;
  std::vector<std::string> text_lines;  // utf-8
  double font_size = kStampMaxFontSize;
  bool border = true;

  /**
   * @brief Fit the font size to the box
   * @details average Helvetica width, clamped to the min and max stamp font
   * size
   */
  void FitFontSize();

  /// @brief the lower part of the box available for text
  [[nodiscard]] BBox TextArea() const noexcept;

  /// @brief the upper part of the box for the image, if any
  [[nodiscard]] std::optional<BBox> ImageArea() const noexcept;

  /// @brief content stream
  [[nodiscard]] std::string BuildStream() const;

  [[nodiscard]] std::string ToString() const;
};

}  // namespace pdfseal::pdf
