/* File: image_obj.hpp
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
#include <string>

#include "pdf_pod_structs.hpp"
#include "pdf_structs.hpp"

namespace pdfseal::pdf {

/**
 * @brief Image XObject of the handwritten signature
 * @details Uncompressed DeviceRGB, 8 bits per component, drawn scaled into
 * the stamp so /Interpolate is set.
 */
struct ImageObj {
  ObjRawId id;
  uint32_t width = 0;
  uint32_t height = 0;
  BytesVector pixels;

  /**
   * @brief Build the image object from raw RGB pixels
   * @param obj_id id assigned in the update
   * @param img width*height*3 bytes
   * @throws PdfSignError if the image is empty or the size doesn't match
   */
  static ImageObj FromRgb(ObjRawId obj_id, const RgbImage &img);

  /// @brief the whole object "id 0 obj <<...>> stream ... endstream endobj"
  [[nodiscard]] BytesVector ToRawData() const;

  /// @brief object header and the stream dictionary
  [[nodiscard]] std::string DictToString() const;
};

}  // namespace pdfseal::pdf
