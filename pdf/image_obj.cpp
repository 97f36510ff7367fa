/* File: image_obj.cpp
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

#include "image_obj.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>
#include <string>

namespace pdfseal::pdf {

ImageObj ImageObj::FromRgb(ObjRawId obj_id, const RgbImage &img) {
  if (!img.IsValid()) {
    throw PdfSignError("[ImageObj::FromRgb] expected " +
                       std::to_string(img.width) + "x" +
                       std::to_string(img.height) + " RGB pixels, got " +
                       std::to_string(img.pixels.size()) + " bytes");
  }
  ImageObj res;
  res.id = obj_id;
  res.width = img.width;
  res.height = img.height;
  res.pixels = img.pixels;
  return res;
}

std::string ImageObj::DictToString() const {
  std::ostringstream builder;
  builder << id.ToString() << "\n"
          << kDictStart << "\n"
          << kTagType << " " << kTagXObject << " " << kTagSubType << " "
          << kTagImage << "\n"
          << kTagWidth << " " << width << " " << kTagHeight << " " << height
          << "\n"
          << kTagColorSpace << " " << kDeviceRgb << " "
          << kTagBitsPerComponent << " 8 " << kTagInterpolate << " true\n"
          << kTagLength << " " << pixels.size() << "\n"
          << kDictEnd << "\n";
  return builder.str();
}

BytesVector ImageObj::ToRawData() const {
  const std::string head = DictToString() + kStreamStart;
  std::string tail = "\n";
  tail += kStreamEnd;
  tail += kObjEnd;
  BytesVector res;
  res.reserve(head.size() + pixels.size() + tail.size());
  std::copy(head.cbegin(), head.cend(), std::back_inserter(res));
  std::copy(pixels.cbegin(), pixels.cend(), std::back_inserter(res));
  std::copy(tail.cbegin(), tail.cend(), std::back_inserter(res));
  return res;
}

}  // namespace pdfseal::pdf
