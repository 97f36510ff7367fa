/* File: form_x_object.cpp
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

#include "form_x_object.hpp"

#include <algorithm>
#include <sstream>

#include "pdf_utils.hpp"

namespace pdfseal::pdf {

namespace {

constexpr double kLineSpacing = 1.2;
constexpr double kImageAreaShare = 0.5;

}  // namespace

BBox FormXObject::TextArea() const noexcept {
  BBox res = bbox;
  if (image.has_value()) {
    res.right_top.y = bbox.left_bottom.y + bbox.Height() * (1 - kImageAreaShare);
  }
  return res;
}

std::optional<BBox> FormXObject::ImageArea() const noexcept {
  if (!image.has_value()) {
    return std::nullopt;
  }
  BBox res = bbox;
  res.left_bottom.y = bbox.left_bottom.y + bbox.Height() * (1 - kImageAreaShare);
  return res;
}

void FormXObject::FitFontSize() {
  if (text_lines.empty()) {
    font_size = kStampMaxFontSize;
    return;
  }
  const BBox area = TextArea();
  const double avail_width = area.Width() - 2 * kStampPadding;
  const double avail_height = area.Height() - 2 * kStampPadding;
  double size = avail_height / (static_cast<double>(text_lines.size()) *
                                kLineSpacing);
  for (const auto &line : text_lines) {
    const size_t glyphs = Utf8ToCodePoints(line).size();
    if (glyphs == 0) {
      continue;
    }
    size = std::min(size, avail_width / (static_cast<double>(glyphs) *
                                         kHelveticaAvgWidth));
  }
  font_size = std::clamp(size, kStampMinFontSize, kStampMaxFontSize);
}

std::string FormXObject::BuildStream() const {
  std::ostringstream builder;
  if (border && bbox.Width() > 1 && bbox.Height() > 1) {
    builder << "q\n0.5 w\n0 0 0.6 RG\n"
            << DoubleToString10(bbox.left_bottom.x + 0.5) << " "
            << DoubleToString10(bbox.left_bottom.y + 0.5) << " "
            << DoubleToString10(bbox.Width() - 1) << " "
            << DoubleToString10(bbox.Height() - 1) << " re\nS\nQ\n";
  }
  // image, aspect ratio preserved, centered in the image area
  const auto img_area = ImageArea();
  const double goal_w =
    img_area.has_value() ? img_area->Width() - 2 * kStampPadding : 0;
  const double goal_h =
    img_area.has_value() ? img_area->Height() - kStampPadding : 0;
  if (image.has_value() && goal_w > 0 && goal_h > 0 && image->pix_width > 0 &&
      image->pix_height > 0) {
    const double ratio =
      std::min(1 / CalcResizeFactor(goal_w, image->pix_width),
               1 / CalcResizeFactor(goal_h, image->pix_height));
    Matrix img_matrix;
    img_matrix.a = image->pix_width * ratio;
    img_matrix.d = image->pix_height * ratio;
    img_matrix.e = img_area->left_bottom.x + (img_area->Width() - img_matrix.a) / 2;
    img_matrix.f = img_area->left_bottom.y;
    builder << "q\n"
            << img_matrix.toString() << " cm\n"
            << resources_img_tag_name << " Do\n"
            << "Q\n";
  }
  if (!text_lines.empty()) {
    const BBox area = TextArea();
    const double x_pos = area.left_bottom.x + kStampPadding;
    double y_pos = area.right_top.y - kStampPadding - font_size;
    builder << "BT\n"
            << kStampFontResName << " " << DoubleToString10(font_size)
            << " Tf\n0 0 0.6 rg\n";
    for (const auto &line : text_lines) {
      builder << "1 0 0 1 " << DoubleToString10(x_pos) << " "
              << DoubleToString10(y_pos) << " Tm\n"
              << "(" << PdfEscapeString(Utf8ToWinAnsi(line)) << ") Tj\n";
      y_pos -= font_size * kLineSpacing;
    }
    builder << "ET\n";
  }
  return builder.str();
}

std::string FormXObject::ToString() const {
  const std::string xstream = BuildStream();
  std::ostringstream builder;
  builder << id.ToString() << "\n"
          << kDictStart << "\n"
          << kTagLength << " " << xstream.size() << "\n"
          << kTagType << " " << type << "\n"
          << kTagSubType << " " << subtype << "\n"
          << kTagBBox << " " << bbox.ToString() << "\n"
          << kTagFormType << " " << form_type << "\n"
          << kTagResources << " " << kDictStart << "\n";
  if (!text_lines.empty()) {
    builder << kTagFont << " " << kDictStart << " " << kStampFontResName << " "
            << kDictStart << " " << kTagType << " " << kTagFont << " "
            << kTagSubType << " /Type1 /BaseFont /Helvetica /Encoding "
               "/WinAnsiEncoding "
            << kDictEnd << " " << kDictEnd << "\n";
  }
  if (image.has_value()) {
    builder << kTagXObject << " " << kDictStart << " "
            << resources_img_tag_name << " " << image->image_ref.ToStringRef()
            << " " << kDictEnd << "\n";
  }
  builder << kDictEnd << "\n"   // end resources dict
          << kDictEnd << "\n";  // end this object dict
  builder << kStreamStart << xstream << "\n" << kStreamEnd;
  builder << kObjEnd;
  return builder.str();
}

}  // namespace pdfseal::pdf
