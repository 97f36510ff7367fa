/* File: pdf_structs.cpp
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

#include "pdf_structs.hpp"

#include <algorithm>
#include <sstream>
#include <string>

#include "pdf_utils.hpp"

namespace pdfseal::pdf {

std::string XYReal::ToString() const {
  std::ostringstream builder;
  builder << DoubleToString10(x) << " " << DoubleToString10(y);
  return builder.str();
}

std::string BBox::ToString() const {
  std::ostringstream builder;
  builder << "[ " << left_bottom.ToString() << " " << right_top.ToString()
          << " ]";
  return builder.str();
}

BBox BBox::ClampTo(const BBox &outer) const noexcept {
  const double width = std::min(Width(), outer.Width());
  const double height = std::min(Height(), outer.Height());
  BBox res;
  res.left_bottom.x = std::clamp(left_bottom.x, outer.left_bottom.x,
                                 outer.right_top.x - width);
  res.left_bottom.y = std::clamp(left_bottom.y, outer.left_bottom.y,
                                 outer.right_top.y - height);
  res.right_top.x = res.left_bottom.x + width;
  res.right_top.y = res.left_bottom.y + height;
  return res;
}

Matrix Matrix::Multiply(const Matrix &other) const noexcept {
  Matrix res;
  res.a = a * other.a + b * other.c;
  res.b = a * other.b + b * other.d;
  res.c = c * other.a + d * other.c;
  res.d = c * other.b + d * other.d;
  res.e = e * other.a + f * other.c + other.e;
  res.f = e * other.b + f * other.d + other.f;
  return res;
}

XYReal Matrix::Transform(const XYReal &point) const noexcept {
  return {a * point.x + c * point.y + e, b * point.x + d * point.y + f};
}

std::string Matrix::toString() const {
  std::ostringstream builder;
  builder << DoubleToString10(a) << " " << DoubleToString10(b) << " "
          << DoubleToString10(c) << " " << DoubleToString10(d) << " "
          << DoubleToString10(e) << " " << DoubleToString10(f);
  return builder.str();
}

ObjRawId ObjRawId::CopyIdFromExisting(const QPDFObjectHandle &other) noexcept {
  return {other.getObjectID(), other.getGeneration()};
}

std::string XRefEntry::ToString() const {
  std::string res;
  const std::string offs = std::to_string(offset);
  if (offs.size() < 10) {
    res.append(std::string(10 - offs.size(), '0'));
  }
  res.append(offs);
  res += ' ';
  const std::string gens = std::to_string(gen);
  if (gens.size() < 5) {
    res.append(std::string(5 - gens.size(), '0'));
  }
  res.append(gens);
  res += " n \n";
  return res;  // result size must be 20 bytes
}

}  // namespace pdfseal::pdf
