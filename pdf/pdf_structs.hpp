/* File: pdf_structs.hpp
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
#include <qpdf/QPDFObjectHandle.hh>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include "pdf_defs.hpp"

namespace pdfseal::pdf {

/// @brief signing failed, the input document is left untouched
class PdfSignError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct ObjRawId {
  int id = 0;
  int gen = 0;

  [[nodiscard]] std::string ToString() const noexcept {
    std::ostringstream builder;
    builder << id << " " << gen << " obj";
    return builder.str();
  }

  [[nodiscard]] std::string ToStringRef() const noexcept {
    std::ostringstream builder;
    builder << id << " " << gen << " R";
    return builder.str();
  }

  ObjRawId &operator++() noexcept {
    ++id;
    return *this;
  }

  bool operator==(const ObjRawId &other) const noexcept {
    return id == other.id && gen == other.gen;
  }

  bool operator<(const ObjRawId &other) const noexcept {
    return id < other.id || (id == other.id && gen < other.gen);
  }

  static ObjRawId CopyIdFromExisting(const QPDFObjectHandle &other) noexcept;
};

struct XYReal {
  double x = 0;
  double y = 0;

  [[nodiscard]] std::string ToString() const;
};

struct BBox {
  XYReal left_bottom;
  XYReal right_top;

  [[nodiscard]] double Width() const noexcept {
    return right_top.x - left_bottom.x;
  }

  [[nodiscard]] double Height() const noexcept {
    return right_top.y - left_bottom.y;
  }

  /// @brief move the box inside the other box, shrink if it doesn't fit
  [[nodiscard]] BBox ClampTo(const BBox &outer) const noexcept;

  [[nodiscard]] std::string ToString() const;
};

/*
Transformation matrix in pdf
[a b 0]
[c d 0]
[e f 1]
*/

struct Matrix {
  double a = 1;
  double b = 0;
  double c = 0;
  double d = 1;
  double e = 0;
  double f = 0;

  /// @brief this x other (apply this first)
  [[nodiscard]] Matrix Multiply(const Matrix &other) const noexcept;

  [[nodiscard]] XYReal Transform(const XYReal &point) const noexcept;

  [[nodiscard]] std::string toString() const;
};

struct XRefEntry {
  ObjRawId id;
  size_t offset = 0;
  uint32_t gen = 0;

  [[nodiscard]] std::string ToString() const;
};

/// @brief incremental update with space reserved for the signature
struct PreparedDocument {
  BytesVector data;         // original bytes + update
  size_t sig_offset = 0;    // offset where the hex signature should be pasted
  size_t sig_max_size = 0;  // maximal hex size to paste
  RangesVector byteranges;
  std::string field_name;
};

}  // namespace pdfseal::pdf
