/* File: sig_val.hpp
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
#include <optional>
#include <string>

#include "pdf_defs.hpp"
#include "pdf_structs.hpp"

namespace pdfseal::pdf {

// signature dictionary, iso table 252
struct SigVal {
  ObjRawId id;
  std::string type = kTagSig;
  std::string filter = kAdobePPKLite;
  std::string subfilter = kETSICAdESdetached;
  BytesVector contents_raw;  // zeroes, reserved for the CMS
  std::optional<std::string> date;  // D:20241015123037+02'00'
  std::optional<std::string> name;  // utf-8
  std::optional<std::string> reason;
  std::optional<std::string> location;
  std::optional<std::string> contact_info;
  std::optional<std::string> app_fullname = kAppFullName;
  // certification signature with DocMDP transform
  std::optional<int> docmdp_permission;

  size_t hex_str_offset = 0;
  size_t hex_str_length = 0;
  size_t byteranges_str_offset = 0;

  ///@brief calculate offset for hex string
  void CalcOffsets();

  [[nodiscard]] std::string ToString() const;
};

}  // namespace pdfseal::pdf
