/* File: cross_ref_stream.cpp
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

#include "cross_ref_stream.hpp"

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <sstream>
#include <stdexcept>

#include "pdf_defs.hpp"

namespace pdfseal::pdf {

namespace {

// big-endian, exactly width bytes
void PushBigEndian(uint64_t val, int width, BytesVector &dest) {
  for (int i = width - 1; i >= 0; --i) {
    dest.push_back(static_cast<unsigned char>((val >> (8 * i)) & 0xFF));
  }
}

uint64_t MaxForWidth(int width) noexcept {
  return width >= 8 ? UINT64_MAX : (static_cast<uint64_t>(1) << (8 * width)) - 1;
}

}  // namespace

BytesVector CrossRefStream::ToRawData() const {
  const std::string func_name = "[CrossRefStream::ToRawData] ";
  BytesVector res;
  // dictionary
  {
    std::ostringstream builder;
    builder << id.ToString() << "\n"
            << kDictStart << "\n"
            << kTagType << " " << type << "\n"
            << kTagSize << " " << size_val << "\n";
    if (!index_vec.empty()) {
      builder << kTagIndex << " [ ";
      for (const auto &ind_pair : index_vec) {
        builder << ind_pair.first << " " << ind_pair.second << " ";
      }
      builder << "]\n";
    }
    builder << kTagW << " [ " << w_field_0_size << " " << w_field_1_size << " "
            << w_field_2_size << " ]\n";
    builder << kTagPrev << " " << prev_val << "\n";
    builder << kTagRoot << " " << root_id << "\n";
    builder << kTagLength << " " << length << "\n";
    if (info_id.has_value()) {
      builder << kTagInfo << " " << info_id.value() << "\n";
    }
    if (id_val.has_value()) {
      builder << kTagID << " " << id_val.value() << "\n";
    }
    if (encrypt.has_value()) {
      builder << kTagEncrypt << " " << encrypt.value() << "\n";
    }
    builder << kDictEnd << "\n";
    builder << kStreamStart;
    const std::string tmp = builder.str();
    std::copy(tmp.cbegin(), tmp.cend(), std::back_inserter(res));
  }
  // stream data, type 1 entries only (objects in use, not compressed)
  {
    BytesVector stream_data;
    stream_data.reserve(static_cast<size_t>(length));
    const uint64_t max_offset = MaxForWidth(w_field_1_size);
    const uint64_t max_gen = MaxForWidth(w_field_2_size);
    for (const auto &entry : entries) {
      if (entry.offset > max_offset || entry.gen > max_gen) {
        throw std::runtime_error(func_name +
                                 "xref entry doesn't fit the /W field size");
      }
      PushBigEndian(1, w_field_0_size, stream_data);
      PushBigEndian(entry.offset, w_field_1_size, stream_data);
      PushBigEndian(entry.gen, w_field_2_size, stream_data);
    }
    std::copy(stream_data.cbegin(), stream_data.cend(),
              std::back_inserter(res));
  }
  {
    std::string obj_end = "\n";
    obj_end += kStreamEnd;
    obj_end += kObjEnd;
    std::copy(obj_end.cbegin(), obj_end.cend(), std::back_inserter(res));
  }
  return res;
}

}  // namespace pdfseal::pdf
