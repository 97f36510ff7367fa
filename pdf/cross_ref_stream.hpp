/* File: cross_ref_stream.hpp
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
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "pdf_defs.hpp"
#include "pdf_structs.hpp"

namespace pdfseal::pdf {

/**
 * @brief Cross-reference stream for an incremental update
 * @details ISO32000 [7.5.8] Cross-Reference Streams
 * The new section must be a stream if the previous one was a stream.
 */
struct CrossRefStream {
  ObjRawId id;
  std::string type = kTagXref;  // /XRef
  int size_val = 0;             // highest object number + 1

  /* /Index[....] - pair of integers for each subsection
   * pair: first_object_id => number_of_objects
   * sorted by the first field
   */
  std::vector<std::pair<int, int>> index_vec;

  // /W [type offset generation]
  int w_field_0_size = 1;
  int w_field_1_size = 4;
  int w_field_2_size = 2;

  std::string prev_val;                // /Prev
  std::string root_id;                 // /Root
  std::optional<std::string> info_id;  // /Info
  std::optional<std::string> id_val;   // /ID
  std::optional<std::string> encrypt;  // /Encrypt
  int length = 0;                      // /Length of data stream
  std::vector<XRefEntry> entries;

  /**
   * @brief Return data ready for copying to the buffer
   * @return BytesVector
   * @throws std::runtime_error if an offset doesn't fit the /W field
   */
  [[nodiscard]] BytesVector ToRawData() const;
};

}  // namespace pdfseal::pdf
