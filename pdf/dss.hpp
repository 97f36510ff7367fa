/* File: dss.hpp
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

#include <map>
#include <string>
#include <vector>

#include "pdf_structs.hpp"

namespace pdfseal::pdf {

/// @brief embedded DER certificate stream
struct CertStreamObj {
  ObjRawId id;
  BytesVector der;

  [[nodiscard]] BytesVector ToRawData() const;
};

/**
 * @brief Document security store
 * @details ETSI EN 319 142-1 [5.4.2], only /Certs is produced, other keys of
 * an existing store are kept as they are
 */
struct Dss {
  ObjRawId id;
  std::vector<ObjRawId> certs;
  std::map<std::string, std::string> other_fields_copied;
  // DER of the certificates already present, for deduplication
  std::vector<BytesVector> known_certs;

  /**
   * @brief Copy an existing store and it's ID
   * @details id stays empty for a direct dictionary
   * @throws std::runtime_error if not a dictionary
   */
  static Dss ShallowCopy(QPDFObjectHandle &other);

  [[nodiscard]] bool Contains(const BytesVector &der) const noexcept;

  [[nodiscard]] std::string ToString() const;
};

}  // namespace pdfseal::pdf
