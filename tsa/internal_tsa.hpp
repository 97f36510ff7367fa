/* File: internal_tsa.hpp
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

#include <memory>
#include <string>

#include "serial_allocator.hpp"
#include "timestamp_authority.hpp"
#include "trust_material.hpp"

namespace pdfseal::tsa {

/**
 * @brief In-process RFC 3161 timestamp authority
 * @details SHA-256/384/512 imprints, one second accuracy, serials from the
 * SerialAllocator. Thread-safe.
 */
class InternalTsa : public ITimestampAuthority {
 public:
  /**
   * @brief Construct a new Internal Tsa object
   * @param trust TSA identity holder
   * @param serials serial source
   * @param policy_oid dotted policy OID
   * @throws std::invalid_argument
   */
  InternalTsa(std::shared_ptr<const crypto::TrustMaterial> trust,
              std::shared_ptr<SerialAllocator> serials,
              std::string policy_oid);

  /**
   * @brief Answer one TimeStampReq
   * @throws std::invalid_argument on an empty request
   * @throws TsaError if the request is rejected or the response can't be
   * built
   */
  BytesVector Respond(const BytesVector &request_der) override;

 private:
  std::shared_ptr<const crypto::TrustMaterial> trust_;
  std::shared_ptr<SerialAllocator> serials_;
  std::string policy_oid_;
};

}  // namespace pdfseal::tsa
