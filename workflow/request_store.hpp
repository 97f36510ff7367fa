/* File: request_store.hpp
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
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "signature_request.hpp"
#include "sqlite_db.hpp"

namespace pdfseal::workflow {

/**
 * @brief SQLite persistence of signature requests
 * @details Table signature_request. Write methods don't open a transaction,
 * the caller groups them with storage::Transaction. All methods throw
 * storage::StorageError.
 */
class RequestStore {
 public:
  explicit RequestStore(storage::SharedDb db);

  /**
   * @brief Insert a new request
   * @return int64_t the row id
   */
  int64_t Insert(const SignatureRequest &request);

  [[nodiscard]] std::optional<SignatureRequest> Get(int64_t id) const;

  /// @brief cancelled requests are returned too
  [[nodiscard]] std::optional<SignatureRequest> FindByLinkToken(
    const std::string &token) const;

  /// @brief requests of the document ordered by order_index
  [[nodiscard]] std::vector<SignatureRequest> ListForDocument(
    const std::string &document_id, bool include_cancelled = false) const;

  /// @brief number of not cancelled requests
  [[nodiscard]] size_t CountActive(const std::string &document_id) const;

  /// @brief replace the code, reset the validation time
  void UpdateOtp(int64_t id, const std::string &code, TimePoint generated_at);

  void SetOtpValidated(int64_t id, TimePoint validated_at);

  /**
   * @brief Set the signed flag
   * @return false if the request was already signed or cancelled
   */
  bool MarkSigned(int64_t id, TimePoint signed_at);

  /// @return size_t number of cancelled requests
  size_t CancelPending(const std::string &document_id, TimePoint cancelled_at);

  void DeleteForDocument(const std::string &document_id);

  [[nodiscard]] const storage::SharedDb &Db() const noexcept { return db_; }

 private:
  storage::SharedDb db_;
};

}  // namespace pdfseal::workflow
