/* File: lifecycle.hpp
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

#include "proof_store.hpp"
#include "request_store.hpp"
#include "signable_document.hpp"

namespace pdfseal::workflow {

/**
 * @brief Status transitions of a signable document
 * @details The signed status is derived from the persisted proof records, so
 * every method can be called again after a crash.
 */
class DocumentLifecycle {
 public:
  /// @throws std::invalid_argument if a store is null
  DocumentLifecycle(std::shared_ptr<RequestStore> requests,
                    std::shared_ptr<journal::ProofStore> proofs);

  /**
   * @brief DRAFT -> SIGNING
   * @return true if the status changed
   */
  bool MarkSigningStarted(SignableDocument &doc) const;

  /**
   * @brief Set SIGNED when every request has its proof record
   * @return true only for the call that made the transition
   * @throws storage::StorageError
   */
  bool Reevaluate(SignableDocument &doc) const;

  /**
   * @brief Cancel the document and its outstanding requests
   * @throws LifecycleError if the document is signed
   */
  void Cancel(SignableDocument &doc) const;

  /**
   * @brief Delete the requests so the document can be edited again
   * @throws LifecycleError unless the document is a draft
   */
  void ResetForEdit(SignableDocument &doc) const;

  [[nodiscard]] static bool IsLocked(const SignableDocument &doc) {
    return workflow::IsLocked(doc.GetStatus());
  }

 private:
  std::shared_ptr<RequestStore> requests_;
  std::shared_ptr<journal::ProofStore> proofs_;
};

}  // namespace pdfseal::workflow
