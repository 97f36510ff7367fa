/* File: memory_document.cpp
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

#include "memory_document.hpp"

#include <stdexcept>
#include <utility>

#include "workflow_errors.hpp"

namespace pdfseal::workflow {

std::string DocumentKindName(DocumentKind kind) noexcept {
  switch (kind) {
    case DocumentKind::kLease:
      return "Lease";
    case DocumentKind::kInventory:
      return "Inventory";
    case DocumentKind::kRentReceipt:
      return "Rent receipt";
    case DocumentKind::kAmendment:
      return "Amendment";
    case DocumentKind::kInsurance:
      return "Insurance";
  }
  return "Document";
}

std::string DocumentKindPrefix(DocumentKind kind) noexcept {
  switch (kind) {
    case DocumentKind::kLease:
      return "bail";
    case DocumentKind::kInventory:
      return "etat_lieux";
    case DocumentKind::kRentReceipt:
      return "quittance";
    case DocumentKind::kAmendment:
      return "avenant";
    case DocumentKind::kInsurance:
      return "assurance";
  }
  return "document";
}

MemoryDocument::MemoryDocument(std::string id, DocumentKind kind,
                               BytesVector original)
    : id_(std::move(id)), kind_(kind), original_(std::move(original)) {
  if (id_.empty()) {
    throw std::invalid_argument("[MemoryDocument] empty document id");
  }
  if (original_.empty()) {
    throw std::invalid_argument("[MemoryDocument] empty pdf");
  }
}

DocumentStatus MemoryDocument::GetStatus() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return status_;
}

void MemoryDocument::SetStatus(DocumentStatus status) {
  const std::lock_guard<std::mutex> lock(mutex_);
  status_ = status;
}

BytesVector MemoryDocument::LatestPdf() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return latest_;
}

void MemoryDocument::SetLatestPdf(BytesVector data) {
  const std::lock_guard<std::mutex> lock(mutex_);
  if (status_ == DocumentStatus::kSigned) {
    throw LifecycleError("[MemoryDocument::SetLatestPdf] document " + id_ +
                         " is signed");
  }
  latest_ = std::move(data);
}

}  // namespace pdfseal::workflow
