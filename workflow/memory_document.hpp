/* File: memory_document.hpp
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
#include <mutex>
#include <string>

#include "signable_document.hpp"

namespace pdfseal::workflow {

enum class DocumentKind : uint8_t {
  kLease,
  kInventory,
  kRentReceipt,
  kAmendment,
  kInsurance
};

[[nodiscard]] std::string DocumentKindName(DocumentKind kind) noexcept;

[[nodiscard]] std::string DocumentKindPrefix(DocumentKind kind) noexcept;

/**
 * @brief SignableDocument kept in memory
 * @details Thread-safe.
 */
class MemoryDocument : public SignableDocument {
 public:
  /// @throws std::invalid_argument if id or original is empty
  MemoryDocument(std::string id, DocumentKind kind, BytesVector original);

  [[nodiscard]] std::string DocumentId() const override { return id_; }

  [[nodiscard]] std::string GetDocumentName() const override {
    return DocumentKindName(kind_);
  }

  [[nodiscard]] std::string GetFilePrefix() const override {
    return DocumentKindPrefix(kind_);
  }

  [[nodiscard]] DocumentKind Kind() const noexcept { return kind_; }

  [[nodiscard]] DocumentStatus GetStatus() const override;

  void SetStatus(DocumentStatus status) override;

  [[nodiscard]] BytesVector OriginalPdf() const override { return original_; }

  [[nodiscard]] BytesVector LatestPdf() const override;

  void SetLatestPdf(BytesVector data) override;

 private:
  const std::string id_;
  const DocumentKind kind_;
  const BytesVector original_;
  mutable std::mutex mutex_;
  DocumentStatus status_ = DocumentStatus::kDraft;
  BytesVector latest_;
};

}  // namespace pdfseal::workflow
