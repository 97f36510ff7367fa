/* File: signable_document.hpp
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

#include <string>

#include "document_status.hpp"
#include "utils.hpp"

namespace pdfseal::workflow {

/**
 * @brief A document that can go through the signing workflow
 * @details Owned by the caller. The workflow only changes the status and the
 * latest signed artifact.
 */
class SignableDocument {
 public:
  SignableDocument() = default;
  SignableDocument(const SignableDocument &) = delete;
  SignableDocument &operator=(const SignableDocument &) = delete;
  SignableDocument(SignableDocument &&) = delete;
  SignableDocument &operator=(SignableDocument &&) = delete;
  virtual ~SignableDocument() = default;

  [[nodiscard]] virtual std::string DocumentId() const = 0;

  /// @brief human readable type, "Lease"
  [[nodiscard]] virtual std::string GetDocumentName() const = 0;

  /// @brief prefix of the produced files, "bail"
  [[nodiscard]] virtual std::string GetFilePrefix() const = 0;

  [[nodiscard]] virtual DocumentStatus GetStatus() const = 0;

  virtual void SetStatus(DocumentStatus status) = 0;

  /// @brief the generated document before certification
  [[nodiscard]] virtual BytesVector OriginalPdf() const = 0;

  /// @brief the last signed artifact, empty before certification
  [[nodiscard]] virtual BytesVector LatestPdf() const = 0;

  /**
   * @brief Replace the signed artifact
   * @throws LifecycleError if the document is already signed
   */
  virtual void SetLatestPdf(BytesVector data) = 0;
};

}  // namespace pdfseal::workflow
