/* File: notifier.hpp
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

#include "signable_document.hpp"
#include "signature_request.hpp"

namespace pdfseal::workflow {

/**
 * @brief Hooks for the notification layer
 * @details Called synchronously after the state is committed. Exceptions
 * thrown by a hook are logged and don't affect the signing result.
 */
class INotifier {
 public:
  INotifier() = default;
  INotifier(const INotifier &) = delete;
  INotifier &operator=(const INotifier &) = delete;
  INotifier(INotifier &&) = delete;
  INotifier &operator=(INotifier &&) = delete;
  virtual ~INotifier() = default;

  /// @brief a fresh code must be sent to the signer
  virtual void OnOtpIssued(const SignableDocument &doc,
                           const SignatureRequest &request,
                           const std::string &otp_code) = 0;

  /// @brief a signer finished, the document is not fully signed yet
  virtual void OnSignatureCompleted(
    const SignableDocument &doc, const SignatureRequest &request,
    const std::optional<SignatureRequest> &next_signer) = 0;

  /// @brief the last signature was added, called once per document
  virtual void OnDocumentSigned(const SignableDocument &doc) = 0;
};

}  // namespace pdfseal::workflow
