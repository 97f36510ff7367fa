/* File: document_status.cpp
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

#include "document_status.hpp"

namespace pdfseal::workflow {

std::string StatusToString(DocumentStatus status) noexcept {
  switch (status) {
    case DocumentStatus::kDraft:
      return "draft";
    case DocumentStatus::kSigning:
      return "signing";
    case DocumentStatus::kSigned:
      return "signed";
    case DocumentStatus::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

std::optional<DocumentStatus> StatusFromString(
  const std::string &val) noexcept {
  if (val == "draft") {
    return DocumentStatus::kDraft;
  }
  if (val == "signing") {
    return DocumentStatus::kSigning;
  }
  if (val == "signed") {
    return DocumentStatus::kSigned;
  }
  if (val == "cancelled") {
    return DocumentStatus::kCancelled;
  }
  return std::nullopt;
}

bool CanTransition(DocumentStatus from, DocumentStatus to) noexcept {
  switch (from) {
    case DocumentStatus::kDraft:
      return to == DocumentStatus::kSigning ||
             to == DocumentStatus::kCancelled;
    case DocumentStatus::kSigning:
      return to == DocumentStatus::kSigned || to == DocumentStatus::kCancelled;
    case DocumentStatus::kSigned:
    case DocumentStatus::kCancelled:
      return false;
  }
  return false;
}

bool IsLocked(DocumentStatus status) noexcept {
  return status == DocumentStatus::kSigning ||
         status == DocumentStatus::kSigned;
}

}  // namespace pdfseal::workflow
