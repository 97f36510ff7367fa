/* File: document_status.hpp
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
#include <optional>
#include <string>

namespace pdfseal::workflow {

enum class DocumentStatus : uint8_t { kDraft, kSigning, kSigned, kCancelled };

/// @brief "draft", "signing", "signed", "cancelled"
std::string StatusToString(DocumentStatus status) noexcept;

std::optional<DocumentStatus> StatusFromString(const std::string &val) noexcept;

/**
 * @brief Check if the transition is allowed
 * @details DRAFT->SIGNING->SIGNED, DRAFT|SIGNING->CANCELLED. A signed
 * document never changes.
 */
bool CanTransition(DocumentStatus from, DocumentStatus to) noexcept;

/// @brief business fields of a locked document must not be edited
bool IsLocked(DocumentStatus status) noexcept;

}  // namespace pdfseal::workflow
