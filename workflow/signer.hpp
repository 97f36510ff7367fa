/* File: signer.hpp
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
#include <variant>

namespace pdfseal::workflow {

/// @brief identity shared by every kind of signer
struct SignerInfo {
  std::string id;
  std::string first_name;
  std::string last_name;
  std::string email;
};

struct Landlord : SignerInfo {};
struct Tenant : SignerInfo {};
/// @brief signs on behalf of the landlord
struct Agent : SignerInfo {};

using Signer = std::variant<Landlord, Tenant, Agent>;

[[nodiscard]] const SignerInfo &GetSignerInfo(const Signer &signer) noexcept;

/// @brief "First Last"
[[nodiscard]] std::string SignerName(const Signer &signer);

[[nodiscard]] const std::string &SignerEmail(const Signer &signer) noexcept;

[[nodiscard]] const std::string &SignerId(const Signer &signer) noexcept;

/// @brief "landlord", "tenant" or "agent"
[[nodiscard]] std::string SignerRole(const Signer &signer);

/**
 * @brief Build a signer from the stored role
 * @throws std::invalid_argument on unknown role
 */
[[nodiscard]] Signer MakeSigner(const std::string &role, SignerInfo info);

}  // namespace pdfseal::workflow
