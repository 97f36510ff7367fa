/* File: signer.cpp
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

#include "signer.hpp"

#include <stdexcept>
#include <type_traits>
#include <utility>

namespace pdfseal::workflow {

const SignerInfo &GetSignerInfo(const Signer &signer) noexcept {
  return std::visit(
    [](const auto &alternative) -> const SignerInfo & { return alternative; },
    signer);
}

std::string SignerName(const Signer &signer) {
  const SignerInfo &info = GetSignerInfo(signer);
  if (info.first_name.empty()) {
    return info.last_name;
  }
  if (info.last_name.empty()) {
    return info.first_name;
  }
  return info.first_name + " " + info.last_name;
}

const std::string &SignerEmail(const Signer &signer) noexcept {
  return GetSignerInfo(signer).email;
}

const std::string &SignerId(const Signer &signer) noexcept {
  return GetSignerInfo(signer).id;
}

std::string SignerRole(const Signer &signer) {
  return std::visit(
    [](const auto &alternative) -> std::string {
      using T = std::decay_t<decltype(alternative)>;
      if constexpr (std::is_same_v<T, Landlord>) {
        return "landlord";
      } else if constexpr (std::is_same_v<T, Tenant>) {
        return "tenant";
      } else {
        return "agent";
      }
    },
    signer);
}

Signer MakeSigner(const std::string &role, SignerInfo info) {
  if (role == "landlord") {
    return Landlord{std::move(info)};
  }
  if (role == "tenant") {
    return Tenant{std::move(info)};
  }
  if (role == "agent") {
    return Agent{std::move(info)};
  }
  throw std::invalid_argument("[MakeSigner] unknown signer role " + role);
}

}  // namespace pdfseal::workflow
