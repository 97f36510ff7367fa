/* File: signature_request.cpp
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

#include "signature_request.hpp"

namespace pdfseal::workflow {

std::string OtpCheckToString(OtpCheck check) noexcept {
  switch (check) {
    case OtpCheck::kValid:
      return "valid";
    case OtpCheck::kWrongCode:
      return "wrong code";
    case OtpCheck::kExpired:
      return "expired code";
    case OtpCheck::kNotIssued:
      return "code not issued";
  }
  return "unknown";
}

}  // namespace pdfseal::workflow
