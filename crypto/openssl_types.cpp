/* File: openssl_types.cpp
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

#include "openssl_types.hpp"

#include <array>

namespace pdfseal::crypto {

std::string OpenSslLastError() {
  std::string res;
  unsigned long err_code = 0;  // NOLINT(google-runtime-int)
  while ((err_code = ERR_get_error()) != 0) {
    std::array<char, 256> buf{};
    ERR_error_string_n(err_code, buf.data(), buf.size());
    if (!res.empty()) {
      res += "; ";
    }
    res += buf.data();
  }
  return res;
}

}  // namespace pdfseal::crypto
