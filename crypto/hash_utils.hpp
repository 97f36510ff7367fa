/* File: hash_utils.hpp
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

#include <cstddef>
#include <string>

#include "openssl_types.hpp"

namespace pdfseal::crypto {

/// @throws CryptoError
BytesVector Sha256(const unsigned char *data, size_t size);

/// @throws CryptoError
BytesVector Sha256(const BytesVector &data);

/// @brief lowercase hex SHA-256
std::string Sha256Hex(const BytesVector &data);

/// @brief HMAC-SHA256 hex
std::string HmacSha256Hex(const std::string &key, const std::string &data);

/// @brief cryptographically secure random bytes
BytesVector RandomBytes(size_t size);

}  // namespace pdfseal::crypto
