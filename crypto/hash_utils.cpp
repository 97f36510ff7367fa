/* File: hash_utils.cpp
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

#include "hash_utils.hpp"

#include <openssl/hmac.h>
#include <openssl/rand.h>

#include <limits>

#include "utils.hpp"

namespace pdfseal::crypto {

BytesVector Sha256(const unsigned char *data, size_t size) {
  BytesVector res(EVP_MAX_MD_SIZE, 0x00);
  unsigned int res_size = 0;
  if (EVP_Digest(data, size, res.data(), &res_size, EVP_sha256(), nullptr) !=
      1) {
    throw CryptoError("[Sha256] digest failed " + OpenSslLastError());
  }
  res.resize(res_size);
  return res;
}

BytesVector Sha256(const BytesVector &data) {
  return Sha256(data.data(), data.size());
}

std::string Sha256Hex(const BytesVector &data) {
  return VecBytesStringRepresentation(Sha256(data));
}

std::string HmacSha256Hex(const std::string &key, const std::string &data) {
  if (key.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
    throw CryptoError("[HmacSha256Hex] key is too long");
  }
  BytesVector res(EVP_MAX_MD_SIZE, 0x00);
  unsigned int res_size = 0;
  if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
           reinterpret_cast<const unsigned char *>(data.data()),  // NOLINT
           data.size(), res.data(), &res_size) == nullptr) {
    throw CryptoError("[HmacSha256Hex] hmac failed " + OpenSslLastError());
  }
  res.resize(res_size);
  return VecBytesStringRepresentation(res);
}

BytesVector RandomBytes(size_t size) {
  if (size > static_cast<size_t>(std::numeric_limits<int>::max())) {
    throw CryptoError("[RandomBytes] size is too big");
  }
  BytesVector res(size, 0x00);
  if (RAND_bytes(res.data(), static_cast<int>(size)) != 1) {
    throw CryptoError("[RandomBytes] RAND_bytes failed " + OpenSslLastError());
  }
  return res;
}

}  // namespace pdfseal::crypto
