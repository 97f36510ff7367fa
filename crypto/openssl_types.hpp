/* File: openssl_types.hpp
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

#include <openssl/asn1.h>
#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pkcs12.h>
#include <openssl/pkcs7.h>
#include <openssl/ts.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace pdfseal::crypto {

using BytesVector = std::vector<unsigned char>;

class CryptoError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

template <typename T, void (*FreeFunc)(T *)>
struct OsslDeleter {
  void operator()(T *ptr) const noexcept { FreeFunc(ptr); }
};

using X509Ptr = std::unique_ptr<X509, OsslDeleter<X509, X509_free>>;
using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, OsslDeleter<EVP_PKEY, EVP_PKEY_free>>;
using BioPtr = std::unique_ptr<BIO, OsslDeleter<BIO, BIO_free_all>>;
using Pkcs7Ptr = std::unique_ptr<PKCS7, OsslDeleter<PKCS7, PKCS7_free>>;
using Pkcs12Ptr = std::unique_ptr<PKCS12, OsslDeleter<PKCS12, PKCS12_free>>;
using BignumPtr = std::unique_ptr<BIGNUM, OsslDeleter<BIGNUM, BN_free>>;
using Asn1IntegerPtr =
  std::unique_ptr<ASN1_INTEGER, OsslDeleter<ASN1_INTEGER, ASN1_INTEGER_free>>;
using Asn1ObjectPtr =
  std::unique_ptr<ASN1_OBJECT, OsslDeleter<ASN1_OBJECT, ASN1_OBJECT_free>>;
using Asn1StringPtr =
  std::unique_ptr<ASN1_STRING, OsslDeleter<ASN1_STRING, ASN1_STRING_free>>;
using X509ExtensionPtr =
  std::unique_ptr<X509_EXTENSION,
                  OsslDeleter<X509_EXTENSION, X509_EXTENSION_free>>;
using X509StorePtr =
  std::unique_ptr<X509_STORE, OsslDeleter<X509_STORE, X509_STORE_free>>;
using TsReqPtr = std::unique_ptr<TS_REQ, OsslDeleter<TS_REQ, TS_REQ_free>>;
using TsRespPtr = std::unique_ptr<TS_RESP, OsslDeleter<TS_RESP, TS_RESP_free>>;
using TsRespCtxPtr =
  std::unique_ptr<TS_RESP_CTX, OsslDeleter<TS_RESP_CTX, TS_RESP_CTX_free>>;
using TsTstInfoPtr =
  std::unique_ptr<TS_TST_INFO, OsslDeleter<TS_TST_INFO, TS_TST_INFO_free>>;
using TsVerifyCtxPtr =
  std::unique_ptr<TS_VERIFY_CTX,
                  OsslDeleter<TS_VERIFY_CTX, TS_VERIFY_CTX_free>>;

struct X509StackDeleter {
  void operator()(STACK_OF(X509) * stack) const noexcept {
    sk_X509_pop_free(stack, X509_free);
  }
};
using X509StackPtr = std::unique_ptr<STACK_OF(X509), X509StackDeleter>;

/**
 * @brief Drain the OpenSSL error queue
 * @return std::string with all queued errors joined by "; "
 */
std::string OpenSslLastError();

/// @brief DER encoding of an ASN.1 object using its i2d function
template <typename T>
BytesVector ToDer(const T *obj,
                  int (*i2d_func)(const T *, unsigned char **)) {
  unsigned char *buf = nullptr;
  const int len = i2d_func(obj, &buf);
  if (len <= 0 || buf == nullptr) {
    throw CryptoError("[ToDer] DER encoding failed " + OpenSslLastError());
  }
  BytesVector res(buf, buf + len);
  OPENSSL_free(buf);
  return res;
}

}  // namespace pdfseal::crypto
