/* File: tst_info.cpp
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

#include "tst_info.hpp"

#include <openssl/ts.h>

#include <algorithm>
#include <chrono>
#include <limits>

#include "hash_utils.hpp"
#include "openssl_types.hpp"
#include "tsa_errors.hpp"

namespace pdfseal::tsa {

using crypto::OpenSslLastError;

namespace {

crypto::Pkcs7Ptr DecodeToken(const BytesVector &token_der) {
  if (token_der.empty() ||
      token_der.size() >
        static_cast<size_t>(std::numeric_limits<long>::max())) {
    throw TsaError("[ParseTimestampToken] empty token");
  }
  const unsigned char *ptr = token_der.data();
  crypto::Pkcs7Ptr res(
    d2i_PKCS7(nullptr, &ptr, static_cast<long>(token_der.size())));
  if (!res) {
    throw TsaError("[ParseTimestampToken] can't decode token " +
                   OpenSslLastError());
  }
  return res;
}

std::string ObjectToString(const ASN1_OBJECT *obj) {
  std::string res(128, '\0');
  const int len =
    OBJ_obj2txt(res.data(), static_cast<int>(res.size()), obj, 1);
  if (len <= 0) {
    return {};
  }
  res.resize(std::min(static_cast<size_t>(len), res.size() - 1));
  return res;
}

}  // namespace

json::object TstInfo::ToJson() const {
  json::object res;
  res["version"] = version;
  res["policy"] = policy;
  res["serial"] = serial;
  res["gen_time"] = std::chrono::system_clock::to_time_t(gen_time);
  res["gen_time_readable"] =
    TimeTToString(std::chrono::system_clock::to_time_t(gen_time));
  res["hash_algo"] = hash_algo;
  res["imprint"] = VecBytesStringRepresentation(imprint);
  if (tsa_name) {
    res["tsa_name"] = tsa_name.value();
  }
  return res;
}

TstInfo ParseTimestampToken(const BytesVector &token_der) {
  const std::string func_name = "[ParseTimestampToken] ";
  const crypto::Pkcs7Ptr token = DecodeToken(token_der);
  const crypto::TsTstInfoPtr tst(PKCS7_to_TS_TST_INFO(token.get()));
  if (!tst) {
    throw TsaError(func_name + "no TSTInfo in the token " + OpenSslLastError());
  }
  TstInfo res;
  res.version = TS_TST_INFO_get_version(tst.get());
  res.policy = ObjectToString(TS_TST_INFO_get_policy_id(tst.get()));
  uint64_t serial = 0;
  if (ASN1_INTEGER_get_uint64(&serial, TS_TST_INFO_get_serial(tst.get())) !=
      1) {
    throw TsaError(func_name + "serial doesn't fit into 64 bits");
  }
  res.serial = serial;
  try {
    res.gen_time = std::chrono::system_clock::from_time_t(
      crypto::Asn1TimeToTimeT(TS_TST_INFO_get_time(tst.get())));
  } catch (const crypto::CryptoError &ex) {
    throw TsaError(func_name + ex.what());
  }
  TS_MSG_IMPRINT *imprint = TS_TST_INFO_get_msg_imprint(tst.get());
  const ASN1_OBJECT *algo_obj = nullptr;
  X509_ALGOR_get0(&algo_obj, nullptr, nullptr,
                  TS_MSG_IMPRINT_get_algo(imprint));
  const int algo_nid = OBJ_obj2nid(algo_obj);
  const char *algo_name = OBJ_nid2sn(algo_nid);
  res.hash_algo = algo_name != nullptr ? algo_name : ObjectToString(algo_obj);
  const ASN1_OCTET_STRING *digest = TS_MSG_IMPRINT_get_msg(imprint);
  res.imprint.assign(ASN1_STRING_get0_data(digest),
                     ASN1_STRING_get0_data(digest) +
                       ASN1_STRING_length(digest));
  const GENERAL_NAME *tsa_name = TS_TST_INFO_get_tsa(tst.get());
  if (tsa_name != nullptr && tsa_name->type == GEN_DIRNAME) {
    res.tsa_name = crypto::NameToString(tsa_name->d.directoryName);
  }
  return res;
}

bool VerifyTimestampToken(
  const BytesVector &token_der, const BytesVector &data,
  const std::vector<const crypto::Certificate *> &trusted) noexcept {
  try {
    const crypto::Pkcs7Ptr token = DecodeToken(token_der);
    const crypto::TsVerifyCtxPtr ctx(TS_VERIFY_CTX_new());
    X509_STORE *store = X509_STORE_new();
    if (!ctx || store == nullptr) {
      X509_STORE_free(store);
      return false;
    }
    // the context owns the store from here
    TS_VERIFY_CTX_set_store(ctx.get(), store);
    for (const auto *cert : trusted) {
      if (cert != nullptr) {
        X509_STORE_add_cert(store, cert->Get());
      }
    }
    const BytesVector hash = crypto::Sha256(data);
    auto *imprint =
      static_cast<unsigned char *>(OPENSSL_malloc(hash.size()));
    if (imprint == nullptr) {
      return false;
    }
    std::copy(hash.cbegin(), hash.cend(), imprint);
    // takes ownership of the buffer
    TS_VERIFY_CTX_set_imprint(ctx.get(), imprint,
                              static_cast<long>(hash.size()));
    TS_VERIFY_CTX_set_flags(
      ctx.get(), TS_VFY_VERSION | TS_VFY_SIGNATURE | TS_VFY_IMPRINT);
    const int res = TS_RESP_verify_token(ctx.get(), token.get());
    ERR_clear_error();
    return res == 1;
  } catch (const std::exception &) {
    ERR_clear_error();
    return false;
  }
}

}  // namespace pdfseal::tsa
