/* File: internal_tsa.cpp
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

#include "internal_tsa.hpp"

#include <openssl/ts.h>

#include <limits>
#include <stdexcept>
#include <utility>

#include "logger_utils.hpp"
#include "openssl_types.hpp"
#include "tsa_errors.hpp"

namespace pdfseal::tsa {

using crypto::OpenSslLastError;

namespace {

// OpenSSL takes ownership of the returned integer
ASN1_INTEGER *SerialCallback(TS_RESP_CTX * /*ctx*/, void *data) {
  const auto *serial = static_cast<const uint64_t *>(data);
  ASN1_INTEGER *res = ASN1_INTEGER_new();
  if (res == nullptr || ASN1_INTEGER_set_uint64(res, *serial) != 1) {
    ASN1_INTEGER_free(res);
    return nullptr;
  }
  return res;
}

std::string StatusText(TS_RESP *resp) {
  const TS_STATUS_INFO *status_info = TS_RESP_get_status_info(resp);
  const ASN1_INTEGER *status = TS_STATUS_INFO_get0_status(status_info);
  std::string res = "status " + std::to_string(ASN1_INTEGER_get(status));
  const STACK_OF(ASN1_UTF8STRING) *text = TS_STATUS_INFO_get0_text(status_info);
  for (int i = 0; text != nullptr && i < sk_ASN1_UTF8STRING_num(text); ++i) {
    const ASN1_UTF8STRING *str = sk_ASN1_UTF8STRING_value(text, i);
    res += " ";
    res.append(reinterpret_cast<const char *>(  // NOLINT
                 ASN1_STRING_get0_data(str)),
               ASN1_STRING_length(str));
  }
  return res;
}

}  // namespace

InternalTsa::InternalTsa(std::shared_ptr<const crypto::TrustMaterial> trust,
                         std::shared_ptr<SerialAllocator> serials,
                         std::string policy_oid)
  : trust_(std::move(trust)),
    serials_(std::move(serials)),
    policy_oid_(std::move(policy_oid)) {
  if (!trust_ || !serials_) {
    throw std::invalid_argument("[InternalTsa] null dependency");
  }
  const crypto::Asn1ObjectPtr policy(OBJ_txt2obj(policy_oid_.c_str(), 1));
  if (!policy) {
    throw std::invalid_argument("[InternalTsa] invalid policy OID " +
                                policy_oid_);
  }
}

BytesVector InternalTsa::Respond(const BytesVector &request_der) {
  const std::string func_name = "[InternalTsa::Respond] ";
  if (request_der.empty()) {
    throw std::invalid_argument(func_name + "empty request");
  }
  if (request_der.size() >
      static_cast<size_t>(std::numeric_limits<int>::max())) {
    throw std::invalid_argument(func_name + "request is too big");
  }
  uint64_t serial = serials_->Next();
  const crypto::TsRespCtxPtr ctx(TS_RESP_CTX_new());
  if (!ctx) {
    throw TsaError(func_name + "TS_RESP_CTX_new failed");
  }
  const auto &identity = trust_->Tsa();
  const crypto::Asn1ObjectPtr policy(OBJ_txt2obj(policy_oid_.c_str(), 1));
  if (TS_RESP_CTX_set_signer_cert(ctx.get(), identity.cert.Get()) != 1 ||
      TS_RESP_CTX_set_signer_key(ctx.get(), identity.key.get()) != 1 ||
      !policy || TS_RESP_CTX_set_def_policy(ctx.get(), policy.get()) != 1 ||
      TS_RESP_CTX_add_md(ctx.get(), EVP_sha256()) != 1 ||
      TS_RESP_CTX_add_md(ctx.get(), EVP_sha384()) != 1 ||
      TS_RESP_CTX_add_md(ctx.get(), EVP_sha512()) != 1 ||
      TS_RESP_CTX_set_signer_digest(ctx.get(), EVP_sha256()) != 1 ||
      TS_RESP_CTX_set_ess_cert_id_digest(ctx.get(), EVP_sha256()) != 1 ||
      TS_RESP_CTX_set_accuracy(ctx.get(), 1, 0, 0) != 1) {
    throw TsaError(func_name + "can't configure the response context " +
                   OpenSslLastError());
  }
  TS_RESP_CTX_add_flags(ctx.get(), TS_TSA_NAME);
  TS_RESP_CTX_set_serial_cb(ctx.get(), SerialCallback, &serial);

  const crypto::BioPtr req_bio(BIO_new_mem_buf(
    request_der.data(), static_cast<int>(request_der.size())));
  if (!req_bio) {
    throw TsaError(func_name + "BIO_new_mem_buf failed");
  }
  const crypto::TsRespPtr resp(
    TS_RESP_create_response(ctx.get(), req_bio.get()));
  if (!resp) {
    throw TsaError(func_name + "can't create the response " +
                   OpenSslLastError());
  }
  const long status = ASN1_INTEGER_get(  // NOLINT(google-runtime-int)
    TS_STATUS_INFO_get0_status(TS_RESP_get_status_info(resp.get())));
  if (status != TS_STATUS_GRANTED && status != TS_STATUS_GRANTED_WITH_MODS) {
    throw TsaError(func_name + "request rejected, " + StatusText(resp.get()));
  }
  auto res = crypto::ToDer<TS_RESP>(resp.get(), i2d_TS_RESP);
  auto logger = logger::InitLog();
  if (logger) {
    logger->debug("{} timestamp issued, serial {}", func_name, serial);
  }
  return res;
}

}  // namespace pdfseal::tsa
