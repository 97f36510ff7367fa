/* File: signature_info.cpp
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

#include "signature_info.hpp"

#include <openssl/pkcs7.h>

#include <limits>

namespace pdfseal::crypto {

namespace {

Pkcs7Ptr DecodePkcs7(const BytesVector &cms_der) {
  if (cms_der.empty() ||
      cms_der.size() > static_cast<size_t>(std::numeric_limits<long>::max())) {
    throw CryptoError("[ParseCmsSignature] empty signature");
  }
  const unsigned char *ptr = cms_der.data();
  Pkcs7Ptr p7(d2i_PKCS7(nullptr, &ptr, static_cast<long>(cms_der.size())));
  if (!p7) {
    throw CryptoError("[ParseCmsSignature] can't decode CMS " +
                      OpenSslLastError());
  }
  if (PKCS7_type_is_signed(p7.get()) == 0) {
    throw CryptoError("[ParseCmsSignature] not a SignedData");
  }
  return p7;
}

}  // namespace

CmsSignatureInfo ParseCmsSignature(const BytesVector &cms_der) {
  const std::string func_name = "[ParseCmsSignature] ";
  const Pkcs7Ptr p7 = DecodePkcs7(cms_der);
  STACK_OF(X509) *signers =
    PKCS7_get0_signers(p7.get(), nullptr, 0);
  if (signers == nullptr || sk_X509_num(signers) != 1) {
    if (signers != nullptr) {
      sk_X509_free(signers);
    }
    throw CryptoError(func_name + "expected exactly one signer " +
                      OpenSslLastError());
  }
  X509 *signer = sk_X509_value(signers, 0);
  // the stack doesn't own its certificates
  sk_X509_free(signers);
  if (X509_up_ref(signer) != 1) {
    throw CryptoError(func_name + "X509_up_ref failed");
  }
  CmsSignatureInfo res{Certificate(X509Ptr(signer)), {}, std::nullopt,
                       std::nullopt};

  STACK_OF(X509) *certs = p7->d.sign->cert;
  for (int i = 0; certs != nullptr && i < sk_X509_num(certs); ++i) {
    X509 *cert = sk_X509_value(certs, i);
    if (X509_up_ref(cert) == 1) {
      res.certs.emplace_back(X509Ptr(cert));
    }
  }

  STACK_OF(PKCS7_SIGNER_INFO) *infos = PKCS7_get_signer_info(p7.get());
  if (infos == nullptr || sk_PKCS7_SIGNER_INFO_num(infos) != 1) {
    throw CryptoError(func_name + "expected exactly one SignerInfo");
  }
  PKCS7_SIGNER_INFO *signer_info = sk_PKCS7_SIGNER_INFO_value(infos, 0);
  ASN1_TYPE *token =
    PKCS7_get_attribute(signer_info, NID_id_smime_aa_timeStampToken);
  if (token != nullptr && token->type == V_ASN1_SEQUENCE &&
      token->value.sequence != nullptr) {
    const ASN1_STRING *seq = token->value.sequence;
    const unsigned char *data = ASN1_STRING_get0_data(seq);
    res.timestamp_token = BytesVector(data, data + ASN1_STRING_length(seq));
  }
  ASN1_TYPE *signing_time =
    PKCS7_get_signed_attribute(signer_info, NID_pkcs9_signingTime);
  if (signing_time != nullptr && (signing_time->type == V_ASN1_UTCTIME ||
                                  signing_time->type == V_ASN1_GENERALIZEDTIME)) {
    res.signing_time = std::chrono::system_clock::from_time_t(
      Asn1TimeToTimeT(signing_time->value.utctime));
  }
  return res;
}

bool VerifyDetachedCms(const BytesVector &cms_der,
                       const BytesVector &data) noexcept {
  try {
    const Pkcs7Ptr p7 = DecodePkcs7(cms_der);
    const BioPtr data_bio(
      BIO_new_mem_buf(data.data(), static_cast<int>(data.size())));
    if (!data_bio) {
      return false;
    }
    const int res = PKCS7_verify(p7.get(), nullptr, nullptr, data_bio.get(),
                                 nullptr, PKCS7_NOVERIFY | PKCS7_BINARY);
    ERR_clear_error();
    return res == 1;
  } catch (const std::exception &) {
    ERR_clear_error();
    return false;
  }
}

}  // namespace pdfseal::crypto
