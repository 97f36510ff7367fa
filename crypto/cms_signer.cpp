/* File: cms_signer.cpp
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

#include "cms_signer.hpp"

#include <openssl/ess.h>

#include <limits>

namespace pdfseal::crypto {

namespace {

void AddSigningCertV2(PKCS7_SIGNER_INFO *signer_info, X509 *cert) {
  const std::string func_name = "[SignDetachedCms] ";
  ESS_SIGNING_CERT_V2 *ess_raw =
    OSSL_ESS_signing_cert_v2_new_init(EVP_sha256(), cert, nullptr, 0);
  if (ess_raw == nullptr) {
    throw CryptoError(func_name + "can't create ESS signing certificate " +
                      OpenSslLastError());
  }
  const std::unique_ptr<
    ESS_SIGNING_CERT_V2,
    OsslDeleter<ESS_SIGNING_CERT_V2, ESS_SIGNING_CERT_V2_free>>
    ess(ess_raw);
  const BytesVector der = ToDer<ESS_SIGNING_CERT_V2>(ess.get(),
                                                     i2d_ESS_SIGNING_CERT_V2);
  Asn1StringPtr seq(ASN1_STRING_new());
  if (!seq ||
      ASN1_STRING_set(seq.get(), der.data(), static_cast<int>(der.size())) !=
        1) {
    throw CryptoError(func_name + "can't encode ESS attribute");
  }
  // the attribute takes ownership on success
  if (PKCS7_add_signed_attribute(signer_info,
                                 NID_id_smime_aa_signingCertificateV2,
                                 V_ASN1_SEQUENCE, seq.get()) != 1) {
    throw CryptoError(func_name + "can't add ESS attribute " +
                      OpenSslLastError());
  }
  static_cast<void>(seq.release());
}

void AddTimestampToken(PKCS7_SIGNER_INFO *signer_info,
                       const TimestampFunc &timestamper) {
  const std::string func_name = "[SignDetachedCms] ";
  const ASN1_OCTET_STRING *sig_value = signer_info->enc_digest;
  if (sig_value == nullptr || sig_value->length <= 0) {
    throw CryptoError(func_name + "empty signature value");
  }
  const BytesVector sig_bytes(sig_value->data,
                              sig_value->data + sig_value->length);
  const BytesVector token = timestamper(sig_bytes);
  if (token.empty() ||
      token.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
    throw CryptoError(func_name + "invalid timestamp token size");
  }
  Asn1StringPtr seq(ASN1_STRING_new());
  if (!seq || ASN1_STRING_set(seq.get(), token.data(),
                              static_cast<int>(token.size())) != 1) {
    throw CryptoError(func_name + "can't encode timestamp token");
  }
  if (PKCS7_add_attribute(signer_info, NID_id_smime_aa_timeStampToken,
                          V_ASN1_SEQUENCE, seq.get()) != 1) {
    throw CryptoError(func_name + "can't add timestamp token " +
                      OpenSslLastError());
  }
  static_cast<void>(seq.release());
}

}  // namespace

BytesVector SignDetachedCms(const BytesVector &data,
                            const CmsSignParams &params) {
  const std::string func_name = "[SignDetachedCms] ";
  if (params.cert == nullptr || params.key == nullptr) {
    throw CryptoError(func_name + "no signer certificate or key");
  }
  if (data.empty() ||
      data.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
    throw CryptoError(func_name + "invalid data size");
  }
  constexpr int sign_flags =
    PKCS7_DETACHED | PKCS7_BINARY | PKCS7_NOSMIMECAP | PKCS7_PARTIAL;
  const Pkcs7Ptr p7(
    PKCS7_sign(nullptr, nullptr, nullptr, nullptr, sign_flags));
  if (!p7) {
    throw CryptoError(func_name + "PKCS7_sign failed " + OpenSslLastError());
  }
  // default digest is SHA-1, add the signer explicitly
  PKCS7_SIGNER_INFO *signer_info = PKCS7_sign_add_signer(
    p7.get(), params.cert->Get(), params.key, EVP_sha256(), sign_flags);
  if (signer_info == nullptr) {
    throw CryptoError(func_name + "can't add signer " + OpenSslLastError());
  }
  AddSigningCertV2(signer_info, params.cert->Get());
  if (params.chain != nullptr) {
    for (const auto &cert : *params.chain) {
      if (PKCS7_add_certificate(p7.get(), cert.Get()) != 1) {
        throw CryptoError(func_name + "can't add chain certificate " +
                          OpenSslLastError());
      }
    }
  }
  {
    const BioPtr p7bio(PKCS7_dataInit(p7.get(), nullptr));
    if (!p7bio ||
        BIO_write(p7bio.get(), data.data(), static_cast<int>(data.size())) !=
          static_cast<int>(data.size()) ||
        BIO_flush(p7bio.get()) != 1 ||
        PKCS7_dataFinal(p7.get(), p7bio.get()) != 1) {
      throw CryptoError(func_name + "signing failed " + OpenSslLastError());
    }
  }
  if (params.timestamper) {
    AddTimestampToken(signer_info, params.timestamper);
  }
  return ToDer<PKCS7>(p7.get(), i2d_PKCS7);
}

}  // namespace pdfseal::crypto
