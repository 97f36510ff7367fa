/* File: cert_common_info.cpp
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

#include "cert_common_info.hpp"

#include "certificate.hpp"
#include "hash_utils.hpp"
#include "utils.hpp"

namespace pdfseal::crypto {

namespace {

std::optional<std::string> CommonName(const X509_NAME *name) {
  const int index = X509_NAME_get_index_by_NID(name, NID_commonName, -1);
  if (index < 0) {
    return std::nullopt;
  }
  unsigned char *utf8 = nullptr;
  const int len = ASN1_STRING_to_UTF8(
    &utf8, X509_NAME_ENTRY_get_data(X509_NAME_get_entry(name, index)));
  if (len < 0 || utf8 == nullptr) {
    return std::nullopt;
  }
  std::string res(reinterpret_cast<char *>(utf8), len);  // NOLINT
  OPENSSL_free(utf8);
  return res;
}

}  // namespace

CertCommonInfo::CertCommonInfo(const X509 *cert) {
  if (cert == nullptr) {
    throw CryptoError("[CertCommonInfo] null certificate");
  }
  version = X509_get_version(cert) + 1;
  const BignumPtr bn(
    ASN1_INTEGER_to_BN(X509_get0_serialNumber(cert), nullptr));
  if (bn) {
    serial.resize(BN_num_bytes(bn.get()));
    BN_bn2bin(bn.get(), serial.data());
  }
  const char *algo_name = OBJ_nid2ln(X509_get_signature_nid(cert));
  sig_algo = algo_name != nullptr ? algo_name : "unknown";
  issuer = NameToString(X509_get_issuer_name(cert));
  issuer_common_name =
    CommonName(X509_get_issuer_name(cert)).value_or(std::string());
  subject = NameToString(X509_get_subject_name(cert));
  subj_common_name =
    CommonName(X509_get_subject_name(cert)).value_or(std::string());
  not_before = Asn1TimeToTimeT(X509_get0_notBefore(cert));
  not_after = Asn1TimeToTimeT(X509_get0_notAfter(cert));
  const EVP_PKEY *pub_key = X509_get0_pubkey(cert);
  if (pub_key != nullptr) {
    const char *key_algo = OBJ_nid2ln(EVP_PKEY_get_base_id(pub_key));
    pub_key_algo = key_algo != nullptr ? key_algo : "unknown";
  }
  fingerprint_sha256 =
    Sha256Hex(ToDer<X509>(cert, i2d_X509));
  email = ExtractEmail(cert);
}

json::object CertCommonInfo::ToJson() const noexcept {
  json::object res;
  res["version"] = version;
  res["serial"] = VecBytesStringRepresentation(serial);
  res["signature_algo"] = sig_algo;
  res["issuer"] = issuer;
  res["issuer_common_name"] = issuer_common_name;
  res["subject"] = subject;
  res["subject_common_name"] = subj_common_name;
  if (email.has_value()) {
    res["email"] = email.value();
  }
  res["not_before"] = not_before;
  res["not_before_readable"] = TimeTToString(not_before);
  res["not_after"] = not_after;
  res["not_after_readable"] = TimeTToString(not_after);
  res["public_key_algo"] = pub_key_algo;
  res["fingerprint_sha256"] = fingerprint_sha256;
  return res;
}

}  // namespace pdfseal::crypto
