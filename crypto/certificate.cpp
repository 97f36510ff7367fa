/* File: certificate.cpp
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

#include "certificate.hpp"

#include <openssl/pem.h>

#include <filesystem>
#include <limits>
#include <utility>

#include "hash_utils.hpp"

namespace pdfseal::crypto {

std::string NameToString(const X509_NAME *name) {
  if (name == nullptr) {
    return {};
  }
  const BioPtr bio(BIO_new(BIO_s_mem()));
  if (!bio ||
      X509_NAME_print_ex(bio.get(), name, 0,
                         XN_FLAG_RFC2253 & ~ASN1_STRFLGS_ESC_MSB) < 0) {
    throw CryptoError("[NameToString] print name failed " +
                      OpenSslLastError());
  }
  char *data = nullptr;
  const long len = BIO_get_mem_data(bio.get(), &data);  // NOLINT
  if (len <= 0 || data == nullptr) {
    return {};
  }
  return {data, static_cast<size_t>(len)};
}

time_t Asn1TimeToTimeT(const ASN1_TIME *asn_time) {
  std::tm tm_info{};
  if (asn_time == nullptr || ASN1_TIME_to_tm(asn_time, &tm_info) != 1) {
    throw CryptoError("[Asn1TimeToTimeT] invalid time " + OpenSslLastError());
  }
  return timegm(&tm_info);
}

std::optional<std::string> ExtractEmail(const X509 *cert) {
  const X509_NAME *name = X509_get_subject_name(cert);
  const int index = X509_NAME_get_index_by_NID(name, NID_pkcs9_emailAddress, -1);
  if (index >= 0) {
    const ASN1_STRING *value =
      X509_NAME_ENTRY_get_data(X509_NAME_get_entry(name, index));
    return std::string(
      reinterpret_cast<const char *>(ASN1_STRING_get0_data(value)),  // NOLINT
      ASN1_STRING_length(value));
  }
  auto *names = static_cast<GENERAL_NAMES *>(
    X509_get_ext_d2i(cert, NID_subject_alt_name, nullptr, nullptr));
  if (names == nullptr) {
    return std::nullopt;
  }
  std::optional<std::string> res;
  for (int i = 0; i < sk_GENERAL_NAME_num(names); ++i) {
    const GENERAL_NAME *gen_name = sk_GENERAL_NAME_value(names, i);
    if (gen_name->type == GEN_EMAIL) {
      const ASN1_IA5STRING *ia5 = gen_name->d.rfc822Name;
      res = std::string(
        reinterpret_cast<const char *>(ASN1_STRING_get0_data(ia5)),  // NOLINT
        ASN1_STRING_length(ia5));
      break;
    }
  }
  GENERAL_NAMES_free(names);
  return res;
}

Certificate::Certificate(X509Ptr cert) : cert_(std::move(cert)) {
  if (!cert_) {
    throw CryptoError("[Certificate] null certificate");
  }
}

Certificate Certificate::FromDer(const BytesVector &der) {
  const std::string func_name = "[Certificate::FromDer] ";
  if (der.empty() ||
      der.size() > static_cast<size_t>(std::numeric_limits<long>::max())) {  // NOLINT
    throw CryptoError(func_name + "invalid certificate size");
  }
  const unsigned char *ptr = der.data();
  X509Ptr cert(d2i_X509(nullptr, &ptr, static_cast<long>(der.size())));  // NOLINT
  if (!cert) {
    throw CryptoError(func_name + "decode failed " + OpenSslLastError());
  }
  return Certificate(std::move(cert));
}

Certificate Certificate::FromPem(const std::string &pem) {
  const std::string func_name = "[Certificate::FromPem] ";
  const BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
  if (!bio) {
    throw CryptoError(func_name + "BIO_new_mem_buf failed");
  }
  X509Ptr cert(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
  if (!cert) {
    throw CryptoError(func_name + "decode failed " + OpenSslLastError());
  }
  return Certificate(std::move(cert));
}

Certificate Certificate::FromPemFile(const std::string &path) {
  const std::string func_name = "[Certificate::FromPemFile] ";
  if (path.empty() || !std::filesystem::exists(path)) {
    throw CryptoError(func_name + "file not found " + path);
  }
  const BioPtr bio(BIO_new_file(path.c_str(), "r"));
  if (!bio) {
    throw CryptoError(func_name + "can't open " + path);
  }
  X509Ptr cert(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
  if (!cert) {
    throw CryptoError(func_name + "decode failed " + path + " " +
                      OpenSslLastError());
  }
  return Certificate(std::move(cert));
}

Certificate Certificate::Share() const {
  if (X509_up_ref(cert_.get()) != 1) {
    throw CryptoError("[Certificate::Share] X509_up_ref failed");
  }
  return Certificate(X509Ptr(cert_.get()));
}

BytesVector Certificate::GetRawCopy() const {
  return ToDer<X509>(cert_.get(), i2d_X509);
}

std::string Certificate::ToPem() const {
  const BioPtr bio(BIO_new(BIO_s_mem()));
  if (!bio || PEM_write_bio_X509(bio.get(), cert_.get()) != 1) {
    throw CryptoError("[Certificate::ToPem] " + OpenSslLastError());
  }
  char *data = nullptr;
  const long len = BIO_get_mem_data(bio.get(), &data);  // NOLINT
  return {data, static_cast<size_t>(len)};
}

std::string Certificate::Fingerprint() const {
  return Sha256Hex(GetRawCopy());
}

BytesVector Certificate::Serial() const {
  const ASN1_INTEGER *serial = X509_get0_serialNumber(cert_.get());
  const BignumPtr bn(ASN1_INTEGER_to_BN(serial, nullptr));
  if (!bn) {
    return {};
  }
  BytesVector res(BN_num_bytes(bn.get()), 0x00);
  BN_bn2bin(bn.get(), res.data());
  return res;
}

std::string Certificate::SubjectDN() const {
  return NameToString(X509_get_subject_name(cert_.get()));
}

std::string Certificate::IssuerDN() const {
  return NameToString(X509_get_issuer_name(cert_.get()));
}

std::optional<std::string> Certificate::SubjectAttribute(int nid) const {
  const X509_NAME *name = X509_get_subject_name(cert_.get());
  const int index = X509_NAME_get_index_by_NID(name, nid, -1);
  if (index < 0) {
    return std::nullopt;
  }
  const X509_NAME_ENTRY *entry = X509_NAME_get_entry(name, index);
  const ASN1_STRING *value = X509_NAME_ENTRY_get_data(entry);
  unsigned char *utf8 = nullptr;
  const int len = ASN1_STRING_to_UTF8(&utf8, value);
  if (len < 0 || utf8 == nullptr) {
    return std::nullopt;
  }
  std::string res(reinterpret_cast<char *>(utf8), len);  // NOLINT
  OPENSSL_free(utf8);
  return res;
}

std::optional<std::string> Certificate::Email() const {
  return ExtractEmail(cert_.get());
}

TimePoint Certificate::NotBefore() const {
  return std::chrono::system_clock::from_time_t(
    Asn1TimeToTimeT(X509_get0_notBefore(cert_.get())));
}

TimePoint Certificate::NotAfter() const {
  return std::chrono::system_clock::from_time_t(
    Asn1TimeToTimeT(X509_get0_notAfter(cert_.get())));
}

bool Certificate::IsTimeValid(TimePoint time_point) const noexcept {
  time_t check_time = std::chrono::system_clock::to_time_t(time_point);
  return X509_cmp_time(X509_get0_notBefore(cert_.get()), &check_time) < 0 &&
         X509_cmp_time(X509_get0_notAfter(cert_.get()), &check_time) > 0;
}

bool Certificate::IsSelfSigned() const noexcept {
  return X509_check_issued(cert_.get(), cert_.get()) == X509_V_OK;
}

}  // namespace pdfseal::crypto
