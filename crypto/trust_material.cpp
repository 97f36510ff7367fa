/* File: trust_material.cpp
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

#include "trust_material.hpp"

#include <openssl/pem.h>

#include <algorithm>
#include <filesystem>
#include <utility>

#include "logger_utils.hpp"

namespace pdfseal::crypto {

namespace {

void CheckKeyMatch(const SigningIdentity &identity, const std::string &what) {
  if (!identity.key) {
    throw TrustMaterialError("[TrustMaterial] no private key for " + what);
  }
  if (X509_check_private_key(identity.cert.Get(), identity.key.get()) != 1) {
    throw TrustMaterialError("[TrustMaterial] private key doesn't match the " +
                             what + " certificate " + OpenSslLastError());
  }
}

bool FilePresent(const std::string &path) {
  return !path.empty() && std::filesystem::exists(path);
}

}  // namespace

SigningIdentity LoadPkcs12Identity(const std::string &path,
                                   const std::string &passphrase) {
  const std::string func_name = "[LoadPkcs12Identity] ";
  if (!FilePresent(path)) {
    throw TrustMaterialError(func_name + "PKCS#12 file not found " + path);
  }
  if (passphrase.empty()) {
    throw TrustMaterialError(func_name + "empty passphrase for " + path);
  }
  const BioPtr bio(BIO_new_file(path.c_str(), "rb"));
  if (!bio) {
    throw TrustMaterialError(func_name + "can't open " + path);
  }
  const Pkcs12Ptr p12(d2i_PKCS12_bio(bio.get(), nullptr));
  if (!p12) {
    throw TrustMaterialError(func_name + "can't decode " + path + " " +
                             OpenSslLastError());
  }
  EVP_PKEY *raw_key = nullptr;
  X509 *raw_cert = nullptr;
  STACK_OF(X509) *raw_ca = nullptr;
  if (PKCS12_parse(p12.get(), passphrase.c_str(), &raw_key, &raw_cert,
                   &raw_ca) != 1) {
    throw TrustMaterialError(func_name + "can't parse " + path +
                             " (wrong passphrase?) " + OpenSslLastError());
  }
  EvpPkeyPtr key(raw_key);
  X509Ptr cert(raw_cert);
  const X509StackPtr ca_stack(raw_ca);
  if (!cert || !key) {
    throw TrustMaterialError(func_name + "no certificate or key in " + path);
  }
  std::vector<Certificate> chain;
  for (int i = 0; ca_stack && i < sk_X509_num(ca_stack.get()); ++i) {
    X509 *ca_cert = sk_X509_value(ca_stack.get(), i);
    if (X509_up_ref(ca_cert) == 1) {
      chain.emplace_back(X509Ptr(ca_cert));
    }
  }
  return SigningIdentity{Certificate(std::move(cert)), std::move(key),
                         std::move(chain)};
}

SigningIdentity LoadPemIdentity(const std::string &cert_path,
                                const std::string &key_path,
                                const std::string &passphrase) {
  const std::string func_name = "[LoadPemIdentity] ";
  if (!FilePresent(cert_path)) {
    throw TrustMaterialError(func_name + "certificate not found " + cert_path);
  }
  if (!FilePresent(key_path)) {
    throw TrustMaterialError(func_name + "private key not found " + key_path);
  }
  if (passphrase.empty()) {
    throw TrustMaterialError(func_name + "empty passphrase for " + key_path);
  }
  std::optional<Certificate> cert;
  try {
    cert = Certificate::FromPemFile(cert_path);
  } catch (const CryptoError &ex) {
    throw TrustMaterialError(func_name + ex.what());
  }
  const BioPtr bio(BIO_new_file(key_path.c_str(), "r"));
  if (!bio) {
    throw TrustMaterialError(func_name + "can't open " + key_path);
  }
  EvpPkeyPtr key(PEM_read_bio_PrivateKey(
    bio.get(), nullptr, nullptr,
    const_cast<char *>(passphrase.c_str())));  // NOLINT
  if (!key) {
    throw TrustMaterialError(func_name + "can't decrypt " + key_path +
                             " (wrong passphrase?) " + OpenSslLastError());
  }
  return SigningIdentity{std::move(cert.value()), std::move(key), {}};
}

TrustMaterial::TrustMaterial(SigningIdentity org,
                             std::optional<SigningIdentity> ca,
                             SigningIdentity tsa, bool allow_self_signed)
  : org_(std::move(org)), ca_(std::move(ca)), tsa_(std::move(tsa)) {
  const std::string func_name = "[TrustMaterial] ";
  CheckKeyMatch(org_, "organisation");
  CheckKeyMatch(tsa_, "TSA");
  if (ca_) {
    CheckKeyMatch(ca_.value(), "CA");
  } else if (!allow_self_signed) {
    throw TrustMaterialError(func_name +
                             "CA is absent and the self-signed fallback is "
                             "disabled");
  }
  // without the extension OpenSSL reports every usage as allowed
  if ((X509_get_extension_flags(tsa_.cert.Get()) & EXFLAG_XKUSAGE) == 0 ||
      (X509_get_extended_key_usage(tsa_.cert.Get()) & XKU_TIMESTAMP) == 0) {
    throw TrustMaterialError(func_name +
                             "TSA certificate has no timeStamping usage");
  }
}

std::shared_ptr<const TrustMaterial> TrustMaterial::Load(
  const TrustConfig &config) {
  const std::string func_name = "[TrustMaterial::Load] ";
  auto logger = logger::InitLog();
  if (config.org_pkcs12.empty()) {
    throw TrustMaterialError(func_name + "organisation identity is not set");
  }
  if (config.tsa_cert.empty() || config.tsa_key.empty()) {
    throw TrustMaterialError(func_name + "TSA identity is not set");
  }
  SigningIdentity org =
    LoadPkcs12Identity(config.org_pkcs12, config.org_passphrase);
  SigningIdentity tsa =
    LoadPemIdentity(config.tsa_cert, config.tsa_key, config.tsa_passphrase);
  std::optional<SigningIdentity> ca;
  if (FilePresent(config.ca_cert) && FilePresent(config.ca_key)) {
    ca = LoadPemIdentity(config.ca_cert, config.ca_key, config.ca_passphrase);
  } else if (config.allow_self_signed_fallback) {
    if (logger) {
      logger->warn(
        "{} internal CA not found, signer certificates will be self-signed",
        func_name);
    }
  } else {
    throw TrustMaterialError(func_name + "internal CA not found " +
                             config.ca_cert);
  }
  auto res = std::make_shared<const TrustMaterial>(
    std::move(org), std::move(ca), std::move(tsa),
    config.allow_self_signed_fallback);
  if (logger) {
    logger->info("{} organisation {} TSA {}", func_name,
                 res->Organisation().cert.SubjectDN(),
                 res->Tsa().cert.SubjectDN());
  }
  return res;
}

std::vector<BytesVector> TrustMaterial::ValidationCertsDer() const {
  std::vector<BytesVector> res;
  auto push_unique = [&res](const Certificate &cert) {
    auto der = cert.GetRawCopy();
    if (std::find(res.cbegin(), res.cend(), der) == res.cend()) {
      res.push_back(std::move(der));
    }
  };
  push_unique(org_.cert);
  std::for_each(org_.chain.cbegin(), org_.chain.cend(), push_unique);
  if (ca_) {
    push_unique(ca_->cert);
  }
  push_unique(tsa_.cert);
  return res;
}

}  // namespace pdfseal::crypto
