/* File: ephemeral_issuer.cpp
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

#include "ephemeral_issuer.hpp"

#include <openssl/rand.h>
#include <openssl/rsa.h>

#include <stdexcept>
#include <utility>

#include "logger_utils.hpp"

namespace pdfseal::crypto {

namespace {

constexpr int kRsaKeyBits = 2048;
constexpr int kSerialBits = 159;
constexpr long kValiditySeconds = 365L * 24 * 60 * 60;
// eIDAS "document signing" extended key usage
constexpr const char *const kDocumentSigningEku = "1.3.6.1.5.5.7.3.36";

void AddNameEntry(X509_NAME *name, const char *field, const std::string &val) {
  if (val.empty()) {
    return;
  }
  if (X509_NAME_add_entry_by_txt(
        name, field, MBSTRING_UTF8,
        reinterpret_cast<const unsigned char *>(val.c_str()),  // NOLINT
        -1, -1, 0) != 1) {
    throw CryptoError(std::string("[EphemeralIssuer] can't set ") + field +
                      " " + OpenSslLastError());
  }
}

void AddExtension(X509 *cert, X509V3_CTX *ctx, int nid,
                  const std::string &value) {
  const X509ExtensionPtr ext(
    X509V3_EXT_conf_nid(nullptr, ctx, nid, value.c_str()));
  if (!ext) {
    throw CryptoError("[EphemeralIssuer] can't create extension " +
                      std::to_string(nid) + " " + OpenSslLastError());
  }
  if (X509_add_ext(cert, ext.get(), -1) != 1) {
    throw CryptoError("[EphemeralIssuer] can't add extension " +
                      OpenSslLastError());
  }
}

void SetRandomSerial(X509 *cert) {
  const BignumPtr bn(BN_new());
  if (!bn || BN_rand(bn.get(), kSerialBits, BN_RAND_TOP_ANY,
                     BN_RAND_BOTTOM_ANY) != 1) {
    throw CryptoError("[EphemeralIssuer] can't generate serial " +
                      OpenSslLastError());
  }
  const Asn1IntegerPtr serial(BN_to_ASN1_INTEGER(bn.get(), nullptr));
  if (!serial || X509_set_serialNumber(cert, serial.get()) != 1) {
    throw CryptoError("[EphemeralIssuer] can't set serial " +
                      OpenSslLastError());
  }
}

}  // namespace

SignerCredential::SignerCredential(Certificate cert, EvpPkeyPtr key,
                                   std::vector<Certificate> chain,
                                   bool self_signed)
  : cert_(std::move(cert)),
    key_(std::move(key)),
    chain_(std::move(chain)),
    self_signed_(self_signed) {}

EvpPkeyPtr SignerCredential::ConsumeKey() {
  if (!key_) {
    throw CryptoError("[SignerCredential] private key was already used");
  }
  return std::move(key_);
}

EphemeralIssuer::EphemeralIssuer(std::shared_ptr<const TrustMaterial> trust)
  : trust_(std::move(trust)) {
  if (!trust_) {
    throw std::invalid_argument("[EphemeralIssuer] trust material is null");
  }
}

SignerCredential EphemeralIssuer::Issue(const SignerIdentity &identity,
                                        const std::string &org_unit) const {
  const std::string func_name = "[EphemeralIssuer::Issue] ";
  if (identity.common_name.empty()) {
    throw std::invalid_argument(func_name + "empty common name");
  }
  if (identity.email.empty() ||
      identity.email.find(',') != std::string::npos ||
      identity.email.find('@') == std::string::npos) {
    throw std::invalid_argument(func_name + "invalid email " + identity.email);
  }
  EvpPkeyPtr key(EVP_RSA_gen(kRsaKeyBits));
  if (!key) {
    throw CryptoError(func_name + "key generation failed " +
                      OpenSslLastError());
  }
  X509Ptr cert(X509_new());
  if (!cert || X509_set_version(cert.get(), 2) != 1) {
    throw CryptoError(func_name + "can't create certificate " +
                      OpenSslLastError());
  }
  SetRandomSerial(cert.get());
  if (X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0) == nullptr ||
      X509_gmtime_adj(X509_getm_notAfter(cert.get()), kValiditySeconds) ==
        nullptr) {
    throw CryptoError(func_name + "can't set validity " + OpenSslLastError());
  }
  X509_NAME *subject = X509_get_subject_name(cert.get());
  AddNameEntry(subject, "O", org_unit);
  AddNameEntry(subject, "CN", identity.common_name);
  AddNameEntry(subject, "emailAddress", identity.email);
  if (X509_set_pubkey(cert.get(), key.get()) != 1) {
    throw CryptoError(func_name + "can't set public key " +
                      OpenSslLastError());
  }

  const SigningIdentity *ca = trust_->Ca();
  X509 *issuer_cert = ca != nullptr ? ca->cert.Get() : cert.get();
  EVP_PKEY *issuer_key = ca != nullptr ? ca->key.get() : key.get();
  if (X509_set_issuer_name(cert.get(), X509_get_subject_name(issuer_cert)) !=
      1) {
    throw CryptoError(func_name + "can't set issuer " + OpenSslLastError());
  }
  X509V3_CTX ctx;
  X509V3_set_ctx_nodb(&ctx);
  X509V3_set_ctx(&ctx, issuer_cert, cert.get(), nullptr, nullptr, 0);
  AddExtension(cert.get(), &ctx, NID_basic_constraints, "critical,CA:FALSE");
  AddExtension(cert.get(), &ctx, NID_key_usage,
               "critical,digitalSignature,nonRepudiation");
  AddExtension(cert.get(), &ctx, NID_ext_key_usage,
               std::string(kDocumentSigningEku) + ",emailProtection");
  AddExtension(cert.get(), &ctx, NID_subject_alt_name,
               "email:" + identity.email);
  AddExtension(cert.get(), &ctx, NID_subject_key_identifier, "hash");
  // self-signed: the issuer key id is taken from the subject key id above
  AddExtension(cert.get(), &ctx, NID_authority_key_identifier,
               "keyid:always");
  if (X509_sign(cert.get(), issuer_key, EVP_sha256()) <= 0) {
    throw CryptoError(func_name + "can't sign certificate " +
                      OpenSslLastError());
  }

  std::vector<Certificate> chain;
  if (ca != nullptr) {
    chain.push_back(ca->cert.Share());
  } else {
    auto logger = logger::InitLog();
    if (logger) {
      logger->warn("{} no internal CA, certificate for {} is self-signed",
                   func_name, identity.email);
    }
  }
  return SignerCredential(Certificate(std::move(cert)), std::move(key),
                          std::move(chain), ca == nullptr);
}

}  // namespace pdfseal::crypto
