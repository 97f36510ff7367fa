/* File: test_material.cpp
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

#include "test_material.hpp"

#include <openssl/pem.h>
#include <openssl/rand.h>

#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

#include "hash_utils.hpp"
#include "openssl_types.hpp"

namespace pdfseal::test {

using crypto::BioPtr;
using crypto::CryptoError;
using crypto::EvpPkeyPtr;
using crypto::OpenSslLastError;
using crypto::X509Ptr;

namespace {

struct KeyAndCert {
  EvpPkeyPtr key;
  X509Ptr cert;
};

void AddExt(X509 *cert, X509V3_CTX *ctx, int nid, const char *value) {
  const crypto::X509ExtensionPtr ext(
    X509V3_EXT_conf_nid(nullptr, ctx, nid, value));
  if (!ext || X509_add_ext(cert, ext.get(), -1) != 1) {
    throw CryptoError("[test] extension failed " + OpenSslLastError());
  }
}

KeyAndCert MakeCert(const std::string &common_name, const KeyAndCert *issuer,
                    bool is_ca, const char *eku) {
  KeyAndCert res{EvpPkeyPtr(EVP_RSA_gen(2048)), X509Ptr(X509_new())};
  if (!res.key || !res.cert) {
    throw CryptoError("[test] key generation failed");
  }
  X509 *cert = res.cert.get();
  X509_set_version(cert, 2);
  const auto serial = crypto::RandomBytes(8);
  const crypto::BignumPtr bn(
    BN_bin2bn(serial.data(), static_cast<int>(serial.size()), nullptr));
  BN_to_ASN1_INTEGER(bn.get(), X509_get_serialNumber(cert));
  X509_gmtime_adj(X509_getm_notBefore(cert), -3600);
  X509_gmtime_adj(X509_getm_notAfter(cert), 10L * 365 * 24 * 3600);
  X509_NAME *name = X509_get_subject_name(cert);
  X509_NAME_add_entry_by_txt(name, "O", MBSTRING_UTF8,
                             reinterpret_cast<const unsigned char *>("Test"),
                             -1, -1, 0);
  X509_NAME_add_entry_by_txt(
    name, "CN", MBSTRING_UTF8,
    reinterpret_cast<const unsigned char *>(common_name.c_str()), -1, -1, 0);
  X509_set_pubkey(cert, res.key.get());
  X509 *issuer_cert = issuer != nullptr ? issuer->cert.get() : cert;
  EVP_PKEY *issuer_key = issuer != nullptr ? issuer->key.get() : res.key.get();
  X509_set_issuer_name(cert, X509_get_subject_name(issuer_cert));
  X509V3_CTX ctx;
  X509V3_set_ctx_nodb(&ctx);
  X509V3_set_ctx(&ctx, issuer_cert, cert, nullptr, nullptr, 0);
  if (is_ca) {
    AddExt(cert, &ctx, NID_basic_constraints, "critical,CA:TRUE");
    AddExt(cert, &ctx, NID_key_usage, "critical,keyCertSign,cRLSign");
  } else {
    AddExt(cert, &ctx, NID_basic_constraints, "critical,CA:FALSE");
    AddExt(cert, &ctx, NID_key_usage,
           "critical,digitalSignature,nonRepudiation");
  }
  if (eku != nullptr) {
    AddExt(cert, &ctx, NID_ext_key_usage, eku);
  }
  AddExt(cert, &ctx, NID_subject_key_identifier, "hash");
  AddExt(cert, &ctx, NID_authority_key_identifier, "keyid:always");
  if (X509_sign(cert, issuer_key, EVP_sha256()) <= 0) {
    throw CryptoError("[test] X509_sign failed " + OpenSslLastError());
  }
  return res;
}

void WritePem(const KeyAndCert &pair, const std::string &cert_path,
              const std::string &key_path) {
  const BioPtr cert_bio(BIO_new_file(cert_path.c_str(), "w"));
  const BioPtr key_bio(BIO_new_file(key_path.c_str(), "w"));
  if (!cert_bio || !key_bio ||
      PEM_write_bio_X509(cert_bio.get(), pair.cert.get()) != 1 ||
      PEM_write_bio_PrivateKey(
        key_bio.get(), pair.key.get(), EVP_aes_256_cbc(), nullptr, 0, nullptr,
        const_cast<char *>(kTestPassphrase)) != 1) {  // NOLINT
    throw CryptoError("[test] can't write PEM files " + OpenSslLastError());
  }
}

void WritePkcs12(const KeyAndCert &pair, const KeyAndCert &ca,
                 const std::string &path) {
  STACK_OF(X509) *chain = sk_X509_new_null();
  sk_X509_push(chain, ca.cert.get());
  crypto::Pkcs12Ptr p12(PKCS12_create(kTestPassphrase, "organisation",
                                      pair.key.get(), pair.cert.get(), chain,
                                      0, 0, 0, 0, 0));
  // the stack doesn't own the CA certificate
  sk_X509_free(chain);
  const BioPtr bio(BIO_new_file(path.c_str(), "wb"));
  if (!p12 || !bio || i2d_PKCS12_bio(bio.get(), p12.get()) != 1) {
    throw CryptoError("[test] can't write PKCS#12 " + OpenSslLastError());
  }
}

}  // namespace

std::string MakeTempDir(const std::string &prefix) {
  const auto suffix = VecBytesStringRepresentation(crypto::RandomBytes(6));
  const auto path =
    std::filesystem::temp_directory_path() / (prefix + "_" + suffix);
  std::filesystem::create_directories(path);
  return path.string();
}

TrustConfig WriteTestPki(const std::string &dir, bool with_ca) {
  const KeyAndCert ca = MakeCert("Test Internal CA", nullptr, true, nullptr);
  const KeyAndCert tsa =
    MakeCert("Test TSA", &ca, false, "critical,timeStamping");
  const KeyAndCert org = MakeCert("Test Organisation", &ca, false, nullptr);
  TrustConfig res;
  res.org_pkcs12 = dir + "/org.p12";
  res.org_passphrase = kTestPassphrase;
  res.tsa_cert = dir + "/tsa.pem";
  res.tsa_key = dir + "/tsa.key";
  res.tsa_passphrase = kTestPassphrase;
  WritePkcs12(org, ca, res.org_pkcs12);
  WritePem(tsa, res.tsa_cert, res.tsa_key);
  if (with_ca) {
    res.ca_cert = dir + "/ca.pem";
    res.ca_key = dir + "/ca.key";
    res.ca_passphrase = kTestPassphrase;
    WritePem(ca, res.ca_cert, res.ca_key);
  }
  return res;
}

std::shared_ptr<const crypto::TrustMaterial> MakeTestTrust(bool with_ca) {
  const std::string dir = MakeTempDir("pdfseal_pki");
  const TrustConfig config = WriteTestPki(dir, with_ca);
  return crypto::TrustMaterial::Load(config);
}

}  // namespace pdfseal::test
