/* File: test_crypto.cpp
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

#include <openssl/x509v3.h>

#include <filesystem>
#include <stdexcept>
#include <string>
#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "cms_signer.hpp"
#include "ephemeral_issuer.hpp"
#include "hash_utils.hpp"
#include "signature_info.hpp"
#include "test_material.hpp"
#include "trust_material.hpp"

using namespace pdfseal;
using namespace pdfseal::crypto;

namespace {

bool HasExtKeyUsage(const Certificate &cert, int nid) {
  auto *usage = static_cast<EXTENDED_KEY_USAGE *>(
    X509_get_ext_d2i(cert.Get(), NID_ext_key_usage, nullptr, nullptr));
  if (usage == nullptr) {
    return false;
  }
  bool found = false;
  for (int i = 0; i < sk_ASN1_OBJECT_num(usage); ++i) {
    if (OBJ_obj2nid(sk_ASN1_OBJECT_value(usage, i)) == nid) {
      found = true;
    }
  }
  EXTENDED_KEY_USAGE_free(usage);
  return found;
}

}  // namespace

TEST_CASE("Hash") {
  const BytesVector abc{'a', 'b', 'c'};
  REQUIRE(Sha256Hex(abc) ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  REQUIRE(Sha256(abc).size() == 32);
  REQUIRE(RandomBytes(16).size() == 16);
  REQUIRE(RandomBytes(16) != RandomBytes(16));
  REQUIRE(HmacSha256Hex("key", "data").size() == 64);
  REQUIRE(HmacSha256Hex("key", "data") != HmacSha256Hex("key2", "data"));
}

TEST_CASE("TrustMaterial") {
  const std::string dir = test::MakeTempDir("pdfseal_trust");
  SECTION("load_full") {
    auto conf = test::WriteTestPki(dir);
    auto trust = TrustMaterial::Load(conf);
    REQUIRE(trust);
    REQUIRE(trust->Ca() != nullptr);
    REQUIRE_FALSE(trust->SelfSignedFallback());
    REQUIRE(trust->Organisation().cert.SubjectAttribute(NID_commonName) ==
            "Test Organisation");
    REQUIRE(trust->Organisation().chain.size() == 1);
    // org, CA (deduplicated with the chain), TSA
    REQUIRE(trust->ValidationCertsDer().size() == 3);
  }
  SECTION("ca_absent_fallback") {
    auto conf = test::WriteTestPki(dir, false);
    auto trust = TrustMaterial::Load(conf);
    REQUIRE(trust->Ca() == nullptr);
    REQUIRE(trust->SelfSignedFallback());
  }
  SECTION("ca_absent_no_fallback") {
    auto conf = test::WriteTestPki(dir, false);
    conf.allow_self_signed_fallback = false;
    REQUIRE_THROWS_AS(TrustMaterial::Load(conf), TrustMaterialError);
  }
  SECTION("wrong_passphrase") {
    auto conf = test::WriteTestPki(dir);
    conf.org_passphrase = "wrong";
    REQUIRE_THROWS_AS(TrustMaterial::Load(conf), TrustMaterialError);
  }
  SECTION("empty_passphrase") {
    auto conf = test::WriteTestPki(dir);
    conf.tsa_passphrase.clear();
    REQUIRE_THROWS_AS(TrustMaterial::Load(conf), TrustMaterialError);
  }
  SECTION("missing_file") {
    auto conf = test::WriteTestPki(dir);
    conf.org_pkcs12 = dir + "/nothing.p12";
    REQUIRE_THROWS_AS(TrustMaterial::Load(conf), TrustMaterialError);
  }
  SECTION("tsa_without_timestamping") {
    auto conf = test::WriteTestPki(dir);
    // CA certificate has no timeStamping usage
    conf.tsa_cert = conf.ca_cert;
    conf.tsa_key = conf.ca_key;
    REQUIRE_THROWS_AS(TrustMaterial::Load(conf), TrustMaterialError);
  }
  SECTION("key_mismatch") {
    auto conf = test::WriteTestPki(dir);
    conf.ca_key = conf.tsa_key;
    REQUIRE_THROWS_AS(TrustMaterial::Load(conf), TrustMaterialError);
  }
  std::filesystem::remove_all(dir);
}

TEST_CASE("EphemeralIssuer") {
  SECTION("issued_by_ca") {
    auto trust = test::MakeTestTrust();
    const EphemeralIssuer issuer(trust);
    auto cred =
      issuer.Issue({"Alice Martin", "alice@example.com"}, "pdfseal user");
    REQUIRE_FALSE(cred.SelfSigned());
    REQUIRE(cred.Chain().size() == 1);
    const auto &cert = cred.Cert();
    REQUIRE(cert.SubjectAttribute(NID_commonName) == "Alice Martin");
    REQUIRE(cert.SubjectAttribute(NID_organizationName) == "pdfseal user");
    REQUIRE(cert.Email() == "alice@example.com");
    REQUIRE(cert.IssuerDN() == trust->Ca()->cert.SubjectDN());
    REQUIRE_FALSE(cert.IsSelfSigned());
    REQUIRE(X509_verify(cert.Get(),
                        X509_get0_pubkey(trust->Ca()->cert.Get())) == 1);
    REQUIRE(cert.IsTimeValid(std::chrono::system_clock::now()));
    REQUIRE_FALSE(cert.IsTimeValid(std::chrono::system_clock::now() +
                                   std::chrono::hours(24 * 400)));
    REQUIRE(HasExtKeyUsage(cert, NID_email_protect));
    REQUIRE((X509_get_key_usage(cert.Get()) & KU_NON_REPUDIATION) != 0);
    REQUIRE((X509_get_key_usage(cert.Get()) & KU_DIGITAL_SIGNATURE) != 0);
    REQUIRE(X509_check_ca(cert.Get()) == 0);
    // serials are random
    auto other =
      issuer.Issue({"Alice Martin", "alice@example.com"}, "pdfseal user");
    REQUIRE(other.Cert().Serial() != cert.Serial());
  }
  SECTION("self_signed_fallback") {
    const EphemeralIssuer issuer(test::MakeTestTrust(false));
    auto cred = issuer.Issue({"Bob", "bob@example.com"}, "pdfseal user");
    REQUIRE(cred.SelfSigned());
    REQUIRE(cred.Chain().empty());
    REQUIRE(cred.Cert().IsSelfSigned());
  }
  SECTION("key_used_once") {
    const EphemeralIssuer issuer(test::MakeTestTrust());
    auto cred = issuer.Issue({"Bob", "bob@example.com"}, "pdfseal user");
    REQUIRE(cred.KeyAvailable());
    auto key = cred.ConsumeKey();
    REQUIRE(key);
    REQUIRE_FALSE(cred.KeyAvailable());
    REQUIRE_THROWS_AS(cred.ConsumeKey(), CryptoError);
  }
  SECTION("invalid_identity") {
    const EphemeralIssuer issuer(test::MakeTestTrust());
    REQUIRE_THROWS_AS(issuer.Issue({"", "bob@example.com"}, "x"),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(issuer.Issue({"Bob", "bob,@example.com"}, "x"),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(issuer.Issue({"Bob", "no-at-sign"}, "x"),
                      std::invalid_argument);
  }
}

TEST_CASE("CmsSigner") {
  auto trust = test::MakeTestTrust();
  const auto &org = trust->Organisation();
  const BytesVector data{'%', 'P', 'D', 'F', '-', '1', '.', '7'};

  SECTION("sign_and_parse") {
    CmsSignParams params;
    params.cert = &org.cert;
    params.key = org.key.get();
    params.chain = &org.chain;
    auto cms = SignDetachedCms(data, params);
    REQUIRE_FALSE(cms.empty());
    REQUIRE(VerifyDetachedCms(cms, data));
    REQUIRE_FALSE(VerifyDetachedCms(cms, BytesVector{'x'}));
    auto info = ParseCmsSignature(cms);
    REQUIRE(info.signer_cert.Fingerprint() == org.cert.Fingerprint());
    REQUIRE(info.certs.size() == 2);
    REQUIRE_FALSE(info.timestamp_token.has_value());
    REQUIRE(info.signing_time.has_value());
    // zero padded like in the /Contents placeholder
    cms.resize(cms.size() + 100, 0);
    REQUIRE(ParseCmsSignature(cms).signer_cert.Fingerprint() ==
            org.cert.Fingerprint());
  }
  SECTION("timestamp_over_signature_value") {
    BytesVector stamped_value;
    CmsSignParams params;
    params.cert = &org.cert;
    params.key = org.key.get();
    params.timestamper = [&stamped_value](const BytesVector &sig_value) {
      stamped_value = sig_value;
      return BytesVector{0x30, 0x03, 0x02, 0x01, 0x01};
    };
    auto cms = SignDetachedCms(data, params);
    // RSA-2048 signature value
    REQUIRE(stamped_value.size() == 256);
    auto info = ParseCmsSignature(cms);
    REQUIRE(info.timestamp_token.has_value());
    REQUIRE(info.timestamp_token.value() ==
            BytesVector{0x30, 0x03, 0x02, 0x01, 0x01});
    REQUIRE(VerifyDetachedCms(cms, data));
  }
  SECTION("timestamper_failure_propagates") {
    CmsSignParams params;
    params.cert = &org.cert;
    params.key = org.key.get();
    params.timestamper = [](const BytesVector &) -> BytesVector {
      throw std::runtime_error("tsa down");
    };
    REQUIRE_THROWS_AS(SignDetachedCms(data, params), std::runtime_error);
  }
  SECTION("errors") {
    CmsSignParams params;
    REQUIRE_THROWS_AS(SignDetachedCms(data, params), CryptoError);
    params.cert = &org.cert;
    params.key = org.key.get();
    REQUIRE_THROWS_AS(SignDetachedCms(BytesVector{}, params), CryptoError);
    REQUIRE_THROWS_AS(ParseCmsSignature(BytesVector{1, 2, 3}), CryptoError);
    REQUIRE_FALSE(VerifyDetachedCms(BytesVector{1, 2, 3}, data));
  }
}

TEST_CASE("Certificate") {
  auto trust = test::MakeTestTrust();
  const auto &tsa = trust->Tsa().cert;
  auto copy = Certificate::FromDer(tsa.GetRawCopy());
  REQUIRE(copy.Fingerprint() == tsa.Fingerprint());
  auto from_pem = Certificate::FromPem(tsa.ToPem());
  REQUIRE(from_pem.SubjectDN() == tsa.SubjectDN());
  REQUIRE(from_pem.SubjectDN().find("CN=Test TSA") != std::string::npos);
  REQUIRE_THROWS_AS(Certificate::FromDer(BytesVector{0x30, 0x00}),
                    CryptoError);
  auto info = tsa.CommonInfo();
  REQUIRE(info.subj_common_name == "Test TSA");
  REQUIRE(info.issuer_common_name == "Test Internal CA");
  REQUIRE(info.fingerprint_sha256 == tsa.Fingerprint());
}
