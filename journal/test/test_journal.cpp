/* File: test_journal.cpp
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

#include <boost/json.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <system_error>
#include <vector>
#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "ephemeral_issuer.hpp"
#include "hash_utils.hpp"
#include "internal_tsa.hpp"
#include "journal_errors.hpp"
#include "memory_document.hpp"
#include "pdf_signer.hpp"
#include "proof_journal.hpp"
#include "proof_record.hpp"
#include "proof_store.hpp"
#include "serial_allocator.hpp"
#include "signer.hpp"
#include "sqlite_db.hpp"
#include "test_material.hpp"
#include "test_pdf_builder.hpp"
#include "timestamp_client.hpp"

using namespace pdfseal;
using namespace pdfseal::journal;

namespace {

constexpr const char *const kSealKey = "journal-seal-key";

struct JournalFixture {
  std::string dir = test::MakeTempDir("pdfseal_journal");
  std::shared_ptr<const crypto::TrustMaterial> trust = test::MakeTestTrust();
  storage::SharedDb db =
    std::make_shared<storage::SqliteDb>(dir + "/pdfseal.sqlite");
  std::shared_ptr<tsa::InternalTsa> authority =
    std::make_shared<tsa::InternalTsa>(
      trust, std::make_shared<tsa::SerialAllocator>(db), "1.2.3.4.1");
  tsa::TimestampClient client{authority, std::chrono::milliseconds(5000)};
  crypto::EphemeralIssuer issuer{trust};
  pdf::SigningConfig signing;
  std::shared_ptr<ProofStore> store = std::make_shared<ProofStore>(db);
  ProofJournal journal{store, JournalConfig{kSealKey}, "pdfseal"};
  workflow::MemoryDocument doc{"lease-42", workflow::DocumentKind::kLease,
                               test::BuildTestPdf({})};

  JournalFixture() {
    pdf::CertifyParams params;
    params.identity = &trust->Organisation();
    params.validation_certs = trust->ValidationCertsDer();
    params.signing_time = std::chrono::system_clock::now();
    doc.SetLatestPdf(pdf::PdfSigner(signing, client.AsTimestampFunc())
                       .CertifyDocument(doc.OriginalPdf(), params));
  }
  JournalFixture(const JournalFixture &) = delete;
  JournalFixture &operator=(const JournalFixture &) = delete;
  JournalFixture(JournalFixture &&) = delete;
  JournalFixture &operator=(JournalFixture &&) = delete;
  ~JournalFixture() {
    db.reset();
    std::error_code err;
    std::filesystem::remove_all(dir, err);
  }

  /// @brief approve the latest pdf as the request signer
  BytesVector Approve(const workflow::SignatureRequest &request,
                      const std::string &field_name,
                      const std::string &cert_email) {
    crypto::SignerCredential credential =
      issuer.Issue({workflow::SignerName(request.signer), cert_email},
                   signing.org_unit);
    pdf::ApproveParams params;
    params.credential = &credential;
    params.signer_name = workflow::SignerName(request.signer);
    params.signer_email = workflow::SignerEmail(request.signer);
    params.signing_time = std::chrono::system_clock::now();
    params.field_name = field_name;
    return pdf::PdfSigner(signing, client.AsTimestampFunc())
      .ApproveDocument(doc.LatestPdf(), params);
  }
};

workflow::SignatureRequest MakeRequest(int64_t id, int order) {
  workflow::SignatureRequest request;
  request.id = id;
  request.document_id = "lease-42";
  request.order = order;
  request.signer = workflow::Tenant{
    {"t" + std::to_string(id), "Jean", "Dupont", "jean@example.org"}};
  request.link_token = "token" + std::to_string(id);
  request.otp_code = "123456";
  request.otp_generated_at =
    std::chrono::system_clock::now() - std::chrono::minutes(2);
  return request;
}

const HttpProvenance kHttp{"203.0.113.7", "Mozilla/5.0 (X11; Linux x86_64)",
                           "https://example.org/sign/abc"};

}  // namespace

TEST_CASE("Proof record to json") {
  ProofRecord record;
  record.signer_role = "tenant";
  record.signer_name = "Jean Dupont";
  record.signer_email = "jean@example.org";
  record.field_name = "t1-jean-dupont";
  record.otp_code = "654321";
  record.http = kHttp;
  record.pdf_hash_before = std::string(64, 'a');
  record.pdf_hash_after = std::string(64, 'b');
  record.certificate_fingerprint = std::string(64, 'c');

  json::object obj = record.ToJson();
  REQUIRE(obj.at("signer_role").as_string() == "tenant");
  REQUIRE(obj.at("field_name").as_string() == "t1-jean-dupont");
  REQUIRE(obj.at("otp").as_object().at("otp_code").as_string() == "654321");
  REQUIRE(obj.at("otp").as_object().at("otp_validated").as_bool());
  REQUIRE(obj.at("http").as_object().at("ip_address").as_string() ==
          "203.0.113.7");
  const auto &crypto_obj = obj.at("cryptographic").as_object();
  REQUIRE(crypto_obj.at("pdf_hash_before").as_string() ==
          std::string(64, 'a'));
  REQUIRE(crypto_obj.contains("certificate_valid_until"));
  REQUIRE(obj.at("tsa_timestamp").is_null());

  record.tsa_timestamp = "2024-03-05T14:07:09Z (serial: 7)";
  obj = record.ToJson();
  REQUIRE(obj.at("tsa_timestamp").as_string() ==
          "2024-03-05T14:07:09Z (serial: 7)");
}

TEST_CASE("Record rejects incomplete evidence") {
  JournalFixture fixture;
  auto request = MakeRequest(1, 1);
  const BytesVector signed_pdf =
    fixture.Approve(request, "t1-jean-dupont", "jean@example.org");
  const auto now = std::chrono::system_clock::now();

  SECTION("no code") {
    request.otp_code.reset();
    REQUIRE_THROWS_AS(
      fixture.journal.Record(fixture.doc, request, fixture.doc.LatestPdf(),
                             signed_pdf, "t1-jean-dupont", kHttp, now),
      IntegrityError);
  }
  SECTION("no generation time") {
    request.otp_generated_at.reset();
    REQUIRE_THROWS_AS(
      fixture.journal.Record(fixture.doc, request, fixture.doc.LatestPdf(),
                             signed_pdf, "t1-jean-dupont", kHttp, now),
      IntegrityError);
  }
  SECTION("empty artifact") {
    REQUIRE_THROWS_AS(
      fixture.journal.Record(fixture.doc, request, fixture.doc.LatestPdf(), {},
                             "t1-jean-dupont", kHttp, now),
      IntegrityError);
  }
  SECTION("unknown field") {
    REQUIRE_THROWS_AS(
      fixture.journal.Record(fixture.doc, request, fixture.doc.LatestPdf(),
                             signed_pdf, "no-such-field", kHttp, now),
      IntegrityError);
  }
  REQUIRE(fixture.store->CountForDocument("lease-42") == 0);
}

TEST_CASE("Record reads the artifact") {
  JournalFixture fixture;
  const auto request = MakeRequest(1, 1);
  const BytesVector before = fixture.doc.LatestPdf();
  const BytesVector after =
    fixture.Approve(request, "t1-jean-dupont", "jean@example.org");
  const auto signature_time = std::chrono::system_clock::now();

  const ProofRecord record =
    fixture.journal.Record(fixture.doc, request, before, after,
                           "t1-jean-dupont", kHttp, signature_time);
  REQUIRE(record.id > 0);
  REQUIRE(record.pdf_hash_before == crypto::Sha256Hex(before));
  REQUIRE(record.pdf_hash_after == crypto::Sha256Hex(after));
  REQUIRE(record.pdf_hash_before != record.pdf_hash_after);
  REQUIRE(record.certificate_fingerprint.size() == 64);
  REQUIRE(record.certificate_subject_dn.find("Jean Dupont") !=
          std::string::npos);
  REQUIRE(record.certificate_pem.find("BEGIN CERTIFICATE") !=
          std::string::npos);
  REQUIRE(record.certificate_valid_from < record.certificate_valid_until);
  REQUIRE(record.otp_validated_at == record.signature_timestamp);
  REQUIRE(record.signer_role == "tenant");
  REQUIRE(record.tsa_serial.has_value());
  REQUIRE(record.tsa_token.has_value());
  REQUIRE(record.tsa_timestamp.has_value());
  REQUIRE(record.tsa_timestamp->find(
            "(serial: " + std::to_string(record.tsa_serial.value()) + ")") !=
          std::string::npos);

  const auto stored = fixture.store->FindByRequest(1);
  REQUIRE(stored.has_value());
  REQUIRE(stored->certificate_fingerprint == record.certificate_fingerprint);
  REQUIRE(stored->http.user_agent == kHttp.user_agent);
  REQUIRE(stored->tsa_serial == record.tsa_serial);

  // one proof per request
  REQUIRE_THROWS_AS(fixture.journal.Record(fixture.doc, request, before, after,
                                           "t1-jean-dupont", kHttp,
                                           signature_time),
                    storage::StorageError);
  REQUIRE(fixture.store->CountForDocument("lease-42") == 1);
}

TEST_CASE("Record with a different certificate email") {
  JournalFixture fixture;
  const auto request = MakeRequest(1, 1);
  const BytesVector after =
    fixture.Approve(request, "t1-jean-dupont", "other@example.org");
  const ProofRecord record = fixture.journal.Record(
    fixture.doc, request, fixture.doc.LatestPdf(), after, "t1-jean-dupont",
    kHttp, std::chrono::system_clock::now());
  REQUIRE(record.signer_email == "jean@example.org");
  REQUIRE(fixture.store->CountForDocument("lease-42") == 1);
}

TEST_CASE("Journal") {
  JournalFixture fixture;
  const auto first = MakeRequest(1, 1);
  const auto second = MakeRequest(2, 2);
  for (const auto *request : {&first, &second}) {
    const std::string field =
      "t" + std::to_string(request->id) + "-jean-dupont";
    const BytesVector before = fixture.doc.LatestPdf();
    const BytesVector after =
      fixture.Approve(*request, field, "jean@example.org");
    fixture.journal.Record(fixture.doc, *request, before, after, field, kHttp,
                           std::chrono::system_clock::now());
    fixture.doc.SetLatestPdf(after);
  }
  fixture.doc.SetStatus(workflow::DocumentStatus::kSigned);

  const json::object journal = fixture.journal.AssembleJournal(fixture.doc);
  const auto &document = journal.at("document").as_object();
  REQUIRE(document.at("type").as_string() == "bail");
  REQUIRE(document.at("id").as_string() == "lease-42");
  REQUIRE(document.at("name").as_string() == "Lease");
  REQUIRE(document.at("status").as_string() == "signed");
  REQUIRE(document.at("pdf_hash_final").as_string() ==
          crypto::Sha256Hex(fixture.doc.LatestPdf()));

  const auto &certification = journal.at("certification").as_object();
  REQUIRE(certification.at("certifier").as_string() == "pdfseal");
  const std::string cert_field(
    certification.at("field_name").as_string().c_str());
  REQUIRE(cert_field.rfind("Certification_", 0) == 0);
  REQUIRE(certification.at("timestamp_t0").is_string());

  const auto &signatures = journal.at("signatures").as_array();
  REQUIRE(signatures.size() == 2);
  REQUIRE(journal.at("signature_count").as_uint64() == 2);
  REQUIRE(signatures[0].as_object().at("field_name").as_string() ==
          "t1-jean-dupont");
  REQUIRE(signatures[1].as_object().at("field_name").as_string() ==
          "t2-jean-dupont");
  REQUIRE(journal.at("timestamps").as_object().at("t_final").is_string());
  REQUIRE(journal.at("timestamps").as_object().at("t0_certification") ==
          certification.at("timestamp_t0"));
  const auto &audit = journal.at("audit").as_object();
  REQUIRE(audit.at("journal_version").as_string() == kJournalVersion);

  SECTION("seal") {
    REQUIRE(audit.at("hmac_sha256").as_string().size() == 64);
    REQUIRE(ProofJournal::VerifySeal(journal, kSealKey));
    REQUIRE_FALSE(ProofJournal::VerifySeal(journal, "wrong-key"));
    REQUIRE_FALSE(ProofJournal::VerifySeal(journal, ""));
    json::object tampered = journal;
    tampered["signature_count"] = 3;
    REQUIRE_FALSE(ProofJournal::VerifySeal(tampered, kSealKey));
    json::object unsealed = journal;
    unsealed["audit"].as_object().erase("hmac_sha256");
    REQUIRE_FALSE(ProofJournal::VerifySeal(unsealed, kSealKey));
  }

  SECTION("export") {
    const std::string path = fixture.dir + "/journal.json";
    fixture.journal.ExportJournal(fixture.doc, path);
    std::ifstream file(path, std::ios_base::binary);
    REQUIRE(file.is_open());
    const std::string text((std::istreambuf_iterator<char>(file)),
                           std::istreambuf_iterator<char>());
    const json::value parsed = json::parse(text);
    REQUIRE(parsed.as_object().at("signatures").as_array().size() == 2);
    REQUIRE(ProofJournal::VerifySeal(parsed.as_object(), kSealKey));
    REQUIRE_THROWS_AS(
      fixture.journal.ExportJournal(fixture.doc,
                                    fixture.dir + "/missing/journal.json"),
      std::runtime_error);
  }
}

TEST_CASE("Journal of an unsigned draft") {
  JournalFixture fixture;
  workflow::MemoryDocument draft("draft-1", workflow::DocumentKind::kInsurance,
                                 test::BuildTestPdf({}));
  ProofJournal unsealed(fixture.store, JournalConfig{}, "pdfseal");
  const json::object journal = unsealed.AssembleJournal(draft);
  REQUIRE(journal.at("document").as_object().at("type").as_string() ==
          "assurance");
  REQUIRE(journal.at("document").as_object().at("pdf_hash_final").is_null());
  REQUIRE(journal.at("certification")
            .as_object()
            .at("certificate_subject")
            .is_null());
  REQUIRE(journal.at("signatures").as_array().empty());
  REQUIRE(journal.at("timestamps").as_object().at("t_final").is_null());
  REQUIRE_FALSE(journal.at("audit").as_object().contains("hmac_sha256"));
}
