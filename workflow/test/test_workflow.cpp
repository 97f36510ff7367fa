/* File: test_workflow.cpp
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

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <variant>
#include <vector>
#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "document_status.hpp"
#include "internal_tsa.hpp"
#include "lifecycle.hpp"
#include "memory_document.hpp"
#include "notifier.hpp"
#include "orchestrator.hpp"
#include "pdf.hpp"
#include "serial_allocator.hpp"
#include "signer.hpp"
#include "sqlite_db.hpp"
#include "test_material.hpp"
#include "test_pdf_builder.hpp"
#include "timestamp_client.hpp"
#include "tsa_errors.hpp"
#include "workflow_errors.hpp"

using namespace pdfseal;
using namespace pdfseal::workflow;

namespace {

class RecordingNotifier : public INotifier {
 public:
  void OnOtpIssued(const SignableDocument & /*doc*/,
                   const SignatureRequest &request,
                   const std::string &otp_code) override {
    const std::lock_guard<std::mutex> lock(mutex_);
    otp_codes.push_back(otp_code);
    otp_requests.push_back(request.id);
  }

  void OnSignatureCompleted(
    const SignableDocument & /*doc*/, const SignatureRequest &request,
    const std::optional<SignatureRequest> &next_signer) override {
    const std::lock_guard<std::mutex> lock(mutex_);
    completed.push_back(request.id);
    next.push_back(next_signer ? next_signer->id : 0);
  }

  void OnDocumentSigned(const SignableDocument & /*doc*/) override {
    ++documents_signed;
  }

  std::vector<std::string> otp_codes;
  std::vector<int64_t> otp_requests;
  std::vector<int64_t> completed;
  std::vector<int64_t> next;
  std::atomic<int> documents_signed{0};

 private:
  std::mutex mutex_;
};

struct WorkflowFixture {
  std::string dir = test::MakeTempDir("pdfseal_workflow");
  std::shared_ptr<const crypto::TrustMaterial> trust = test::MakeTestTrust();
  storage::SharedDb db =
    std::make_shared<storage::SqliteDb>(dir + "/pdfseal.sqlite");
  std::shared_ptr<tsa::InternalTsa> authority =
    std::make_shared<tsa::InternalTsa>(
      trust, std::make_shared<tsa::SerialAllocator>(db), "1.2.3.4.1");
  tsa::TimestampClient client{authority, std::chrono::milliseconds(5000)};
  std::shared_ptr<RecordingNotifier> notifier =
    std::make_shared<RecordingNotifier>();
  Config config;
  SignatureOrchestrator orchestrator{config, trust, db,
                                     client.AsTimestampFunc(), notifier};

  WorkflowFixture() = default;
  WorkflowFixture(const WorkflowFixture &) = delete;
  WorkflowFixture &operator=(const WorkflowFixture &) = delete;
  WorkflowFixture(WorkflowFixture &&) = delete;
  WorkflowFixture &operator=(WorkflowFixture &&) = delete;
  ~WorkflowFixture() {
    db.reset();
    std::error_code err;
    std::filesystem::remove_all(dir, err);
  }
};

std::unique_ptr<MemoryDocument> MakeDocument(const std::string &id) {
  test::TestPdfOptions options;
  options.pages = {{"Lease agreement"}, {"Signatures"}};
  return std::make_unique<MemoryDocument>(id, DocumentKind::kLease,
                                          test::BuildTestPdf(options));
}

std::vector<Signer> TwoSigners() {
  return {Landlord{{"a1b2", "Marie", "Curie", "marie@example.org"}},
          Tenant{{"c3d4", "Jean", "Dupont", "jean@example.org"}}};
}

SignerProofInputs Inputs(const std::string &otp) {
  SignerProofInputs inputs;
  inputs.otp_code = otp;
  inputs.http = {"192.0.2.10", "Mozilla/5.0", "https://example.org/sign"};
  return inputs;
}

}  // namespace

TEST_CASE("Document status") {
  REQUIRE(StatusToString(DocumentStatus::kSigning) == "signing");
  REQUIRE(StatusFromString("cancelled") == DocumentStatus::kCancelled);
  REQUIRE_FALSE(StatusFromString("archived").has_value());
  REQUIRE(CanTransition(DocumentStatus::kDraft, DocumentStatus::kSigning));
  REQUIRE(CanTransition(DocumentStatus::kSigning, DocumentStatus::kSigned));
  REQUIRE(CanTransition(DocumentStatus::kSigning, DocumentStatus::kCancelled));
  REQUIRE_FALSE(CanTransition(DocumentStatus::kSigned, DocumentStatus::kDraft));
  REQUIRE_FALSE(
    CanTransition(DocumentStatus::kSigned, DocumentStatus::kCancelled));
  REQUIRE_FALSE(CanTransition(DocumentStatus::kDraft, DocumentStatus::kSigned));
  REQUIRE_FALSE(IsLocked(DocumentStatus::kDraft));
  REQUIRE(IsLocked(DocumentStatus::kSigning));
  REQUIRE(IsLocked(DocumentStatus::kSigned));
  REQUIRE_FALSE(IsLocked(DocumentStatus::kCancelled));
}

TEST_CASE("Signer") {
  const Signer agent = Agent{{"e5", "Paul", "Martin", "paul@example.org"}};
  REQUIRE(SignerName(agent) == "Paul Martin");
  REQUIRE(SignerEmail(agent) == "paul@example.org");
  REQUIRE(SignerId(agent) == "e5");
  REQUIRE(SignerRole(agent) == "agent");
  const Signer tenant = MakeSigner("tenant", {"t1", "", "Durand", "d@x.org"});
  REQUIRE(std::holds_alternative<Tenant>(tenant));
  REQUIRE(SignerName(tenant) == "Durand");
  REQUIRE_THROWS_AS(MakeSigner("notary", {}), std::invalid_argument);
}

TEST_CASE("MemoryDocument") {
  auto doc = MakeDocument("lease-1");
  REQUIRE(doc->GetDocumentName() == "Lease");
  REQUIRE(doc->GetFilePrefix() == "bail");
  REQUIRE(doc->GetStatus() == DocumentStatus::kDraft);
  REQUIRE(doc->LatestPdf().empty());
  REQUIRE(DocumentKindPrefix(DocumentKind::kInventory) == "etat_lieux");
  REQUIRE_THROWS_AS(MemoryDocument("", DocumentKind::kLease, {1}),
                    std::invalid_argument);
  doc->SetStatus(DocumentStatus::kSigned);
  REQUIRE_THROWS_AS(doc->SetLatestPdf({1, 2}), LifecycleError);
}

TEST_CASE("Create requests") {
  WorkflowFixture fixture;
  auto &orchestrator = fixture.orchestrator;
  auto doc = MakeDocument("lease-create");
  const auto requests = orchestrator.CreateRequests(*doc, TwoSigners());
  REQUIRE(requests.size() == 2);
  REQUIRE(requests[0].order == 1);
  REQUIRE(requests[1].order == 2);
  REQUIRE(requests[0].link_token.size() == 32);
  REQUIRE(requests[0].link_token != requests[1].link_token);
  REQUIRE_FALSE(requests[0].otp_code.has_value());
  REQUIRE_FALSE(requests[0].is_signed);
  REQUIRE(SignerRole(requests[0].signer) == "landlord");
  REQUIRE(doc->GetStatus() == DocumentStatus::kDraft);

  SECTION("active requests exist") {
    REQUIRE_THROWS_AS(orchestrator.CreateRequests(*doc, TwoSigners()),
                      OrchestratorError);
  }
  SECTION("invalid signers") {
    auto other = MakeDocument("lease-other");
    REQUIRE_THROWS_AS(orchestrator.CreateRequests(*other, {}),
                      OrchestratorError);
    REQUIRE_THROWS_AS(
      orchestrator.CreateRequests(
        *other, {Tenant{{"x", "No", "Mail", ""}}}),
      OrchestratorError);
    REQUIRE_THROWS_AS(
      orchestrator.CreateRequests(
        *other, {Tenant{{"x", "A", "B", "same@example.org"}},
                 Tenant{{"y", "C", "D", "same@example.org"}}}),
      OrchestratorError);
    REQUIRE(orchestrator.Requests().CountActive("lease-other") == 0);
  }
  SECTION("link token") {
    const auto found = orchestrator.FindByLinkToken(requests[1].link_token);
    REQUIRE(found.has_value());
    REQUIRE(found->id == requests[1].id);
    REQUIRE_FALSE(orchestrator.FindByLinkToken("unknown").has_value());
    REQUIRE_FALSE(orchestrator.FindByLinkToken("").has_value());
  }
  SECTION("next signer") {
    const auto next = orchestrator.NextSigner(requests[0]);
    REQUIRE(next.has_value());
    REQUIRE(next->id == requests[1].id);
  }
  SECTION("field name") {
    REQUIRE(SignatureOrchestrator::SignatureFieldName(requests[0]) ==
            "a1b2-marie-curie");
  }
}

TEST_CASE("OTP") {
  WorkflowFixture fixture;
  auto &orchestrator = fixture.orchestrator;
  auto doc = MakeDocument("lease-otp");
  const auto requests = orchestrator.CreateRequests(*doc, TwoSigners());
  const int64_t first = requests[0].id;
  const int64_t second = requests[1].id;

  SECTION("not issued") {
    REQUIRE(orchestrator.ValidateAndConsume(first, "123456") ==
            OtpCheck::kNotIssued);
  }
  SECTION("second signer does not start signing") {
    const std::string code = orchestrator.IssueOtp(*doc, second);
    REQUIRE(code.size() == 6);
    REQUIRE(doc->GetStatus() == DocumentStatus::kDraft);
  }
  SECTION("first signer starts signing") {
    const std::string code = orchestrator.IssueOtp(*doc, first);
    const int value = std::stoi(code);
    REQUIRE(value >= 100000);
    REQUIRE(value <= 999999);
    REQUIRE(doc->GetStatus() == DocumentStatus::kSigning);
    REQUIRE(fixture.notifier->otp_codes.size() == 1);
    REQUIRE(fixture.notifier->otp_codes[0] == code);
    REQUIRE(fixture.notifier->otp_requests[0] == first);
  }
  SECTION("wrong code") {
    const std::string code = orchestrator.IssueOtp(*doc, first);
    const std::string wrong = code == "111111" ? "222222" : "111111";
    REQUIRE(orchestrator.ValidateAndConsume(first, wrong) ==
            OtpCheck::kWrongCode);
    REQUIRE_FALSE(
      orchestrator.Requests().Get(first)->otp_validated_at.has_value());
  }
  SECTION("expiry boundary") {
    const std::string code = orchestrator.IssueOtp(*doc, first);
    const TimePoint generated =
      orchestrator.Requests().Get(first)->otp_generated_at.value();
    const std::chrono::minutes max_age(10);
    REQUIRE(orchestrator.ValidateAndConsume(
              first, code, max_age,
              generated + std::chrono::minutes(10) +
                std::chrono::seconds(1)) == OtpCheck::kExpired);
    REQUIRE_FALSE(
      orchestrator.Requests().Get(first)->otp_validated_at.has_value());
    REQUIRE(orchestrator.ValidateAndConsume(
              first, code, max_age,
              generated + std::chrono::minutes(9) +
                std::chrono::seconds(59)) == OtpCheck::kValid);
    REQUIRE(orchestrator.ValidateAndConsume(
              first, code, max_age, generated + max_age) == OtpCheck::kValid);
    REQUIRE(orchestrator.Requests().Get(first)->otp_validated_at.has_value());
  }
  SECTION("new code replaces the old one") {
    const std::string old_code = orchestrator.IssueOtp(*doc, first);
    std::string new_code = orchestrator.IssueOtp(*doc, first);
    while (new_code == old_code) {
      new_code = orchestrator.IssueOtp(*doc, first);
    }
    REQUIRE(orchestrator.ValidateAndConsume(first, old_code) ==
            OtpCheck::kWrongCode);
    REQUIRE(orchestrator.ValidateAndConsume(first, new_code) ==
            OtpCheck::kValid);
  }
}

TEST_CASE("Signing order and finalisation") {
  WorkflowFixture fixture;
  auto &orchestrator = fixture.orchestrator;
  auto doc = MakeDocument("lease-ab");
  orchestrator.CertifyDocument(*doc);
  const auto requests = orchestrator.CreateRequests(*doc, TwoSigners());
  const int64_t first = requests[0].id;
  const int64_t second = requests[1].id;
  const std::string first_code = orchestrator.IssueOtp(*doc, first);
  const std::string second_code = orchestrator.IssueOtp(*doc, second);

  // signer 2 can't jump ahead
  REQUIRE_THROWS_AS(orchestrator.CompleteSignature(*doc, second,
                                                   doc->LatestPdf(),
                                                   Inputs(second_code)),
                    NotYourTurnError);
  REQUIRE_FALSE(orchestrator.Requests().Get(second)->is_signed);
  REQUIRE(fixture.orchestrator.Journal().Store()->CountForDocument(
            "lease-ab") == 0);

  SECTION("wrong code") {
    const std::string wrong = first_code == "111111" ? "222222" : "111111";
    try {
      orchestrator.CompleteSignature(*doc, first, doc->LatestPdf(),
                                     Inputs(wrong));
      FAIL("the code must be rejected");
    } catch (const InvalidOtpError &ex) {
      REQUIRE(ex.Check() == OtpCheck::kWrongCode);
    }
    REQUIRE_FALSE(orchestrator.Requests().Get(first)->is_signed);
  }

  SECTION("both signers") {
    const BytesVector certified = doc->LatestPdf();
    const BytesVector after_first = orchestrator.CompleteSignature(
      *doc, first, doc->LatestPdf(), Inputs(first_code));
    REQUIRE(std::equal(certified.cbegin(), certified.cend(),
                       after_first.cbegin()));
    REQUIRE(doc->LatestPdf() == after_first);
    REQUIRE(doc->GetStatus() == DocumentStatus::kSigning);
    REQUIRE(DocumentLifecycle::IsLocked(*doc));
    REQUIRE(orchestrator.Requests().Get(first)->is_signed);
    REQUIRE(fixture.notifier->completed.size() == 1);
    REQUIRE(fixture.notifier->next[0] == second);
    REQUIRE(fixture.notifier->documents_signed == 0);

    // a second completion of the same request
    REQUIRE_THROWS_AS(orchestrator.CompleteSignature(
                        *doc, first, doc->LatestPdf(), Inputs(first_code)),
                      AlreadySignedError);

    orchestrator.CompleteSignature(*doc, second, doc->LatestPdf(),
                                   Inputs(second_code));
    REQUIRE(doc->GetStatus() == DocumentStatus::kSigned);
    REQUIRE(fixture.notifier->documents_signed == 1);
    REQUIRE(fixture.notifier->completed.size() == 1);

    const auto proofs =
      orchestrator.Journal().Store()->ListForDocument("lease-ab");
    REQUIRE(proofs.size() == 2);
    REQUIRE(proofs[0].request_id == first);
    REQUIRE(proofs[1].request_id == second);
    REQUIRE(proofs[0].signature_timestamp <= proofs[1].signature_timestamp);
    REQUIRE(proofs[0].field_name == "a1b2-marie-curie");
    REQUIRE(proofs[1].http.ip_address == "192.0.2.10");

    pdf::Pdf pdf(doc->LatestPdf());
    REQUIRE(pdf.FindSignatures());
    REQUIRE(pdf.GetSignaturesCount() == 3);

    // finalisation is idempotent
    REQUIRE_FALSE(orchestrator.Lifecycle().Reevaluate(*doc));
    REQUIRE_FALSE(orchestrator.Lifecycle().Reevaluate(*doc));
    REQUIRE(fixture.notifier->documents_signed == 1);
    REQUIRE_THROWS_AS(orchestrator.Lifecycle().Cancel(*doc), LifecycleError);
    REQUIRE_THROWS_AS(orchestrator.CompleteSignature(*doc, second,
                                                     doc->LatestPdf(),
                                                     Inputs(second_code)),
                      AlreadySignedError);
  }
}

TEST_CASE("Completion needs the latest certified artifact") {
  WorkflowFixture fixture;
  auto &orchestrator = fixture.orchestrator;
  auto doc = MakeDocument("lease-stale");

  SECTION("uncertified draft") {
    const auto requests = orchestrator.CreateRequests(
      *doc, {Tenant{{"t1", "Jean", "Dupont", "jean@example.org"}}});
    const std::string code = orchestrator.IssueOtp(*doc, requests[0].id);
    REQUIRE_THROWS_AS(orchestrator.CompleteSignature(*doc, requests[0].id,
                                                     doc->OriginalPdf(),
                                                     Inputs(code)),
                      OrchestratorError);
    REQUIRE_FALSE(orchestrator.Requests().Get(requests[0].id)->is_signed);
    REQUIRE(orchestrator.Journal().Store()->CountForDocument("lease-stale") ==
            0);
    REQUIRE(doc->LatestPdf().empty());
    pdf::Pdf pdf(doc->OriginalPdf());
    REQUIRE_FALSE(pdf.HasDocMdp());
  }

  SECTION("previous version of the document") {
    const BytesVector certified = orchestrator.CertifyDocument(*doc);
    const auto requests = orchestrator.CreateRequests(*doc, TwoSigners());
    const std::string first_code = orchestrator.IssueOtp(*doc, requests[0].id);
    const std::string second_code =
      orchestrator.IssueOtp(*doc, requests[1].id);
    REQUIRE_THROWS_AS(orchestrator.CompleteSignature(*doc, requests[0].id,
                                                     doc->OriginalPdf(),
                                                     Inputs(first_code)),
                      OrchestratorError);
    const BytesVector after_first = orchestrator.CompleteSignature(
      *doc, requests[0].id, certified, Inputs(first_code));

    // the certified version misses the first approval
    REQUIRE_THROWS_AS(orchestrator.CompleteSignature(*doc, requests[1].id,
                                                     certified,
                                                     Inputs(second_code)),
                      OrchestratorError);
    REQUIRE_FALSE(orchestrator.Requests().Get(requests[1].id)->is_signed);
    REQUIRE(doc->LatestPdf() == after_first);
    REQUIRE(orchestrator.Journal().Store()->CountForDocument("lease-stale") ==
            1);

    // the code is not consumed by the rejected attempt
    orchestrator.CompleteSignature(*doc, requests[1].id, doc->LatestPdf(),
                                   Inputs(second_code));
    REQUIRE(doc->GetStatus() == DocumentStatus::kSigned);
    pdf::Pdf pdf(doc->LatestPdf());
    REQUIRE(pdf.FindSignatures());
    REQUIRE(pdf.GetSignaturesCount() == 3);
  }
}

TEST_CASE("Expired code") {
  WorkflowFixture fixture;
  auto &orchestrator = fixture.orchestrator;
  TimePoint now = std::chrono::system_clock::now();
  orchestrator.SetClock([&now] { return now; });
  auto doc = MakeDocument("lease-c");
  orchestrator.CertifyDocument(*doc);
  const auto requests = orchestrator.CreateRequests(
    *doc, {Tenant{{"t1", "Jean", "Dupont", "jean@example.org"}}});
  const int64_t request_id = requests[0].id;
  const std::string code = orchestrator.IssueOtp(*doc, request_id);
  now += std::chrono::minutes(11);
  try {
    orchestrator.CompleteSignature(*doc, request_id, doc->LatestPdf(),
                                   Inputs(code));
    FAIL("the code must be expired");
  } catch (const InvalidOtpError &ex) {
    REQUIRE(ex.Check() == OtpCheck::kExpired);
  }
  REQUIRE_FALSE(orchestrator.Requests().Get(request_id)->is_signed);

  const std::string fresh = orchestrator.IssueOtp(*doc, request_id);
  now += std::chrono::minutes(2);
  orchestrator.CompleteSignature(*doc, request_id, doc->LatestPdf(),
                                 Inputs(fresh));
  REQUIRE(orchestrator.Requests().Get(request_id)->is_signed);
  REQUIRE(doc->GetStatus() == DocumentStatus::kSigned);
  REQUIRE(fixture.notifier->documents_signed == 1);
}

TEST_CASE("Timestamp failure leaves no trace") {
  WorkflowFixture fixture;
  SignatureOrchestrator orchestrator(
    fixture.config, fixture.trust, fixture.db,
    [](const BytesVector & /*data*/) -> BytesVector {
      throw tsa::TsaTimeoutError("[test] no response");
    },
    fixture.notifier);
  auto doc = MakeDocument("lease-fault");
  // certified by the working authority
  doc->SetLatestPdf(
    fixture.orchestrator.CertifyDocument(*MakeDocument("lease-fault")));
  const auto requests = orchestrator.CreateRequests(*doc, TwoSigners());
  const std::string code = orchestrator.IssueOtp(*doc, requests[0].id);
  const DocumentStatus status = doc->GetStatus();
  const BytesVector latest = doc->LatestPdf();

  REQUIRE_THROWS_AS(orchestrator.CompleteSignature(*doc, requests[0].id,
                                                   latest, Inputs(code)),
                    tsa::TsaTimeoutError);
  REQUIRE_FALSE(orchestrator.Requests().Get(requests[0].id)->is_signed);
  REQUIRE(orchestrator.Journal().Store()->CountForDocument("lease-fault") ==
          0);
  REQUIRE(doc->GetStatus() == status);
  REQUIRE(doc->LatestPdf() == latest);
  REQUIRE(fixture.notifier->completed.empty());
}

TEST_CASE("Certify once") {
  WorkflowFixture fixture;
  auto doc = MakeDocument("lease-e");
  const BytesVector certified = fixture.orchestrator.CertifyDocument(*doc);
  REQUIRE(doc->LatestPdf() == certified);
  REQUIRE_THROWS_AS(fixture.orchestrator.CertifyDocument(*doc),
                    OrchestratorError);
  pdf::Pdf pdf(certified);
  REQUIRE(pdf.HasDocMdp());
}

TEST_CASE("Concurrent completion of one request") {
  WorkflowFixture fixture;
  auto &orchestrator = fixture.orchestrator;
  auto doc = MakeDocument("lease-race");
  orchestrator.CertifyDocument(*doc);
  const auto requests = orchestrator.CreateRequests(*doc, TwoSigners());
  const std::string code = orchestrator.IssueOtp(*doc, requests[0].id);
  const BytesVector latest = doc->LatestPdf();

  std::atomic<int> succeeded{0};
  std::atomic<int> rejected{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 2; ++i) {
    threads.emplace_back([&] {
      try {
        orchestrator.CompleteSignature(*doc, requests[0].id, latest,
                                       Inputs(code));
        ++succeeded;
      } catch (const AlreadySignedError &) {
        ++rejected;
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }
  REQUIRE(succeeded == 1);
  REQUIRE(rejected == 1);
  REQUIRE(orchestrator.Journal().Store()->CountForDocument("lease-race") == 1);
}

TEST_CASE("Cancel and reset") {
  WorkflowFixture fixture;
  auto &orchestrator = fixture.orchestrator;
  auto doc = MakeDocument("lease-cancel");
  auto requests = orchestrator.CreateRequests(*doc, TwoSigners());

  SECTION("reset a draft") {
    orchestrator.Lifecycle().ResetForEdit(*doc);
    REQUIRE(orchestrator.Requests().CountActive("lease-cancel") == 0);
    requests = orchestrator.CreateRequests(*doc, TwoSigners());
    REQUIRE(requests.size() == 2);
  }
  SECTION("cancel while signing") {
    orchestrator.IssueOtp(*doc, requests[0].id);
    REQUIRE(doc->GetStatus() == DocumentStatus::kSigning);
    REQUIRE_THROWS_AS(orchestrator.Lifecycle().ResetForEdit(*doc),
                      LifecycleError);
    orchestrator.Lifecycle().Cancel(*doc);
    REQUIRE(doc->GetStatus() == DocumentStatus::kCancelled);
    REQUIRE_FALSE(DocumentLifecycle::IsLocked(*doc));
    const auto found = orchestrator.FindByLinkToken(requests[0].link_token);
    REQUIRE(found.has_value());
    REQUIRE(found->IsCancelled());
    REQUIRE(orchestrator.Requests().CountActive("lease-cancel") == 0);
    REQUIRE_NOTHROW(orchestrator.Lifecycle().Cancel(*doc));
    REQUIRE_THROWS_AS(orchestrator.IssueOtp(*doc, requests[1].id),
                      OrchestratorError);
    REQUIRE_THROWS_AS(orchestrator.CreateRequests(*doc, TwoSigners()),
                      OrchestratorError);
  }
  SECTION("cancel after the first signature") {
    orchestrator.CertifyDocument(*doc);
    const std::string code = orchestrator.IssueOtp(*doc, requests[0].id);
    orchestrator.CompleteSignature(*doc, requests[0].id, doc->LatestPdf(),
                                   Inputs(code));
    orchestrator.Lifecycle().Cancel(*doc);
    REQUIRE(doc->GetStatus() == DocumentStatus::kCancelled);
    const auto signed_request =
      orchestrator.FindByLinkToken(requests[0].link_token);
    REQUIRE(signed_request.has_value());
    REQUIRE(signed_request->is_signed);
    REQUIRE_FALSE(signed_request->IsCancelled());
    const auto pending = orchestrator.FindByLinkToken(requests[1].link_token);
    REQUIRE(pending.has_value());
    REQUIRE(pending->IsCancelled());
  }
}
