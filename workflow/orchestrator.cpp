/* File: orchestrator.cpp
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

#include "orchestrator.hpp"

#include <openssl/crypto.h>

#include <exception>
#include <mutex>
#include <random>
#include <set>
#include <stdexcept>
#include <utility>

#include "hash_utils.hpp"
#include "logger_utils.hpp"
#include "utils.hpp"
#include "workflow_errors.hpp"

namespace pdfseal::workflow {

namespace {

constexpr size_t kLinkTokenSize = 16;
constexpr int kOtpMin = 100000;
constexpr int kOtpMax = 999999;

std::string GenerateOtp() {
  std::random_device rand_dev;
  std::mt19937 gen(rand_dev());
  std::uniform_int_distribution<int> dist(kOtpMin, kOtpMax);
  return std::to_string(dist(gen));
}

bool SameCode(const std::string &left, const std::string &right) noexcept {
  return left.size() == right.size() &&
         CRYPTO_memcmp(left.data(), right.data(), left.size()) == 0;
}

}  // namespace

SignatureOrchestrator::SignatureOrchestrator(
  Config config, std::shared_ptr<const crypto::TrustMaterial> trust,
  storage::SharedDb db, crypto::TimestampFunc timestamper,
  std::shared_ptr<INotifier> notifier)
    : config_(std::move(config)),
      trust_(std::move(trust)),
      db_(std::move(db)),
      requests_(std::make_shared<RequestStore>(db_)),
      proofs_(std::make_shared<journal::ProofStore>(db_)),
      journal_(proofs_, config_.journal, config_.signing.certifier_name),
      lifecycle_(requests_, proofs_),
      issuer_(trust_),
      signer_(config_.signing, std::move(timestamper)),
      notifier_(std::move(notifier)) {}

BytesVector SignatureOrchestrator::CertifyDocument(
  SignableDocument &doc, std::optional<std::string> field_name) {
  const std::string func_name = "[SignatureOrchestrator::CertifyDocument] ";
  if (!doc.LatestPdf().empty()) {
    throw OrchestratorError(func_name + "document " + doc.DocumentId() +
                            " is already certified");
  }
  if (doc.GetStatus() != DocumentStatus::kDraft) {
    throw OrchestratorError(func_name + "document " + doc.DocumentId() +
                            " is " + StatusToString(doc.GetStatus()));
  }
  pdf::CertifyParams params;
  params.identity = &trust_->Organisation();
  params.validation_certs = trust_->ValidationCertsDer();
  params.signing_time = clock_();
  params.field_name = std::move(field_name);
  BytesVector res = signer_.CertifyDocument(doc.OriginalPdf(), params);
  doc.SetLatestPdf(res);
  return res;
}

std::vector<SignatureRequest> SignatureOrchestrator::CreateRequests(
  const SignableDocument &doc, const std::vector<Signer> &signers) {
  const std::string func_name = "[SignatureOrchestrator::CreateRequests] ";
  if (signers.empty()) {
    throw OrchestratorError(func_name + "no signers");
  }
  const DocumentStatus status = doc.GetStatus();
  if (status == DocumentStatus::kSigned ||
      status == DocumentStatus::kCancelled) {
    throw OrchestratorError(func_name + "document " + doc.DocumentId() +
                            " is " + StatusToString(status));
  }
  std::set<std::string> emails;
  for (const auto &signer : signers) {
    if (SignerName(signer).empty() || SignerEmail(signer).empty()) {
      throw OrchestratorError(func_name + "signer without name or email");
    }
    if (!emails.insert(SignerEmail(signer)).second) {
      throw OrchestratorError(func_name + "duplicate signer email " +
                              SignerEmail(signer));
    }
  }
  {
    storage::Transaction txn(*db_);
    if (requests_->CountActive(doc.DocumentId()) != 0) {
      throw OrchestratorError(func_name + "document " + doc.DocumentId() +
                              " already has signature requests");
    }
    int order = 0;
    for (const auto &signer : signers) {
      SignatureRequest request;
      request.document_id = doc.DocumentId();
      request.order = ++order;
      request.signer = signer;
      request.link_token =
        VecBytesStringRepresentation(crypto::RandomBytes(kLinkTokenSize));
      request.id = requests_->Insert(request);
    }
    txn.Commit();
  }
  auto logger = logger::InitLog();
  if (logger) {
    logger->info("{}{} requests created for document {}", func_name,
                 signers.size(), doc.DocumentId());
  }
  return requests_->ListForDocument(doc.DocumentId());
}

std::string SignatureOrchestrator::IssueOtp(SignableDocument &doc,
                                            int64_t request_id) {
  const std::string func_name = "[SignatureOrchestrator::IssueOtp] ";
  const SignatureRequest request = LoadRequest(request_id, func_name);
  if (request.document_id != doc.DocumentId()) {
    throw OrchestratorError(func_name + "request " +
                            std::to_string(request_id) +
                            " belongs to another document");
  }
  if (request.is_signed) {
    throw AlreadySignedError(func_name + "request " +
                             std::to_string(request_id) + " is signed");
  }
  if (request.IsCancelled()) {
    throw OrchestratorError(func_name + "request " +
                            std::to_string(request_id) + " is cancelled");
  }
  const std::string code = GenerateOtp();
  requests_->UpdateOtp(request_id, code, clock_());
  if (request.order == 1) {
    lifecycle_.MarkSigningStarted(doc);
  }
  auto logger = logger::InitLog();
  if (logger) {
    logger->info("{}code issued for request {} of document {}", func_name,
                 request_id, doc.DocumentId());
  }
  NotifyOtpIssued(doc, LoadRequest(request_id, func_name), code);
  return code;
}

OtpCheck SignatureOrchestrator::ValidateAndConsume(int64_t request_id,
                                                   const std::string &otp) {
  return ValidateAndConsume(request_id, otp,
                            std::chrono::minutes(config_.otp.max_age_minutes),
                            clock_());
}

OtpCheck SignatureOrchestrator::ValidateAndConsume(int64_t request_id,
                                                   const std::string &otp,
                                                   std::chrono::minutes max_age,
                                                   TimePoint now) {
  const std::string func_name = "[SignatureOrchestrator::ValidateAndConsume] ";
  const SignatureRequest request = LoadRequest(request_id, func_name);
  if (!request.otp_code || request.otp_code->empty() ||
      !request.otp_generated_at) {
    return OtpCheck::kNotIssued;
  }
  if (!SameCode(request.otp_code.value(), otp)) {
    return OtpCheck::kWrongCode;
  }
  if (now > request.otp_generated_at.value() + max_age) {
    return OtpCheck::kExpired;
  }
  requests_->SetOtpValidated(request_id, now);
  return OtpCheck::kValid;
}

void SignatureOrchestrator::AssertTurn(const SignatureRequest &request) const {
  const std::string func_name = "[SignatureOrchestrator::AssertTurn] ";
  const std::lock_guard<std::recursive_mutex> lock(db_->Mutex());
  const SignatureRequest stored = LoadRequest(request.id, func_name);
  if (stored.is_signed) {
    throw AlreadySignedError(func_name + "request " +
                             std::to_string(stored.id) + " is signed");
  }
  if (stored.IsCancelled()) {
    throw OrchestratorError(func_name + "request " +
                            std::to_string(stored.id) + " is cancelled");
  }
  for (const auto &other : requests_->ListForDocument(stored.document_id)) {
    if (other.IsPending()) {
      if (other.id != stored.id) {
        throw NotYourTurnError(func_name + "not your turn, request " +
                               std::to_string(other.id) + " (order " +
                               std::to_string(other.order) +
                               ") must be signed first");
      }
      return;
    }
  }
  throw OrchestratorError(func_name + "request " + std::to_string(stored.id) +
                          " is not in the document signing order");
}

void SignatureOrchestrator::AssertLatestArtifact(
  const SignableDocument &doc, const SignatureRequest &request,
  const BytesVector &pdf_in) const {
  const std::string func_name =
    "[SignatureOrchestrator::AssertLatestArtifact] ";
  const std::lock_guard<std::recursive_mutex> lock(db_->Mutex());
  if (doc.LatestPdf() == pdf_in) {
    return;
  }
  // a concurrent completion of the same request replaced the artifact
  AssertTurn(request);
  throw OrchestratorError(func_name + "document " + doc.DocumentId() +
                          " has a newer signed version");
}

BytesVector SignatureOrchestrator::CompleteSignature(
  SignableDocument &doc, int64_t request_id, const BytesVector &pdf_in,
  const SignerProofInputs &inputs) {
  const std::string func_name = "[SignatureOrchestrator::CompleteSignature] ";
  auto logger = logger::InitLog();
  SignatureRequest request = LoadRequest(request_id, func_name);
  if (request.document_id != doc.DocumentId()) {
    throw OrchestratorError(func_name + "request " +
                            std::to_string(request_id) +
                            " belongs to another document");
  }
  if (doc.GetStatus() == DocumentStatus::kCancelled) {
    throw OrchestratorError(func_name + "document " + doc.DocumentId() +
                            " is cancelled");
  }
  if (doc.GetStatus() == DocumentStatus::kSigned) {
    throw AlreadySignedError(func_name + "document " + doc.DocumentId() +
                             " is signed");
  }
  if (pdf_in.empty()) {
    throw OrchestratorError(func_name + "empty pdf");
  }
  if (doc.LatestPdf().empty()) {
    throw OrchestratorError(func_name + "document " + doc.DocumentId() +
                            " is not certified");
  }
  // (a) order and OTP
  AssertTurn(request);
  AssertLatestArtifact(doc, request, pdf_in);
  const OtpCheck check = ValidateAndConsume(request_id, inputs.otp_code);
  if (check != OtpCheck::kValid) {
    throw InvalidOtpError(func_name + "request " + std::to_string(request_id),
                          check);
  }
  request = LoadRequest(request_id, func_name);

  // (b) signer certificate and approval signature
  const TimePoint signature_time = clock_();
  const std::string field_name =
    inputs.target_field.value_or(SignatureFieldName(request));
  crypto::SignerCredential credential = issuer_.Issue(
    {SignerName(request.signer), SignerEmail(request.signer)},
    config_.signing.org_unit);
  if (credential.SelfSigned() && logger) {
    logger->warn("{}request {} signed with a self-signed certificate",
                 func_name, request_id);
  }
  pdf::ApproveParams params;
  params.credential = &credential;
  params.signer_name = SignerName(request.signer);
  params.signer_email = SignerEmail(request.signer);
  params.signing_time = signature_time;
  params.field_name = field_name;
  params.target_field = inputs.target_field;
  params.anchor_marker = inputs.anchor_marker;
  params.image = inputs.signature_image;
  BytesVector pdf_out = signer_.ApproveDocument(pdf_in, params);

  // (c) proof record and (d) signed flag, committed together
  {
    storage::Transaction txn(*db_);
    AssertTurn(request);
    AssertLatestArtifact(doc, request, pdf_in);
    journal_.Record(doc, request, pdf_in, pdf_out, field_name, inputs.http,
                    signature_time);
    if (!requests_->MarkSigned(request_id, signature_time)) {
      throw AlreadySignedError(func_name + "request " +
                               std::to_string(request_id) +
                               " was completed concurrently");
    }
    // artifact and signed flag change under the same lock
    doc.SetLatestPdf(pdf_out);
    try {
      txn.Commit();
    } catch (const std::exception &) {
      doc.SetLatestPdf(pdf_in);
      throw;
    }
  }
  if (logger) {
    logger->info("{}request {} of document {} signed, field {}", func_name,
                 request_id, doc.DocumentId(), field_name);
  }

  // (e) status
  lifecycle_.MarkSigningStarted(doc);
  if (lifecycle_.Reevaluate(doc)) {
    NotifyDocumentSigned(doc);
  } else {
    NotifySignatureCompleted(doc, LoadRequest(request_id, func_name));
  }
  return pdf_out;
}

std::optional<SignatureRequest> SignatureOrchestrator::FindByLinkToken(
  const std::string &token) const {
  if (token.empty()) {
    return std::nullopt;
  }
  return requests_->FindByLinkToken(token);
}

std::optional<SignatureRequest> SignatureOrchestrator::NextSigner(
  const SignatureRequest &request) const {
  for (auto &other : requests_->ListForDocument(request.document_id)) {
    if (other.IsPending() && other.id != request.id) {
      return std::move(other);
    }
  }
  return std::nullopt;
}

std::string SignatureOrchestrator::SignatureFieldName(
  const SignatureRequest &request) {
  const std::string &signer_id = SignerId(request.signer);
  const std::string prefix =
    signer_id.empty() ? std::to_string(request.order) : signer_id;
  return prefix + "-" + Slugify(SignerName(request.signer));
}

SignatureRequest SignatureOrchestrator::LoadRequest(
  int64_t request_id, const std::string &func_name) const {
  auto request = requests_->Get(request_id);
  if (!request) {
    throw OrchestratorError(func_name + "no request " +
                            std::to_string(request_id));
  }
  return std::move(request.value());
}

void SignatureOrchestrator::NotifyOtpIssued(
  const SignableDocument &doc, const SignatureRequest &request,
  const std::string &code) const noexcept {
  if (!notifier_) {
    return;
  }
  try {
    notifier_->OnOtpIssued(doc, request, code);
  } catch (const std::exception &ex) {
    auto logger = logger::InitLog();
    if (logger) {
      logger->error("[SignatureOrchestrator] OnOtpIssued failed {}",
                    ex.what());
    }
  }
}

void SignatureOrchestrator::NotifySignatureCompleted(
  const SignableDocument &doc, const SignatureRequest &request) const noexcept {
  if (!notifier_) {
    return;
  }
  try {
    notifier_->OnSignatureCompleted(doc, request, NextSigner(request));
  } catch (const std::exception &ex) {
    auto logger = logger::InitLog();
    if (logger) {
      logger->error("[SignatureOrchestrator] OnSignatureCompleted failed {}",
                    ex.what());
    }
  }
}

void SignatureOrchestrator::NotifyDocumentSigned(
  const SignableDocument &doc) const noexcept {
  if (!notifier_) {
    return;
  }
  try {
    notifier_->OnDocumentSigned(doc);
  } catch (const std::exception &ex) {
    auto logger = logger::InitLog();
    if (logger) {
      logger->error("[SignatureOrchestrator] OnDocumentSigned failed {}",
                    ex.what());
    }
  }
}

}  // namespace pdfseal::workflow
