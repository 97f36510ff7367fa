/* File: orchestrator.hpp
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

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "cms_signer.hpp"
#include "config.hpp"
#include "ephemeral_issuer.hpp"
#include "lifecycle.hpp"
#include "notifier.hpp"
#include "pdf_pod_structs.hpp"
#include "pdf_signer.hpp"
#include "proof_journal.hpp"
#include "request_store.hpp"
#include "signable_document.hpp"
#include "signature_request.hpp"
#include "sqlite_db.hpp"
#include "trust_material.hpp"

namespace pdfseal::workflow {

/// @brief what the signer submits with the signature
struct SignerProofInputs {
  std::string otp_code;
  journal::HttpProvenance http;
  std::optional<pdf::RgbImage> signature_image;
  // text searched in the page content to place the stamp
  std::optional<std::string> anchor_marker;
  // pre-placed unsigned field to sign
  std::optional<std::string> target_field;
};

/**
 * @brief Ordered multi-party signing of one document
 * @details Safe to use from several threads for different documents. For one
 * document a duplicate completion is rejected by the request state.
 */
class SignatureOrchestrator {
 public:
  using Clock = std::function<TimePoint()>;

  /**
   * @brief Construct a new Signature Orchestrator
   * @param config signing, otp and journal sections are used
   * @param trust organisation, CA and TSA identities
   * @param db requests and proof records storage
   * @param timestamper RFC 3161 token source for the approval signatures
   * @param notifier may be null
   * @throws std::invalid_argument on null trust or db, empty timestamper
   * @throws storage::StorageError
   */
  SignatureOrchestrator(Config config,
                        std::shared_ptr<const crypto::TrustMaterial> trust,
                        storage::SharedDb db, crypto::TimestampFunc timestamper,
                        std::shared_ptr<INotifier> notifier = nullptr);

  /**
   * @brief Add the certification signature to the original document
   * @details The result becomes the latest pdf of the document.
   * @throws OrchestratorError if the document was already certified
   * @throws pdf::PdfSignError, tsa::TsaError
   */
  BytesVector CertifyDocument(SignableDocument &doc,
                              std::optional<std::string> field_name = {});

  /**
   * @brief Create one request per signer, orders 1..N
   * @throws OrchestratorError if the document has active requests, the list
   * is empty, a signer has no name or email, an email is repeated
   */
  std::vector<SignatureRequest> CreateRequests(
    const SignableDocument &doc, const std::vector<Signer> &signers);

  /**
   * @brief Generate a fresh 6-digit code for the request
   * @details The previous code is discarded. The first signer's code starts
   * the signing of a draft document.
   * @return std::string the code
   * @throws AlreadySignedError, OrchestratorError
   */
  std::string IssueOtp(SignableDocument &doc, int64_t request_id);

  /// @brief ValidateAndConsume with the configured age and the current time
  OtpCheck ValidateAndConsume(int64_t request_id, const std::string &otp);

  /**
   * @brief Check the code
   * @details Valid if the code matches and now <= generated + max_age. Only a
   * valid check changes the request (validation time).
   * @throws OrchestratorError if the request doesn't exist
   */
  OtpCheck ValidateAndConsume(int64_t request_id, const std::string &otp,
                              std::chrono::minutes max_age, TimePoint now);

  /**
   * @brief Check that the request is the next one to sign
   * @details The state is read from the storage.
   * @throws NotYourTurnError if a lower order request is unsigned
   * @throws AlreadySignedError if the request is signed
   * @throws OrchestratorError if the request is cancelled or missing
   */
  void AssertTurn(const SignatureRequest &request) const;

  /**
   * @brief Sign the document for the request
   * @details Issues a signer certificate, adds the approval signature with a
   * fresh timestamp, records the proof and marks the request signed in one
   * transaction, then updates the document status. On failure the request,
   * the document status and the latest pdf are unchanged.
   * @param doc the document
   * @param request_id request being completed
   * @param pdf_in current signed artifact, must equal doc.LatestPdf()
   * @param inputs OTP, provenance, stamp options
   * @return BytesVector the new artifact
   * @throws OrchestratorError if the document is not certified or pdf_in is
   * not the latest artifact
   * @throws NotYourTurnError, AlreadySignedError, InvalidOtpError,
   * pdf::PdfSignError, tsa::TsaError,
   * journal::IntegrityError, storage::StorageError
   */
  BytesVector CompleteSignature(SignableDocument &doc, int64_t request_id,
                                const BytesVector &pdf_in,
                                const SignerProofInputs &inputs);

  /// @brief cancelled requests are found too
  [[nodiscard]] std::optional<SignatureRequest> FindByLinkToken(
    const std::string &token) const;

  /// @brief the first unsigned request after this one
  [[nodiscard]] std::optional<SignatureRequest> NextSigner(
    const SignatureRequest &request) const;

  /// @brief <signer id>-<slug of the name>
  [[nodiscard]] static std::string SignatureFieldName(
    const SignatureRequest &request);

  [[nodiscard]] const DocumentLifecycle &Lifecycle() const noexcept {
    return lifecycle_;
  }

  [[nodiscard]] const journal::ProofJournal &Journal() const noexcept {
    return journal_;
  }

  [[nodiscard]] const RequestStore &Requests() const noexcept {
    return *requests_;
  }

  /// @brief Set(Mock) the time source, default std::chrono::system_clock
  void SetClock(Clock clock) { clock_ = std::move(clock); }

 private:
  /// @throws OrchestratorError if pdf_in is not the latest artifact
  void AssertLatestArtifact(const SignableDocument &doc,
                            const SignatureRequest &request,
                            const BytesVector &pdf_in) const;

  SignatureRequest LoadRequest(int64_t request_id,
                               const std::string &func_name) const;

  void NotifyOtpIssued(const SignableDocument &doc,
                       const SignatureRequest &request,
                       const std::string &code) const noexcept;
  void NotifySignatureCompleted(const SignableDocument &doc,
                                const SignatureRequest &request) const noexcept;
  void NotifyDocumentSigned(const SignableDocument &doc) const noexcept;

  Config config_;
  std::shared_ptr<const crypto::TrustMaterial> trust_;
  storage::SharedDb db_;
  std::shared_ptr<RequestStore> requests_;
  std::shared_ptr<journal::ProofStore> proofs_;
  journal::ProofJournal journal_;
  DocumentLifecycle lifecycle_;
  crypto::EphemeralIssuer issuer_;
  pdf::PdfSigner signer_;
  std::shared_ptr<INotifier> notifier_;
  Clock clock_ = [] { return std::chrono::system_clock::now(); };
};

}  // namespace pdfseal::workflow
