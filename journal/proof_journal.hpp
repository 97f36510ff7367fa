/* File: proof_journal.hpp
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

#include <boost/json.hpp>
#include <memory>
#include <string>

#include "config.hpp"
#include "proof_record.hpp"
#include "proof_store.hpp"
#include "signable_document.hpp"
#include "signature_request.hpp"
#include "utils.hpp"

namespace pdfseal::journal {

constexpr const char *const kJournalVersion = "1.0";

/**
 * @brief Forensic journal of the approval signatures
 * @details Records are built from the produced artifact, never from the
 * values used to sign it.
 */
class ProofJournal {
 public:
  /**
   * @brief Construct a new Proof Journal
   * @param store proof records storage
   * @param config seal key for the exported journal
   * @param certifier_name organisation name reported in the journal
   * @throws std::invalid_argument if store is null
   */
  ProofJournal(std::shared_ptr<ProofStore> store, JournalConfig config,
               std::string certifier_name);

  /**
   * @brief Persist the proof of one signature
   * @param doc signed document
   * @param request the request, with the OTP evidence
   * @param pdf_before the document passed to the signer
   * @param pdf_after the produced document
   * @param field_name signature field in pdf_after
   * @param http provenance of the signing request
   * @param signature_time time of the signature, also the OTP validation time
   * @return ProofRecord the stored record
   * @throws IntegrityError if the OTP evidence is missing or the certificate
   * can't be extracted from pdf_after
   * @throws storage::StorageError
   */
  ProofRecord Record(const workflow::SignableDocument &doc,
                     const workflow::SignatureRequest &request,
                     const BytesVector &pdf_before,
                     const BytesVector &pdf_after,
                     const std::string &field_name, const HttpProvenance &http,
                     TimePoint signature_time);

  /**
   * @brief Build the audit journal of the document
   * @details document, certification, signatures (chronological),
   * signature_count, timestamps, audit. The audit block is sealed with
   * HMAC-SHA256 if a seal key is configured.
   * @throws storage::StorageError
   */
  [[nodiscard]] json::object AssembleJournal(
    const workflow::SignableDocument &doc) const;

  /**
   * @brief Write the journal to a file
   * @throws std::runtime_error if the file can't be written
   */
  void ExportJournal(const workflow::SignableDocument &doc,
                     const std::string &path) const;

  /**
   * @brief Check the seal of an assembled journal
   * @return false if the seal is missing or doesn't match
   */
  [[nodiscard]] static bool VerifySeal(const json::object &journal,
                                       const std::string &key) noexcept;

  [[nodiscard]] const std::shared_ptr<ProofStore> &Store() const noexcept {
    return store_;
  }

 private:
  std::shared_ptr<ProofStore> store_;
  JournalConfig config_;
  std::string certifier_name_;
};

}  // namespace pdfseal::journal
