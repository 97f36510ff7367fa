/* File: proof_journal.cpp
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

#include "proof_journal.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <fstream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <utility>

#include "hash_utils.hpp"
#include "journal_errors.hpp"
#include "logger_utils.hpp"
#include "pdf.hpp"
#include "pdf_signer.hpp"
#include "tsa_errors.hpp"
#include "tst_info.hpp"

namespace pdfseal::journal {

namespace {

/// @brief the signature of the earliest incremental update
std::optional<std::string> FindCertificationField(const BytesVector &data) {
  pdf::Pdf doc(data);
  if (!doc.FindSignatures()) {
    return std::nullopt;
  }
  std::optional<std::string> res;
  uint64_t min_end = std::numeric_limits<uint64_t>::max();
  for (unsigned int i = 0; i < doc.GetSignaturesCount(); ++i) {
    const auto ranges = doc.GetSigByteRanges(i);
    if (ranges.size() != 2) {
      continue;
    }
    const uint64_t end = ranges[1].first + ranges[1].second;
    if (end < min_end) {
      min_end = end;
      res = doc.GetSigFieldName(i);
    }
  }
  return res;
}

std::string SealBody(const json::object &journal) {
  return json::serialize(journal);
}

}  // namespace

ProofJournal::ProofJournal(std::shared_ptr<ProofStore> store,
                           JournalConfig config, std::string certifier_name)
    : store_(std::move(store)),
      config_(std::move(config)),
      certifier_name_(std::move(certifier_name)) {
  if (!store_) {
    throw std::invalid_argument("[ProofJournal] proof store is null");
  }
}

ProofRecord ProofJournal::Record(const workflow::SignableDocument &doc,
                                 const workflow::SignatureRequest &request,
                                 const BytesVector &pdf_before,
                                 const BytesVector &pdf_after,
                                 const std::string &field_name,
                                 const HttpProvenance &http,
                                 TimePoint signature_time) {
  const std::string func_name = "[ProofJournal::Record] ";
  if (!request.otp_code || request.otp_code->empty()) {
    throw IntegrityError(func_name + "no OTP code for request " +
                         std::to_string(request.id));
  }
  if (!request.otp_generated_at) {
    throw IntegrityError(func_name + "no OTP generation time for request " +
                         std::to_string(request.id));
  }
  if (pdf_after.empty()) {
    throw IntegrityError(func_name + "empty signed document");
  }
  auto logger = logger::InitLog();

  ProofRecord record;
  record.document_id = doc.DocumentId();
  record.request_id = request.id;
  record.field_name = field_name;
  record.signer_role = workflow::SignerRole(request.signer);
  record.signer_name = workflow::SignerName(request.signer);
  record.signer_email = workflow::SignerEmail(request.signer);
  record.otp_code = request.otp_code.value();
  record.otp_generated_at = request.otp_generated_at.value();
  record.otp_validated_at = signature_time;
  record.otp_validated = true;
  record.http = http;
  record.signature_timestamp = signature_time;
  record.pdf_hash_before = crypto::Sha256Hex(pdf_before);
  record.pdf_hash_after = crypto::Sha256Hex(pdf_after);

  std::optional<crypto::CmsSignatureInfo> info;
  try {
    info = pdf::ExtractSignatureInfo(pdf_after, field_name);
  } catch (const std::exception &ex) {
    throw IntegrityError(func_name + "can't extract the certificate from " +
                         field_name + " " + ex.what());
  }
  const crypto::Certificate &cert = info->signer_cert;
  record.certificate_pem = cert.ToPem();
  record.certificate_fingerprint = cert.Fingerprint();
  record.certificate_subject_dn = cert.SubjectDN();
  record.certificate_issuer_dn = cert.IssuerDN();
  record.certificate_valid_from = cert.NotBefore();
  record.certificate_valid_until = cert.NotAfter();
  const auto cert_email = cert.Email();
  if (cert_email && cert_email.value() != record.signer_email && logger) {
    logger->warn("{}certificate email {} differs from the signer email {}",
                 func_name, cert_email.value(), record.signer_email);
  }

  if (info->timestamp_token) {
    record.tsa_token = info->timestamp_token;
    try {
      const tsa::TstInfo tst = tsa::ParseTimestampToken(
        info->timestamp_token.value());
      record.tsa_serial = tst.serial;
      record.tsa_timestamp = TimePointToIso8601(tst.gen_time) +
                             " (serial: " + std::to_string(tst.serial) + ")";
    } catch (const tsa::TsaError &ex) {
      if (logger) {
        logger->warn("{}unreadable timestamp token in {}: {}", func_name,
                     field_name, ex.what());
      }
    }
  } else if (logger) {
    logger->warn("{}no timestamp token in {}", func_name, field_name);
  }

  record.id = store_->Insert(record);
  if (logger) {
    logger->info("{}proof {} recorded, document {} field {} fingerprint {}",
                 func_name, record.id, record.document_id, field_name,
                 record.certificate_fingerprint.substr(0, 16));
  }
  return record;
}

json::object ProofJournal::AssembleJournal(
  const workflow::SignableDocument &doc) const {
  const std::string func_name = "[ProofJournal::AssembleJournal] ";
  auto logger = logger::InitLog();
  const auto records = store_->ListForDocument(doc.DocumentId());
  const BytesVector latest = doc.LatestPdf();

  json::object journal;
  {
    json::object document;
    document["type"] = doc.GetFilePrefix();
    document["id"] = doc.DocumentId();
    document["name"] = doc.GetDocumentName();
    if (latest.empty()) {
      document["pdf_hash_final"] = nullptr;
    } else {
      document["pdf_hash_final"] = crypto::Sha256Hex(latest);
    }
    document["status"] = workflow::StatusToString(doc.GetStatus());
    journal["document"] = std::move(document);
  }

  json::value timestamp_t0 = nullptr;
  {
    json::object certification;
    certification["certifier"] = certifier_name_;
    certification["certificate_subject"] = nullptr;
    certification["certificate_issuer"] = nullptr;
    if (!latest.empty()) {
      try {
        const auto field = FindCertificationField(latest);
        if (field) {
          const auto info = pdf::ExtractSignatureInfo(latest, field.value());
          certification["field_name"] = field.value();
          certification["certificate_subject"] = info.signer_cert.SubjectDN();
          certification["certificate_issuer"] = info.signer_cert.IssuerDN();
          if (info.timestamp_token) {
            timestamp_t0 = TimePointToIso8601(
              tsa::ParseTimestampToken(info.timestamp_token.value()).gen_time);
          }
        }
      } catch (const std::exception &ex) {
        if (logger) {
          logger->warn("{}can't read the certification signature: {}",
                       func_name, ex.what());
        }
      }
    }
    certification["timestamp_t0"] = timestamp_t0;
    journal["certification"] = std::move(certification);
  }

  json::array signatures;
  for (const auto &record : records) {
    signatures.emplace_back(record.ToJson());
  }
  journal["signatures"] = std::move(signatures);
  journal["signature_count"] = records.size();
  {
    json::object timestamps;
    timestamps["t0_certification"] = timestamp_t0;
    if (records.empty()) {
      timestamps["t_final"] = nullptr;
    } else {
      timestamps["t_final"] =
        TimePointToIso8601(records.back().signature_timestamp);
    }
    journal["timestamps"] = std::move(timestamps);
  }
  {
    json::object audit;
    audit["generated_at"] =
      TimePointToIso8601(std::chrono::system_clock::now());
    audit["journal_version"] = kJournalVersion;
    journal["audit"] = std::move(audit);
  }
  const std::string seal_key = config_.seal_key;
  if (!seal_key.empty()) {
    const std::string hmac =
      crypto::HmacSha256Hex(seal_key, SealBody(journal));
    journal["audit"].as_object()["hmac_sha256"] = hmac;
  }
  if (logger) {
    logger->info("{}journal of {} assembled, {} signatures", func_name,
                 doc.DocumentId(), records.size());
  }
  return journal;
}

void ProofJournal::ExportJournal(const workflow::SignableDocument &doc,
                                 const std::string &path) const {
  const std::string func_name = "[ProofJournal::ExportJournal] ";
  const json::object journal = AssembleJournal(doc);
  std::ofstream file(path, std::ios_base::binary | std::ios_base::trunc);
  if (!file.is_open()) {
    throw std::runtime_error(func_name + "can't open " + path);
  }
  file << json::serialize(journal);
  file.close();
  if (file.fail()) {
    throw std::runtime_error(func_name + "can't write " + path);
  }
}

bool ProofJournal::VerifySeal(const json::object &journal,
                              const std::string &key) noexcept {
  if (key.empty()) {
    return false;
  }
  try {
    json::object body = journal;
    auto *audit = body.if_contains("audit");
    if (audit == nullptr || !audit->is_object()) {
      return false;
    }
    auto &audit_obj = audit->as_object();
    const auto *hmac = audit_obj.if_contains("hmac_sha256");
    if (hmac == nullptr || !hmac->is_string()) {
      return false;
    }
    const std::string expected(hmac->as_string().c_str());
    // the seal is the last member of the audit block
    audit_obj.erase("hmac_sha256");
    return crypto::HmacSha256Hex(key, SealBody(body)) == expected;
  } catch (const std::exception &) {
    return false;
  }
}

}  // namespace pdfseal::journal
