/* File: cli_utils.cpp
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

#include "cli_utils.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/json.hpp>
#include <chrono>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "ephemeral_issuer.hpp"
#include "internal_tsa.hpp"
#include "lifecycle.hpp"
#include "pdf.hpp"
#include "pdf_signer.hpp"
#include "proof_journal.hpp"
#include "proof_store.hpp"
#include "request_store.hpp"
#include "serial_allocator.hpp"
#include "signature_info.hpp"
#include "tr.hpp"
#include "tst_info.hpp"

namespace pdfseal::cli {

namespace json = boost::json;

bool CheckInputFile(const std::string &file, bool expect_pdf,
                    const std::shared_ptr<spdlog::logger> &log) {
  try {
    if (!std::filesystem::exists(file)) {
      log->error(trs("File not found") + " " + file);
      return false;
    }
    if (!std::filesystem::is_regular_file(file)) {
      log->error(trs("This file is not a regular file") + " " + file);
      return false;
    }
    if (std::filesystem::file_size(file) == 0) {
      log->error(trs("File is empty") + " " + file);
      return false;
    }
    if (!expect_pdf) {
      return true;
    }
    if (std::filesystem::file_size(file) < 10) {
      log->error(trs("File is too small") + " " + file);
      return false;
    }
    // read 10 bytes to string
    auto ifile = std::ifstream(file, std::ios_base::binary);
    if (!ifile.is_open()) {
      log->error(trs("Can not open file") + " " + file);
      return false;
    }
    std::string read_buff;
    read_buff.resize(10, 0x00);
    if (!ifile.read(read_buff.data(), 10)) {
      log->error(trs("Can not read the file") + " " + file);
      return false;
    }
    if (!boost::contains(read_buff, "PDF")) {
      log->error(trs("Not a pdf file") + " " + file);
      return false;
    }
  } catch (const std::exception &ex) {
    log->error(ex.what());
    return false;
  }
  return true;
}

bool CheckOutputDir(const std::string &output_file,
                    const std::shared_ptr<spdlog::logger> &log) {
  const std::filesystem::path output_dir =
    std::filesystem::path(output_file).parent_path();
  std::error_code err;
  if (!std::filesystem::is_directory(output_dir, err)) {
    log->error(trs("Directory not found") + " " + output_dir.string());
    return false;
  }
  const std::filesystem::path tmp_filename =
    output_dir / "test_temporary_file_for_pdfseal";
  std::ofstream ofile(tmp_filename);
  if (!ofile.is_open()) {
    log->error(trs("Can not create file in directory") + " " +
               output_dir.string());
    return false;
  }
  ofile.close();
  std::filesystem::remove(tmp_filename, err);
  return true;
}

std::optional<BytesVector> FileToVector(const std::string &path) noexcept {
  namespace fs = std::filesystem;
  std::error_code err;
  if (path.empty() || !fs::exists(path, err)) {
    return std::nullopt;
  }
  std::ifstream file(path, std::ios_base::binary);
  if (!file.is_open()) {
    return std::nullopt;
  }
  BytesVector res;
  try {
    res.assign(std::istreambuf_iterator<char>(file),
               std::istreambuf_iterator<char>());
  } catch ([[maybe_unused]] const std::exception &ex) {
    return std::nullopt;
  }
  return res;
}

void VectorToFile(const BytesVector &data, const std::string &path) {
  std::ofstream file(path, std::ios_base::binary | std::ios_base::trunc);
  if (!file.is_open()) {
    throw std::runtime_error("[VectorToFile] can't open " + path);
  }
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  file.write(reinterpret_cast<const char *>(data.data()),
             static_cast<std::streamsize>(data.size()));
  file.close();
  if (file.fail()) {
    throw std::runtime_error("[VectorToFile] can't write " + path);
  }
}

std::optional<workflow::DocumentKind> ParseDocumentKind(
  const std::string &val) noexcept {
  using workflow::DocumentKind;
  if (val == "lease") {
    return DocumentKind::kLease;
  }
  if (val == "inventory") {
    return DocumentKind::kInventory;
  }
  if (val == "receipt") {
    return DocumentKind::kRentReceipt;
  }
  if (val == "amendment") {
    return DocumentKind::kAmendment;
  }
  if (val == "insurance") {
    return DocumentKind::kInsurance;
  }
  return std::nullopt;
}

Services LoadServices(const std::string &config_path) {
  Services res;
  res.config = LoadConfig(config_path);
  res.trust = crypto::TrustMaterial::Load(res.config.trust);
  res.db = std::make_shared<storage::SqliteDb>(res.config.storage.database);
  storage::SharedDb serial_db =
    res.config.tsa.serial_db.empty()
      ? res.db
      : std::make_shared<storage::SqliteDb>(res.config.tsa.serial_db);
  auto authority = std::make_shared<tsa::InternalTsa>(
    res.trust, std::make_shared<tsa::SerialAllocator>(std::move(serial_db)),
    res.config.tsa.policy_oid);
  res.timestamp_client = std::make_shared<tsa::TimestampClient>(
    std::move(authority), std::chrono::milliseconds(res.config.tsa.timeout_ms));
  return res;
}

bool PerformCertify(const Options &options, const Services &services,
                    const std::shared_ptr<spdlog::logger> &log) {
  const auto data = FileToVector(options.GetInputFile());
  if (!data) {
    log->error(trs("Can not read the file") + " " + options.GetInputFile());
    return false;
  }
  pdf::CertifyParams params;
  params.identity = &services.trust->Organisation();
  params.validation_certs = services.trust->ValidationCertsDer();
  params.signing_time = std::chrono::system_clock::now();
  params.field_name = options.GetField();
  const pdf::PdfSigner signer(services.config.signing,
                              services.timestamp_client->AsTimestampFunc());
  const BytesVector result = signer.CertifyDocument(data.value(), params);
  VectorToFile(result, options.GetOutputFile());
  log->info(trs("Certified document written to") + " " +
            options.GetOutputFile());
  return true;
}

bool PerformApprove(const Options &options, const Services &services,
                    const std::shared_ptr<spdlog::logger> &log) {
  const auto data = FileToVector(options.GetInputFile());
  if (!data) {
    log->error(trs("Can not read the file") + " " + options.GetInputFile());
    return false;
  }
  const crypto::EphemeralIssuer issuer(services.trust);
  crypto::SignerCredential credential =
    issuer.Issue({options.GetSignerName(), options.GetSignerEmail()},
                 services.config.signing.org_unit);
  if (credential.SelfSigned()) {
    log->warn(tr("No internal CA, the signer certificate is self-signed"));
  }
  pdf::ApproveParams params;
  params.credential = &credential;
  params.signer_name = options.GetSignerName();
  params.signer_email = options.GetSignerEmail();
  params.signing_time = std::chrono::system_clock::now();
  params.anchor_marker = options.GetMarker();
  params.target_field = options.GetField();
  params.field_name = options.GetField().value_or(
    "cli-" + Slugify(options.GetSignerName()));
  const pdf::PdfSigner signer(services.config.signing,
                              services.timestamp_client->AsTimestampFunc());
  const BytesVector result = signer.ApproveDocument(data.value(), params);
  VectorToFile(result, options.GetOutputFile());
  log->info(trs("Signed document written to") + " " + options.GetOutputFile());
  return true;
}

bool PerformJournal(const Options &options, const Services &services,
                    const std::shared_ptr<spdlog::logger> &log) {
  const auto kind = ParseDocumentKind(options.GetDocumentKind());
  if (!kind) {
    log->error(trs("Unknown document kind") + " " + options.GetDocumentKind());
    return false;
  }
  auto data = FileToVector(options.GetInputFile());
  if (!data) {
    log->error(trs("Can not read the file") + " " + options.GetInputFile());
    return false;
  }
  workflow::MemoryDocument doc(options.GetDocumentId(), kind.value(),
                               data.value());
  doc.SetLatestPdf(std::move(data.value()));
  auto requests = std::make_shared<workflow::RequestStore>(services.db);
  auto proofs = std::make_shared<journal::ProofStore>(services.db);
  const workflow::DocumentLifecycle lifecycle(requests, proofs);
  if (proofs->CountForDocument(doc.DocumentId()) > 0) {
    lifecycle.MarkSigningStarted(doc);
  }
  lifecycle.Reevaluate(doc);

  const journal::ProofJournal journal(proofs, services.config.journal,
                                      services.config.signing.certifier_name);
  const std::string output = options.GetOutputFile();
  if (output.empty()) {
    std::cout << json::serialize(journal.AssembleJournal(doc)) << "\n";
    return true;
  }
  journal.ExportJournal(doc, output);
  log->info(trs("Journal written to") + " " + output);
  return true;
}

bool PerformTimestamp(const Options &options, const Services &services,
                      const std::shared_ptr<spdlog::logger> &log) {
  const auto data = FileToVector(options.GetInputFile());
  if (!data) {
    log->error(trs("Can not read the file") + " " + options.GetInputFile());
    return false;
  }
  const BytesVector token = services.timestamp_client->Timestamp(data.value());
  VectorToFile(token, options.GetOutputFile());
  const tsa::TstInfo tst_info = tsa::ParseTimestampToken(token);
  std::cout << json::serialize(tst_info.ToJson()) << "\n";
  log->info(trs("Timestamp token written to") + " " + options.GetOutputFile());
  return true;
}

namespace {

json::object CertificateToJson(const crypto::Certificate &cert) {
  json::object res;
  res["subject"] = cert.SubjectDN();
  res["issuer"] = cert.IssuerDN();
  res["serial"] = VecBytesStringRepresentation(cert.Serial());
  res["fingerprint"] = cert.Fingerprint();
  res["not_before"] = TimePointToIso8601(cert.NotBefore());
  res["not_after"] = TimePointToIso8601(cert.NotAfter());
  const auto email = cert.Email();
  if (email) {
    res["email"] = email.value();
  }
  return res;
}

json::object SignatureToJson(pdf::Pdf &doc, unsigned int sig_index,
                             size_t file_size,
                             const std::shared_ptr<spdlog::logger> &log) {
  json::object res;
  res["field_name"] = doc.GetSigFieldName(sig_index);
  const auto ranges = doc.GetSigByteRanges(sig_index);
  json::array ranges_json;
  for (const auto &range : ranges) {
    ranges_json.emplace_back(json::array{range.first, range.second});
  }
  res["byte_range"] = std::move(ranges_json);
  res["covers_whole_file"] =
    ranges.size() == 2 && ranges[1].first + ranges[1].second == file_size;
  const BytesVector raw_signature = doc.GetRawSignature(sig_index);
  res["cms_valid"] =
    crypto::VerifyDetachedCms(raw_signature, doc.GetRawData(sig_index));
  try {
    const crypto::CmsSignatureInfo info =
      crypto::ParseCmsSignature(raw_signature);
    res["signer"] = CertificateToJson(info.signer_cert);
    if (info.signing_time) {
      res["signing_time"] = TimePointToIso8601(info.signing_time.value());
    }
    if (info.timestamp_token) {
      res["timestamp"] =
        tsa::ParseTimestampToken(info.timestamp_token.value()).ToJson();
    } else {
      res["timestamp"] = nullptr;
    }
  } catch (const std::exception &ex) {
    log->warn(trs("Can not parse the signature") + " " +
              std::to_string(sig_index) + " " + ex.what());
    res["error"] = ex.what();
  }
  return res;
}

}  // namespace

bool PerformInfo(const Options &options,
                 const std::shared_ptr<spdlog::logger> &log) {
  auto data = FileToVector(options.GetInputFile());
  if (!data) {
    log->error(trs("Can not read the file") + " " + options.GetInputFile());
    return false;
  }
  const size_t file_size = data->size();
  pdf::Pdf doc(std::move(data.value()));
  json::object res;
  res["file"] = options.GetInputFile();
  res["pages"] = doc.GetPagesCount();
  res["certified"] = doc.HasDocMdp();
  json::array signatures;
  if (doc.FindSignatures()) {
    for (unsigned int i = 0; i < doc.GetSignaturesCount(); ++i) {
      signatures.emplace_back(SignatureToJson(doc, i, file_size, log));
    }
  }
  res["signature_count"] = signatures.size();
  res["signatures"] = std::move(signatures);
  std::cout << json::serialize(res) << "\n";
  return true;
}

}  // namespace pdfseal::cli
