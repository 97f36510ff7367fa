/* File: proof_store.cpp
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

#include "proof_store.hpp"

#include <mutex>
#include <stdexcept>
#include <utility>

namespace pdfseal::journal {

namespace {

constexpr const char *const kSelectColumns =
  "SELECT id, document_id, request_id, field_name, signer_role, signer_name, "
  "signer_email, otp_code, otp_generated_at, otp_validated_at, "
  "otp_validated, ip_address, user_agent, referer, signature_timestamp, "
  "pdf_hash_before, pdf_hash_after, certificate_pem, "
  "certificate_fingerprint, certificate_subject_dn, certificate_issuer_dn, "
  "certificate_valid_from, certificate_valid_until, tsa_timestamp, "
  "tsa_serial, tsa_token "
  "FROM proof_record ";

ProofRecord ReadRow(const storage::Statement &stmt) {
  ProofRecord res;
  res.id = stmt.GetInt64(0);
  res.document_id = stmt.GetText(1);
  res.request_id = stmt.GetInt64(2);
  res.field_name = stmt.GetText(3);
  res.signer_role = stmt.GetText(4);
  res.signer_name = stmt.GetText(5);
  res.signer_email = stmt.GetText(6);
  res.otp_code = stmt.GetText(7);
  res.otp_generated_at = MicrosToTimePoint(stmt.GetInt64(8));
  res.otp_validated_at = MicrosToTimePoint(stmt.GetInt64(9));
  res.otp_validated = stmt.GetInt64(10) != 0;
  res.http.ip_address = stmt.GetText(11);
  res.http.user_agent = stmt.GetText(12);
  res.http.referer = stmt.GetText(13);
  res.signature_timestamp = MicrosToTimePoint(stmt.GetInt64(14));
  res.pdf_hash_before = stmt.GetText(15);
  res.pdf_hash_after = stmt.GetText(16);
  res.certificate_pem = stmt.GetText(17);
  res.certificate_fingerprint = stmt.GetText(18);
  res.certificate_subject_dn = stmt.GetText(19);
  res.certificate_issuer_dn = stmt.GetText(20);
  res.certificate_valid_from = MicrosToTimePoint(stmt.GetInt64(21));
  res.certificate_valid_until = MicrosToTimePoint(stmt.GetInt64(22));
  res.tsa_timestamp = stmt.GetOptionalText(23);
  auto serial = stmt.GetOptionalInt64(24);
  if (serial) {
    res.tsa_serial = static_cast<uint64_t>(serial.value());
  }
  if (!stmt.IsNull(25)) {
    res.tsa_token = stmt.GetBlob(25);
  }
  return res;
}

}  // namespace

ProofStore::ProofStore(storage::SharedDb db) : db_(std::move(db)) {
  if (!db_) {
    throw std::invalid_argument("[ProofStore] database is null");
  }
  const std::lock_guard<std::recursive_mutex> lock(db_->Mutex());
  db_->Exec(
    "CREATE TABLE IF NOT EXISTS proof_record ("
    "id INTEGER PRIMARY KEY AUTOINCREMENT, "
    "document_id TEXT NOT NULL, "
    "request_id INTEGER NOT NULL UNIQUE, "
    "field_name TEXT NOT NULL, "
    "signer_role TEXT NOT NULL, "
    "signer_name TEXT NOT NULL, "
    "signer_email TEXT NOT NULL, "
    "otp_code TEXT NOT NULL, "
    "otp_generated_at INTEGER NOT NULL, "
    "otp_validated_at INTEGER NOT NULL, "
    "otp_validated INTEGER NOT NULL, "
    "ip_address TEXT NOT NULL, "
    "user_agent TEXT NOT NULL, "
    "referer TEXT NOT NULL, "
    "signature_timestamp INTEGER NOT NULL, "
    "pdf_hash_before TEXT NOT NULL, "
    "pdf_hash_after TEXT NOT NULL, "
    "certificate_pem TEXT NOT NULL, "
    "certificate_fingerprint TEXT NOT NULL, "
    "certificate_subject_dn TEXT NOT NULL, "
    "certificate_issuer_dn TEXT NOT NULL, "
    "certificate_valid_from INTEGER NOT NULL, "
    "certificate_valid_until INTEGER NOT NULL, "
    "tsa_timestamp TEXT, "
    "tsa_serial INTEGER, "
    "tsa_token BLOB)");
  db_->Exec(
    "CREATE INDEX IF NOT EXISTS proof_record_document "
    "ON proof_record (document_id, signature_timestamp)");
}

int64_t ProofStore::Insert(const ProofRecord &record) {
  const std::lock_guard<std::recursive_mutex> lock(db_->Mutex());
  auto stmt = db_->Prepare(
    "INSERT INTO proof_record (document_id, request_id, field_name, "
    "signer_role, signer_name, signer_email, otp_code, otp_generated_at, "
    "otp_validated_at, otp_validated, ip_address, user_agent, referer, "
    "signature_timestamp, pdf_hash_before, pdf_hash_after, certificate_pem, "
    "certificate_fingerprint, certificate_subject_dn, certificate_issuer_dn, "
    "certificate_valid_from, certificate_valid_until, tsa_timestamp, "
    "tsa_serial, tsa_token) "
    "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, "
    "?, ?, ?, ?)");
  stmt.Bind(1, record.document_id)
    .Bind(2, record.request_id)
    .Bind(3, record.field_name)
    .Bind(4, record.signer_role)
    .Bind(5, record.signer_name)
    .Bind(6, record.signer_email)
    .Bind(7, record.otp_code)
    .Bind(8, TimePointToMicros(record.otp_generated_at))
    .Bind(9, TimePointToMicros(record.otp_validated_at))
    .Bind(10, static_cast<int64_t>(record.otp_validated ? 1 : 0))
    .Bind(11, record.http.ip_address)
    .Bind(12, record.http.user_agent)
    .Bind(13, record.http.referer)
    .Bind(14, TimePointToMicros(record.signature_timestamp))
    .Bind(15, record.pdf_hash_before)
    .Bind(16, record.pdf_hash_after)
    .Bind(17, record.certificate_pem)
    .Bind(18, record.certificate_fingerprint)
    .Bind(19, record.certificate_subject_dn)
    .Bind(20, record.certificate_issuer_dn)
    .Bind(21, TimePointToMicros(record.certificate_valid_from))
    .Bind(22, TimePointToMicros(record.certificate_valid_until))
    .Bind(23, record.tsa_timestamp);
  if (record.tsa_serial) {
    stmt.Bind(24, static_cast<int64_t>(record.tsa_serial.value()));
  } else {
    stmt.BindNull(24);
  }
  if (record.tsa_token) {
    stmt.Bind(25, record.tsa_token.value());
  } else {
    stmt.BindNull(25);
  }
  stmt.Exec();
  return db_->LastInsertId();
}

std::vector<ProofRecord> ProofStore::ListForDocument(
  const std::string &document_id) const {
  const std::lock_guard<std::recursive_mutex> lock(db_->Mutex());
  auto stmt = db_->Prepare(std::string(kSelectColumns) +
                           "WHERE document_id = ? "
                           "ORDER BY signature_timestamp, id");
  stmt.Bind(1, document_id);
  std::vector<ProofRecord> res;
  while (stmt.Step()) {
    res.push_back(ReadRow(stmt));
  }
  return res;
}

size_t ProofStore::CountForDocument(const std::string &document_id) const {
  const std::lock_guard<std::recursive_mutex> lock(db_->Mutex());
  auto stmt =
    db_->Prepare("SELECT COUNT(*) FROM proof_record WHERE document_id = ?");
  stmt.Bind(1, document_id);
  if (!stmt.Step()) {
    throw storage::StorageError("[ProofStore::CountForDocument] no result");
  }
  return static_cast<size_t>(stmt.GetInt64(0));
}

std::optional<ProofRecord> ProofStore::FindByRequest(int64_t request_id) const {
  const std::lock_guard<std::recursive_mutex> lock(db_->Mutex());
  auto stmt =
    db_->Prepare(std::string(kSelectColumns) + "WHERE request_id = ?");
  stmt.Bind(1, request_id);
  if (!stmt.Step()) {
    return std::nullopt;
  }
  return ReadRow(stmt);
}

}  // namespace pdfseal::journal
