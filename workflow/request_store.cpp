/* File: request_store.cpp
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

#include "request_store.hpp"

#include <mutex>
#include <stdexcept>
#include <utility>

namespace pdfseal::workflow {

namespace {

constexpr const char *const kSelectColumns =
  "SELECT id, document_id, order_index, signer_role, signer_id, "
  "first_name, last_name, email, link_token, otp_code, otp_generated_at, "
  "otp_validated_at, signed, signed_at, cancelled_at "
  "FROM signature_request ";

std::optional<TimePoint> OptionalTime(const storage::Statement &stmt,
                                      int col) {
  auto micros = stmt.GetOptionalInt64(col);
  if (!micros) {
    return std::nullopt;
  }
  return MicrosToTimePoint(micros.value());
}

std::optional<int64_t> OptionalMicros(const std::optional<TimePoint> &val) {
  if (!val) {
    return std::nullopt;
  }
  return TimePointToMicros(val.value());
}

SignatureRequest ReadRow(const storage::Statement &stmt) {
  SignerInfo info;
  info.id = stmt.GetText(4);
  info.first_name = stmt.GetText(5);
  info.last_name = stmt.GetText(6);
  info.email = stmt.GetText(7);
  SignatureRequest res{};
  res.id = stmt.GetInt64(0);
  res.document_id = stmt.GetText(1);
  res.order = static_cast<int>(stmt.GetInt64(2));
  res.signer = MakeSigner(stmt.GetText(3), std::move(info));
  res.link_token = stmt.GetText(8);
  res.otp_code = stmt.GetOptionalText(9);
  res.otp_generated_at = OptionalTime(stmt, 10);
  res.otp_validated_at = OptionalTime(stmt, 11);
  res.is_signed = stmt.GetInt64(12) != 0;
  res.signed_at = OptionalTime(stmt, 13);
  res.cancelled_at = OptionalTime(stmt, 14);
  return res;
}

}  // namespace

RequestStore::RequestStore(storage::SharedDb db) : db_(std::move(db)) {
  if (!db_) {
    throw std::invalid_argument("[RequestStore] database is null");
  }
  const std::lock_guard<std::recursive_mutex> lock(db_->Mutex());
  db_->Exec(
    "CREATE TABLE IF NOT EXISTS signature_request ("
    "id INTEGER PRIMARY KEY AUTOINCREMENT, "
    "document_id TEXT NOT NULL, "
    "order_index INTEGER NOT NULL, "
    "signer_role TEXT NOT NULL, "
    "signer_id TEXT NOT NULL, "
    "first_name TEXT NOT NULL, "
    "last_name TEXT NOT NULL, "
    "email TEXT NOT NULL, "
    "link_token TEXT NOT NULL UNIQUE, "
    "otp_code TEXT, "
    "otp_generated_at INTEGER, "
    "otp_validated_at INTEGER, "
    "signed INTEGER NOT NULL DEFAULT 0, "
    "signed_at INTEGER, "
    "cancelled_at INTEGER)");
  // cancelled requests keep their order, a new set reuses the numbers
  db_->Exec(
    "CREATE UNIQUE INDEX IF NOT EXISTS signature_request_order "
    "ON signature_request (document_id, order_index) "
    "WHERE cancelled_at IS NULL");
}

int64_t RequestStore::Insert(const SignatureRequest &request) {
  const std::lock_guard<std::recursive_mutex> lock(db_->Mutex());
  const SignerInfo &info = GetSignerInfo(request.signer);
  auto stmt = db_->Prepare(
    "INSERT INTO signature_request (document_id, order_index, signer_role, "
    "signer_id, first_name, last_name, email, link_token, otp_code, "
    "otp_generated_at, otp_validated_at, signed, signed_at, cancelled_at) "
    "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
  stmt.Bind(1, request.document_id)
    .Bind(2, static_cast<int64_t>(request.order))
    .Bind(3, SignerRole(request.signer))
    .Bind(4, info.id)
    .Bind(5, info.first_name)
    .Bind(6, info.last_name)
    .Bind(7, info.email)
    .Bind(8, request.link_token)
    .Bind(9, request.otp_code)
    .Bind(10, OptionalMicros(request.otp_generated_at))
    .Bind(11, OptionalMicros(request.otp_validated_at))
    .Bind(12, static_cast<int64_t>(request.is_signed ? 1 : 0))
    .Bind(13, OptionalMicros(request.signed_at))
    .Bind(14, OptionalMicros(request.cancelled_at));
  stmt.Exec();
  return db_->LastInsertId();
}

std::optional<SignatureRequest> RequestStore::Get(int64_t id) const {
  const std::lock_guard<std::recursive_mutex> lock(db_->Mutex());
  auto stmt = db_->Prepare(std::string(kSelectColumns) + "WHERE id = ?");
  stmt.Bind(1, id);
  if (!stmt.Step()) {
    return std::nullopt;
  }
  return ReadRow(stmt);
}

std::optional<SignatureRequest> RequestStore::FindByLinkToken(
  const std::string &token) const {
  const std::lock_guard<std::recursive_mutex> lock(db_->Mutex());
  auto stmt =
    db_->Prepare(std::string(kSelectColumns) + "WHERE link_token = ?");
  stmt.Bind(1, token);
  if (!stmt.Step()) {
    return std::nullopt;
  }
  return ReadRow(stmt);
}

std::vector<SignatureRequest> RequestStore::ListForDocument(
  const std::string &document_id, bool include_cancelled) const {
  const std::lock_guard<std::recursive_mutex> lock(db_->Mutex());
  std::string sql = std::string(kSelectColumns) + "WHERE document_id = ? ";
  if (!include_cancelled) {
    sql += "AND cancelled_at IS NULL ";
  }
  sql += "ORDER BY order_index, id";
  auto stmt = db_->Prepare(sql);
  stmt.Bind(1, document_id);
  std::vector<SignatureRequest> res;
  while (stmt.Step()) {
    res.push_back(ReadRow(stmt));
  }
  return res;
}

size_t RequestStore::CountActive(const std::string &document_id) const {
  const std::lock_guard<std::recursive_mutex> lock(db_->Mutex());
  auto stmt = db_->Prepare(
    "SELECT COUNT(*) FROM signature_request "
    "WHERE document_id = ? AND cancelled_at IS NULL");
  stmt.Bind(1, document_id);
  if (!stmt.Step()) {
    throw storage::StorageError("[RequestStore::CountActive] no result");
  }
  return static_cast<size_t>(stmt.GetInt64(0));
}

void RequestStore::UpdateOtp(int64_t id, const std::string &code,
                             TimePoint generated_at) {
  const std::lock_guard<std::recursive_mutex> lock(db_->Mutex());
  auto stmt = db_->Prepare(
    "UPDATE signature_request SET otp_code = ?, otp_generated_at = ?, "
    "otp_validated_at = NULL WHERE id = ?");
  stmt.Bind(1, code).Bind(2, TimePointToMicros(generated_at)).Bind(3, id);
  stmt.Exec();
}

void RequestStore::SetOtpValidated(int64_t id, TimePoint validated_at) {
  const std::lock_guard<std::recursive_mutex> lock(db_->Mutex());
  auto stmt = db_->Prepare(
    "UPDATE signature_request SET otp_validated_at = ? WHERE id = ?");
  stmt.Bind(1, TimePointToMicros(validated_at)).Bind(2, id);
  stmt.Exec();
}

bool RequestStore::MarkSigned(int64_t id, TimePoint signed_at) {
  const std::lock_guard<std::recursive_mutex> lock(db_->Mutex());
  auto stmt = db_->Prepare(
    "UPDATE signature_request SET signed = 1, signed_at = ? "
    "WHERE id = ? AND signed = 0 AND cancelled_at IS NULL");
  stmt.Bind(1, TimePointToMicros(signed_at)).Bind(2, id);
  stmt.Exec();
  auto changes = db_->Prepare("SELECT changes()");
  return changes.Step() && changes.GetInt64(0) == 1;
}

size_t RequestStore::CancelPending(const std::string &document_id,
                                   TimePoint cancelled_at) {
  const std::lock_guard<std::recursive_mutex> lock(db_->Mutex());
  auto stmt = db_->Prepare(
    "UPDATE signature_request SET cancelled_at = ? "
    "WHERE document_id = ? AND cancelled_at IS NULL AND signed = 0");
  stmt.Bind(1, TimePointToMicros(cancelled_at)).Bind(2, document_id);
  stmt.Exec();
  auto changes = db_->Prepare("SELECT changes()");
  return changes.Step() ? static_cast<size_t>(changes.GetInt64(0)) : 0;
}

void RequestStore::DeleteForDocument(const std::string &document_id) {
  const std::lock_guard<std::recursive_mutex> lock(db_->Mutex());
  auto stmt =
    db_->Prepare("DELETE FROM signature_request WHERE document_id = ?");
  stmt.Bind(1, document_id);
  stmt.Exec();
}

}  // namespace pdfseal::workflow
