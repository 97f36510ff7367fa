/* File: lifecycle.cpp
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

#include "lifecycle.hpp"

#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

#include "logger_utils.hpp"
#include "workflow_errors.hpp"

namespace pdfseal::workflow {

namespace {

void SetChecked(SignableDocument &doc, DocumentStatus to,
                const std::string &func_name) {
  const DocumentStatus from = doc.GetStatus();
  if (!CanTransition(from, to)) {
    throw LifecycleError(func_name + "illegal transition " +
                         StatusToString(from) + " -> " + StatusToString(to) +
                         " for document " + doc.DocumentId());
  }
  doc.SetStatus(to);
  auto logger = logger::InitLog();
  if (logger) {
    logger->info("{}document {} {} -> {}", func_name, doc.DocumentId(),
                 StatusToString(from), StatusToString(to));
  }
}

}  // namespace

DocumentLifecycle::DocumentLifecycle(
  std::shared_ptr<RequestStore> requests,
  std::shared_ptr<journal::ProofStore> proofs)
    : requests_(std::move(requests)), proofs_(std::move(proofs)) {
  if (!requests_ || !proofs_) {
    throw std::invalid_argument("[DocumentLifecycle] store is null");
  }
}

bool DocumentLifecycle::MarkSigningStarted(SignableDocument &doc) const {
  if (doc.GetStatus() != DocumentStatus::kDraft) {
    return false;
  }
  SetChecked(doc, DocumentStatus::kSigning,
             "[DocumentLifecycle::MarkSigningStarted] ");
  return true;
}

bool DocumentLifecycle::Reevaluate(SignableDocument &doc) const {
  const std::string func_name = "[DocumentLifecycle::Reevaluate] ";
  // the database lock orders concurrent evaluations of the same document
  storage::Transaction txn(*requests_->Db());
  const DocumentStatus status = doc.GetStatus();
  if (status == DocumentStatus::kSigned ||
      status == DocumentStatus::kCancelled) {
    txn.Commit();
    return false;
  }
  const size_t request_count = requests_->CountActive(doc.DocumentId());
  const size_t proof_count = proofs_->CountForDocument(doc.DocumentId());
  if (request_count == 0 || proof_count != request_count) {
    txn.Commit();
    return false;
  }
  if (status == DocumentStatus::kDraft) {
    SetChecked(doc, DocumentStatus::kSigning, func_name);
  }
  SetChecked(doc, DocumentStatus::kSigned, func_name);
  txn.Commit();
  return true;
}

void DocumentLifecycle::Cancel(SignableDocument &doc) const {
  const std::string func_name = "[DocumentLifecycle::Cancel] ";
  storage::Transaction txn(*requests_->Db());
  const DocumentStatus status = doc.GetStatus();
  if (status == DocumentStatus::kCancelled) {
    txn.Commit();
    return;
  }
  if (status == DocumentStatus::kSigned) {
    throw LifecycleError(func_name + "document " + doc.DocumentId() +
                         " is signed, issue a corrective document instead");
  }
  const size_t cancelled = requests_->CancelPending(
    doc.DocumentId(), std::chrono::system_clock::now());
  SetChecked(doc, DocumentStatus::kCancelled, func_name);
  txn.Commit();
  auto logger = logger::InitLog();
  if (logger) {
    logger->info("{}{} requests cancelled", func_name, cancelled);
  }
}

void DocumentLifecycle::ResetForEdit(SignableDocument &doc) const {
  const std::string func_name = "[DocumentLifecycle::ResetForEdit] ";
  if (doc.GetStatus() != DocumentStatus::kDraft) {
    throw LifecycleError(func_name + "document " + doc.DocumentId() +
                         " is " + StatusToString(doc.GetStatus()));
  }
  requests_->DeleteForDocument(doc.DocumentId());
}

}  // namespace pdfseal::workflow
