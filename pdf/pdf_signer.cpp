/* File: pdf_signer.cpp
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

#include "pdf_signer.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "anchor_locator.hpp"
#include "logger_utils.hpp"
#include "pdf.hpp"
#include "pdf_utils.hpp"

namespace pdfseal::pdf {

namespace {

BBox RectFromConfig(const RectConfig &rect) {
  return BBox{{rect.llx, rect.lly}, {rect.urx, rect.ury}};
}

}  // namespace

PdfSigner::PdfSigner(SigningConfig config, crypto::TimestampFunc timestamper)
    : config_(std::move(config)), timestamper_(std::move(timestamper)) {
  if (!timestamper_) {
    throw std::invalid_argument("[PdfSigner] empty timestamper");
  }
}

BytesVector PdfSigner::CertifyDocument(const BytesVector &pdf,
                                       const CertifyParams &params) const {
  const std::string func_name = "[PdfSigner::CertifyDocument] ";
  if (params.identity == nullptr || !params.identity->key) {
    throw PdfSignError(func_name + "no certifier identity");
  }
  Pdf doc(pdf);
  if (doc.FindSignatures() || doc.HasDocMdp()) {
    throw PdfSignError(func_name + "the document is already signed");
  }
  SignParams sign_params;
  sign_params.mode = SignMode::kCertify;
  sign_params.field_name =
    params.field_name.value_or(CertificationFieldName(params.signing_time));
  sign_params.page_index = 0;
  sign_params.signing_time =
    PdfDateString(params.signing_time, config_.utc_offset_minutes);
  sign_params.signer_name = config_.certifier_name;
  sign_params.reason = config_.reason_certify;
  sign_params.location = config_.location;
  sign_params.dss_certs = params.validation_certs;
  sign_params.placeholder_size = config_.placeholder_size;
  PreparedDocument prepared = doc.CreateObjectKit(sign_params);

  crypto::CmsSignParams cms_params;
  cms_params.cert = &params.identity->cert;
  cms_params.key = params.identity->key.get();
  cms_params.chain = &params.identity->chain;
  cms_params.timestamper = timestamper_;
  auto res = SignPrepared(std::move(prepared), cms_params);
  auto logger = logger::InitLog();
  if (logger) {
    logger->info("{}document certified, field {}", func_name,
                 sign_params.field_name);
  }
  return res;
}

BytesVector PdfSigner::ApproveDocument(const BytesVector &pdf,
                                       ApproveParams &params) const {
  const std::string func_name = "[PdfSigner::ApproveDocument] ";
  if (params.credential == nullptr || !params.credential->KeyAvailable()) {
    throw PdfSignError(func_name + "no signer key");
  }
  if (params.field_name.empty() && !params.target_field) {
    throw PdfSignError(func_name + "empty field name");
  }
  Pdf doc(pdf);
  if (!doc.HasDocMdp()) {
    throw PdfSignError(func_name + "the document is not certified");
  }
  const StampPlacement placement = ResolvePlacement(doc, params);
  SignParams sign_params;
  sign_params.mode = SignMode::kApprove;
  sign_params.field_name = params.target_field.value_or(params.field_name);
  sign_params.use_existing_field = placement.existing_field;
  sign_params.page_index = placement.page_index;
  sign_params.stamp_rect = placement.rect;
  sign_params.stamp_lines = StampLines(params);
  sign_params.image = params.image;
  sign_params.signing_time =
    PdfDateString(params.signing_time, config_.utc_offset_minutes);
  sign_params.signer_name = params.signer_name;
  sign_params.reason = config_.reason_approve;
  sign_params.location = config_.location;
  sign_params.contact_info = params.signer_email;
  sign_params.dss_certs.push_back(params.credential->Cert().GetRawCopy());
  for (const auto &cert : params.credential->Chain()) {
    sign_params.dss_certs.push_back(cert.GetRawCopy());
  }
  sign_params.placeholder_size = config_.placeholder_size;
  PreparedDocument prepared = doc.CreateObjectKit(sign_params);

  crypto::EvpPkeyPtr key;
  try {
    key = params.credential->ConsumeKey();
  } catch (const crypto::CryptoError &ex) {
    throw PdfSignError(func_name + ex.what());
  }
  crypto::CmsSignParams cms_params;
  cms_params.cert = &params.credential->Cert();
  cms_params.key = key.get();
  cms_params.chain = &params.credential->Chain();
  cms_params.timestamper = timestamper_;
  auto res = SignPrepared(std::move(prepared), cms_params);
  auto logger = logger::InitLog();
  if (logger) {
    logger->info("{}approval signature added, field {} page {}", func_name,
                 sign_params.field_name, placement.page_index + 1);
  }
  return res;
}

StampPlacement PdfSigner::ResolvePlacement(Pdf &pdf,
                                           const ApproveParams &params) const {
  const std::string func_name = "[PdfSigner::ResolvePlacement] ";
  StampPlacement res;
  // 1. pre-placed field
  if (params.target_field.has_value()) {
    auto field = pdf.FindSigField(params.target_field.value());
    if (!field) {
      throw PdfSignError(func_name + "signature field not found " +
                         params.target_field.value());
    }
    auto page_index = pdf.FindFieldPage(*field);
    if (!page_index) {
      throw PdfSignError(func_name + "can't find the page of field " +
                         params.target_field.value());
    }
    res.page_index = page_index.value();
    res.existing_field = true;
    return res;
  }
  // 2. anchor marker
  if (params.anchor_marker.has_value() && !params.anchor_marker->empty()) {
    auto match = LocateAnchor(*pdf.getQPDF(), params.anchor_marker.value());
    if (match) {
      auto page_rect = VisiblePageRect(pdf.GetPage(match->page_index));
      if (!page_rect) {
        throw PdfSignError(func_name + kErrPageSize);
      }
      BBox rect;
      rect.left_bottom = {match->position.x,
                          match->position.y - config_.stamp_height};
      rect.right_top = {match->position.x + config_.stamp_width,
                        match->position.y};
      res.page_index = match->page_index;
      res.rect = rect.ClampTo(page_rect.value());
      return res;
    }
    auto logger = logger::InitLog();
    if (logger) {
      logger->debug("{}marker {} not found", func_name,
                    params.anchor_marker.value());
    }
  }
  // 3. default rectangle on the last page
  const size_t pages = pdf.GetPagesCount();
  if (!config_.default_rect.IsEmpty() && pages > 0) {
    res.page_index = static_cast<int>(pages - 1);
    res.rect = RectFromConfig(config_.default_rect);
    return res;
  }
  throw PdfSignError(func_name + "no placement for the signature stamp");
}

std::vector<std::string> PdfSigner::StampLines(
  const ApproveParams &params) const {
  std::vector<std::string> res;
  res.push_back(params.signer_name + " - " + params.signer_email);
  res.push_back(
    StampDateString(params.signing_time, config_.utc_offset_minutes));
  if (!config_.caption.empty()) {
    res.push_back(config_.caption);
  }
  return res;
}

BytesVector PdfSigner::SignPrepared(
  PreparedDocument prepared, const crypto::CmsSignParams &cms_params) const {
  const std::string func_name = "[PdfSigner::SignPrepared] ";
  const BytesVector data =
    ExtractByteRanges(prepared.data, prepared.byteranges);
  BytesVector cms;
  try {
    cms = crypto::SignDetachedCms(data, cms_params);
  } catch (const crypto::CryptoError &ex) {
    throw PdfSignError(func_name + ex.what());
  }
  const std::string hex = ByteVectorToHexString(cms);
  if (hex.size() > prepared.sig_max_size) {
    throw PdfSignError(func_name + "signature placeholder is too small, need " +
                       std::to_string(hex.size()) + " have " +
                       std::to_string(prepared.sig_max_size));
  }
  PatchData(prepared.data, prepared.sig_offset, hex);
  auto logger = logger::InitLog();
  if (logger) {
    logger->debug("{}signature size {} at offset {}", func_name, cms.size(),
                  prepared.sig_offset);
  }
  return std::move(prepared.data);
}

std::string CertificationFieldName(TimePoint time_point) {
  const time_t time = std::chrono::system_clock::to_time_t(time_point);
  std::tm tm_info{};
  gmtime_r(&time, &tm_info);
  std::ostringstream builder;
  builder << "Certification_" << std::put_time(&tm_info, "%Y%m%d_%H%M%S");
  return builder.str();
}

crypto::CmsSignatureInfo ExtractSignatureInfo(const BytesVector &pdf,
                                              const std::string &field_name) {
  const std::string func_name = "[ExtractSignatureInfo] ";
  Pdf doc(pdf);
  if (!doc.FindSignatures()) {
    throw PdfSignError(func_name + "no signatures in the document");
  }
  auto index = doc.FindSignatureByField(field_name);
  if (!index) {
    throw PdfSignError(func_name + "no signature in the field " + field_name);
  }
  const BytesVector raw = doc.GetRawSignature(index.value());
  if (raw.empty()) {
    throw PdfSignError(func_name + "empty signature value in " + field_name);
  }
  return crypto::ParseCmsSignature(raw);
}

}  // namespace pdfseal::pdf
