/* File: pdf.cpp
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

#include "pdf.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <iterator>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "common_defs.hpp"
#include "cross_ref_stream.hpp"
#include "logger_utils.hpp"
#include "pdf_defs.hpp"
#include "pdf_pod_structs.hpp"
#include "pdf_structs.hpp"
#include "pdf_utils.hpp"

namespace pdfseal::pdf {

namespace {

void Log(const std::string &msg) noexcept {
  auto logger = logger::InitLog();
  if (logger) {
    logger->debug("[Pdf] {}", msg);
  }
}

void AppendString(const std::string &src, BytesVector &dest) {
  std::copy(src.cbegin(), src.cend(), std::back_inserter(dest));
}

}  // namespace

Pdf::Pdf() : qpdf_(std::make_unique<QPDF>()) {}

Pdf::Pdf(BytesVector data) : qpdf_(std::make_unique<QPDF>()) {
  Open(std::move(data));
}

void Pdf::Open(BytesVector data) {
  const std::string func_name = "[Pdf::Open] ";
  if (data.empty()) {
    throw PdfSignError(func_name + "empty pdf data");
  }
  if (data.size() > kMaxPdfFileSize) {
    throw PdfSignError(func_name + "file is too big");
  }
  signatures_.clear();
  root_.reset();
  acroform_.reset();
  update_kit_.reset();
  // qpdf reads the buffer lazily, it must live as long as the QPDF object
  src_data_ = std::move(data);
  qpdf_ = std::make_unique<QPDF>();
  try {
    qpdf_->processMemoryFile(
      "document", reinterpret_cast<const char *>(src_data_.data()),  // NOLINT
      src_data_.size());
  } catch (const std::exception &ex) {
    throw PdfSignError(func_name + "can't parse pdf " + ex.what());
  }
  if (qpdf_->isEncrypted()) {
    throw PdfSignError(func_name + "encrypted documents are not supported");
  }
}

bool Pdf::FindSignatures() noexcept {
  signatures_.clear();
  try {
    PtrPdfObj obj_root = std::make_unique<QPDFObjectHandle>(qpdf_->getRoot());
    if (obj_root->isNull()) {
      Log("Not root found");
      return false;
    }
    root_ = std::move(obj_root);
    const std::string tag_acro(kTagAcroForm);
    if (!root_->hasKey(tag_acro)) {
      Log(kErrNoAcro);
      return false;
    }
    acroform_ = std::make_unique<QPDFObjectHandle>(root_->getKey(tag_acro));
    if (acroform_->isNull() || !acroform_->isDictionary()) {
      Log(kErrNoAcro);
      return false;
    }
    const std::string tag_fields(kTagFields);
    if (!acroform_->hasKey(tag_fields)) {
      Log("No fields in the AcroForm");
      return false;
    }
    auto acro_fields = acroform_->getKey(tag_fields);
    if (!acro_fields.isArray()) {
      Log("Acro /Fields is not an array");
      return false;
    }
    for (int i = 0; i < acro_fields.getArrayNItems(); ++i) {
      QPDFObjectHandle field = acro_fields.getArrayItem(i);
      auto signature = GetSignatureV(field);
      if (!signature) {
        continue;
      }
      auto byterange = signature->getKey(kTagByteRange);
      if (byterange.isNull() || !byterange.isArray()) {
        Log("No byterange is found");
        continue;
      }
      const int num_items = byterange.getArrayNItems();
      if (num_items % 2 != 0) {
        Log("Error number of items in byterange array is odd");
        continue;
      }
      int64_t start = 0;
      RangesVector byteranges;
      bool valid = true;
      for (int i2 = 0; i2 < num_items; ++i2) {
        auto item = byterange.getArrayItem(i2);
        if (!item.isInteger() || item.getIntValue() < 0) {
          valid = false;
          break;
        }
        const auto val = item.getIntValue();
        if (i2 % 2 == 0) {
          start = val;
        } else {
          byteranges.emplace_back(start, val);
        }
      }
      if (!valid) {
        Log("Invalid byterange value");
        continue;
      }
      std::string field_name;
      if (field.hasKey(kTagT) && field.getKey(kTagT).isString()) {
        field_name = field.getKey(kTagT).getUTF8Value();
      }
      signatures_.emplace_back(SigInstance{
        std::move(signature), std::move(byteranges), std::move(field_name)});
    }
  } catch (const std::exception &ex) {
    Log(std::string("FindSignatures failed ") + ex.what());
    signatures_.clear();
    return false;
  }
  return !signatures_.empty();
}

BytesVector Pdf::GetRawSignature(unsigned int sig_index) const noexcept {
  BytesVector res;
  if (signatures_.size() < sig_index + 1) {
    Log("No sig with such index");
    return res;
  }
  const PtrPdfObj &signature = signatures_[sig_index].signature;
  if (!signature || signature->isNull()) {
    return res;
  }
  try {
    auto contents = signature->getKey(kTagContents);
    if (!contents.isString()) {
      Log("Signature /Contents is not a string");
      return res;
    }
    const std::string raw = contents.getStringValue();
    std::copy(raw.cbegin(), raw.cend(), std::back_inserter(res));
  } catch (const std::exception &ex) {
    Log(ex.what());
    res.clear();
  }
  return res;
}

RangesVector Pdf::GetSigByteRanges(unsigned int sig_index) const noexcept {
  if (signatures_.size() < sig_index + 1) {
    Log("No sig with such index");
    return {};
  }
  return signatures_.at(sig_index).bytes_ranges;
}

// get a Raw data from pdf (except signature) specified in byrerange_
BytesVector Pdf::GetRawData(unsigned int sig_index) const noexcept {
  if (signatures_.size() < sig_index + 1) {
    Log("No signature with such index");
    return {};
  }
  try {
    return ExtractByteRanges(src_data_, signatures_[sig_index].bytes_ranges);
  } catch (const std::exception &ex) {
    Log(ex.what());
  }
  return {};
}

std::string Pdf::GetSigFieldName(unsigned int sig_index) const noexcept {
  if (signatures_.size() < sig_index + 1) {
    return {};
  }
  return signatures_[sig_index].field_name;
}

std::optional<unsigned int> Pdf::FindSignatureByField(
  const std::string &field_name) const noexcept {
  for (size_t i = 0; i < signatures_.size(); ++i) {
    if (signatures_[i].field_name == field_name) {
      return static_cast<unsigned int>(i);
    }
  }
  return std::nullopt;
}

bool Pdf::HasDocMdp() const noexcept {
  auto root = GetRoot();
  if (!root) {
    return false;
  }
  try {
    if (!root->hasKey(kTagPerms)) {
      return false;
    }
    auto perms = root->getKey(kTagPerms);
    return perms.isDictionary() && perms.hasKey(kTagDocMDP);
  } catch (const std::exception &ex) {
    Log(ex.what());
  }
  return false;
}

PtrPdfObjShared Pdf::FindSigField(const std::string &field_name) const noexcept {
  auto acroform = GetAcroform();
  if (!acroform) {
    return nullptr;
  }
  try {
    if (!acroform->isDictionary() || !acroform->hasKey(kTagFields) ||
        !acroform->getKey(kTagFields).isArray()) {
      return nullptr;
    }
    for (auto &field : acroform->getKey(kTagFields).getArrayAsVector()) {
      if (field.isDictionary() && field.hasKey(kTagFT) &&
          field.getKey(kTagFT).isName() &&
          field.getKey(kTagFT).getName() == kTagSig && field.hasKey(kTagT) &&
          field.getKey(kTagT).isString() &&
          field.getKey(kTagT).getUTF8Value() == field_name) {
        return std::make_shared<QPDFObjectHandle>(field);
      }
    }
  } catch (const std::exception &ex) {
    Log(ex.what());
  }
  return nullptr;
}

bool Pdf::HasField(const std::string &field_name) const noexcept {
  auto acroform = GetAcroform();
  if (!acroform) {
    return false;
  }
  try {
    if (!acroform->isDictionary() || !acroform->hasKey(kTagFields) ||
        !acroform->getKey(kTagFields).isArray()) {
      return false;
    }
    for (auto &field : acroform->getKey(kTagFields).getArrayAsVector()) {
      if (field.isDictionary() && field.hasKey(kTagT) &&
          field.getKey(kTagT).isString() &&
          field.getKey(kTagT).getUTF8Value() == field_name) {
        return true;
      }
    }
  } catch (const std::exception &ex) {
    Log(ex.what());
  }
  return false;
}

std::optional<int> Pdf::FindFieldPage(
  const QPDFObjectHandle &field) const noexcept {
  try {
    const ObjRawId field_id = ObjRawId::CopyIdFromExisting(field);
    auto all_pages = qpdf_->getAllPages();
    for (size_t i = 0; i < all_pages.size(); ++i) {
      auto &page = all_pages[i];
      if (!page.hasKey(kTagAnnots) || !page.getKey(kTagAnnots).isArray()) {
        continue;
      }
      for (auto &annot : page.getKey(kTagAnnots).getArrayAsVector()) {
        if (annot.isIndirect() &&
            ObjRawId::CopyIdFromExisting(annot) == field_id) {
          return static_cast<int>(i);
        }
      }
    }
    // the widget is not listed in /Annots, try the /P
    QPDFObjectHandle field_copy = field;
    if (field_copy.hasKey(kTagP) && field_copy.getKey(kTagP).isIndirect()) {
      const ObjRawId page_id =
        ObjRawId::CopyIdFromExisting(field_copy.getKey(kTagP));
      for (size_t i = 0; i < all_pages.size(); ++i) {
        if (ObjRawId::CopyIdFromExisting(all_pages[i]) == page_id) {
          return static_cast<int>(i);
        }
      }
    }
  } catch (const std::exception &ex) {
    Log(ex.what());
  }
  return std::nullopt;
}

// ---------------------------------------------------
// private

PtrPdfObj Pdf::GetSignatureV(QPDFObjectHandle &field) const noexcept {
  if (field.isDictionary() && field.hasKey(kTagFT) &&
      field.getKey(kTagFT).isName() && field.getKey(kTagFT).getName() == kTagSig) {
    if (!field.hasKey(kTagV)) {
      Log("No value of signature");
      return nullptr;
    }
    PtrPdfObj signature_v =
      std::make_unique<QPDFObjectHandle>(field.getKey(kTagV));
    if (!signature_v->isDictionary() || !signature_v->hasKey(kTagType) ||
        !signature_v->getKey(kTagType).isName() ||
        signature_v->getKey(kTagType).getName() != kTagSig) {
      Log("Invalid Signature");
      return nullptr;
    }
    if (!signature_v->hasKey(kTagFilter) ||
        !signature_v->getKey(kTagFilter).isName()) {
      Log("Invalid /Filter field in signature");
      return nullptr;
    }
    if (!signature_v->hasKey(kTagContents)) {
      Log("No signature content was found");
      return nullptr;
    }
    if (!signature_v->hasKey(kTagByteRange)) {
      Log("No byte range found");
      return nullptr;
    }
    return signature_v;
  }
  return nullptr;
}

ObjRawId Pdf::GetLastObjID() const noexcept {
  if (!qpdf_) {
    return {};
  }
  ObjRawId res{};
  try {
    auto objects = qpdf_->getAllObjects();
    auto it_max = std::max_element(
      objects.cbegin(), objects.cend(),
      [](const QPDFObjectHandle &left, const QPDFObjectHandle &right) {
        return left.getObjectID() < right.getObjectID();
      });
    if (it_max != objects.cend()) {
      res.id = it_max->getObjectID();
      res.gen = it_max->getGeneration();
    }
  } catch (const std::exception &ex) {
    Log(ex.what());
  }
  const size_t obj_count = qpdf_->getObjectCount();
  if (obj_count > static_cast<size_t>(std::numeric_limits<int>::max())) {
    Log("[LastObjID] object count > max int");
    return res;
  }
  const int count = static_cast<int>(obj_count);
  if (res.id < count) {
    res.id = count;
    res.gen = 0;
  }
  return res;
}

PtrPdfObjShared Pdf::GetAcroform() const noexcept {
  auto obj_root = GetRoot();
  if (!obj_root) {
    return nullptr;
  }
  try {
    if (obj_root->hasKey(kTagAcroForm)) {
      auto res =
        std::make_shared<QPDFObjectHandle>(obj_root->getKey(kTagAcroForm));
      if (res->isNull()) {
        return nullptr;
      }
      return res;
    }
  } catch (const std::exception &ex) {
    Log(ex.what());
  }
  return nullptr;
}

PtrPdfObjShared Pdf::GetPage(int page_index) const noexcept {
  if (!qpdf_) {
    Log("[GetPage] empty document");
    return nullptr;
  }
  try {
    auto all_pages = qpdf_->getAllPages();
    if (all_pages.empty() || page_index < 0 ||
        static_cast<size_t>(page_index) > all_pages.size() - 1) {
      return nullptr;
    }
    auto res = std::make_shared<QPDFObjectHandle>(all_pages[page_index]);
    if (res->isNull() || !res->isPageObject()) {
      return nullptr;
    }
    return res;
  } catch (const std::exception &ex) {
    Log(ex.what());
  }
  return nullptr;
}

PtrPdfObjShared Pdf::GetRoot() const noexcept {
  if (!qpdf_) {
    Log("[GetRoot] empty document");
    return nullptr;
  }
  try {
    PtrPdfObjShared obj_root =
      std::make_shared<QPDFObjectHandle>(qpdf_->getRoot());
    if (obj_root->isNull()) {
      return nullptr;
    }
    return obj_root;
  } catch (const std::exception &ex) {
    Log(ex.what());
  }
  return nullptr;
}

PtrPdfObjShared Pdf::GetTrailer() const noexcept {
  if (!qpdf_) {
    Log("[GetTrailer] empty document");
    return nullptr;
  }
  try {
    PtrPdfObjShared obj_trailer =
      std::make_shared<QPDFObjectHandle>(qpdf_->getTrailer());
    if (obj_trailer->isNull()) {
      return nullptr;
    }
    return obj_trailer;
  } catch (const std::exception &ex) {
    Log(ex.what());
  }
  return nullptr;
}

PreparedDocument Pdf::CreateObjectKit(const SignParams &params) {
  const std::string func_name = "[Pdf::CreateObjectKit] ";
  if (src_data_.empty()) {
    throw PdfSignError(func_name + "no document opened");
  }
  if (params.field_name.empty()) {
    throw PdfSignError(func_name + "empty field name");
  }
  if (params.placeholder_size < kMinPlaceholderSize) {
    throw PdfSignError(func_name + "signature placeholder is too small");
  }
  update_kit_ = std::make_shared<PdfUpdateObjectKit>();
  update_kit_->original_last_id = GetLastObjID();
  update_kit_->last_assigned_id = update_kit_->original_last_id;
  int page_index = params.page_index;
  if (params.use_existing_field) {
    auto field = FindSigField(params.field_name);
    if (!field) {
      throw PdfSignError(func_name + "signature field not found " +
                         params.field_name);
    }
    if (field->hasKey(kTagV) && !field->getKey(kTagV).isNull()) {
      throw PdfSignError(func_name + "signature field is already signed " +
                         params.field_name);
    }
    auto field_page = FindFieldPage(*field);
    if (!field_page) {
      throw PdfSignError(func_name + "can't find the page of field " +
                         params.field_name);
    }
    page_index = field_page.value();
    update_kit_->sig_field = SigField::CopyExisting(*field);
  } else if (HasField(params.field_name)) {
    throw PdfSignError(func_name + "signature field already exists " +
                       params.field_name);
  }
  update_kit_->p_page_original = GetPage(page_index);
  if (!update_kit_->p_page_original) {
    throw PdfSignError(func_name + "target page not found");
  }
  // the whole update is built in memory, qpdf exceptions become PdfSignError
  try {
    CreateImageObj(params);
    CreateFormXobj(params);
    CreateEmptySigVal(params);
    CreateSignAnnot(params);
    CreateAcroForm(params);
    CreateUpdatedPage(params);
    CreateDss(params);
    CreateUpdateRoot(params);
    CreateXRef(params);
  } catch (const PdfSignError &) {
    throw;
  } catch (const std::exception &ex) {
    throw PdfSignError(func_name + ex.what());
  }
  update_kit_->result.field_name = params.field_name;
  Log(func_name + "update size " +
      std::to_string(update_kit_->result.data.size() - src_data_.size()));
  return std::move(update_kit_->result);
}

void Pdf::CreateImageObj(const SignParams &params) {
  if (params.mode == SignMode::kCertify || !params.image.has_value()) {
    return;
  }
  update_kit_->image_obj = ImageObj::FromRgb(
    ++update_kit_->last_assigned_id, params.image.value());
}

void Pdf::CreateFormXobj(const SignParams &params) {
  FormXObject &form_x_object = update_kit_->form_x_object;
  form_x_object.id = ++update_kit_->last_assigned_id;
  update_kit_->origial_page_rect =
    VisiblePageRect(update_kit_->p_page_original);
  if (!update_kit_->origial_page_rect.has_value()) {
    throw PdfSignError(kErrPageSize);
  }
  if (params.mode == SignMode::kCertify) {
    // invisible
    form_x_object.border = false;
    return;
  }
  const BBox rect = params.use_existing_field ? update_kit_->sig_field.rect
                                              : params.stamp_rect;
  form_x_object.bbox.right_top.x = rect.Width();
  form_x_object.bbox.right_top.y = rect.Height();
  form_x_object.text_lines = params.stamp_lines;
  if (update_kit_->image_obj.has_value()) {
    form_x_object.image = StampImagePlacement{update_kit_->image_obj->id,
                                              update_kit_->image_obj->width,
                                              update_kit_->image_obj->height};
  }
  form_x_object.FitFontSize();
}

void Pdf::CreateEmptySigVal(const SignParams &params) {
  SigVal &sig_val = update_kit_->sig_val;
  sig_val.id = ++update_kit_->last_assigned_id;
  sig_val.contents_raw.resize(params.placeholder_size, 0x00);
  if (!params.signing_time.empty()) {
    sig_val.date = params.signing_time;
  }
  sig_val.name = params.signer_name;
  sig_val.reason = params.reason;
  sig_val.location = params.location;
  sig_val.contact_info = params.contact_info;
  if (params.mode == SignMode::kCertify) {
    sig_val.docmdp_permission = kDocMdpPermission;
  }
  sig_val.CalcOffsets();
}

void Pdf::CreateSignAnnot(const SignParams &params) {
  SigField &sig_field = update_kit_->sig_field;
  if (!params.use_existing_field) {
    sig_field.id = ++update_kit_->last_assigned_id;
    sig_field.name = params.field_name;
    if (params.mode == SignMode::kApprove) {
      // keep the stamp on the visible part of the page
      sig_field.rect =
        params.stamp_rect.ClampTo(update_kit_->origial_page_rect.value());
    }
  }
  sig_field.parent =
    ObjRawId::CopyIdFromExisting(*update_kit_->p_page_original);
  sig_field.appearance_ref = update_kit_->form_x_object.id;
  sig_field.value = update_kit_->sig_val.id;
  sig_field.flags = kWidgetFlagsPrintLocked;
}

void Pdf::CreateAcroForm(const SignParams & /*params*/) {
  AcroForm &acroform = update_kit_->acroform;
  auto original_acro_form = GetAcroform();
  if (original_acro_form && original_acro_form->isDictionary()) {
    acroform = AcroForm::ShallowCopy(original_acro_form);
    if (acroform.need_appearances_dropped) {
      Log("/NeedAppearances removed from the AcroForm");
    }
  }
  if (acroform.id.id == 0) {
    // no acroform or a direct dictionary
    acroform.id = ++update_kit_->last_assigned_id;
  }
  acroform.AddField(update_kit_->sig_field.id);
}

void Pdf::CreateUpdatedPage(const SignParams & /*params*/) {
  update_kit_->updated_page = CreatePageUpdateWithAnnots(
    update_kit_->p_page_original, {update_kit_->sig_field.id});
}

void Pdf::CreateDss(const SignParams &params) {
  if (params.dss_certs.empty()) {
    return;
  }
  auto root = GetRoot();
  Dss dss;
  if (root && root->hasKey(kTagDSS) && root->getKey(kTagDSS).isDictionary()) {
    auto original_dss = root->getKey(kTagDSS);
    dss = Dss::ShallowCopy(original_dss);
  }
  if (dss.id.id == 0) {
    dss.id = ++update_kit_->last_assigned_id;
  }
  for (const auto &der : params.dss_certs) {
    if (der.empty() || dss.Contains(der)) {
      continue;
    }
    CertStreamObj cert_obj{++update_kit_->last_assigned_id, der};
    dss.certs.push_back(cert_obj.id);
    dss.known_certs.push_back(der);
    update_kit_->dss_cert_objects.push_back(std::move(cert_obj));
  }
  update_kit_->dss = std::move(dss);
}

void Pdf::CreateUpdateRoot(const SignParams &params) {
  auto root = GetRoot();
  update_kit_->p_root_original = root;
  if (!root || !root->isDictionary()) {
    throw PdfSignError("[Pdf::CreateUpdateRoot] can't find the pdf root");
  }
  std::ostringstream builder;
  builder << ObjRawId::CopyIdFromExisting(*root).ToString() << "\n"
          << kDictStart << "\n";
  auto root_unparsed_map = DictToUnparsedMap(*root);
  root_unparsed_map.insert_or_assign(kTagAcroForm,
                                     update_kit_->acroform.id.ToStringRef());
  if (update_kit_->dss.has_value()) {
    root_unparsed_map.insert_or_assign(kTagDSS,
                                       update_kit_->dss->id.ToStringRef());
  }
  if (params.mode == SignMode::kCertify) {
    std::map<std::string, std::string> perms;
    if (root->hasKey(kTagPerms) && root->getKey(kTagPerms).isDictionary()) {
      auto original_perms = root->getKey(kTagPerms);
      perms = DictToUnparsedMap(original_perms);
    }
    perms.insert_or_assign(kTagDocMDP, update_kit_->sig_val.id.ToStringRef());
    std::string perms_unparsed = kDictStart;
    perms_unparsed += "\n";
    perms_unparsed += UnparsedMapToString(perms);
    perms_unparsed += kDictEnd;
    root_unparsed_map.insert_or_assign(kTagPerms, perms_unparsed);
  }
  builder << UnparsedMapToString(root_unparsed_map);
  builder << kDictEnd << "\n" << kObjEnd;
  update_kit_->root_updated = builder.str();
}

void Pdf::CreateXRef(const SignParams & /*params*/) {
  const std::string func_name = "[Pdf::CreateXRef] ";
  BytesVector file_buff = src_data_;
  auto prev_x_ref = FindXrefOffset(file_buff);
  if (!prev_x_ref) {
    throw PdfSignError(func_name + "can't find pdf xref");
  }
  file_buff.push_back('\n');
  std::vector<XRefEntry> &ref_entries = update_kit_->ref_entries;
  // page
  ref_entries.emplace_back(
    XRefEntry{ObjRawId::CopyIdFromExisting(*update_kit_->p_page_original),
              file_buff.size(), 0});
  AppendString(update_kit_->updated_page, file_buff);
  // root
  ref_entries.emplace_back(
    XRefEntry{ObjRawId::CopyIdFromExisting(*update_kit_->p_root_original),
              file_buff.size(), 0});
  AppendString(update_kit_->root_updated, file_buff);
  // image
  if (update_kit_->image_obj.has_value()) {
    ref_entries.emplace_back(
      XRefEntry{update_kit_->image_obj->id, file_buff.size(), 0});
    auto raw_img_obj = update_kit_->image_obj->ToRawData();
    std::copy(raw_img_obj.cbegin(), raw_img_obj.cend(),
              std::back_inserter(file_buff));
  }
  // xobject
  ref_entries.emplace_back(
    XRefEntry{update_kit_->form_x_object.id, file_buff.size(), 0});
  AppendString(update_kit_->form_x_object.ToString(), file_buff);
  // sig value
  SigVal &sig_val = update_kit_->sig_val;
  ref_entries.emplace_back(XRefEntry{sig_val.id, file_buff.size(), 0});
  sig_val.hex_str_offset += file_buff.size();
  sig_val.byteranges_str_offset += file_buff.size();
  AppendString(sig_val.ToString(), file_buff);
  // sig field
  ref_entries.emplace_back(
    XRefEntry{update_kit_->sig_field.id, file_buff.size(), 0});
  AppendString(update_kit_->sig_field.ToString(), file_buff);
  // the acroform
  ref_entries.emplace_back(
    XRefEntry{update_kit_->acroform.id, file_buff.size(), 0});
  AppendString(update_kit_->acroform.ToString(), file_buff);
  // document security store
  for (const auto &cert_obj : update_kit_->dss_cert_objects) {
    ref_entries.emplace_back(XRefEntry{cert_obj.id, file_buff.size(), 0});
    auto raw_cert = cert_obj.ToRawData();
    std::copy(raw_cert.cbegin(), raw_cert.cend(),
              std::back_inserter(file_buff));
  }
  if (update_kit_->dss.has_value()) {
    ref_entries.emplace_back(
      XRefEntry{update_kit_->dss->id, file_buff.size(), 0});
    AppendString(update_kit_->dss->ToString(), file_buff);
  }
  // create new trailer
  auto trailer_orig = GetTrailer();
  if (!trailer_orig || !trailer_orig->isDictionary()) {
    throw PdfSignError(func_name + "can't find document trailer");
  }
  auto map_unparsed = DictToUnparsedMap(*trailer_orig);
  // the new section has the same type as the previous one
  if (trailer_orig->hasKey(kTagType) && trailer_orig->getKey(kTagType).isName() &&
      trailer_orig->getKey(kTagType).getName() == kTagXref) {
    CreateCrossRefStream(map_unparsed, prev_x_ref.value(), file_buff,
                         update_kit_->last_assigned_id, ref_entries);
  } else {
    CreateSimpleXref(map_unparsed, prev_x_ref.value(), file_buff,
                     update_kit_->last_assigned_id, ref_entries);
  }
  // finally patch byteranges
  {
    std::string patch = "0 ";  // file beginning
    const size_t befor_hex = sig_val.hex_str_offset;
    patch += std::to_string(befor_hex);
    patch += ' ';
    const size_t offset_hex_end =
      sig_val.hex_str_offset + sig_val.hex_str_length + 2;  // 2 is <>
    if (offset_hex_end > file_buff.size()) {
      throw PdfSignError(func_name + "invalid signature value offset");
    }
    const size_t after_hex = file_buff.size() - offset_hex_end;
    patch += std::to_string(offset_hex_end);
    patch += " ";
    patch += std::to_string(after_hex);
    patch += " ]";
    if (patch.size() > kSizeOfSpacesReservedForByteRanges ||
        sig_val.byteranges_str_offset + patch.size() >= file_buff.size()) {
      throw PdfSignError(func_name + "byterange doesn't fit the reserved space");
    }
    PatchData(file_buff, sig_val.byteranges_str_offset, patch);
    PreparedDocument &result = update_kit_->result;
    result.byteranges.emplace_back(0, befor_hex);
    result.byteranges.emplace_back(offset_hex_end, after_hex);
    result.sig_offset = befor_hex + 1;
    result.sig_max_size = sig_val.hex_str_length;
  }
  update_kit_->result.data = std::move(file_buff);
}

}  // namespace pdfseal::pdf
