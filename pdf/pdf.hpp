/* File: pdf.hpp
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

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "pdf_defs.hpp"
#include "pdf_pod_structs.hpp"
#include "pdf_structs.hpp"
#include "pdf_update_object_kit.hpp"

namespace pdfseal::pdf {

struct SigInstance {
  PtrPdfObj signature;
  RangesVector bytes_ranges;
  std::string field_name;
};

/**
 * @brief A pdf document opened from memory
 * @details Read access to the signatures and creation of an incremental update
 * with an empty signature value.
 */
class Pdf {
 public:
  /**
   * @brief Construct a new Pdf object
   * @throws propagated exceptions
   */
  Pdf();

  /**
   * @brief Construct and open
   * @param data the whole pdf file
   * @throws PdfSignError if can't parse
   */
  explicit Pdf(BytesVector data);

  Pdf(const Pdf &) = delete;
  Pdf(Pdf &&) = delete;
  Pdf &operator=(const Pdf &) = delete;
  Pdf &operator=(Pdf &&) = delete;
  ~Pdf() = default;

  /**
   * @brief Open a pdf from memory
   * @param data the whole pdf file
   * @throws PdfSignError on empty, too big or malformed data
   */
  void Open(BytesVector data);

  /**
   * @brief true if some Signatures found
   *
   * @return true
   * @return false
   */
  [[nodiscard]] bool FindSignatures() noexcept;

  /**
   * @brief Get the Raw Signature data
   * @return std::vector<unsigned char>
   */
  [[nodiscard]] BytesVector GetRawSignature(
    unsigned int sig_index) const noexcept;

  /**
   * @brief Get the byte ranges for the specified signature.
   * @param sig_index Signature index
   * @return RangesVector
   */
  [[nodiscard]] RangesVector GetSigByteRanges(
    unsigned int sig_index) const noexcept;

  /**
   * @brief Get the Raw Data object excluding the signature value
   * @return std::vector<unsigned char>
   */
  [[nodiscard]] BytesVector GetRawData(unsigned int sig_index) const noexcept;

  /// @brief the /T of the field holding the signature
  [[nodiscard]] std::string GetSigFieldName(
    unsigned int sig_index) const noexcept;

  /// @brief index of the signature stored in the field
  [[nodiscard]] std::optional<unsigned int> FindSignatureByField(
    const std::string &field_name) const noexcept;

  [[nodiscard]] size_t GetSignaturesCount() const noexcept {
    return signatures_.size();
  };

  /// @brief true if the catalog has /Perms /DocMDP
  [[nodiscard]] bool HasDocMdp() const noexcept;

  /// @brief true if a top-level field of any type has this /T
  [[nodiscard]] bool HasField(const std::string &field_name) const noexcept;

  /**
   * @brief Find a signature field by it's name
   * @return the field dictionary or nullptr
   */
  [[nodiscard]] PtrPdfObjShared FindSigField(
    const std::string &field_name) const noexcept;

  /// @brief index of the page containing the widget of the field
  [[nodiscard]] std::optional<int> FindFieldPage(
    const QPDFObjectHandle &field) const noexcept;

  // for tests
  [[nodiscard]] const std::unique_ptr<QPDF> &getQPDF() const & noexcept {
    return qpdf_;
  }

  /**
   * @brief Get the Last Object ID
   * @return ObjRawId
   */
  [[nodiscard]] ObjRawId GetLastObjID() const noexcept;

  /**
   * @brief check is there /Acroform in document calalog
   * @return shared pointer to acroform
   */
  [[nodiscard]] PtrPdfObjShared GetAcroform() const noexcept;

  [[nodiscard]] PtrPdfObjShared GetPage(int page_index) const noexcept;

  [[nodiscard]] PtrPdfObjShared GetRoot() const noexcept;

  [[nodiscard]] PtrPdfObjShared GetTrailer() const noexcept;

  [[nodiscard]] size_t GetPagesCount() const noexcept {
    return qpdf_->getAllPages().size();
  };

  /**
   * @brief Create a kit of object for pdf incremental update
   * @return PreparedDocument original data + update with the reserved space
   * @throws PdfSignError
   */
  PreparedDocument CreateObjectKit(const SignParams &params);

 private:
  /**
   * @brief Get the Signature Value object
   * @return PtrPdfObj
   */
  PtrPdfObj GetSignatureV(QPDFObjectHandle &field) const noexcept;

  void CreateImageObj(const SignParams &params);
  void CreateFormXobj(const SignParams &params);
  void CreateSignAnnot(const SignParams &params);
  void CreateAcroForm(const SignParams &params);
  void CreateUpdatedPage(const SignParams &params);
  void CreateDss(const SignParams &params);
  void CreateUpdateRoot(const SignParams &params);
  void CreateEmptySigVal(const SignParams &params);
  void CreateXRef(const SignParams &params);

  std::unique_ptr<QPDF> qpdf_;
  BytesVector src_data_;
  PtrPdfObj root_;
  PtrPdfObj acroform_;
  std::vector<SigInstance> signatures_;
  std::shared_ptr<PdfUpdateObjectKit> update_kit_;
};

}  // namespace pdfseal::pdf
