/* File: pdf_signer.hpp
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

#include <optional>
#include <string>
#include <vector>

#include "cms_signer.hpp"
#include "config.hpp"
#include "ephemeral_issuer.hpp"
#include "pdf_pod_structs.hpp"
#include "pdf_structs.hpp"
#include "signature_info.hpp"
#include "trust_material.hpp"
#include "utils.hpp"

namespace pdfseal::pdf {

class Pdf;

struct CertifyParams {
  const crypto::SigningIdentity *identity = nullptr;  // organisation
  // trust set for the document security store
  std::vector<BytesVector> validation_certs;
  TimePoint signing_time;
  // Certification_<YYYYmmdd_HHMMSS> if empty
  std::optional<std::string> field_name;
};

struct ApproveParams {
  crypto::SignerCredential *credential = nullptr;
  std::string signer_name;
  std::string signer_email;
  TimePoint signing_time;
  std::string field_name;
  // existing unsigned field to sign, takes precedence over the marker
  std::optional<std::string> target_field;
  std::optional<std::string> anchor_marker;
  std::optional<RgbImage> image;
};

/// @brief where the approval stamp goes
struct StampPlacement {
  int page_index = 0;
  BBox rect;
  bool existing_field = false;
};

/**
 * @brief Certification and approval signatures as incremental updates
 * @details The input is never modified, the result is returned only when the
 * signature value is in place.
 */
class PdfSigner {
 public:
  /**
   * @brief Construct a new signer
   * @param config signing section of the configuration
   * @param timestamper returns an RFC 3161 token over the signature value
   * @throws std::invalid_argument if timestamper is empty
   */
  PdfSigner(SigningConfig config, crypto::TimestampFunc timestamper);

  /**
   * @brief Add the certification signature (DocMDP P=2, invisible)
   * @param pdf unsigned document
   * @return BytesVector the certified document
   * @throws PdfSignError if the document is already signed or certified
   * @throws tsa::TsaError on timestamp failure
   */
  [[nodiscard]] BytesVector CertifyDocument(const BytesVector &pdf,
                                            const CertifyParams &params) const;

  /**
   * @brief Add an approval signature with a visual stamp
   * @param pdf document
   * @param params the credential key is consumed
   * @return BytesVector the signed document
   * @throws PdfSignError no placement, ambiguous marker, missing field
   * @throws tsa::TsaError on timestamp failure
   */
  [[nodiscard]] BytesVector ApproveDocument(const BytesVector &pdf,
                                            ApproveParams &params) const;

  /**
   * @brief Choose the stamp placement
   * @details existing field, anchor marker, default rectangle on the last page
   * @throws PdfSignError if nothing is available
   */
  [[nodiscard]] StampPlacement ResolvePlacement(
    Pdf &pdf, const ApproveParams &params) const;

  /// @brief text lines of the approval stamp
  [[nodiscard]] std::vector<std::string> StampLines(
    const ApproveParams &params) const;

 private:
  BytesVector SignPrepared(PreparedDocument prepared,
                           const crypto::CmsSignParams &cms_params) const;

  SigningConfig config_;
  crypto::TimestampFunc timestamper_;
};

/// @brief Certification_<YYYYmmdd_HHMMSS>
std::string CertificationFieldName(TimePoint time_point);

/**
 * @brief Read the signature stored in the field
 * @return crypto::CmsSignatureInfo signer certificate and timestamp token
 * @throws PdfSignError if the field has no signature
 * @throws crypto::CryptoError if the CMS can't be parsed
 */
crypto::CmsSignatureInfo ExtractSignatureInfo(const BytesVector &pdf,
                                              const std::string &field_name);

}  // namespace pdfseal::pdf
