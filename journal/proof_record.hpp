/* File: proof_record.hpp
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
#include <cstdint>
#include <optional>
#include <string>

#include "utils.hpp"

namespace pdfseal::journal {

namespace json = boost::json;

/// @brief where the signing request came from, passed through as is
struct HttpProvenance {
  std::string ip_address;
  std::string user_agent;
  std::string referer;
};

/**
 * @brief Immutable evidence of one approval signature
 * @details Certificate and TSA fields are read from the signed artifact.
 */
struct ProofRecord {
  int64_t id = 0;
  std::string document_id;
  int64_t request_id = 0;
  std::string field_name;
  std::string signer_role;
  std::string signer_name;
  std::string signer_email;
  // OTP
  std::string otp_code;
  TimePoint otp_generated_at;
  TimePoint otp_validated_at;
  bool otp_validated = true;
  HttpProvenance http;
  // cryptographic
  TimePoint signature_timestamp;
  std::string pdf_hash_before;  // SHA-256 hex
  std::string pdf_hash_after;
  std::string certificate_pem;
  std::string certificate_fingerprint;
  std::string certificate_subject_dn;
  std::string certificate_issuer_dn;
  TimePoint certificate_valid_from;
  TimePoint certificate_valid_until;
  // "<gen time ISO 8601> (serial: N)"
  std::optional<std::string> tsa_timestamp;
  std::optional<uint64_t> tsa_serial;
  std::optional<BytesVector> tsa_token;

  /// @brief journal entry with nested otp, http and cryptographic objects
  [[nodiscard]] json::object ToJson() const;
};

}  // namespace pdfseal::journal
