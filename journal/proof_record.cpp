/* File: proof_record.cpp
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

#include "proof_record.hpp"

#include <utility>

namespace pdfseal::journal {

json::object ProofRecord::ToJson() const {
  json::object res;
  res["signer_role"] = signer_role;
  res["signer_name"] = signer_name;
  res["signer_email"] = signer_email;
  res["field_name"] = field_name;
  res["signature_timestamp"] = TimePointToIso8601(signature_timestamp);
  {
    json::object otp;
    otp["otp_code"] = otp_code;
    otp["otp_generated_at"] = TimePointToIso8601(otp_generated_at);
    otp["otp_validated_at"] = TimePointToIso8601(otp_validated_at);
    otp["otp_validated"] = otp_validated;
    res["otp"] = std::move(otp);
  }
  {
    json::object http_obj;
    http_obj["ip_address"] = http.ip_address;
    http_obj["user_agent"] = http.user_agent;
    http_obj["referer"] = http.referer;
    res["http"] = std::move(http_obj);
  }
  {
    json::object crypto;
    crypto["pdf_hash_before"] = pdf_hash_before;
    crypto["pdf_hash_after"] = pdf_hash_after;
    crypto["certificate_fingerprint"] = certificate_fingerprint;
    crypto["certificate_subject"] = certificate_subject_dn;
    crypto["certificate_issuer"] = certificate_issuer_dn;
    crypto["certificate_valid_from"] =
      TimePointToIso8601(certificate_valid_from);
    crypto["certificate_valid_until"] =
      TimePointToIso8601(certificate_valid_until);
    res["cryptographic"] = std::move(crypto);
  }
  if (tsa_timestamp) {
    res["tsa_timestamp"] = tsa_timestamp.value();
  } else {
    res["tsa_timestamp"] = nullptr;
  }
  return res;
}

}  // namespace pdfseal::journal
