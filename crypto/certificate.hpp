/* File: certificate.hpp
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

#include "cert_common_info.hpp"
#include "openssl_types.hpp"
#include "utils.hpp"

namespace pdfseal::crypto {

/**
 * @brief X509 certificate wrapper
 * @details owns one reference to the X509 object
 */
class Certificate {
 public:
  /// @brief take ownership
  /// @throws CryptoError if null
  explicit Certificate(X509Ptr cert);

  Certificate(const Certificate &) = delete;
  Certificate &operator=(const Certificate &) = delete;
  Certificate(Certificate &&other) noexcept = default;
  Certificate &operator=(Certificate &&other) noexcept = default;
  ~Certificate() = default;

  /// @throws CryptoError
  static Certificate FromDer(const BytesVector &der);

  /// @throws CryptoError
  static Certificate FromPem(const std::string &pem);

  /// @throws CryptoError
  static Certificate FromPemFile(const std::string &path);

  /// @brief new owning reference to the same certificate
  [[nodiscard]] Certificate Share() const;

  [[nodiscard]] X509 *Get() const noexcept { return cert_.get(); }

  /// @brief DER encoded certificate
  [[nodiscard]] BytesVector GetRawCopy() const;

  [[nodiscard]] std::string ToPem() const;

  /// @brief SHA-256 of DER, lowercase hex
  [[nodiscard]] std::string Fingerprint() const;

  [[nodiscard]] BytesVector Serial() const;

  /// @brief RFC 2253 subject
  [[nodiscard]] std::string SubjectDN() const;

  /// @brief RFC 2253 issuer
  [[nodiscard]] std::string IssuerDN() const;

  [[nodiscard]] std::optional<std::string> SubjectAttribute(int nid) const;

  /// @brief emailAddress from the subject, or the first rfc822 SAN entry
  [[nodiscard]] std::optional<std::string> Email() const;

  [[nodiscard]] TimePoint NotBefore() const;
  [[nodiscard]] TimePoint NotAfter() const;

  ///@brief check notBefore notAfter bounds
  [[nodiscard]] bool IsTimeValid(TimePoint time_point) const noexcept;

  [[nodiscard]] bool IsSelfSigned() const noexcept;

  [[nodiscard]] CertCommonInfo CommonInfo() const { return CertCommonInfo(Get()); }

 private:
  X509Ptr cert_;
};

/// @brief RFC 2253 one-line representation of a name
std::string NameToString(const X509_NAME *name);

/// @brief emailAddress from the subject, or the first rfc822 SAN entry
std::optional<std::string> ExtractEmail(const X509 *cert);

/// @brief convert ASN1_TIME to the unix time
/// @throws CryptoError
time_t Asn1TimeToTimeT(const ASN1_TIME *asn_time);

}  // namespace pdfseal::crypto
