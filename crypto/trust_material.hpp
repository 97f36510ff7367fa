/* File: trust_material.hpp
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

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "certificate.hpp"
#include "config.hpp"
#include "openssl_types.hpp"

namespace pdfseal::crypto {

class TrustMaterialError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// @brief certificate, private key and the rest of the chain
struct SigningIdentity {
  Certificate cert;
  EvpPkeyPtr key;
  std::vector<Certificate> chain;
};

/**
 * @brief Load an identity from a PKCS#12 file
 * @throws TrustMaterialError
 */
SigningIdentity LoadPkcs12Identity(const std::string &path,
                                   const std::string &passphrase);

/**
 * @brief Load an identity from PEM certificate and encrypted PEM key
 * @throws TrustMaterialError
 */
SigningIdentity LoadPemIdentity(const std::string &cert_path,
                                const std::string &key_path,
                                const std::string &passphrase);

/**
 * @brief Organisation, internal CA and TSA identities
 * @details Loaded once at startup, never modified, shared between threads.
 */
class TrustMaterial {
 public:
  /**
   * @brief Construct and validate
   * @param org organisation certifier identity
   * @param ca internal CA, may be empty only with allow_self_signed
   * @param tsa TSA identity, the certificate must allow timeStamping
   * @throws TrustMaterialError
   */
  TrustMaterial(SigningIdentity org, std::optional<SigningIdentity> ca,
                SigningIdentity tsa, bool allow_self_signed);

  TrustMaterial(const TrustMaterial &) = delete;
  TrustMaterial(TrustMaterial &&) = delete;
  TrustMaterial &operator=(const TrustMaterial &) = delete;
  TrustMaterial &operator=(TrustMaterial &&) = delete;
  ~TrustMaterial() = default;

  /**
   * @brief Load all identities from files
   * @throws TrustMaterialError on a missing file, empty passphrase, key
   * mismatch
   */
  static std::shared_ptr<const TrustMaterial> Load(const TrustConfig &config);

  [[nodiscard]] const SigningIdentity &Organisation() const noexcept {
    return org_;
  }

  /// @brief nullptr if the CA is absent (self-signed fallback)
  [[nodiscard]] const SigningIdentity *Ca() const noexcept {
    return ca_ ? &ca_.value() : nullptr;
  }

  [[nodiscard]] const SigningIdentity &Tsa() const noexcept { return tsa_; }

  [[nodiscard]] bool SelfSignedFallback() const noexcept {
    return !ca_.has_value();
  }

  /**
   * @brief DER certificates for the long-term validation data
   * @details organisation chain, CA and TSA certificates without duplicates
   */
  [[nodiscard]] std::vector<BytesVector> ValidationCertsDer() const;

 private:
  SigningIdentity org_;
  std::optional<SigningIdentity> ca_;
  SigningIdentity tsa_;
};

}  // namespace pdfseal::crypto
