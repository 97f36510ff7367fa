/* File: ephemeral_issuer.hpp
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
#include <string>
#include <vector>

#include "certificate.hpp"
#include "openssl_types.hpp"
#include "trust_material.hpp"

namespace pdfseal::crypto {

struct SignerIdentity {
  std::string common_name;
  std::string email;
};

/**
 * @brief Short-lived signer certificate and its private key
 * @details The key is used for exactly one signature, ConsumeKey releases it.
 */
class SignerCredential {
 public:
  SignerCredential(Certificate cert, EvpPkeyPtr key,
                   std::vector<Certificate> chain, bool self_signed);

  SignerCredential(const SignerCredential &) = delete;
  SignerCredential &operator=(const SignerCredential &) = delete;
  SignerCredential(SignerCredential &&) noexcept = default;
  SignerCredential &operator=(SignerCredential &&) noexcept = default;
  ~SignerCredential() = default;

  [[nodiscard]] const Certificate &Cert() const noexcept { return cert_; }

  /// @brief issuing chain, empty for a self-signed certificate
  [[nodiscard]] const std::vector<Certificate> &Chain() const noexcept {
    return chain_;
  }

  [[nodiscard]] bool SelfSigned() const noexcept { return self_signed_; }

  [[nodiscard]] bool KeyAvailable() const noexcept { return key_ != nullptr; }

  /**
   * @brief Take the private key out of the credential
   * @throws CryptoError if the key was already consumed
   */
  EvpPkeyPtr ConsumeKey();

 private:
  Certificate cert_;
  EvpPkeyPtr key_;
  std::vector<Certificate> chain_;
  bool self_signed_ = false;
};

/**
 * @brief Issues one signer certificate per signature
 * @details RSA-2048, one year validity, signed by the internal CA or
 * self-signed when the CA is absent.
 */
class EphemeralIssuer {
 public:
  explicit EphemeralIssuer(std::shared_ptr<const TrustMaterial> trust);

  /**
   * @brief Generate a key pair and a certificate for the signer
   * @param identity common name and email
   * @param org_unit organisation name in the subject
   * @throws CryptoError, std::invalid_argument
   */
  [[nodiscard]] SignerCredential Issue(const SignerIdentity &identity,
                                       const std::string &org_unit) const;

 private:
  std::shared_ptr<const TrustMaterial> trust_;
};

}  // namespace pdfseal::crypto
