/* File: config.hpp
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
#include <cstdint>
#include <istream>
#include <string>

namespace pdfseal {

// rectangle in pdf user space units [llx lly urx ury]
struct RectConfig {
  double llx = 0;
  double lly = 0;
  double urx = 0;
  double ury = 0;

  [[nodiscard]] bool IsEmpty() const noexcept {
    return urx <= llx || ury <= lly;
  }
};

struct TrustConfig {
  std::string org_pkcs12;  // organisation certifier identity
  std::string org_passphrase;
  std::string ca_cert;  // internal CA for the ephemeral certificates
  std::string ca_key;
  std::string ca_passphrase;
  std::string tsa_cert;
  std::string tsa_key;
  std::string tsa_passphrase;
  bool allow_self_signed_fallback = true;
};

struct TsaConfig {
  std::string policy_oid = "1.2.3.4.1";
  uint32_t timeout_ms = 5000;
  std::string serial_db;  // empty - use the storage database
};

struct SigningConfig {
  std::string certifier_name = "pdfseal";
  std::string reason_certify = "Document certification";
  std::string reason_approve = "Agreement to the terms of the document";
  std::string location = "France";
  std::string org_unit = "pdfseal user";
  std::string caption = "Signature conforme eIDAS";
  int utc_offset_minutes = 0;
  RectConfig default_rect{425, 20, 575, 150};
  double stamp_width = 150;
  double stamp_height = 60;
  size_t placeholder_size = 32768;
};

struct OtpConfig {
  uint32_t max_age_minutes = 10;
};

struct StorageConfig {
  std::string database = "pdfseal.sqlite";
};

struct JournalConfig {
  std::string seal_key;  // HMAC key for the exported journal, optional
};

struct Config {
  TrustConfig trust;
  TsaConfig tsa;
  SigningConfig signing;
  OtpConfig otp;
  StorageConfig storage;
  JournalConfig journal;
};

/**
 * @brief Load an ini configuration file
 * @param path to the file
 * @return Config
 * @throws std::invalid_argument on a missing file or invalid values
 */
Config LoadConfig(const std::string &path);

/// @brief Load the configuration from a stream with ini syntax
Config LoadConfig(std::istream &stream);

/**
 * @brief Parse a rectangle
 * @param val "llx lly urx ury"
 * @throws std::invalid_argument
 */
RectConfig ParseRect(const std::string &val);

}  // namespace pdfseal
