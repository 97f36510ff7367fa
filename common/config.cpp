/* File: config.cpp
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

#include "config.hpp"

#include <boost/program_options.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "utils.hpp"

namespace pdfseal {

namespace po = boost::program_options;

RectConfig ParseRect(const std::string &val) {
  const std::string func_name = "[ParseRect] ";
  std::istringstream stream(val);
  std::vector<double> coords;
  double coord = 0;
  while (stream >> coord) {
    coords.push_back(coord);
  }
  if (!stream.eof() || coords.size() != 4) {
    throw std::invalid_argument(func_name + "expected four numbers, got \"" +
                                val + "\"");
  }
  RectConfig res{coords[0], coords[1], coords[2], coords[3]};
  if (res.IsEmpty()) {
    throw std::invalid_argument(func_name + "empty rectangle \"" + val + "\"");
  }
  return res;
}

Config LoadConfig(const std::string &path) {
  const std::string func_name = "[LoadConfig] ";
  if (path.empty() || !std::filesystem::exists(path)) {
    throw std::invalid_argument(func_name + "config file not found " + path);
  }
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::invalid_argument(func_name + "can't open config file " + path);
  }
  return LoadConfig(file);
}

Config LoadConfig(std::istream &stream) {
  const std::string func_name = "[LoadConfig] ";
  Config res;
  std::string default_rect;
  po::options_description description("pdfseal configuration");
  description.add_options()
    // clang-format off
    ("trust.org_pkcs12", po::value<std::string>(&res.trust.org_pkcs12))
    ("trust.org_passphrase", po::value<std::string>(&res.trust.org_passphrase))
    ("trust.ca_cert", po::value<std::string>(&res.trust.ca_cert))
    ("trust.ca_key", po::value<std::string>(&res.trust.ca_key))
    ("trust.ca_passphrase", po::value<std::string>(&res.trust.ca_passphrase))
    ("trust.tsa_cert", po::value<std::string>(&res.trust.tsa_cert))
    ("trust.tsa_key", po::value<std::string>(&res.trust.tsa_key))
    ("trust.tsa_passphrase", po::value<std::string>(&res.trust.tsa_passphrase))
    ("trust.allow_self_signed_fallback",
      po::value<bool>(&res.trust.allow_self_signed_fallback)->default_value(true))
    ("tsa.policy_oid", po::value<std::string>(&res.tsa.policy_oid)->default_value(res.tsa.policy_oid))
    ("tsa.timeout_ms", po::value<uint32_t>(&res.tsa.timeout_ms)->default_value(res.tsa.timeout_ms))
    ("tsa.serial_db", po::value<std::string>(&res.tsa.serial_db))
    ("signing.certifier_name", po::value<std::string>(&res.signing.certifier_name)->default_value(res.signing.certifier_name))
    ("signing.reason_certify", po::value<std::string>(&res.signing.reason_certify)->default_value(res.signing.reason_certify))
    ("signing.reason_approve", po::value<std::string>(&res.signing.reason_approve)->default_value(res.signing.reason_approve))
    ("signing.location", po::value<std::string>(&res.signing.location)->default_value(res.signing.location))
    ("signing.org_unit", po::value<std::string>(&res.signing.org_unit)->default_value(res.signing.org_unit))
    ("signing.caption", po::value<std::string>(&res.signing.caption)->default_value(res.signing.caption))
    ("signing.utc_offset_minutes", po::value<int>(&res.signing.utc_offset_minutes)->default_value(0))
    ("signing.default_rect", po::value<std::string>(&default_rect))
    ("signing.stamp_width", po::value<double>(&res.signing.stamp_width)->default_value(res.signing.stamp_width))
    ("signing.stamp_height", po::value<double>(&res.signing.stamp_height)->default_value(res.signing.stamp_height))
    ("signing.placeholder_size", po::value<size_t>(&res.signing.placeholder_size)->default_value(res.signing.placeholder_size))
    ("otp.max_age_minutes", po::value<uint32_t>(&res.otp.max_age_minutes)->default_value(res.otp.max_age_minutes))
    ("storage.database", po::value<std::string>(&res.storage.database)->default_value(res.storage.database))
    ("journal.seal_key", po::value<std::string>(&res.journal.seal_key));
  // clang-format on
  po::variables_map var_map;
  try {
    po::store(po::parse_config_file(stream, description, false), var_map);
    po::notify(var_map);
  } catch (const po::error &ex) {
    throw std::invalid_argument(func_name + ex.what());
  }
  if (!default_rect.empty()) {
    res.signing.default_rect = ParseRect(default_rect);
  }
  if (res.signing.utc_offset_minutes < -14 * 60 ||
      res.signing.utc_offset_minutes > 14 * 60) {
    throw std::invalid_argument(func_name + "utc offset is out of range");
  }
  if (res.tsa.timeout_ms == 0) {
    throw std::invalid_argument(func_name + "tsa timeout can't be zero");
  }
  if (res.signing.placeholder_size < 4096) {
    throw std::invalid_argument(func_name + "signature placeholder too small");
  }
  if (res.signing.stamp_width <= 0 || res.signing.stamp_height <= 0) {
    throw std::invalid_argument(func_name + "invalid stamp size");
  }
  res.trust.org_passphrase = ResolveSecret(res.trust.org_passphrase);
  res.trust.ca_passphrase = ResolveSecret(res.trust.ca_passphrase);
  res.trust.tsa_passphrase = ResolveSecret(res.trust.tsa_passphrase);
  res.journal.seal_key = ResolveSecret(res.journal.seal_key);
  if (res.tsa.serial_db.empty()) {
    res.tsa.serial_db = res.storage.database;
  }
  return res;
}

}  // namespace pdfseal
