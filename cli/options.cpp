/* File: options.cpp
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

#include "options.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <utility>

#include "tr.hpp"

namespace pdfseal::cli {

Options::Options(int argc, char **&argv, std::shared_ptr<spdlog::logger> logger)
  : log_(std::move(logger)), description_(tr("Allowed options")) {
  description_.add_options()
    // clang-format off
      (kHelpTag, tr("produce this help message"))
      (kActionTag,po::value<std::string>(),tr("certify, approve, journal, timestamp or info"))
      (kConfigTag,po::value<std::string>(),tr("Configuration file"))
      (kInputTag,po::value<std::string>(),tr("Input file"))
      (kOutputTag,po::value<std::string>(),tr("Output file"))
      (kSignerNameTag,po::value<std::string>(),tr("Signer full name"))
      (kSignerEmailTag,po::value<std::string>(),tr("Signer e-mail"))
      (kMarkerTag,po::value<std::string>(),tr("Text marker to place the stamp at"))
      (kFieldTag,po::value<std::string>(),tr("Signature field name"))
      (kDocumentIdTag,po::value<std::string>(),tr("Document identifier"))
      (kDocumentKindTag,po::value<std::string>(),tr("lease, inventory, receipt, amendment or insurance"));
  // clang-format on
  try {
    po::store(po::command_line_parser(argc, argv).options(description_).run(),
              var_map_);
    po::notify(var_map_);
  } catch (
    const boost::wrapexcept<po::invalid_command_line_syntax> & /*ex*/) {
    log_->error(tr("Wrong parameters, see --help"));
    wrong_params_ = true;
  } catch (const boost::wrapexcept<po::unknown_option> &ex) {
    log_->error(trs("Unknown option passed.") + " " + ex.what());
    wrong_params_ = true;
  } catch (const boost::wrapexcept<po::ambiguous_option> & /*ex*/) {
    wrong_params_ = true;
    log_->error(
      tr("Ambiguous option passed,use - for short options and -- "
         "for full otions,--help for help"));
  }
}

bool Options::help() const {
  std::cout << tr("Certification and signature of PDF documents") << "\n";
  if (var_map_.empty() || var_map_.count(kHelpTagL) > 0 || wrong_params_ ||
      !AllMandatoryAreSet()) {
    // clang-format off
    std::cout << tr("Usage") << ":\n  "
              << TRANSLATION_DOMAIN
              << " --action certify --config ./pdfseal.ini"
              << " --input lease.pdf --output lease_certified.pdf\n  "
              << TRANSLATION_DOMAIN
              << " --action approve --config ./pdfseal.ini"
              << " --input lease_certified.pdf --output lease_signed.pdf"
              << " --signer-name \"Jean Dupont\" --signer-email jean@example.org"
              << " --marker \"Signature du locataire\"\n  "
              << TRANSLATION_DOMAIN
              << " --action journal --config ./pdfseal.ini"
              << " --document-id 42 --input lease_signed.pdf"
              << " --output journal.json\n  "
              << TRANSLATION_DOMAIN
              << " --action timestamp --config ./pdfseal.ini"
              << " --input data.bin --output data.tsr\n  "
              << TRANSLATION_DOMAIN
              << " --action info --input lease_signed.pdf\n";
    std::cout << description_ << "\n";
    // clang-format on
    return true;
  }
  return false;
}

std::string Options::ResolvePath(const std::string &path) const {
  std::string local_path = path;
  const char *home = std::getenv("HOME");  // NOLINT
  if (home != nullptr && boost::starts_with(local_path, "~/")) {
    std::string home_path = home;
    home_path += "/";
    boost::replace_first(local_path, "~/", home_path);
  }
  std::error_code err_code;
  const std::filesystem::path fs_path =
    std::filesystem::absolute(local_path, err_code);
  if (err_code) {
    log_->error(err_code.message());
    return local_path;
  }
  return fs_path.string();
}

std::string Options::GetString(const char *tag) const {
  if (var_map_.count(tag) == 0) {
    return {};
  }
  return var_map_.at(tag).as<std::string>();
}

bool Options::AllMandatoryAreSet() const {
  const auto action = GetAction();
  if (!action) {
    log_->error(tr("No valid action is set"));
    return false;
  }
  if (var_map_.count(kInputTagL) == 0) {
    log_->error(tr("No input file is set"));
    return false;
  }
  if (action == Action::kInfo) {
    return true;
  }
  if (var_map_.count(kConfigTagL) == 0) {
    log_->error(tr("No configuration file is set"));
    return false;
  }
  if (action != Action::kJournal && var_map_.count(kOutputTagL) == 0) {
    log_->error(tr("No output file is set"));
    return false;
  }
  if (action == Action::kApprove) {
    if (GetSignerName().empty()) {
      log_->error(tr("No signer name is set"));
      return false;
    }
    if (GetSignerEmail().empty()) {
      log_->error(tr("No signer e-mail is set"));
      return false;
    }
  }
  if (action == Action::kJournal && GetDocumentId().empty()) {
    log_->error(tr("No document id is set"));
    return false;
  }
  return true;
}

std::optional<Action> Options::GetAction() const {
  const std::string action = GetString(kActionTagL);
  if (action == "certify") {
    return Action::kCertify;
  }
  if (action == "approve") {
    return Action::kApprove;
  }
  if (action == "journal") {
    return Action::kJournal;
  }
  if (action == "timestamp") {
    return Action::kTimestamp;
  }
  if (action == "info") {
    return Action::kInfo;
  }
  return std::nullopt;
}

std::string Options::GetConfigPath() const {
  const std::string res = GetString(kConfigTagL);
  return res.empty() ? res : ResolvePath(res);
}

std::string Options::GetInputFile() const {
  const std::string res = GetString(kInputTagL);
  return res.empty() ? res : ResolvePath(res);
}

std::string Options::GetOutputFile() const {
  const std::string res = GetString(kOutputTagL);
  return res.empty() ? res : ResolvePath(res);
}

std::string Options::GetSignerName() const {
  return GetString(kSignerNameTagL);
}

std::string Options::GetSignerEmail() const {
  return GetString(kSignerEmailTagL);
}

std::optional<std::string> Options::GetMarker() const {
  if (var_map_.count(kMarkerTagL) == 0) {
    return std::nullopt;
  }
  return GetString(kMarkerTagL);
}

std::optional<std::string> Options::GetField() const {
  if (var_map_.count(kFieldTagL) == 0) {
    return std::nullopt;
  }
  return GetString(kFieldTagL);
}

std::string Options::GetDocumentId() const {
  return GetString(kDocumentIdTagL);
}

std::string Options::GetDocumentKind() const {
  const std::string res = GetString(kDocumentKindTagL);
  if (res.empty()) {
    log_->debug(tr("Document kind was not set, lease will be used"));
    return "lease";
  }
  return res;
}

}  // namespace pdfseal::cli
