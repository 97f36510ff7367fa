/* File: options.hpp
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

#include <spdlog/spdlog.h>

#include <boost/program_options.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace pdfseal::cli {

namespace po = boost::program_options;

const char *const kHelpTag = "help,h";
const char *const kHelpTagL = "help";
const char *const kActionTag = "action,a";
const char *const kActionTagL = "action";
const char *const kConfigTag = "config,c";
const char *const kConfigTagL = "config";
const char *const kInputTag = "input,i";
const char *const kInputTagL = "input";
const char *const kOutputTag = "output,o";
const char *const kOutputTagL = "output";
const char *const kSignerNameTag = "signer-name,n";
const char *const kSignerNameTagL = "signer-name";
const char *const kSignerEmailTag = "signer-email,e";
const char *const kSignerEmailTagL = "signer-email";
const char *const kMarkerTag = "marker,m";
const char *const kMarkerTagL = "marker";
const char *const kFieldTag = "field,f";
const char *const kFieldTagL = "field";
const char *const kDocumentIdTag = "document-id,d";
const char *const kDocumentIdTagL = "document-id";
const char *const kDocumentKindTag = "document-kind,k";
const char *const kDocumentKindTagL = "document-kind";
const char *const kError = "Error:";

enum class Action : uint8_t { kCertify, kApprove, kJournal, kTimestamp, kInfo };

class Options {
 public:
  Options(int argc, char **&argv, std::shared_ptr<spdlog::logger> logger);

  [[nodiscard]] bool help() const;
  [[nodiscard]] bool AllMandatoryAreSet() const;
  [[nodiscard]] bool WrongParams() const { return wrong_params_; }

  [[nodiscard]] std::optional<Action> GetAction() const;
  [[nodiscard]] std::string GetConfigPath() const;
  [[nodiscard]] std::string GetInputFile() const;
  [[nodiscard]] std::string GetOutputFile() const;
  [[nodiscard]] std::string GetSignerName() const;
  [[nodiscard]] std::string GetSignerEmail() const;
  [[nodiscard]] std::optional<std::string> GetMarker() const;
  [[nodiscard]] std::optional<std::string> GetField() const;
  [[nodiscard]] std::string GetDocumentId() const;
  [[nodiscard]] std::string GetDocumentKind() const;

 private:
  [[nodiscard]] std::string ResolvePath(const std::string &path) const;
  [[nodiscard]] std::string GetString(const char *tag) const;

  std::shared_ptr<spdlog::logger> log_;
  po::options_description description_;
  bool wrong_params_ = false;
  po::variables_map var_map_;
};

}  // namespace pdfseal::cli
