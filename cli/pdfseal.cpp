/* File: pdfseal.cpp
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

#include <libintl.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <clocale>
#include <exception>
#include <iostream>
#include <memory>

#include "cli_utils.hpp"
#include "options.hpp"
#include "tr.hpp"

int main(int argc, char* argv[]) {
  using pdfseal::cli::Action;
  using pdfseal::cli::tr;
  using pdfseal::cli::trs;
  // setup the transtlator
  if (setlocale(LC_ALL, "") == nullptr) {  // NOLINT
    std::cerr << "Failed to set locale.\n";
    return 1;
  }
  bindtextdomain(TRANSLATION_DOMAIN, TRANSLATIONS_INSTALL_DIR);
  bind_textdomain_codeset(TRANSLATION_DOMAIN, "UTF-8");
  textdomain(TRANSLATION_DOMAIN);
  try {
    // ----------------
    // setup logging
    auto console = spdlog::stdout_color_mt(TRANSLATION_DOMAIN);
    if (!console) {
      std::cerr << tr("Setup logger failed");
      return 1;
    }
    const pdfseal::cli::Options options(argc, argv, console);
    if (options.help()) {
      return options.WrongParams() ? 1 : 0;
    }
    const auto action = options.GetAction().value();
    const bool expect_pdf = action != Action::kTimestamp;
    if (!pdfseal::cli::CheckInputFile(options.GetInputFile(), expect_pdf,
                                      console)) {
      console->error(tr("Input file is not OK"));
      return 1;
    }
    if (action == Action::kInfo) {
      return pdfseal::cli::PerformInfo(options, console) ? 0 : 1;
    }
    const std::string output = options.GetOutputFile();
    if (!output.empty() && !pdfseal::cli::CheckOutputDir(output, console)) {
      console->error(tr("Output directory is not OK"));
      return 1;
    }
    // ----------------
    // configuration, trust material, storage
    const pdfseal::cli::Services services =
      pdfseal::cli::LoadServices(options.GetConfigPath());
    console->debug(trs("Configuration loaded from ") +
                   options.GetConfigPath());
    bool succeeded = false;
    switch (action) {
      case Action::kCertify:
        succeeded = pdfseal::cli::PerformCertify(options, services, console);
        break;
      case Action::kApprove:
        succeeded = pdfseal::cli::PerformApprove(options, services, console);
        break;
      case Action::kJournal:
        succeeded = pdfseal::cli::PerformJournal(options, services, console);
        break;
      case Action::kTimestamp:
        succeeded = pdfseal::cli::PerformTimestamp(options, services, console);
        break;
      case Action::kInfo:
        break;
    }
    return succeeded ? 0 : 1;
  } catch (const std::exception& ex) {
    std::cerr << tr("Error:") << ex.what() << "\n";
    return 1;
  }
  return 0;
}
