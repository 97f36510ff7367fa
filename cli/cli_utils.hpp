/* File: cli_utils.hpp
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

#include <memory>
#include <optional>
#include <string>

#include "config.hpp"
#include "memory_document.hpp"
#include "options.hpp"
#include "sqlite_db.hpp"
#include "timestamp_client.hpp"
#include "trust_material.hpp"
#include "utils.hpp"

namespace pdfseal::cli {

/// @brief everything the signing actions need, built from the config file
struct Services {
  Config config;
  std::shared_ptr<const crypto::TrustMaterial> trust;
  storage::SharedDb db;
  std::shared_ptr<tsa::TimestampClient> timestamp_client;
};

/**
 * @brief Check the input file - readable, non-empty
 *
 * @param file filename
 * @param expect_pdf check the %PDF header
 * @param log logger
 * @return true if file is ok
 */
bool CheckInputFile(const std::string &file, bool expect_pdf,
                    const std::shared_ptr<spdlog::logger> &log);

/**
 * @brief Check the directory of the output file
 *
 * @param output_file
 * @param log logger
 * @return true - existing,writable
 * @return false
 */
bool CheckOutputDir(const std::string &output_file,
                    const std::shared_ptr<spdlog::logger> &log);

/**
 * @brief Load file to vector
 * @return optional BytesVector - empty if fail
 */
std::optional<BytesVector> FileToVector(const std::string &path) noexcept;

/**
 * @brief Write the buffer to a file
 * @throws std::runtime_error
 */
void VectorToFile(const BytesVector &data, const std::string &path);

/// @brief lease, inventory, receipt, amendment, insurance
std::optional<workflow::DocumentKind> ParseDocumentKind(
  const std::string &val) noexcept;

/**
 * @brief Load the configuration, trust material, database and TSA
 * @throws std::invalid_argument, crypto::TrustMaterialError,
 * storage::StorageError
 */
Services LoadServices(const std::string &config_path);

/**
 * @brief Certify the input file
 * @return true on success
 */
bool PerformCertify(const Options &options, const Services &services,
                    const std::shared_ptr<spdlog::logger> &log);

/**
 * @brief Add one approval signature with an ephemeral certificate
 * @return true on success
 */
bool PerformApprove(const Options &options, const Services &services,
                    const std::shared_ptr<spdlog::logger> &log);

/**
 * @brief Export the journal of the document
 * @details The input file is the latest signed document, the status is
 * derived from the stored requests and proof records. Without --output the
 * journal is printed.
 * @return true on success
 */
bool PerformJournal(const Options &options, const Services &services,
                    const std::shared_ptr<spdlog::logger> &log);

/**
 * @brief Timestamp the input file with the internal authority
 * @details The DER token is written to the output file, its TSTInfo is
 * printed.
 * @return true on success
 */
bool PerformTimestamp(const Options &options, const Services &services,
                      const std::shared_ptr<spdlog::logger> &log);

/**
 * @brief Print the signatures of the input file
 * @return true if the file was read
 */
bool PerformInfo(const Options &options,
                 const std::shared_ptr<spdlog::logger> &log);

}  // namespace pdfseal::cli
