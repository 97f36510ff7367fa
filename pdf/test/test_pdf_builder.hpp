/* File: test_pdf_builder.hpp
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
#include <vector>

#include "utils.hpp"

namespace pdfseal::test {

/// @brief unsigned signature field placed on a page
struct TestSigField {
  std::string name;
  int page_index = 0;
  double llx = 0;
  double lly = 0;
  double urx = 0;
  double ury = 0;
};

struct TestPdfOptions {
  // one entry per page, lines are shown with Helvetica 12 starting at 72 770
  std::vector<std::vector<std::string>> pages{{"Test document"}};
  // cross-reference stream instead of a cross-reference table
  bool xref_stream = false;
  std::optional<TestSigField> sig_field;
};

/// @brief small A4 document built in memory
BytesVector BuildTestPdf(const TestPdfOptions &options = {});

/// @brief baseline of the first text line
constexpr double kTestTextX = 72;
constexpr double kTestTextY = 770;
constexpr double kTestFontSize = 12;
constexpr double kTestLeading = 14;

}  // namespace pdfseal::test
