/* File: anchor_locator.hpp
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
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <string>
#include <vector>

#include "pdf_structs.hpp"

namespace pdfseal::pdf {

/// @brief position of a marker found in the page text
struct AnchorMatch {
  int page_index = 0;
  XYReal position;  // start of the marker baseline, default user space
  double font_size = 0;
};

/**
 * @brief Find all occurrences of the marker in the page text
 * @details Text shown with simple fonts only, the marker must be written with
 * one font. Horizontal positions are estimated with an average glyph width.
 * @param page
 * @param marker text to search
 * @return std::vector<AnchorMatch> baseline start of each occurrence
 * @throws PdfSignError if the content stream can't be parsed
 */
std::vector<AnchorMatch> FindTextOnPage(QPDFPageObjectHelper &page,
                                        int page_index,
                                        const std::string &marker);

/**
 * @brief Locate the only anchor marker in the document
 * @return std::nullopt if the marker is not present
 * @throws PdfSignError "ambiguous anchor marker" on several matches (on one
 * page or on several pages)
 */
std::optional<AnchorMatch> LocateAnchor(QPDF &qpdf, const std::string &marker);

}  // namespace pdfseal::pdf
