/* File: anchor_locator.cpp
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

#include "anchor_locator.hpp"

#include <cmath>
#include <exception>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <stack>
#include <string>
#include <utility>
#include <vector>

#include "logger_utils.hpp"
#include "pdf_defs.hpp"

namespace pdfseal::pdf {

namespace {

// estimated advance of one glyph in text space units
constexpr double kAvgGlyphAdvance = 0.5;

/// @brief piece of text shown by one operator
struct TextRun {
  size_t start = 0;  // position in the page text
  size_t length = 0;
  XYReal origin;              // user space
  double glyph_advance = 0;   // user space
  double font_size = 0;       // user space
};

/**
 * @brief Collects the page text with glyph positions
 * @details ISO 32000 [9.4] Text objects, only the operators that change the
 * text position are interpreted.
 */
class TextCollector : public QPDFObjectHandle::ParserCallbacks {
 public:
  explicit TextCollector(QPDFObjectHandle fonts) : fonts_(std::move(fonts)) {}

  void handleObject(QPDFObjectHandle obj) override {
    if (!obj.isOperator()) {
      operands_.push_back(obj);
      return;
    }
    HandleOperator(obj.getOperatorValue());
    operands_.clear();
  }

  void handleEOF() override {}

  [[nodiscard]] const std::string &Text() const noexcept { return text_; }
  [[nodiscard]] const std::vector<TextRun> &Runs() const noexcept {
    return runs_;
  }

 private:
  [[nodiscard]] double Number(size_t index) {
    if (index >= operands_.size() || !operands_[index].isNumber()) {
      return 0;
    }
    return operands_[index].getNumericValue();
  }

  void HandleOperator(const std::string &oper) {
    if (oper == "q") {
      ctm_stack_.push(ctm_);
    } else if (oper == "Q") {
      if (!ctm_stack_.empty()) {
        ctm_ = ctm_stack_.top();
        ctm_stack_.pop();
      }
    } else if (oper == "cm" && operands_.size() == 6) {
      ctm_ = MatrixFromOperands().Multiply(ctm_);
    } else if (oper == "BT") {
      text_matrix_ = Matrix{};
      line_matrix_ = Matrix{};
      NewLine();
    } else if (oper == "Tf" && operands_.size() == 2) {
      font_size_ = Number(1);
      simple_font_ = IsSimpleFont(operands_[0]);
    } else if (oper == "TL") {
      leading_ = Number(0);
    } else if (oper == "Td") {
      MoveLine(Number(0), Number(1));
    } else if (oper == "TD") {
      leading_ = -Number(1);
      MoveLine(Number(0), Number(1));
    } else if (oper == "Tm" && operands_.size() == 6) {
      text_matrix_ = MatrixFromOperands();
      line_matrix_ = text_matrix_;
      NewLine();
    } else if (oper == "T*") {
      MoveLine(0, -leading_);
    } else if (oper == "Tj" && !operands_.empty()) {
      ShowString(operands_.back());
    } else if (oper == "'" && !operands_.empty()) {
      MoveLine(0, -leading_);
      ShowString(operands_.back());
    } else if (oper == "\"" && operands_.size() == 3) {
      MoveLine(0, -leading_);
      ShowString(operands_.back());
    } else if (oper == "TJ" && !operands_.empty() &&
               operands_.back().isArray()) {
      for (auto &item : operands_.back().getArrayAsVector()) {
        if (item.isString()) {
          ShowString(item);
        } else if (item.isNumber()) {
          // displacement in thousandths of text space unit
          text_matrix_.e -= item.getNumericValue() / 1000 * font_size_ *
                            text_matrix_.a;
          text_matrix_.f -= item.getNumericValue() / 1000 * font_size_ *
                            text_matrix_.b;
        }
      }
    }
  }

  [[nodiscard]] Matrix MatrixFromOperands() {
    return Matrix{Number(0), Number(1), Number(2),
                  Number(3), Number(4), Number(5)};
  }

  void MoveLine(double t_x, double t_y) {
    line_matrix_ = Matrix{1, 0, 0, 1, t_x, t_y}.Multiply(line_matrix_);
    text_matrix_ = line_matrix_;
    NewLine();
  }

  // markers never span lines
  void NewLine() {
    if (!text_.empty() && text_.back() != '\n') {
      text_ += '\n';
    }
  }

  [[nodiscard]] bool IsSimpleFont(QPDFObjectHandle name) {
    if (!name.isName() || !fonts_.isDictionary() ||
        !fonts_.hasKey(name.getName())) {
      return true;
    }
    auto font = fonts_.getKey(name.getName());
    return !(font.isDictionary() && font.hasKey(kTagSubType) &&
             font.getKey(kTagSubType).isName() &&
             font.getKey(kTagSubType).getName() == "/Type0");
  }

  void ShowString(QPDFObjectHandle str) {
    if (!str.isString()) {
      return;
    }
    const std::string val = str.getStringValue();
    const Matrix trm = text_matrix_.Multiply(ctm_);
    const double advance = kAvgGlyphAdvance * font_size_;
    if (simple_font_ && !val.empty()) {
      TextRun run;
      run.start = text_.size();
      run.length = val.size();
      run.origin = trm.Transform({0, 0});
      const XYReal next = trm.Transform({advance, 0});
      run.glyph_advance = std::hypot(next.x - run.origin.x,
                                     next.y - run.origin.y);
      run.font_size = std::fabs(font_size_ * std::sqrt(std::fabs(
                                                trm.a * trm.d - trm.b * trm.c)));
      text_ += val;
      runs_.push_back(run);
    }
    // move the text matrix as if every glyph had the average width
    const double t_x = advance * static_cast<double>(val.size());
    text_matrix_ = Matrix{1, 0, 0, 1, t_x, 0}.Multiply(text_matrix_);
  }

  QPDFObjectHandle fonts_;
  std::vector<QPDFObjectHandle> operands_;
  Matrix ctm_;
  std::stack<Matrix> ctm_stack_;
  Matrix text_matrix_;
  Matrix line_matrix_;
  double font_size_ = 0;
  double leading_ = 0;
  bool simple_font_ = true;
  std::string text_;
  std::vector<TextRun> runs_;
};

}  // namespace

std::vector<AnchorMatch> FindTextOnPage(QPDFPageObjectHelper &page,
                                        int page_index,
                                        const std::string &marker) {
  const std::string func_name = "[FindTextOnPage] ";
  std::vector<AnchorMatch> res;
  if (marker.empty()) {
    return res;
  }
  QPDFObjectHandle fonts = QPDFObjectHandle::newNull();
  auto resources = page.getAttribute(kTagResources, false);
  if (resources.isDictionary() && resources.hasKey(kTagFont)) {
    fonts = resources.getKey(kTagFont);
  }
  TextCollector collector(fonts);
  try {
    page.parseContents(&collector);
  } catch (const std::exception &ex) {
    throw PdfSignError(func_name + "can't parse the page content " + ex.what());
  }
  const std::string &text = collector.Text();
  const auto &runs = collector.Runs();
  size_t pos = text.find(marker);
  while (pos != std::string::npos) {
    for (const auto &run : runs) {
      if (pos >= run.start && pos < run.start + run.length) {
        const double shift =
          run.glyph_advance * static_cast<double>(pos - run.start);
        AnchorMatch match;
        match.page_index = page_index;
        match.position = {run.origin.x + shift, run.origin.y};
        match.font_size = run.font_size;
        res.push_back(match);
        break;
      }
    }
    pos = text.find(marker, pos + marker.size());
  }
  return res;
}

std::optional<AnchorMatch> LocateAnchor(QPDF &qpdf, const std::string &marker) {
  const std::string func_name = "[LocateAnchor] ";
  std::optional<AnchorMatch> res;
  auto pages = QPDFPageDocumentHelper(qpdf).getAllPages();
  for (size_t i = 0; i < pages.size(); ++i) {
    auto matches = FindTextOnPage(pages[i], static_cast<int>(i), marker);
    if (matches.empty()) {
      continue;
    }
    if (matches.size() > 1 || res.has_value()) {
      throw PdfSignError(func_name + "ambiguous anchor marker");
    }
    res = matches.front();
  }
  auto logger = logger::InitLog();
  if (logger && res) {
    logger->debug("{} marker found on page {} at {}", func_name,
                  res->page_index, res->position.ToString());
  }
  return res;
}

}  // namespace pdfseal::pdf
