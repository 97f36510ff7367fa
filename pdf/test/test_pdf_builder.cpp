/* File: test_pdf_builder.cpp
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

#include "test_pdf_builder.hpp"

#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

#include "pdf_structs.hpp"
#include "pdf_utils.hpp"

namespace pdfseal::test {

namespace {

class Writer {
 public:
  void Raw(const std::string &str) {
    buf_.insert(buf_.end(), str.cbegin(), str.cend());
  }

  void Object(int id, const std::string &body) {
    if (offsets_.size() <= static_cast<size_t>(id)) {
      offsets_.resize(id + 1, 0);
    }
    offsets_[id] = buf_.size();
    Raw(std::to_string(id) + " 0 obj\n" + body + "\nendobj\n");
  }

  [[nodiscard]] size_t Size() const noexcept { return buf_.size(); }

  [[nodiscard]] const std::vector<size_t> &Offsets() const noexcept {
    return offsets_;
  }

  BytesVector &Buf() noexcept { return buf_; }

 private:
  BytesVector buf_;
  std::vector<size_t> offsets_;
};

std::string Ref(int id) { return std::to_string(id) + " 0 R"; }

std::string ContentStream(const std::vector<std::string> &lines) {
  std::ostringstream content;
  content << "BT\n/F1 " << kTestFontSize << " Tf\n"
          << kTestLeading << " TL\n"
          << kTestTextX << " " << kTestTextY << " Td\n";
  bool first = true;
  for (const auto &line : lines) {
    if (!first) {
      content << "T*\n";
    }
    first = false;
    content << "(" << pdf::PdfEscapeString(line) << ") Tj\n";
  }
  content << "ET\n";
  return content.str();
}

void PushBigEndian(BytesVector &buf, uint64_t val, int bytes) {
  for (int i = bytes - 1; i >= 0; --i) {
    buf.push_back(static_cast<unsigned char>((val >> (8 * i)) & 0xFF));
  }
}

}  // namespace

BytesVector BuildTestPdf(const TestPdfOptions &options) {
  const int pages_count = static_cast<int>(options.pages.size());
  // 1 catalog, 2 pages, 3 font, then page + content pairs
  constexpr int kFirstPageId = 4;
  const int field_id = kFirstPageId + 2 * pages_count;
  const int acroform_id = field_id + 1;
  const bool with_field = options.sig_field.has_value();
  const int last_id = with_field ? acroform_id : field_id - 1;

  Writer writer;
  writer.Raw("%PDF-1.7\n%\xE2\xE3\xCF\xD3\n");

  std::string catalog = "<< /Type /Catalog /Pages 2 0 R";
  if (with_field) {
    catalog += " /AcroForm " + Ref(acroform_id);
  }
  catalog += " >>";
  writer.Object(1, catalog);

  std::string kids;
  for (int i = 0; i < pages_count; ++i) {
    kids += Ref(kFirstPageId + 2 * i) + " ";
  }
  writer.Object(2, "<< /Type /Pages /Kids [ " + kids + "] /Count " +
                     std::to_string(pages_count) + " >>");
  writer.Object(3,
                "<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica "
                "/Encoding /WinAnsiEncoding >>");

  for (int i = 0; i < pages_count; ++i) {
    const int page_id = kFirstPageId + 2 * i;
    const int content_id = page_id + 1;
    std::string page =
      "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 595 842] "
      "/Resources << /Font << /F1 3 0 R >> >> /Contents " +
      Ref(content_id);
    if (with_field && options.sig_field->page_index == i) {
      page += " /Annots [ " + Ref(field_id) + " ]";
    }
    page += " >>";
    writer.Object(page_id, page);
    const std::string content = ContentStream(options.pages[i]);
    writer.Object(content_id, "<< /Length " + std::to_string(content.size()) +
                                " >>\nstream\n" + content + "\nendstream");
  }

  if (with_field) {
    const auto &field = options.sig_field.value();
    const std::string rect =
      "[" + pdf::DoubleToString10(field.llx) + " " +
      pdf::DoubleToString10(field.lly) + " " +
      pdf::DoubleToString10(field.urx) + " " +
      pdf::DoubleToString10(field.ury) + "]";
    writer.Object(field_id,
                  "<< /FT /Sig /T " + pdf::PdfTextString(field.name) +
                    " /Type /Annot /Subtype /Widget /F 4 /Rect " + rect +
                    " /P " + Ref(kFirstPageId + 2 * field.page_index) +
                    " >>");
    writer.Object(acroform_id, "<< /Fields [ " + Ref(field_id) + " ] >>");
  }

  const std::string id_hex = "<0123456789ABCDEF0123456789ABCDEF>";
  if (!options.xref_stream) {
    const size_t xref_offset = writer.Size();
    std::ostringstream xref;
    xref << "xref\n0 " << last_id + 1 << "\n0000000000 65535 f \n";
    for (int id = 1; id <= last_id; ++id) {
      pdf::XRefEntry entry;
      entry.id = pdf::ObjRawId{id, 0};
      entry.offset = writer.Offsets()[id];
      xref << entry.ToString();
    }
    xref << "trailer\n<< /Size " << last_id + 1 << " /Root 1 0 R /ID [ "
         << id_hex << " " << id_hex << " ] >>\nstartxref\n"
         << xref_offset << "\n%%EOF\n";
    writer.Raw(xref.str());
    return writer.Buf();
  }

  const int xref_id = last_id + 1;
  const size_t xref_offset = writer.Size();
  BytesVector entries;
  // free head
  PushBigEndian(entries, 0, 1);
  PushBigEndian(entries, 0, 4);
  PushBigEndian(entries, 0xFFFF, 2);
  for (int id = 1; id <= last_id; ++id) {
    PushBigEndian(entries, 1, 1);
    PushBigEndian(entries, writer.Offsets()[id], 4);
    PushBigEndian(entries, 0, 2);
  }
  PushBigEndian(entries, 1, 1);
  PushBigEndian(entries, xref_offset, 4);
  PushBigEndian(entries, 0, 2);

  std::ostringstream head;
  head << xref_id << " 0 obj\n<< /Type /XRef /Size " << xref_id + 1
       << " /W [ 1 4 2 ] /Root 1 0 R /ID [ " << id_hex << " " << id_hex
       << " ] /Length " << entries.size() << " >>\nstream\n";
  writer.Raw(head.str());
  writer.Buf().insert(writer.Buf().end(), entries.cbegin(), entries.cend());
  std::ostringstream tail;
  tail << "\nendstream\nendobj\nstartxref\n" << xref_offset << "\n%%EOF\n";
  writer.Raw(tail.str());
  return writer.Buf();
}

}  // namespace pdfseal::test
