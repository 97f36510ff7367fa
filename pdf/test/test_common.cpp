/* File: test_common.cpp
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

#include <algorithm>
#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "acro_form.hpp"
#include "anchor_locator.hpp"
#include "cross_ref_stream.hpp"
#include "image_obj.hpp"
#include "pdf.hpp"
#include "pdf_structs.hpp"
#include "pdf_utils.hpp"
#include "test_pdf_builder.hpp"

using namespace pdfseal;
using namespace pdfseal::pdf;

TEST_CASE("Text strings") {
  SECTION("escape") {
    REQUIRE(PdfEscapeString("a(b)c\\") == "a\\(b\\)c\\\\");
  }
  SECTION("ascii text string") {
    REQUIRE(PdfTextString("Certification") == "(Certification)");
  }
  SECTION("utf16 text string") {
    // é
    REQUIRE(PdfTextString("\xC3\xA9") == "<FEFF00E9>");
    // U+1F600 surrogate pair
    REQUIRE(PdfTextString("\xF0\x9F\x98\x80") == "<FEFFD83DDE00>");
  }
  SECTION("winansi") {
    REQUIRE(Utf8ToWinAnsi("abc") == "abc");
    REQUIRE(Utf8ToWinAnsi("\xC3\xA9") == "\xE9");
    // en dash
    REQUIRE(Utf8ToWinAnsi("\xE2\x80\x93") == "\x96");
    // CJK has no WinAnsi code
    REQUIRE(Utf8ToWinAnsi("\xE4\xB8\xAD") == "?");
  }
  SECTION("code points") {
    const auto points = Utf8ToCodePoints("a\xC3\xA9\xFF");
    REQUIRE(points.size() == 3);
    REQUIRE(points[0] == 'a');
    REQUIRE(points[1] == 0xE9);
    REQUIRE(points[2] == 0xFFFD);
  }
}

TEST_CASE("Numbers") {
  REQUIRE(DoubleToString10(1.0) == "1");
  REQUIRE(DoubleToString10(0.5) == "0.5");
  REQUIRE(DoubleToString10(425) == "425");
  REQUIRE_THROWS(CalcResizeFactor(0, 10));
  REQUIRE(CalcResizeFactor(10, 5) == Approx(0.5));
}

TEST_CASE("BBox") {
  const BBox page{{0, 0}, {595, 842}};
  SECTION("inside") {
    const BBox box{{425, 20}, {575, 150}};
    const BBox res = box.ClampTo(page);
    REQUIRE(res.left_bottom.x == Approx(425));
    REQUIRE(res.right_top.y == Approx(150));
  }
  SECTION("moved inside") {
    const BBox box{{500, 800}, {650, 860}};
    const BBox res = box.ClampTo(page);
    REQUIRE(res.Width() == Approx(150));
    REQUIRE(res.Height() == Approx(60));
    REQUIRE(res.right_top.x == Approx(595));
    REQUIRE(res.right_top.y == Approx(842));
  }
  SECTION("shrunk") {
    const BBox box{{-10, -10}, {1000, 100}};
    const BBox res = box.ClampTo(page);
    REQUIRE(res.left_bottom.x == Approx(0));
    REQUIRE(res.Width() == Approx(595));
  }
}

TEST_CASE("Byteranges") {
  const BytesVector data{'0', '1', '2', '3', '4', '5', '6', '7', '8', '9'};
  SECTION("extract") {
    const auto res = ExtractByteRanges(data, {{0, 2}, {5, 5}});
    REQUIRE(res == BytesVector{'0', '1', '5', '6', '7', '8', '9'});
  }
  SECTION("out of range") {
    REQUIRE_THROWS_AS(ExtractByteRanges(data, {{0, 2}, {8, 5}}),
                      PdfSignError);
  }
  SECTION("patch") {
    BytesVector buf = data;
    PatchData(buf, 3, "ab");
    REQUIRE(buf[3] == 'a');
    REQUIRE(buf[4] == 'b');
    REQUIRE(buf.size() == data.size());
    REQUIRE_THROWS_AS(PatchData(buf, 9, "ab"), std::invalid_argument);
  }
  SECTION("hex") {
    REQUIRE(ByteVectorToHexString({0x00, 0xAB, 0x10}) == "00ab10");
  }
}

TEST_CASE("Cross-reference") {
  SECTION("find startxref") {
    const std::string tail = "abc\nstartxref\n1234\n%%EOF\n";
    REQUIRE(FindXrefOffset(BytesVector(tail.cbegin(), tail.cend()))
              .value_or("") == "1234");
    const std::string none = "no offset here";
    REQUIRE_FALSE(
      FindXrefOffset(BytesVector(none.cbegin(), none.cend())).has_value());
    REQUIRE_FALSE(FindXrefOffset({}).has_value());
  }
  SECTION("sections") {
    std::vector<XRefEntry> entries(4);
    entries[0].id.id = 10;
    entries[1].id.id = 3;
    entries[2].id.id = 11;
    entries[3].id.id = 4;
    const auto sections = BuildXRefStreamSections(entries);
    REQUIRE(sections.size() == 2);
    REQUIRE(sections[0].first == 3);
    REQUIRE(sections[0].second == 2);
    REQUIRE(sections[1].first == 10);
    REQUIRE(sections[1].second == 2);
    REQUIRE(entries.front().id.id == 3);
    entries[1].id.id = 3;
    REQUIRE_THROWS(BuildXRefStreamSections(entries));
  }
  SECTION("table entry") {
    XRefEntry entry;
    entry.offset = 1234;
    const std::string str = entry.ToString();
    REQUIRE(str.size() == 20);
    REQUIRE(str.substr(0, 10) == "0000001234");
  }
  SECTION("stream entry width") {
    CrossRefStream stream;
    stream.id.id = 12;
    XRefEntry entry;
    entry.id.id = 5;
    entry.offset = 0x01020304;
    stream.entries.push_back(entry);
    stream.length = 7;
    const BytesVector raw = stream.ToRawData();
    const std::string marker = "stream\n";
    auto it = std::search(raw.cbegin(), raw.cend(), marker.cbegin(),
                          marker.cend());
    REQUIRE(it != raw.cend());
    it += static_cast<std::ptrdiff_t>(marker.size());
    const BytesVector row(it, it + 7);
    REQUIRE(row == BytesVector{0x01, 0x01, 0x02, 0x03, 0x04, 0x00, 0x00});
    stream.entries[0].offset = 0x1FFFFFFFFULL;
    REQUIRE_THROWS(stream.ToRawData());
  }
}

TEST_CASE("Pdf open") {
  std::unique_ptr<Pdf> pdf;
  REQUIRE_NOTHROW(pdf = std::make_unique<Pdf>());
  REQUIRE_THROWS_AS(pdf->Open({}), PdfSignError);
  const std::string garbage = "this is not a pdf";
  REQUIRE_THROWS_AS(pdf->Open(BytesVector(garbage.cbegin(), garbage.cend())),
                    PdfSignError);
  test::TestPdfOptions options;
  options.pages = {{"first"}, {"second"}, {"third"}};
  SECTION("classic xref") {
    REQUIRE_NOTHROW(pdf->Open(test::BuildTestPdf(options)));
  }
  SECTION("xref stream") {
    options.xref_stream = true;
    REQUIRE_NOTHROW(pdf->Open(test::BuildTestPdf(options)));
  }
  REQUIRE(pdf->GetPagesCount() == 3);
  REQUIRE_FALSE(pdf->FindSignatures());
  REQUIRE(pdf->GetSignaturesCount() == 0);
  REQUIRE_FALSE(pdf->HasDocMdp());
  REQUIRE(pdf->GetAcroform() == nullptr);
  REQUIRE(pdf->GetPage(2) != nullptr);
  REQUIRE(pdf->GetPage(3) == nullptr);
  REQUIRE(pdf->GetLastObjID().id >= 9);
}

TEST_CASE("Signature field lookup") {
  test::TestPdfOptions options;
  options.pages = {{"first"}, {"second"}};
  options.sig_field = test::TestSigField{"tenant-sig", 1, 100, 100, 250, 160};
  Pdf pdf(test::BuildTestPdf(options));
  auto field = pdf.FindSigField("tenant-sig");
  REQUIRE(field != nullptr);
  REQUIRE(pdf.FindFieldPage(*field).value_or(-1) == 1);
  REQUIRE(pdf.FindSigField("landlord-sig") == nullptr);
  REQUIRE(pdf.GetAcroform() != nullptr);
  REQUIRE_FALSE(pdf.FindSignatures());
}

TEST_CASE("Anchor marker") {
  test::TestPdfOptions options;
  options.pages = {{"Contract"}, {"Terms", "Signature: [[sig]]"}};
  SECTION("single") {
    Pdf pdf(test::BuildTestPdf(options));
    const auto match = LocateAnchor(*pdf.getQPDF(), "[[sig]]");
    REQUIRE(match.has_value());
    REQUIRE(match->page_index == 1);
    // second line, 11 glyphs before the marker
    REQUIRE(match->position.y == Approx(test::kTestTextY - test::kTestLeading));
    REQUIRE(match->position.x ==
            Approx(test::kTestTextX + 11 * test::kTestFontSize * 0.5));
    REQUIRE(match->font_size == Approx(test::kTestFontSize));
  }
  SECTION("absent") {
    Pdf pdf(test::BuildTestPdf(options));
    REQUIRE_FALSE(LocateAnchor(*pdf.getQPDF(), "[[other]]").has_value());
  }
  SECTION("twice on one page") {
    options.pages[0].emplace_back("[[sig]] and [[sig]]");
    Pdf pdf(test::BuildTestPdf(options));
    REQUIRE_THROWS_AS(LocateAnchor(*pdf.getQPDF(), "[[sig]]"), PdfSignError);
  }
  SECTION("on two pages") {
    options.pages[0].emplace_back("[[sig]]");
    Pdf pdf(test::BuildTestPdf(options));
    REQUIRE_THROWS_AS(LocateAnchor(*pdf.getQPDF(), "[[sig]]"), PdfSignError);
  }
}

TEST_CASE("AcroForm copy") {
  auto dict = std::make_shared<QPDFObjectHandle>(QPDFObjectHandle::parse(
    "<< /Fields [] /SigFlags 1 /NeedAppearances true /DA (/Helv 0 Tf 0 g) >>"));
  AcroForm acroform = AcroForm::ShallowCopy(dict);
  REQUIRE(acroform.id.id == 0);
  REQUIRE(acroform.sig_flags == 3);
  REQUIRE(acroform.need_appearances_dropped);
  REQUIRE(acroform.other_fields_copied.count("/DA") == 1);
  REQUIRE(acroform.other_fields_copied.count("/NeedAppearances") == 0);
  acroform.id = ObjRawId{12, 0};
  acroform.AddField(ObjRawId{10, 0});
  acroform.AddField(ObjRawId{10, 0});
  REQUIRE(acroform.fields.size() == 1);
  const std::string raw = acroform.ToString();
  REQUIRE(raw.find("/Fields [ 10 0 R ]") != std::string::npos);
  REQUIRE(raw.find("/NeedAppearances") == std::string::npos);
  REQUIRE_THROWS(AcroForm::ShallowCopy(nullptr));
}

TEST_CASE("Signature image object") {
  RgbImage img{2, 1, {255, 0, 0, 0, 0, 255}};
  const ImageObj image = ImageObj::FromRgb(ObjRawId{7, 0}, img);
  const BytesVector raw = image.ToRawData();
  const std::string text(raw.cbegin(), raw.cend());
  REQUIRE(text.find("/Width 2 /Height 1") != std::string::npos);
  REQUIRE(text.find("/Length 6") != std::string::npos);
  REQUIRE(text.find("endstream") != std::string::npos);
  img.pixels.pop_back();
  REQUIRE_THROWS_AS(ImageObj::FromRgb(ObjRawId{7, 0}, img), PdfSignError);
}
