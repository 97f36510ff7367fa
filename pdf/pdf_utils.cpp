/* File: pdf_utils.cpp
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

#include "pdf_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <iterator>
#include <limits>
#include <map>
#include <numeric>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "cross_ref_stream.hpp"
#include "pdf_defs.hpp"
#include "pdf_structs.hpp"

namespace pdfseal::pdf {

BytesVector ExtractByteRanges(const BytesVector &data,
                              const RangesVector &byteranges) {
  const std::string func_name = "[ExtractByteRanges] ";
  const uint64_t buff_size = std::accumulate(
    byteranges.cbegin(), byteranges.cend(), static_cast<uint64_t>(0),
    [](uint64_t res, const std::pair<uint64_t, uint64_t> &range) {
      return res + range.second;
    });
  BytesVector res;
  res.reserve(buff_size);
  for (const auto &brange : byteranges) {
    if (brange.first > data.size() ||
        brange.second > data.size() - brange.first) {
      throw PdfSignError(func_name + "byterange is out of the file bounds");
    }
    const auto start = data.cbegin() + static_cast<std::ptrdiff_t>(brange.first);
    std::copy(start, start + static_cast<std::ptrdiff_t>(brange.second),
              std::back_inserter(res));
  }
  return res;
}

std::string DoubleToString10(double val) {
  std::ostringstream builder;
  builder << std::setprecision(10) << std::fixed << val;
  std::string res = builder.str();
  res.erase(res.find_last_not_of('0') + 1, std::string::npos);
  if (res.back() == '.') {
    res.pop_back();
  }
  if (res == "-0") {
    res = "0";
  }
  return res;
}

std::optional<BBox> VisiblePageSize(const PtrPdfObjShared &page_obj) noexcept {
  if (!page_obj || page_obj->isNull() || !page_obj->isDictionary() ||
      !page_obj->hasKey(kTagType) ||
      page_obj->getKey(kTagType).getName() != kTagPage) {
    return std::nullopt;
  }
  QPDFPageObjectHelper page_helper(*page_obj);
  auto media_box = page_helper.getMediaBox();
  if (!media_box.isArray()) {
    return std::nullopt;
  }
  auto crop_box = page_helper.getCropBox();
  auto crop_box_rect = crop_box.getArrayAsRectangle();
  BBox res;
  res.left_bottom.x = 0;
  res.left_bottom.y = 0;
  res.right_top.x = crop_box_rect.urx - crop_box_rect.llx;
  res.right_top.y = crop_box_rect.ury - crop_box_rect.lly;
  return res;
}

std::optional<XYReal> CropBoxOffsetsXY(
  const PtrPdfObjShared &page_obj) noexcept {
  if (!page_obj || page_obj->isNull() || !page_obj->isDictionary() ||
      !page_obj->hasKey(kTagType) ||
      page_obj->getKey(kTagType).getName() != kTagPage) {
    return std::nullopt;
  }
  QPDFPageObjectHelper page_helper(*page_obj);
  auto crop_box = page_helper.getCropBox();
  auto crop_box_rect = crop_box.getArrayAsRectangle();
  return XYReal{crop_box_rect.llx, crop_box_rect.lly};
}

std::optional<BBox> VisiblePageRect(const PtrPdfObjShared &page_obj) noexcept {
  auto size = VisiblePageSize(page_obj);
  auto offsets = CropBoxOffsetsXY(page_obj);
  if (!size || !offsets) {
    return std::nullopt;
  }
  BBox res;
  res.left_bottom = offsets.value();
  res.right_top.x = offsets->x + size->Width();
  res.right_top.y = offsets->y + size->Height();
  return res;
}

std::map<std::string, std::string> DictToUnparsedMap(QPDFObjectHandle &dict) {
  if (!dict.isDictionary()) {
    return {};
  }
  auto src_map = dict.getDictAsMap();
  std::map<std::string, std::string> unparsed_map;
  std::for_each(
    src_map.begin(), src_map.end(),
    [&unparsed_map](std::pair<const std::string, QPDFObjectHandle> &pair_val) {
      unparsed_map[pair_val.first] = pair_val.second.unparse();
    });
  return unparsed_map;
}

std::string UnparsedMapToString(const std::map<std::string, std::string> &map) {
  std::ostringstream builder;
  std::for_each(map.cbegin(), map.cend(),
                [&builder](const std::pair<std::string, std::string> &pair) {
                  builder << pair.first << " " << pair.second << "\n";
                });
  return builder.str();
}

std::string BuildXrefRawTable(const std::vector<XRefEntry> &entries) {
  auto entries_cp = entries;
  std::sort(entries_cp.begin(), entries_cp.end(),
            [](const XRefEntry &left, const XRefEntry &right) {
              return left.id.id < right.id.id;
            });
  int prev = 0;
  int counter = 0;
  int start_id = 0;
  std::ostringstream res;
  res << kXref;
  std::string tmp;
  for (size_t i = 0; i < entries_cp.size(); ++i) {
    // first iteration or current entry element id is sequentinal
    if (i == 0 || entries_cp[i].id.id == prev + 1) {
      if (counter == 0) {
        start_id = entries_cp[i].id.id;
      }
      tmp.append(entries_cp[i].ToString());
      prev = entries_cp[i].id.id;
      ++counter;
      continue;
    }
    // not sequentinal element was encountered
    res << start_id << " " << counter << "\n" << tmp;
    counter = 1;
    tmp.clear();
    tmp.append(entries_cp[i].ToString());
    start_id = entries_cp[i].id.id;
    prev = entries_cp[i].id.id;
  }
  res << start_id << " " << counter << "\n" << tmp;
  return res.str();
}

std::vector<std::pair<int, int>> BuildXRefStreamSections(
  std::vector<XRefEntry> &entries) {
  std::vector<std::pair<int, int>> res;
  if (entries.empty()) {
    return res;
  }
  std::sort(entries.begin(), entries.end(),
            [](const XRefEntry &left, const XRefEntry &right) {
              return left.id.id < right.id.id;
            });
  int prev = 0;
  int counter = 0;
  int start_id = 0;
  for (size_t i = 0; i < entries.size(); ++i) {
    const int curr_id = entries[i].id.id;
    if (i > 0 && curr_id == prev) {
      throw std::runtime_error("[BuildXRefStreamSections] non unique entries");
    }
    if (i == 0 || curr_id == prev + 1) {
      if (counter == 0) {
        start_id = curr_id;
      }
      ++counter;
      prev = curr_id;
      continue;
    }
    res.emplace_back(start_id, counter);
    counter = 1;
    start_id = curr_id;
    prev = curr_id;
  }
  if (counter > 0) {
    res.emplace_back(start_id, counter);
  }
  return res;
}

std::optional<std::string> FindXrefOffset(const BytesVector &buf) {
  const std::string tag = "startxref";
  const size_t tag_size = tag.size();
  if (buf.size() <= tag_size) {
    return std::nullopt;
  }
  size_t last = std::string::npos;
  for (size_t i = buf.size() - tag_size; (i > 0 && last == std::string::npos);
       --i) {
    if (std::equal(tag.cbegin(), tag.cend(), buf.cbegin() + i)) {
      last = i;
    }
  }
  if (last == std::string::npos) {
    return std::nullopt;
  }
  last += tag_size;
  while (last < buf.size() &&
         (buf[last] == '\r' || buf[last] == '\n' || buf[last] == ' ')) {
    ++last;
  }
  size_t last_end = last;
  while (last_end < buf.size() && std::isdigit(buf[last_end]) != 0) {
    ++last_end;
  }
  if (last_end > last) {
    return std::string(buf.data() + last, buf.data() + last_end);
  }
  return std::nullopt;
}

std::string ByteVectorToHexString(const BytesVector &vec) {
  std::ostringstream oss;
  for (const unsigned char byte : vec) {
    oss << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<int>(byte);
  }
  return oss.str();
}

void PatchData(BytesVector &buf, size_t offset, const std::string &data) {
  const std::string func_name = "[PatchData] ";
  if (data.empty() || offset > buf.size() ||
      data.size() > buf.size() - offset) {
    throw std::invalid_argument(func_name + "data doesn't fit the buffer");
  }
  std::copy(data.cbegin(), data.cend(),
            buf.begin() + static_cast<std::ptrdiff_t>(offset));
}

std::string CreatePageUpdateWithAnnots(const PtrPdfObjShared &p_page_original,
                                       std::vector<ObjRawId> annot_ids) {
  // unparsed elements of the resulting /Annots array
  std::vector<std::string> annots;
  std::set<ObjRawId> present;
  if (p_page_original->hasKey(kTagAnnots) &&
      p_page_original->getKey(kTagAnnots).isArray()) {
    auto vec_annots = p_page_original->getKey(kTagAnnots).getArrayAsVector();
    for (auto &val : vec_annots) {
      if (val.isIndirect()) {
        const ObjRawId annot_id = ObjRawId::CopyIdFromExisting(val);
        present.insert(annot_id);
        annots.emplace_back(annot_id.ToStringRef());
      } else {
        annots.emplace_back(val.unparse());
      }
    }
  }
  for (const auto &annot_id : annot_ids) {
    if (present.count(annot_id) == 0) {
      annots.emplace_back(annot_id.ToStringRef());
    }
  }
  auto unparsed_map = DictToUnparsedMap(*p_page_original);
  std::string annots_unparsed_val;
  {
    std::ostringstream builder;
    builder << "[ ";
    for (const auto &ann : annots) {
      builder << ann << " ";
    }
    builder << "]";
    annots_unparsed_val = builder.str();
  }
  unparsed_map.insert_or_assign(kTagAnnots, annots_unparsed_val);

  std::ostringstream builder;
  builder << ObjRawId::CopyIdFromExisting(*p_page_original).ToString() << " \n"
          << kDictStart << "\n";
  builder << UnparsedMapToString(unparsed_map);
  builder << kDictEnd << "\n" << kObjEnd;
  return builder.str();
}

namespace {

void AppendFinalInfo(size_t xref_offset, BytesVector &result_file_buf) {
  std::string final_info = kStartXref;
  final_info += "\n";
  final_info += std::to_string(xref_offset);
  final_info += "\n";
  final_info += kEof;
  final_info += "\n";
  std::copy(final_info.cbegin(), final_info.cend(),
            std::back_inserter(result_file_buf));
}

}  // namespace

void CreateCrossRefStream(
  std::map<std::string, std::string> &old_trailer_fields,
  const std::string &prev_x_ref_offset,
  std::vector<unsigned char> &result_file_buf, ObjRawId &last_assigned_id,
  std::vector<XRefEntry> &ref_entries) {
  CrossRefStream crs{};
  // the stream is an object itself
  crs.id = ++last_assigned_id;
  crs.size_val = crs.id.id + 1;  // highest object number + 1
  ref_entries.push_back(XRefEntry{crs.id, result_file_buf.size(), 0});
  crs.entries = ref_entries;
  crs.index_vec = BuildXRefStreamSections(crs.entries);
  crs.prev_val = prev_x_ref_offset;
  if (old_trailer_fields.count(kTagRoot) > 0) {
    crs.root_id = old_trailer_fields.at(kTagRoot);
  }
  if (old_trailer_fields.count(kTagInfo) > 0) {
    crs.info_id = old_trailer_fields.at(kTagInfo);
  }
  if (old_trailer_fields.count(kTagID) > 0) {
    crs.id_val = old_trailer_fields.at(kTagID);
  }
  if (old_trailer_fields.count(kTagEncrypt) > 0) {
    crs.encrypt = old_trailer_fields.at(kTagEncrypt);
  }
  if (crs.entries.size() >
      static_cast<size_t>(std::numeric_limits<int>::max() / 8)) {
    throw std::runtime_error("[CreateCrossRefStream] can not cast to int");
  }
  crs.length = (crs.w_field_0_size + crs.w_field_1_size + crs.w_field_2_size) *
               static_cast<int>(crs.entries.size());

  const size_t xref_table_offset = result_file_buf.size();
  {
    auto buf = crs.ToRawData();
    std::copy(buf.cbegin(), buf.cend(), std::back_inserter(result_file_buf));
  }
  AppendFinalInfo(xref_table_offset, result_file_buf);
}

void CreateSimpleXref(std::map<std::string, std::string> &old_trailer_fields,
                      const std::string &prev_x_ref_offset,
                      std::vector<unsigned char> &result_file_buf,
                      const ObjRawId &last_assigned_id,
                      std::vector<XRefEntry> &ref_entries) {
  old_trailer_fields.insert_or_assign(kTagPrev, prev_x_ref_offset);
  old_trailer_fields.insert_or_assign(kTagSize,
                                      std::to_string(last_assigned_id.id + 1));
  // fields to copy from old trailer
  {
    const std::set<std::string> trailer_possible_fields{
      kTagSize, kTagPrev, kTagRoot, kTagEncrypt, kTagInfo, kTagID};
    std::map<std::string, std::string> tmp_trailer;
    std::copy_if(old_trailer_fields.cbegin(), old_trailer_fields.cend(),
                 std::inserter(tmp_trailer, tmp_trailer.end()),
                 [&trailer_possible_fields](
                   const std::pair<std::string, std::string> &pair_val) {
                   return trailer_possible_fields.count(pair_val.first) > 0;
                 });
    std::swap(old_trailer_fields, tmp_trailer);
  }
  std::string raw_trailer = "trailer\n<<";
  raw_trailer += UnparsedMapToString(old_trailer_fields);
  raw_trailer += ">>\n";
  const size_t xref_table_offset = result_file_buf.size();
  const std::string raw_xref_table = BuildXrefRawTable(ref_entries);
  std::copy(raw_xref_table.cbegin(), raw_xref_table.cend(),
            std::back_inserter(result_file_buf));
  std::copy(raw_trailer.cbegin(), raw_trailer.cend(),
            std::back_inserter(result_file_buf));
  AppendFinalInfo(xref_table_offset, result_file_buf);
}

std::string PdfEscapeString(const std::string &val) {
  std::string res;
  res.reserve(val.size());
  for (const char symbol : val) {
    switch (symbol) {
      case '(':
      case ')':
      case '\\':
        res += '\\';
        res += symbol;
        break;
      case '\n':
        res += "\\n";
        break;
      case '\r':
        res += "\\r";
        break;
      default:
        res += symbol;
    }
  }
  return res;
}

std::vector<uint32_t> Utf8ToCodePoints(const std::string &utf8) {
  constexpr uint32_t kReplacement = 0xFFFD;
  std::vector<uint32_t> res;
  size_t pos = 0;
  while (pos < utf8.size()) {
    const auto lead = static_cast<unsigned char>(utf8[pos]);
    size_t len = 0;
    uint32_t code = 0;
    if (lead < 0x80) {
      len = 1;
      code = lead;
    } else if ((lead & 0xE0) == 0xC0) {
      len = 2;
      code = lead & 0x1FU;
    } else if ((lead & 0xF0) == 0xE0) {
      len = 3;
      code = lead & 0x0FU;
    } else if ((lead & 0xF8) == 0xF0) {
      len = 4;
      code = lead & 0x07U;
    } else {
      res.push_back(kReplacement);
      ++pos;
      continue;
    }
    if (pos + len > utf8.size()) {
      res.push_back(kReplacement);
      break;
    }
    bool valid = true;
    for (size_t i = 1; i < len; ++i) {
      const auto cont = static_cast<unsigned char>(utf8[pos + i]);
      if ((cont & 0xC0) != 0x80) {
        valid = false;
        break;
      }
      code = (code << 6U) | (cont & 0x3FU);
    }
    if (!valid) {
      res.push_back(kReplacement);
      ++pos;
      continue;
    }
    res.push_back(code);
    pos += len;
  }
  return res;
}

std::string PdfTextString(const std::string &utf8) {
  const bool ascii =
    std::all_of(utf8.cbegin(), utf8.cend(), [](char symbol) {
      return static_cast<unsigned char>(symbol) < 0x80;
    });
  if (ascii) {
    return "(" + PdfEscapeString(utf8) + ")";
  }
  // UTF-16BE with BOM
  std::ostringstream builder;
  builder << "<FEFF" << std::uppercase << std::hex << std::setfill('0');
  for (uint32_t code : Utf8ToCodePoints(utf8)) {
    if (code >= 0x10000) {
      code -= 0x10000;
      builder << std::setw(4) << (0xD800 + (code >> 10U)) << std::setw(4)
              << (0xDC00 + (code & 0x3FFU));
    } else {
      builder << std::setw(4) << code;
    }
  }
  builder << ">";
  return builder.str();
}

std::string Utf8ToWinAnsi(const std::string &utf8) {
  // WinAnsiEncoding differs from Latin-1 in 0x80-0x9F
  static const std::map<uint32_t, unsigned char> kSpecial{
    {0x20AC, 0x80}, {0x201A, 0x82}, {0x0192, 0x83}, {0x201E, 0x84},
    {0x2026, 0x85}, {0x2020, 0x86}, {0x2021, 0x87}, {0x02C6, 0x88},
    {0x2030, 0x89}, {0x0160, 0x8A}, {0x2039, 0x8B}, {0x0152, 0x8C},
    {0x017D, 0x8E}, {0x2018, 0x91}, {0x2019, 0x92}, {0x201C, 0x93},
    {0x201D, 0x94}, {0x2022, 0x95}, {0x2013, 0x96}, {0x2014, 0x97},
    {0x02DC, 0x98}, {0x2122, 0x99}, {0x0161, 0x9A}, {0x203A, 0x9B},
    {0x0153, 0x9C}, {0x017E, 0x9E}, {0x0178, 0x9F}};
  std::string res;
  for (const uint32_t code : Utf8ToCodePoints(utf8)) {
    if (code < 0x80 || (code >= 0xA0 && code <= 0xFF)) {
      res += static_cast<char>(code);
      continue;
    }
    auto it_special = kSpecial.find(code);
    res += it_special != kSpecial.cend() ? static_cast<char>(it_special->second)
                                         : '?';
  }
  return res;
}

}  // namespace pdfseal::pdf
