/* File: sig_field.cpp
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

#include "sig_field.hpp"

#include <algorithm>
#include <set>
#include <sstream>

#include "pdf_structs.hpp"
#include "pdf_utils.hpp"

namespace pdfseal::pdf {

std::string SigField::ToString() const {
  std::ostringstream builder;
  builder << id.ToString() << "\n"
          << kDictStart << "\n"
          << kTagFT << " " << ft << "\n"
          << kTagF << " " << flags << "\n";
  if (name.has_value()) {
    builder << kTagT << " " << PdfTextString(name.value()) << "\n";
  }
  builder << kTagType << " " << type << "\n"
          << kTagSubType << " " << subtype << "\n"
          << kTagP << " " << parent.ToStringRef() << "\n"
          << kTagRect << " " << rect.ToString() << "\n";
  if (appearance_ref.has_value()) {
    builder << kTagAP << " " << kDictStart << "\n"
            << kTagN << " " << appearance_ref->ToStringRef() << "\n"
            << kDictEnd << "\n";
  }
  if (value.has_value()) {
    builder << kTagV << " " << value->ToStringRef() << "\n";
  }
  for (const auto &field_pair : other_fields_copied) {
    builder << field_pair.first << " " << field_pair.second << "\n";
  }
  builder << kDictEnd << "\n" << kObjEnd;
  return builder.str();
}

SigField SigField::CopyExisting(QPDFObjectHandle &other) {
  const std::string func_name = "[SigField::CopyExisting] ";
  if (!other.isDictionary() || !other.isIndirect()) {
    throw PdfSignError(func_name + "field is not an indirect dictionary");
  }
  if (!other.hasKey(kTagRect) || !other.getKey(kTagRect).isRectangle()) {
    throw PdfSignError(func_name +
                       "field without its own widget is not supported");
  }
  SigField res;
  res.id = ObjRawId::CopyIdFromExisting(other);
  const auto rect = other.getKey(kTagRect).getArrayAsRectangle();
  res.rect.left_bottom = {std::min(rect.llx, rect.urx),
                          std::min(rect.lly, rect.ury)};
  res.rect.right_top = {std::max(rect.llx, rect.urx),
                        std::max(rect.lly, rect.ury)};
  // the keys written by ToString are not copied
  const std::set<std::string> own_keys{kTagFT,   kTagF, kTagType, kTagSubType,
                                       kTagP,    kTagRect, kTagAP, kTagV};
  auto unparsed_map = DictToUnparsedMap(other);
  for (const auto &field_pair : unparsed_map) {
    if (own_keys.count(field_pair.first) == 0) {
      res.other_fields_copied.insert(field_pair);
    }
  }
  return res;
}

}  // namespace pdfseal::pdf
