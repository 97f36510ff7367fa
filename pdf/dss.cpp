/* File: dss.cpp
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

#include "dss.hpp"

#include <algorithm>
#include <qpdf/Buffer.hh>
#include <iterator>
#include <sstream>
#include <stdexcept>

#include "pdf_utils.hpp"

namespace pdfseal::pdf {

BytesVector CertStreamObj::ToRawData() const {
  std::ostringstream builder;
  builder << id.ToString() << "\n"
          << kDictStart << " " << kTagLength << " " << der.size() << " "
          << kDictEnd << "\n"
          << kStreamStart;
  const std::string head = builder.str();
  BytesVector res;
  res.reserve(head.size() + der.size() + 32);
  std::copy(head.cbegin(), head.cend(), std::back_inserter(res));
  std::copy(der.cbegin(), der.cend(), std::back_inserter(res));
  std::string tail = "\n";
  tail += kStreamEnd;
  tail += kObjEnd;
  std::copy(tail.cbegin(), tail.cend(), std::back_inserter(res));
  return res;
}

Dss Dss::ShallowCopy(QPDFObjectHandle &other) {
  if (!other.isDictionary()) {
    throw std::runtime_error("[Dss::ShallowCopy] not a dictionary");
  }
  Dss res;
  if (other.isIndirect()) {
    res.id = ObjRawId::CopyIdFromExisting(other);
  }
  if (other.hasKey(kTagCerts) && other.getKey(kTagCerts).isArray()) {
    for (auto &cert : other.getKey(kTagCerts).getArrayAsVector()) {
      if (!cert.isStream() || !cert.isIndirect()) {
        continue;
      }
      res.certs.push_back(ObjRawId::CopyIdFromExisting(cert));
      auto buf = cert.getStreamData();
      if (buf) {
        res.known_certs.emplace_back(buf->getBuffer(),
                                     buf->getBuffer() + buf->getSize());
      }
    }
  }
  auto unparsed_map = DictToUnparsedMap(other);
  for (const auto &field_pair : unparsed_map) {
    if (field_pair.first != kTagCerts) {
      res.other_fields_copied.insert(field_pair);
    }
  }
  return res;
}

bool Dss::Contains(const BytesVector &der) const noexcept {
  return std::find(known_certs.cbegin(), known_certs.cend(), der) !=
         known_certs.cend();
}

std::string Dss::ToString() const {
  std::ostringstream builder;
  builder << id.ToString() << "\n"
          << kDictStart << "\n"
          << kTagType << " " << kTagDSS << "\n"
          << kTagCerts << " [ ";
  for (const auto &cert : certs) {
    builder << cert.ToStringRef() << " ";
  }
  builder << "]\n";
  for (const auto &field_pair : other_fields_copied) {
    if (field_pair.first != kTagType) {
      builder << field_pair.first << " " << field_pair.second << "\n";
    }
  }
  builder << kDictEnd << "\n" << kObjEnd;
  return builder.str();
}

}  // namespace pdfseal::pdf
