/* File: utils.cpp
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

#include "utils.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace pdfseal {

namespace {

std::tm ShiftedTm(TimePoint time_point, int utc_offset_minutes) {
  const time_t shifted = std::chrono::system_clock::to_time_t(time_point) +
                         static_cast<time_t>(utc_offset_minutes) * 60;
  std::tm tm_info{};
  gmtime_r(&shifted, &tm_info);
  return tm_info;
}

std::string OffsetString(int utc_offset_minutes, const char *separator,
                         const char *suffix) {
  std::ostringstream builder;
  builder << (utc_offset_minutes < 0 ? '-' : '+');
  const int abs_offset = std::abs(utc_offset_minutes);
  builder << std::setw(2) << std::setfill('0') << abs_offset / 60 << separator
          << std::setw(2) << std::setfill('0') << abs_offset % 60 << suffix;
  return builder.str();
}

}  // namespace

std::string VecBytesStringRepresentation(const BytesVector &vec) noexcept {
  std::stringstream builder;
  for (const auto symbol : vec) {
    builder << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<int>(symbol);
  }
  return builder.str();
}

std::string TimeTToString(time_t time) noexcept {
  struct tm tm_info {};
  gmtime_r(&time, &tm_info);
  std::ostringstream oss;
  oss << std::put_time(&tm_info, "%Y-%m-%d %H:%M:%S") << " UTC";
  return oss.str();
}

std::string TimePointToIso8601(TimePoint time_point) noexcept {
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                        time_point.time_since_epoch())
                        .count() %
                      1000;
  const std::tm tm_info = ShiftedTm(time_point, 0);
  std::ostringstream oss;
  oss << std::put_time(&tm_info, "%Y-%m-%dT%H:%M:%S") << '.'
      << std::setw(3) << std::setfill('0') << (millis < 0 ? 0 : millis)
      << 'Z';
  return oss.str();
}

int64_t TimePointToMicros(TimePoint time_point) noexcept {
  return std::chrono::duration_cast<std::chrono::microseconds>(
           time_point.time_since_epoch())
    .count();
}

TimePoint MicrosToTimePoint(int64_t micros) noexcept {
  return TimePoint(std::chrono::duration_cast<TimePoint::duration>(
    std::chrono::microseconds(micros)));
}

std::string PdfDateString(TimePoint time_point, int utc_offset_minutes) {
  const std::tm tm_info = ShiftedTm(time_point, utc_offset_minutes);
  std::ostringstream oss;
  oss << "D:" << std::put_time(&tm_info, "%Y%m%d%H%M%S");
  if (utc_offset_minutes == 0) {
    oss << 'Z';
  } else {
    oss << OffsetString(utc_offset_minutes, "'", "'");
  }
  return oss.str();
}

std::string StampDateString(TimePoint time_point, int utc_offset_minutes) {
  const std::tm tm_info = ShiftedTm(time_point, utc_offset_minutes);
  std::ostringstream oss;
  oss << std::put_time(&tm_info, "%d/%m/%Y %H:%M:%S") << ' '
      << OffsetString(utc_offset_minutes, ":", "");
  return oss.str();
}

std::string Slugify(const std::string &val) {
  std::string res;
  res.reserve(val.size());
  for (const char symbol : val) {
    const auto usymbol = static_cast<unsigned char>(symbol);
    if (std::isalnum(usymbol) != 0 && usymbol < 0x80) {
      res.push_back(static_cast<char>(std::tolower(usymbol)));
    } else if (res.empty() || res.back() != '-') {
      res.push_back('-');
    }
  }
  while (!res.empty() && res.back() == '-') {
    res.pop_back();
  }
  return res;
}

std::string ResolveSecret(const std::string &val) {
  if (!boost::starts_with(val, "env:")) {
    return val;
  }
  const std::string var_name = val.substr(4);
  const char *env_val = std::getenv(var_name.c_str());  // NOLINT
  if (env_val == nullptr) {
    throw std::invalid_argument("[ResolveSecret] environment variable " +
                                var_name + " is not set");
  }
  return env_val;
}

}  // namespace pdfseal
