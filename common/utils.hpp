/* File: utils.hpp
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

#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

namespace pdfseal {

using BytesVector = std::vector<unsigned char>;
using TimePoint = std::chrono::system_clock::time_point;

/// @brief hex representation of bytes (lowercase, no separators)
std::string VecBytesStringRepresentation(const BytesVector &vec) noexcept;

/// @brief "2024-10-15 12:30:37 UTC"
std::string TimeTToString(time_t time) noexcept;

/// @brief ISO 8601 UTC with milliseconds "2024-10-15T12:30:37.123Z"
std::string TimePointToIso8601(TimePoint time_point) noexcept;

/// @brief microseconds since the unix epoch, used for storage
int64_t TimePointToMicros(TimePoint time_point) noexcept;

TimePoint MicrosToTimePoint(int64_t micros) noexcept;

/**
 * @brief PDF date string (ISO 32000 7.9.4)
 * @param time_point
 * @param utc_offset_minutes local offset to render
 * @return std::string like D:20241015143037+02'00'
 */
std::string PdfDateString(TimePoint time_point, int utc_offset_minutes);

/**
 * @brief Human readable date for the visual stamp
 * @return std::string like "15/10/2024 14:30:37 +02:00"
 */
std::string StampDateString(TimePoint time_point, int utc_offset_minutes);

/// @brief lowercase ascii, everything except [a-z0-9] becomes '-'
std::string Slugify(const std::string &val);

/// @brief read a value, "env:NAME" is resolved from the environment
std::string ResolveSecret(const std::string &val);

}  // namespace pdfseal
