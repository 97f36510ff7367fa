/* File: logger_utils.hpp
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
#include <spdlog/spdlog.h>

#include <memory>

namespace pdfseal::logger {

/**
 * @brief Get (or create) the library logger
 * @return std::shared_ptr<spdlog::logger>, nullptr if the logger can't be
 * created
 * @details syslog sink if LOG_TO_JOURNAL is set, colored stderr otherwise
 */
std::shared_ptr<spdlog::logger> InitLog() noexcept;

}  // namespace pdfseal::logger
