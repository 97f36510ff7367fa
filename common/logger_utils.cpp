/* File: logger_utils.cpp
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

#include "logger_utils.hpp"

#include <spdlog/common.h>
#include <syslog.h>

#include <iostream>

#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/sinks/syslog_sink.h"
#include "spdlog/spdlog.h"

namespace pdfseal::logger {

std::shared_ptr<spdlog::logger> InitLog() noexcept {
  try {
    if constexpr (LOG_TO_JOURNAL) {
      auto logger = spdlog::get("pdfseal_syslog");
      if (logger) {
        return logger;
      };
      logger = spdlog::syslog_logger_mt("pdfseal_syslog", LOG_TAG);
      logger->set_level(spdlog::level::info);
      return logger;
    } else {
      auto logger = spdlog::get("pdfseal_stderr");
      if (logger) {
        return logger;
      };
      logger = spdlog::stderr_color_mt("pdfseal_stderr");
      logger->set_level(spdlog::level::debug);
      return logger;
    }
  } catch (const std::exception &ex) {
    std::cerr << ex.what();
    openlog(LOG_TAG, LOG_PID, LOG_USER);
    syslog(LOG_ERR, "Can't init the pdfseal logger");  // NOLINT
    return nullptr;
  }
}

}  // namespace pdfseal::logger
