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
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/syslog_sink.h>
#include <spdlog/spdlog.h>
#include <syslog.h>

#include <exception>
#include <iostream>

namespace pdfjpg::logger {

namespace {

constexpr const char *const kJournalLogger = "pdfjpg_syslog";
constexpr const char *const kStderrLogger = "pdfjpg";
// render workers log from their own threads
constexpr const char *const kStderrPattern = "[%Y-%m-%d %T.%e] [%^%l%$] [%t] %v";

} // namespace

std::shared_ptr<spdlog::logger> InitLog() noexcept {
  try {
    if constexpr (LOG_TO_JOURNAL) {
      auto logger = spdlog::get(kJournalLogger);
      if (!logger) {
        logger = spdlog::syslog_logger_mt(kJournalLogger, LOG_TAG, LOG_PID);
      }
      return logger;
    } else {
      // stdout is reserved for the response
      auto logger = spdlog::get(kStderrLogger);
      if (!logger) {
        logger = spdlog::stderr_color_mt(kStderrLogger);
        logger->set_pattern(kStderrPattern);
      }
      return logger;
    }
  } catch (const std::exception &ex) {
    std::cerr << "[InitLog] " << ex.what() << "\n";
    openlog(LOG_TAG, LOG_PID, LOG_USER);
    syslog(LOG_ERR, "Can't create init log"); // NOLINT
    closelog();
    return nullptr;
  }
}

bool SetLogLevel(const std::string &level_name) noexcept {
  const spdlog::level::level_enum level =
    spdlog::level::from_str(level_name);
  // from_str falls back to "off" for unknown names
  if (level == spdlog::level::off && level_name != "off") {
    return false;
  }
  spdlog::set_level(level);
  return true;
}

} // namespace pdfjpg::logger
