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

#include <memory>
#include <spdlog/logger.h>
#include <string>

namespace pdfjpg::logger {

std::shared_ptr<spdlog::logger> InitLog() noexcept;

/**
 * @brief Set the level for all registered loggers
 * @param level_name spdlog level name (trace,debug,info,warn,error,critical,off)
 * @return false if the name is unknown, the level is left unchanged
 */
bool SetLogLevel(const std::string &level_name) noexcept;

} // namespace pdfjpg::logger
