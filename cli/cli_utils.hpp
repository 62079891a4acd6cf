/* File: cli_utils.hpp
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

#include <spdlog/logger.h>

#include <istream>
#include <memory>
#include <optional>
#include <string>

#include "conversion_handler.hpp"
#include "options.hpp"
#include "response.hpp"

namespace pdfjpg::cli {

/**
 * @brief Read the whole stream to a string
 * @param stream
 * @return std::string
 */
std::string ReadAll(std::istream &stream);

/**
 * @brief Check the input file - readable, non-empty, regular
 *
 * @param file path
 * @param log logger
 * @return true if the file is ok
 */
bool CheckInputFile(const std::string &file,
                    const std::shared_ptr<spdlog::logger> &log);

/**
 * @brief Run the handler for the input selected by the options
 *
 * @param options command options object
 * @param handler
 * @param log
 * @return response or std::nullopt if the input can't be read
 */
std::optional<request::Response> RunRequest(
  const Options &options, const handler::ConversionHandler &handler,
  const std::shared_ptr<spdlog::logger> &log);

/**
 * @brief Decode the archive from a success response and write it to a file
 *
 * @param response status 200 response
 * @param path output file, overwritten
 * @param log
 * @return true on success
 */
bool WriteArchive(const request::Response &response, const std::string &path,
                  const std::shared_ptr<spdlog::logger> &log);

} // namespace pdfjpg::cli
