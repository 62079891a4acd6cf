/* File: config.hpp
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

#include <string>

#include "common_defs.hpp"

namespace pdfjpg {

constexpr const char *const kEnvPrefix = "PDFJPG_";

const char *const kCfgTempRoot = "temp-root";
const char *const kCfgRenderWorkers = "render-workers";
const char *const kCfgFetchTimeout = "fetch-timeout";
const char *const kCfgFetchProtocols = "fetch-protocols";
const char *const kCfgLogLevel = "log-level";

constexpr long kDefaultFetchTimeout = 30; // seconds
constexpr const char *const kDefaultFetchProtocols = "http,https";
constexpr const char *const kDefaultLogLevel = "info";

/**
 * @brief Process-wide settings
 * @details Built once at startup and passed by const reference to the
 * handler and its collaborators.
 */
struct Config {
  std::string temp_root;
  int render_workers = kDefaultRenderWorkers;
  long fetch_timeout_sec = kDefaultFetchTimeout;
  std::string fetch_protocols = kDefaultFetchProtocols;
  std::string log_level = kDefaultLogLevel;
};

/**
 * @brief Build the config from defaults and PDFJPG_* environment variables
 * @details PDFJPG_TEMP_ROOT, PDFJPG_RENDER_WORKERS, PDFJPG_FETCH_TIMEOUT,
 * PDFJPG_FETCH_PROTOCOLS, PDFJPG_LOG_LEVEL
 * @return Config
 * @throws std::runtime_error on an invalid value
 */
Config LoadConfig();

/**
 * @brief Check the values
 * @throws std::runtime_error describing the first invalid value
 */
void ValidateConfig(const Config &cfg);

} // namespace pdfjpg
