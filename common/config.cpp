/* File: config.cpp
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

#include "config.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/program_options.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <cstring>
#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>

#include <spdlog/common.h>

namespace pdfjpg {

namespace po = boost::program_options;

namespace {

// PDFJPG_TEMP_ROOT -> temp-root, anything else is ignored
std::string MapEnvName(const std::string &env_name) {
  static const std::map<std::string, std::string> known{
    {"TEMP_ROOT", kCfgTempRoot},
    {"RENDER_WORKERS", kCfgRenderWorkers},
    {"FETCH_TIMEOUT", kCfgFetchTimeout},
    {"FETCH_PROTOCOLS", kCfgFetchProtocols},
    {"LOG_LEVEL", kCfgLogLevel}};
  if (!boost::starts_with(env_name, kEnvPrefix)) {
    return {};
  }
  const auto it_known = known.find(env_name.substr(std::strlen(kEnvPrefix)));
  return it_known == known.cend() ? std::string() : it_known->second;
}

} // namespace

Config LoadConfig() {
  Config cfg;
  std::error_code err_code;
  const std::filesystem::path sys_temp =
    std::filesystem::temp_directory_path(err_code);
  cfg.temp_root = err_code ? std::string("/tmp") : sys_temp.string();

  po::options_description description("Environment");
  // clang-format off
  description.add_options()
    (kCfgTempRoot, po::value<std::string>(&cfg.temp_root))
    (kCfgRenderWorkers, po::value<int>(&cfg.render_workers))
    (kCfgFetchTimeout, po::value<long>(&cfg.fetch_timeout_sec))
    (kCfgFetchProtocols, po::value<std::string>(&cfg.fetch_protocols))
    (kCfgLogLevel, po::value<std::string>(&cfg.log_level));
  // clang-format on
  po::variables_map var_map;
  try {
    po::store(po::parse_environment(description, MapEnvName), var_map);
    po::notify(var_map);
  } catch (const po::error &ex) {
    throw std::runtime_error(std::string("[LoadConfig] ") + ex.what());
  }
  boost::trim(cfg.fetch_protocols);
  boost::to_lower(cfg.log_level);
  ValidateConfig(cfg);
  return cfg;
}

void ValidateConfig(const Config &cfg) {
  if (cfg.temp_root.empty() || !std::filesystem::is_directory(cfg.temp_root)) {
    throw std::runtime_error("[ValidateConfig] temp root is not a directory " +
                             cfg.temp_root);
  }
  if (cfg.render_workers <= 0) {
    throw std::runtime_error(
      "[ValidateConfig] number of render workers should be positive");
  }
  if (cfg.fetch_timeout_sec <= 0) {
    throw std::runtime_error(
      "[ValidateConfig] fetch timeout should be positive");
  }
  if (cfg.fetch_protocols.empty()) {
    throw std::runtime_error("[ValidateConfig] no fetch protocols allowed");
  }
  const auto level = spdlog::level::from_str(cfg.log_level);
  if (level == spdlog::level::off && cfg.log_level != "off") {
    throw std::runtime_error("[ValidateConfig] unknown log level " +
                             cfg.log_level);
  }
}

} // namespace pdfjpg
