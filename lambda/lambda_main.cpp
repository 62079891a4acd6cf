/* File: lambda_main.cpp
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

#include <aws/lambda-runtime/runtime.h>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>

#include "common_defs.hpp"
#include "config.hpp"
#include "conversion_handler.hpp"
#include "logger_utils.hpp"

using aws::lambda_runtime::invocation_request;
using aws::lambda_runtime::invocation_response;

int main() {
  const char *func_name = "[pdfjpg_lambda]";
  auto logger = pdfjpg::logger::InitLog();
  if (!logger) {
    std::cerr << func_name << " Init logger failed\n";
    return 1;
  }
  try {
    const pdfjpg::Config cfg = pdfjpg::LoadConfig();
    if (!pdfjpg::logger::SetLogLevel(cfg.log_level)) {
      logger->warn("{} unknown log level {}", func_name, cfg.log_level);
    }
    const char *path_env = std::getenv("PATH");                // NOLINT
    const char *ld_path_env = std::getenv("LD_LIBRARY_PATH"); // NOLINT
    logger->info("{} PATH: {}", func_name,
                 path_env != nullptr ? path_env : "Not set");
    logger->info("{} LD_LIBRARY_PATH: {}", func_name,
                 ld_path_env != nullptr ? ld_path_env : "Not set");
    const pdfjpg::handler::ConversionHandler handler(cfg, logger);
    aws::lambda_runtime::run_handler(
      [&handler](const invocation_request &req) {
        const auto response = handler.HandleEvent(req.payload);
        return invocation_response::success(response.Serialize(),
                                            pdfjpg::kMimeJson);
      });
  } catch (const std::exception &ex) {
    logger->error("{} {}", func_name, ex.what());
    return 1;
  }
  return 0;
}
