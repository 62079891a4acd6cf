/* File: pdfjpg.cpp
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

#include <exception>
#include <iostream>
#include <memory>

#include "cli_utils.hpp"
#include "common_defs.hpp"
#include "config.hpp"
#include "conversion_handler.hpp"
#include "logger_utils.hpp"
#include "options.hpp"

int main(int argc, char *argv[]) {
  auto logger = pdfjpg::logger::InitLog();
  if (!logger) {
    std::cerr << "Setup logger failed\n";
    return 1;
  }
  try {
    const pdfjpg::cli::Options options(argc, argv, logger);
    if (options.help()) {
      return options.WrongParams() || !options.InputIsUnambiguous() ? 1 : 0;
    }
    // ----------------
    // configuration
    const pdfjpg::Config cfg = pdfjpg::LoadConfig();
    if (!pdfjpg::logger::SetLogLevel(cfg.log_level)) {
      logger->warn("Unknown log level {}", cfg.log_level);
    }
    logger->debug("temp root {} render workers {} fetch timeout {}s",
                  cfg.temp_root, cfg.render_workers, cfg.fetch_timeout_sec);
    // ----------------
    // convert
    const pdfjpg::handler::ConversionHandler handler(cfg, logger);
    auto response = pdfjpg::cli::RunRequest(options, handler, logger);
    if (!response) {
      return 1;
    }
    std::cout << response->Serialize() << "\n";
    const std::string output_zip = options.GetOutputZip();
    if (!output_zip.empty() &&
        !pdfjpg::cli::WriteArchive(response.value(), output_zip, logger)) {
      return 1;
    }
    return response->status_code == pdfjpg::kStatusOk ? 0 : 1;
  } catch (const std::exception &ex) {
    logger->error("Error: {}", ex.what());
    return 1;
  }
  return 0;
}
