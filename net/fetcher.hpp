/* File: fetcher.hpp
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

#include <memory>
#include <string>

#include "config.hpp"
#include "result.hpp"

namespace pdfjpg::net {

/**
 * @brief Downloads remote documents with libcurl
 */
class Fetcher {
public:
  /**
   * @brief Construct a new Fetcher object
   * @param cfg timeout and allowed protocols are taken from here
   * @param logger
   * @throws std::runtime_error if libcurl can't be initialized
   */
  Fetcher(const Config &cfg, std::shared_ptr<spdlog::logger> logger);

  Fetcher(const Fetcher &) = delete;
  Fetcher(Fetcher &&) = delete;
  Fetcher &operator=(const Fetcher &) = delete;
  Fetcher &operator=(Fetcher &&) = delete;
  ~Fetcher() = default;

  /**
   * @brief Download url to a new file
   * @param url remote location
   * @param dest_path file to create
   * @return Done or kFetchFailed
   * @details follows redirects, HTTP status >= 400 is a failure, the
   * destination file is removed on failure
   */
  [[nodiscard]] Result<Done> Download(const std::string &url,
                                      const std::string &dest_path) const;

private:
  static constexpr long kConnectTimeoutSec = 10;
  static constexpr long kMaxRedirects = 5;
  static constexpr const char *const kUserAgent = "pdfjpg/1.0";

  const Config &cfg_;
  std::shared_ptr<spdlog::logger> log_;
};

} // namespace pdfjpg::net
