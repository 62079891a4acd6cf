/* File: conversion_handler.hpp
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
#include <string_view>

#include "config.hpp"
#include "fetcher.hpp"
#include "rasterizer.hpp"
#include "request.hpp"
#include "response.hpp"
#include "result.hpp"
#include "scoped_temp.hpp"

namespace pdfjpg::handler {

/**
 * @brief PDF to JPEG-in-ZIP conversion of one request
 */
class ConversionHandler {
public:
  /**
   * @brief Construct a new Conversion Handler object
   * @param cfg must outlive the handler
   * @param logger
   * @throws std::runtime_error if the network client can't be initialized
   */
  ConversionHandler(const Config &cfg, std::shared_ptr<spdlog::logger> logger);

  ConversionHandler(const ConversionHandler &) = delete;
  ConversionHandler(ConversionHandler &&) = delete;
  ConversionHandler &operator=(const ConversionHandler &) = delete;
  ConversionHandler &operator=(ConversionHandler &&) = delete;
  ~ConversionHandler() = default;

  /**
   * @brief Handle one request
   * @return 200 with a base64 ZIP, 400 if there is no body, 500 otherwise
   * @details all temporary files are removed before return
   */
  [[nodiscard]] request::Response Handle(const request::Request &req) const;

  /**
   * @brief Parse the JSON envelope and handle it
   * @param event_json invocation payload
   */
  [[nodiscard]] request::Response HandleEvent(
    std::string_view event_json) const;

private:
  /// full pipeline, returns the ZIP bytes
  [[nodiscard]] Result<BytesVector> Convert(
    const request::BodyInput &input) const;

  /**
   * @brief Put the PDF from the input to temp_dir/input.pdf
   * @return path to the PDF
   */
  [[nodiscard]] Result<std::string> ResolveInput(
    const request::BodyInput &input, const ScopedTempDir &temp_dir) const;

  const Config &cfg_;
  std::shared_ptr<spdlog::logger> log_;
  net::Fetcher fetcher_;
  pdf::Rasterizer rasterizer_;
};

} // namespace pdfjpg::handler
