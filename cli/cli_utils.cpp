/* File: cli_utils.cpp
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

#include "cli_utils.hpp"

#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <utility>

#include "common_defs.hpp"
#include "request.hpp"
#include "utils.hpp"
#include "zip_writer.hpp"

namespace pdfjpg::cli {

std::string ReadAll(std::istream &stream) {
  std::ostringstream buf;
  buf << stream.rdbuf();
  return buf.str();
}

bool CheckInputFile(const std::string &file,
                    const std::shared_ptr<spdlog::logger> &log) {
  try {
    if (!std::filesystem::exists(file)) {
      log->error("File not found {}", file);
      return false;
    }
    if (!std::filesystem::is_regular_file(file)) {
      log->error("This file is not a regular file {}", file);
      return false;
    }
    if (std::filesystem::file_size(file) == 0) {
      log->error("File is empty {}", file);
      return false;
    }
  } catch (const std::exception &ex) {
    log->error(ex.what());
    return false;
  }
  return true;
}

std::optional<request::Response> RunRequest(
  const Options &options, const handler::ConversionHandler &handler,
  const std::shared_ptr<spdlog::logger> &log) {
  switch (options.GetInputMode()) {
  case InputMode::kPdfFile: {
    const std::string file = options.GetInputFile();
    if (!CheckInputFile(file, log)) {
      return std::nullopt;
    }
    auto pdf_bytes = FileToVector(file);
    if (!pdf_bytes) {
      log->error("Can not read the file {}", file);
      return std::nullopt;
    }
    return handler.Handle(request::MakeBinaryRequest(std::move(*pdf_bytes)));
  }
  case InputMode::kUrl:
    return handler.Handle(request::MakeUrlRequest(options.GetUrl()));
  case InputMode::kEventFile: {
    const std::string file = options.GetEventFile();
    if (!CheckInputFile(file, log)) {
      return std::nullopt;
    }
    std::ifstream ifile(file, std::ios_base::binary);
    if (!ifile.is_open()) {
      log->error("Can not open file {}", file);
      return std::nullopt;
    }
    return handler.HandleEvent(ReadAll(ifile));
  }
  case InputMode::kEventStdin:
    return handler.HandleEvent(ReadAll(std::cin));
  }
  return std::nullopt;
}

bool WriteArchive(const request::Response &response, const std::string &path,
                  const std::shared_ptr<spdlog::logger> &log) {
  if (response.status_code != kStatusOk || !response.is_base64_encoded) {
    log->warn("No archive in the response, {} is not written", path);
    return false;
  }
  auto zip_data = Base64Decode(response.body);
  if (!zip_data) {
    log->error("Response body is not valid base64");
    return false;
  }
  auto entries = archive::ReadEntries(zip_data.value());
  if (entries) {
    log->info("Archive contains {} images", entries.Value().size());
  }
  std::error_code err_code;
  std::filesystem::remove(path, err_code);
  if (err_code) {
    log->error("Can not replace {}: {}", path, err_code.message());
    return false;
  }
  if (!VectorToFile(path, zip_data.value())) {
    log->error("Can not write the archive to {}", path);
    return false;
  }
  log->info("Archive saved to {}", path);
  return true;
}

} // namespace pdfjpg::cli
