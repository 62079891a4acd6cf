/* File: conversion_handler.cpp
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

#include "conversion_handler.hpp"

#include <exception>
#include <string>
#include <utility>
#include <variant>

#include "common_defs.hpp"
#include "pdf_probe.hpp"
#include "utils.hpp"
#include "zip_writer.hpp"

namespace pdfjpg::handler {

using request::Base64Text;
using request::BodyInput;
using request::RawBytes;
using request::Response;
using request::UrlRequest;

ConversionHandler::ConversionHandler(const Config &cfg,
                                     std::shared_ptr<spdlog::logger> logger)
    : cfg_(cfg), log_(std::move(logger)), fetcher_(cfg_, log_),
      rasterizer_(cfg_, log_) {
  log_->info("[ConversionHandler] renderer {}",
             pdf::Rasterizer::EngineVersion());
}

Response ConversionHandler::HandleEvent(std::string_view event_json) const {
  const char *func_name = "[ConversionHandler::HandleEvent]";
  try {
    auto req = request::ParseEvent(event_json);
    if (!req) {
      log_->error("{} {}: {}", func_name, ErrorKindName(req.Error().kind),
                  req.Error().message);
      return request::FailureToResponse(req.Error());
    }
    return Handle(req.Value());
  } catch (const std::exception &ex) {
    log_->error("{} Error: {}", func_name, ex.what());
    return request::MakeErrorResponse(kStatusServerError, ex.what(),
                                      std::string(kErrDetailsHint));
  }
}

Response ConversionHandler::Handle(const request::Request &req) const {
  const char *func_name = "[ConversionHandler::Handle]";
  try {
    auto input = request::ClassifyBody(req);
    if (!input) {
      log_->error("{} {}: {}", func_name, ErrorKindName(input.Error().kind),
                  input.Error().message);
      return request::FailureToResponse(input.Error());
    }
    auto zip_data = Convert(input.Value());
    if (!zip_data) {
      log_->error("{} {}: {}", func_name, ErrorKindName(zip_data.Error().kind),
                  zip_data.Error().message);
      return request::FailureToResponse(zip_data.Error());
    }
    log_->info("{} archive size {} bytes", func_name, zip_data.Value().size());
    return request::MakeArchiveResponse(zip_data.Value());
  } catch (const std::exception &ex) {
    log_->error("{} Error: {}", func_name, ex.what());
    return request::MakeErrorResponse(kStatusServerError, ex.what(),
                                      std::string(kErrDetailsHint));
  }
}

Result<BytesVector> ConversionHandler::Convert(const BodyInput &input) const {
  // removed on every return and on exceptions
  const ScopedTempDir temp_dir(cfg_.temp_root, kTempDirPrefix);
  log_->debug("[ConversionHandler::Convert] temp directory {}",
              temp_dir.Path().string());
  auto pdf_path = ResolveInput(input, temp_dir);
  if (!pdf_path) {
    return pdf_path.Error();
  }
  auto info = pdf::ProbePdf(pdf_path.Value(), log_);
  if (!info) {
    return info.Error();
  }
  const auto images_dir = temp_dir.MakeSubdir(kImagesDirName);
  auto pages = rasterizer_.RenderToJpeg(pdf_path.Value(), images_dir,
                                        info.Value().page_count);
  if (!pages) {
    return pages.Error();
  }
  if (pages.Value().size() != info.Value().page_count) {
    return MakeFailure(ErrorKind::kRenderFailed,
                       "Rendered " + std::to_string(pages.Value().size()) +
                         " pages of " +
                         std::to_string(info.Value().page_count));
  }
  return archive::BuildPageArchive(pages.Value());
}

Result<std::string> ConversionHandler::ResolveInput(
  const BodyInput &input, const ScopedTempDir &temp_dir) const {
  const char *func_name = "[ConversionHandler::ResolveInput]";
  const std::string pdf_path = temp_dir.File(kInputPdfName).string();
  if (const auto *p_url = std::get_if<UrlRequest>(&input)) {
    log_->info("{} remote mode", func_name);
    auto fetch_res = fetcher_.Download(p_url->url, pdf_path);
    if (!fetch_res) {
      return fetch_res.Error();
    }
    return pdf_path;
  }
  if (const auto *p_text = std::get_if<Base64Text>(&input)) {
    log_->info("{} base64 body, {} symbols", func_name, p_text->text.size());
    const auto decoded = Base64Decode(p_text->text);
    if (!decoded) {
      return MakeFailure(ErrorKind::kDecodeFailed,
                         "Invalid base64-encoded string in body");
    }
    if (!VectorToFile(pdf_path, decoded.value())) {
      return MakeFailure(ErrorKind::kInternal, "Can't write " + pdf_path);
    }
    return pdf_path;
  }
  const auto &raw = std::get<RawBytes>(input);
  log_->info("{} binary body, {} bytes", func_name, raw.bytes.size());
  if (!VectorToFile(pdf_path, raw.bytes)) {
    return MakeFailure(ErrorKind::kInternal, "Can't write " + pdf_path);
  }
  return pdf_path;
}

} // namespace pdfjpg::handler
