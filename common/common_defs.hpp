/* File: common_defs.hpp
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
#include <cstdint>
#include <vector>

namespace pdfjpg {

using BytesVector = std::vector<unsigned char>;

constexpr uint64_t kMaxPdfFileSize = 2147483648; //  2GB

// rasterization parameters
constexpr int kRenderDpi = 150;
constexpr const char *const kImageFormat = "jpeg";
constexpr int kDefaultRenderWorkers = 2;

// file names inside the request-scoped temporary directory
constexpr const char *const kTempDirPrefix = "pdfjpg_";
constexpr const char *const kInputPdfName = "input.pdf";
constexpr const char *const kImagesDirName = "images";

// archive
constexpr const char *const kArchiveEntryPrefix = "page_";
constexpr const char *const kArchiveEntrySuffix = ".jpg";
constexpr const char *const kArchiveFileName = "pdf_images.zip";

// request/response envelope
constexpr const char *const kFieldBody = "body";
constexpr const char *const kFieldPdfUrl = "pdf_url";
constexpr const char *const kFieldStatusCode = "statusCode";
constexpr const char *const kFieldHeaders = "headers";
constexpr const char *const kFieldIsBase64 = "isBase64Encoded";
constexpr const char *const kFieldError = "error";
constexpr const char *const kFieldDetails = "details";

constexpr const char *const kHeaderContentType = "Content-Type";
constexpr const char *const kHeaderContentDisposition = "Content-Disposition";
constexpr const char *const kMimeZip = "application/zip";
constexpr const char *const kMimeJson = "application/json";

constexpr int kStatusOk = 200;
constexpr int kStatusBadRequest = 400;
constexpr int kStatusServerError = 500;

// error strings returned to the caller
constexpr const char *const kErrNoBody = "No body found in request";
constexpr const char *const kErrDetailsHint =
  "Check the execution logs for more information";

} // namespace pdfjpg
