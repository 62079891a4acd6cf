/* File: request.hpp
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

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "common_defs.hpp"
#include "result.hpp"

namespace pdfjpg::request {

using RequestBody = std::variant<BytesVector, std::string>;

/**
 * @brief One invocation envelope
 * @details body is std::nullopt when the envelope has no body or it is null
 */
struct Request {
  std::optional<RequestBody> body;
  bool is_base64_encoded = false;
};

/// PDF bytes passed as is
struct RawBytes {
  BytesVector bytes;
};

/// base64 encoded PDF bytes
struct Base64Text {
  std::string text;
};

/// remote mode, the PDF must be downloaded
struct UrlRequest {
  std::string url;
};

using BodyInput = std::variant<RawBytes, Base64Text, UrlRequest>;

/**
 * @brief Parse a JSON invocation envelope
 * @param event_json {"body": ..., "isBase64Encoded": ...}
 * @return Request or Failure
 * @details not a JSON object -> kInvalidInput,
 * body of a type other than string or null -> kDecodeFailed
 */
Result<Request> ParseEvent(std::string_view event_json) noexcept;

/**
 * @brief Build a request with a binary body
 */
Request MakeBinaryRequest(BytesVector pdf_bytes);

/**
 * @brief Build a request with a remote mode body {"pdf_url":"url"}
 */
Request MakeUrlRequest(const std::string &url);

/**
 * @brief Decide how to interpret the body, first match wins
 * @details
 * 1. no body -> kInvalidInput
 * 2. text with a JSON object holding a string "pdf_url" -> UrlRequest
 * 3. any other text -> Base64Text
 * 4. binary -> RawBytes
 */
Result<BodyInput> ClassifyBody(const Request &request);

} // namespace pdfjpg::request
