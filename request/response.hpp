/* File: response.hpp
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

#include <boost/json/value.hpp>
#include <map>
#include <optional>
#include <string>

#include "common_defs.hpp"
#include "result.hpp"

namespace pdfjpg::request {

struct Response {
  int status_code = kStatusServerError;
  std::map<std::string, std::string> headers;
  std::string body;
  bool is_base64_encoded = false;

  [[nodiscard]] boost::json::value ToJson() const;
  [[nodiscard]] std::string Serialize() const;
};

/**
 * @brief Success response with the archive
 * @param zip_data raw ZIP bytes, base64 encoded into the body
 */
Response MakeArchiveResponse(const BytesVector &zip_data);

/**
 * @brief Error response with a JSON body {"error":..., "details":...}
 * @param status_code 4xx or 5xx
 * @param message error text
 * @param details hint, omitted if std::nullopt
 */
Response MakeErrorResponse(int status_code, const std::string &message,
                           const std::optional<std::string> &details);

/**
 * @brief Map a failure to the external response
 * @details kInvalidInput -> 400 without details, everything else -> 500 with
 * the logs hint
 */
Response FailureToResponse(const Failure &failure);

} // namespace pdfjpg::request
