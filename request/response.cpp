/* File: response.cpp
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

#include "response.hpp"

#include <boost/json.hpp>
#include <boost/json/object.hpp>
#include <boost/json/serialize.hpp>
#include <string>

#include "utils.hpp"

namespace pdfjpg::request {

namespace json = boost::json;

json::value Response::ToJson() const {
  json::object res;
  res[kFieldStatusCode] = status_code;
  json::object json_headers;
  for (const auto &header : headers) {
    json_headers[header.first] = header.second;
  }
  res[kFieldHeaders] = std::move(json_headers);
  res[kFieldBody] = body;
  res[kFieldIsBase64] = is_base64_encoded;
  return res;
}

std::string Response::Serialize() const { return json::serialize(ToJson()); }

Response MakeArchiveResponse(const BytesVector &zip_data) {
  Response res;
  res.status_code = kStatusOk;
  res.headers[kHeaderContentType] = kMimeZip;
  res.headers[kHeaderContentDisposition] =
    std::string("attachment; filename=") + kArchiveFileName;
  res.body = Base64Encode(zip_data);
  res.is_base64_encoded = true;
  return res;
}

Response MakeErrorResponse(int status_code, const std::string &message,
                           const std::optional<std::string> &details) {
  json::object err_body;
  err_body[kFieldError] = message;
  if (details) {
    err_body[kFieldDetails] = details.value();
  }
  Response res;
  res.status_code = status_code;
  res.headers[kHeaderContentType] = kMimeJson;
  res.body = json::serialize(err_body);
  res.is_base64_encoded = false;
  return res;
}

Response FailureToResponse(const Failure &failure) {
  if (failure.kind == ErrorKind::kInvalidInput) {
    return MakeErrorResponse(kStatusBadRequest, failure.message, std::nullopt);
  }
  return MakeErrorResponse(kStatusServerError, failure.message,
                           std::string(kErrDetailsHint));
}

} // namespace pdfjpg::request
