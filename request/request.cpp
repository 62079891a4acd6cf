/* File: request.cpp
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

#include "request.hpp"

#include <boost/json.hpp>
#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>
#include <exception>
#include <string>
#include <utility>

namespace pdfjpg::request {

namespace json = boost::json;

Result<Request> ParseEvent(std::string_view event_json) noexcept {
  try {
    boost::system::error_code err_code;
    const json::value event = json::parse(event_json, err_code);
    if (err_code) {
      return MakeFailure(ErrorKind::kInvalidInput,
                         "Malformed request envelope: " + err_code.message());
    }
    if (!event.is_object()) {
      return MakeFailure(ErrorKind::kInvalidInput,
                         "Request envelope is not a JSON object");
    }
    const json::object &obj = event.as_object();
    Request res;
    if (const json::value *p_flag = obj.if_contains(kFieldIsBase64);
        p_flag != nullptr && p_flag->is_bool()) {
      res.is_base64_encoded = p_flag->as_bool();
    }
    const json::value *p_body = obj.if_contains(kFieldBody);
    if (p_body == nullptr || p_body->is_null()) {
      return res;
    }
    if (!p_body->is_string()) {
      return MakeFailure(ErrorKind::kDecodeFailed,
                         "Unsupported body type, a string is expected");
    }
    const json::string &body_str = p_body->as_string();
    res.body = std::string(body_str.data(), body_str.size());
    return res;
  } catch (const std::exception &ex) {
    return MakeFailure(ErrorKind::kInternal, ex.what());
  }
}

Request MakeBinaryRequest(BytesVector pdf_bytes) {
  Request res;
  res.body = std::move(pdf_bytes);
  return res;
}

Request MakeUrlRequest(const std::string &url) {
  json::object obj;
  obj[kFieldPdfUrl] = url;
  Request res;
  res.body = json::serialize(obj);
  return res;
}

Result<BodyInput> ClassifyBody(const Request &request) {
  if (!request.body) {
    return MakeFailure(ErrorKind::kInvalidInput, kErrNoBody);
  }
  if (const auto *p_bytes = std::get_if<BytesVector>(&request.body.value())) {
    return BodyInput{RawBytes{*p_bytes}};
  }
  const std::string &text = std::get<std::string>(request.body.value());
  boost::system::error_code err_code;
  const json::value parsed = json::parse(text, err_code);
  if (!err_code && parsed.is_object()) {
    const json::value *p_url = parsed.as_object().if_contains(kFieldPdfUrl);
    if (p_url != nullptr && p_url->is_string()) {
      const json::string &url = p_url->as_string();
      return BodyInput{UrlRequest{std::string(url.data(), url.size())}};
    }
  }
  return BodyInput{Base64Text{text}};
}

} // namespace pdfjpg::request
