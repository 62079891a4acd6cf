/* File: test_request.cpp
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

#include <boost/json.hpp>
#include <string>
#include <variant>

#include "common_defs.hpp"
#include "request.hpp"
#include "response.hpp"
#include "utils.hpp"

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

using namespace pdfjpg;
using namespace pdfjpg::request;
namespace json = boost::json;

namespace {

Request TextRequest(const std::string &text) {
  Request req;
  req.body = text;
  return req;
}

} // namespace

TEST_CASE("ClassifyBody") {
  SECTION("no body") {
    const Request req;
    auto res = ClassifyBody(req);
    REQUIRE_FALSE(res);
    REQUIRE(res.Error().kind == ErrorKind::kInvalidInput);
    REQUIRE(res.Error().message == kErrNoBody);
  }
  SECTION("binary body") {
    const BytesVector pdf{'%', 'P', 'D', 'F', '-'};
    auto res = ClassifyBody(MakeBinaryRequest(pdf));
    REQUIRE(res);
    REQUIRE(std::holds_alternative<RawBytes>(res.Value()));
    REQUIRE(std::get<RawBytes>(res.Value()).bytes == pdf);
  }
  SECTION("url") {
    auto res = ClassifyBody(
      TextRequest(R"({"pdf_url":"https://example.com/a.pdf"})"));
    REQUIRE(res);
    REQUIRE(std::holds_alternative<UrlRequest>(res.Value()));
    REQUIRE(std::get<UrlRequest>(res.Value()).url ==
            "https://example.com/a.pdf");
  }
  SECTION("url with other fields") {
    auto res = ClassifyBody(TextRequest(
      R"({"name":"doc","pdf_url":"http://host/x.pdf","pages":3})"));
    REQUIRE(res);
    REQUIRE(std::get<UrlRequest>(res.Value()).url == "http://host/x.pdf");
  }
  SECTION("MakeUrlRequest") {
    auto res = ClassifyBody(MakeUrlRequest("https://host/a \"b\".pdf"));
    REQUIRE(res);
    REQUIRE(std::get<UrlRequest>(res.Value()).url ==
            "https://host/a \"b\".pdf");
  }
  SECTION("pdf_url is not a string") {
    const std::string text = R"({"pdf_url":42})";
    auto res = ClassifyBody(TextRequest(text));
    REQUIRE(res);
    REQUIRE(std::holds_alternative<Base64Text>(res.Value()));
    REQUIRE(std::get<Base64Text>(res.Value()).text == text);
  }
  SECTION("json without pdf_url") {
    auto res = ClassifyBody(TextRequest(R"({"url":"https://host/a.pdf"})"));
    REQUIRE(res);
    REQUIRE(std::holds_alternative<Base64Text>(res.Value()));
  }
  SECTION("json array") {
    auto res = ClassifyBody(TextRequest(R"(["https://host/a.pdf"])"));
    REQUIRE(res);
    REQUIRE(std::holds_alternative<Base64Text>(res.Value()));
  }
  SECTION("base64 text") {
    auto res = ClassifyBody(TextRequest("JVBERi0xLjc="));
    REQUIRE(res);
    REQUIRE(std::get<Base64Text>(res.Value()).text == "JVBERi0xLjc=");
  }
  SECTION("is_base64_encoded flag does not change classification") {
    Request req = TextRequest(R"({"pdf_url":"https://host/a.pdf"})");
    req.is_base64_encoded = true;
    auto res = ClassifyBody(req);
    REQUIRE(res);
    REQUIRE(std::holds_alternative<UrlRequest>(res.Value()));
  }
}

TEST_CASE("ParseEvent") {
  SECTION("string body") {
    auto res = ParseEvent(R"({"body":"JVBERi0xLjc=","isBase64Encoded":true})");
    REQUIRE(res);
    REQUIRE(res.Value().body);
    REQUIRE(std::get<std::string>(res.Value().body.value()) == "JVBERi0xLjc=");
    REQUIRE(res.Value().is_base64_encoded);
  }
  SECTION("extra fields are ignored") {
    auto res = ParseEvent(
      R"({"httpMethod":"POST","headers":{"a":"b"},"body":"QUJD"})");
    REQUIRE(res);
    REQUIRE(std::get<std::string>(res.Value().body.value()) == "QUJD");
    REQUIRE_FALSE(res.Value().is_base64_encoded);
  }
  SECTION("missing body") {
    auto res = ParseEvent(R"({"isBase64Encoded":false})");
    REQUIRE(res);
    REQUIRE_FALSE(res.Value().body);
    res = ParseEvent("{}");
    REQUIRE(res);
    REQUIRE_FALSE(res.Value().body);
  }
  SECTION("null body") {
    auto res = ParseEvent(R"({"body":null})");
    REQUIRE(res);
    REQUIRE_FALSE(res.Value().body);
  }
  SECTION("malformed envelope") {
    auto res = ParseEvent("{\"body\":");
    REQUIRE_FALSE(res);
    REQUIRE(res.Error().kind == ErrorKind::kInvalidInput);
    res = ParseEvent("[1,2,3]");
    REQUIRE_FALSE(res);
    REQUIRE(res.Error().kind == ErrorKind::kInvalidInput);
    res = ParseEvent("");
    REQUIRE_FALSE(res);
    REQUIRE(res.Error().kind == ErrorKind::kInvalidInput);
  }
  SECTION("non-string body") {
    auto res = ParseEvent(R"({"body":{"pdf_url":"https://host/a.pdf"}})");
    REQUIRE_FALSE(res);
    REQUIRE(res.Error().kind == ErrorKind::kDecodeFailed);
  }
}

TEST_CASE("Response") {
  SECTION("archive response") {
    const BytesVector zip{'P', 'K', 0x03, 0x04};
    const Response resp = MakeArchiveResponse(zip);
    REQUIRE(resp.status_code == kStatusOk);
    REQUIRE(resp.is_base64_encoded);
    REQUIRE(resp.headers.at(kHeaderContentType) == "application/zip");
    REQUIRE(resp.headers.at(kHeaderContentDisposition) ==
            "attachment; filename=pdf_images.zip");
    REQUIRE(Base64Decode(resp.body).value() == zip);

    const json::value parsed = json::parse(resp.Serialize());
    const json::object &obj = parsed.as_object();
    REQUIRE(obj.at("statusCode").as_int64() == 200);
    REQUIRE(obj.at("isBase64Encoded").as_bool());
    REQUIRE(obj.at("headers").as_object().at("Content-Type").as_string() ==
            "application/zip");
    REQUIRE(obj.at("body").as_string() == resp.body);
  }
  SECTION("bad request") {
    const Response resp = FailureToResponse(
      MakeFailure(ErrorKind::kInvalidInput, kErrNoBody));
    REQUIRE(resp.status_code == kStatusBadRequest);
    REQUIRE_FALSE(resp.is_base64_encoded);
    REQUIRE(resp.headers.at(kHeaderContentType) == "application/json");
    const json::value body = json::parse(resp.body);
    REQUIRE(body.as_object().at("error").as_string() ==
            "No body found in request");
    REQUIRE(body.as_object().if_contains("details") == nullptr);
  }
  SECTION("processing errors are 500") {
    for (const ErrorKind kind :
         {ErrorKind::kFetchFailed, ErrorKind::kDecodeFailed,
          ErrorKind::kRenderFailed, ErrorKind::kArchiveFailed,
          ErrorKind::kInternal}) {
      const Response resp = FailureToResponse(MakeFailure(kind, "failed"));
      REQUIRE(resp.status_code == kStatusServerError);
      REQUIRE_FALSE(resp.is_base64_encoded);
      const json::value body = json::parse(resp.body);
      REQUIRE(body.as_object().at("error").as_string() == "failed");
      REQUIRE(body.as_object().at("details").as_string() ==
              "Check the execution logs for more information");
    }
  }
}
