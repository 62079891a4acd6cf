/* File: test_handler.cpp
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
#include <filesystem>
#include <string>
#include <vector>

#include "common_defs.hpp"
#include "config.hpp"
#include "conversion_handler.hpp"
#include "logger_utils.hpp"
#include "request.hpp"
#include "response.hpp"
#include "scoped_temp.hpp"
#include "test_pdf_gen.hpp"
#include "utils.hpp"
#include "zip_writer.hpp"

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

constexpr const char *const test_dir = TEST_DIR;

using namespace pdfjpg;
using handler::ConversionHandler;
using request::Response;
namespace json = boost::json;

namespace {

std::vector<std::string> ArchiveNames(const Response &resp) {
  std::vector<std::string> res;
  auto zip_data = Base64Decode(resp.body);
  REQUIRE(zip_data);
  auto entries = archive::ReadEntries(zip_data.value());
  REQUIRE(entries);
  for (const auto &entry : entries.Value()) {
    res.push_back(entry.name);
  }
  return res;
}

std::string ErrorMessage(const Response &resp) {
  const json::value body = json::parse(resp.body);
  return json::value_to<std::string>(body.as_object().at(kFieldError));
}

bool IsEmptyDir(const std::filesystem::path &dir) {
  return std::filesystem::is_empty(dir);
}

std::string EventWithBody(const std::string &body) {
  json::object event;
  event[kFieldBody] = body;
  event[kFieldIsBase64] = true;
  return json::serialize(event);
}

} // namespace

TEST_CASE("ConversionHandler") {
  auto logger = logger::InitLog();
  REQUIRE(logger);
  // every request directory must be gone after the call
  const ScopedTempDir temp_root(test_dir, "handler_root_");
  const ScopedTempDir inputs(test_dir, "handler_inputs_");
  Config cfg;
  cfg.temp_root = temp_root.Path().string();
  cfg.fetch_timeout_sec = 5;
  cfg.fetch_protocols = "http,https,file";
  const ConversionHandler handler(cfg, logger);
  const BytesVector pdf = test::MakeTestPdf(3);

  SECTION("missing body") {
    const Response resp = handler.Handle(request::Request{});
    REQUIRE(resp.status_code == 400);
    REQUIRE_FALSE(resp.is_base64_encoded);
    REQUIRE(ErrorMessage(resp) == "No body found in request");
    const json::value body = json::parse(resp.body);
    REQUIRE(body.as_object().if_contains(kFieldDetails) == nullptr);

    const Response event_resp = handler.HandleEvent(R"({"body":null})");
    REQUIRE(event_resp.status_code == 400);
    REQUIRE(handler.HandleEvent("{}").status_code == 400);
    REQUIRE(IsEmptyDir(temp_root.Path()));
  }
  SECTION("base64 body") {
    const Response resp = handler.HandleEvent(EventWithBody(Base64Encode(pdf)));
    REQUIRE(resp.status_code == 200);
    REQUIRE(resp.is_base64_encoded);
    REQUIRE(resp.headers.at(kHeaderContentType) == "application/zip");
    REQUIRE(resp.headers.at(kHeaderContentDisposition) ==
            "attachment; filename=pdf_images.zip");
    const std::vector<std::string> expected{"page_1.jpg", "page_2.jpg",
                                            "page_3.jpg"};
    REQUIRE(ArchiveNames(resp) == expected);
    REQUIRE(IsEmptyDir(temp_root.Path()));
  }
  SECTION("binary body") {
    const Response resp = handler.Handle(request::MakeBinaryRequest(pdf));
    REQUIRE(resp.status_code == 200);
    REQUIRE(ArchiveNames(resp).size() == 3);
    auto zip_data = Base64Decode(resp.body);
    REQUIRE(zip_data);
    auto image = archive::ReadEntryData(zip_data.value(), "page_2.jpg");
    REQUIRE(image);
    REQUIRE(image.Value().size() > 2);
    REQUIRE(image.Value()[0] == 0xFF);
    REQUIRE(image.Value()[1] == 0xD8);
  }
  SECTION("repeated conversion") {
    const std::string event = EventWithBody(Base64Encode(pdf));
    const Response first = handler.HandleEvent(event);
    const Response second = handler.HandleEvent(event);
    REQUIRE(first.status_code == 200);
    REQUIRE(second.status_code == 200);
    REQUIRE(ArchiveNames(first) == ArchiveNames(second));
    REQUIRE(IsEmptyDir(temp_root.Path()));
  }
  SECTION("url body") {
    const std::string source = inputs.File("remote.pdf").string();
    REQUIRE(VectorToFile(source, pdf));
    const Response resp =
      handler.Handle(request::MakeUrlRequest("file://" + source));
    REQUIRE(resp.status_code == 200);
    REQUIRE(ArchiveNames(resp).size() == 3);
    REQUIRE(IsEmptyDir(temp_root.Path()));
  }
  SECTION("url body inside the event") {
    const std::string source = inputs.File("remote.pdf").string();
    REQUIRE(VectorToFile(source, pdf));
    json::object url_body;
    url_body[kFieldPdfUrl] = "file://" + source;
    const Response resp =
      handler.HandleEvent(EventWithBody(json::serialize(url_body)));
    REQUIRE(resp.status_code == 200);
    REQUIRE(ArchiveNames(resp).size() == 3);
  }
  SECTION("unreachable url") {
    const Response resp = handler.Handle(
      request::MakeUrlRequest("http://127.0.0.1:1/missing.pdf"));
    REQUIRE(resp.status_code == 500);
    REQUIRE_FALSE(resp.is_base64_encoded);
    const json::value body = json::parse(resp.body);
    REQUIRE(json::value_to<std::string>(body.as_object().at(kFieldDetails)) ==
            "Check the execution logs for more information");
    REQUIRE(IsEmptyDir(temp_root.Path()));
  }
  SECTION("invalid base64") {
    const Response resp =
      handler.HandleEvent(EventWithBody("this is not base64 at all!"));
    REQUIRE(resp.status_code == 500);
    REQUIRE(ErrorMessage(resp) == "Invalid base64-encoded string in body");
    REQUIRE(IsEmptyDir(temp_root.Path()));
  }
  SECTION("bytes that are not a pdf") {
    const std::string text = "plain text, no pdf here";
    const Response resp = handler.Handle(
      request::MakeBinaryRequest(BytesVector(text.cbegin(), text.cend())));
    REQUIRE(resp.status_code == 500);
    REQUIRE_FALSE(resp.is_base64_encoded);
    REQUIRE(IsEmptyDir(temp_root.Path()));
  }
  SECTION("empty body") {
    const Response resp = handler.HandleEvent(EventWithBody(""));
    REQUIRE(resp.status_code == 500);
    REQUIRE(IsEmptyDir(temp_root.Path()));
  }
  SECTION("malformed envelope") {
    const Response resp = handler.HandleEvent("{\"body\": ");
    REQUIRE(resp.status_code == 400);
  }
  SECTION("non-string body") {
    const Response resp = handler.HandleEvent(R"({"body":[1,2,3]})");
    REQUIRE(resp.status_code == 500);
  }
}
