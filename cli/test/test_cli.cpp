/* File: test_cli.cpp
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

#include <filesystem>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "cli_utils.hpp"
#include "common_defs.hpp"
#include "config.hpp"
#include "conversion_handler.hpp"
#include "logger_utils.hpp"
#include "options.hpp"
#include "scoped_temp.hpp"
#include "test_pdf_gen.hpp"
#include "utils.hpp"
#include "zip_writer.hpp"

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

constexpr const char *const test_dir = TEST_DIR;

using namespace pdfjpg;
using namespace pdfjpg::cli;

namespace {

/// argv for the Options constructor, keeps the strings alive
class Args {
public:
  explicit Args(std::vector<std::string> args) : args_(std::move(args)) {
    for (auto &arg : args_) {
      ptrs_.push_back(arg.data());
    }
    ptrs_.push_back(nullptr);
    argv_ = ptrs_.data();
  }
  [[nodiscard]] int argc() const {
    return static_cast<int>(args_.size());
  }
  char **&argv() { return argv_; }

private:
  std::vector<std::string> args_;
  std::vector<char *> ptrs_;
  char **argv_ = nullptr;
};

} // namespace

TEST_CASE("Options") {
  auto logger = logger::InitLog();
  REQUIRE(logger);

  SECTION("no options reads the event from stdin") {
    Args args({"pdfjpg"});
    const Options opts(args.argc(), args.argv(), logger);
    REQUIRE_FALSE(opts.WrongParams());
    REQUIRE(opts.InputIsUnambiguous());
    REQUIRE(opts.GetInputMode() == InputMode::kEventStdin);
    REQUIRE(opts.GetOutputZip().empty());
  }
  SECTION("event from stdin") {
    Args args({"pdfjpg", "--event", "-"});
    const Options opts(args.argc(), args.argv(), logger);
    REQUIRE(opts.GetInputMode() == InputMode::kEventStdin);
  }
  SECTION("event file") {
    Args args({"pdfjpg", "-e", "/tmp/../tmp/event.json"});
    const Options opts(args.argc(), args.argv(), logger);
    REQUIRE(opts.GetInputMode() == InputMode::kEventFile);
    REQUIRE(opts.GetEventFile() == "/tmp/event.json");
  }
  SECTION("positional input file") {
    Args args({"pdfjpg", "doc.pdf", "-o", "pages.zip"});
    const Options opts(args.argc(), args.argv(), logger);
    REQUIRE(opts.GetInputMode() == InputMode::kPdfFile);
    const auto expected =
      (std::filesystem::current_path() / "doc.pdf").lexically_normal();
    REQUIRE(opts.GetInputFile() == expected.string());
    REQUIRE_FALSE(opts.GetOutputZip().empty());
  }
  SECTION("url") {
    Args args({"pdfjpg", "--url", " https://host/a.pdf "});
    const Options opts(args.argc(), args.argv(), logger);
    REQUIRE(opts.GetInputMode() == InputMode::kUrl);
    REQUIRE(opts.GetUrl() == "https://host/a.pdf");
  }
  SECTION("two inputs") {
    Args args({"pdfjpg", "-i", "doc.pdf", "-u", "https://host/a.pdf"});
    const Options opts(args.argc(), args.argv(), logger);
    REQUIRE_FALSE(opts.InputIsUnambiguous());
    REQUIRE(opts.help());
  }
  SECTION("unknown option") {
    Args args({"pdfjpg", "--pages", "3"});
    const Options opts(args.argc(), args.argv(), logger);
    REQUIRE(opts.WrongParams());
    REQUIRE(opts.help());
  }
  SECTION("help") {
    Args args({"pdfjpg", "--help"});
    const Options opts(args.argc(), args.argv(), logger);
    REQUIRE(opts.help());
    REQUIRE_FALSE(opts.WrongParams());
  }
}

TEST_CASE("RunRequest") {
  auto logger = logger::InitLog();
  REQUIRE(logger);
  const ScopedTempDir tmp(test_dir, "cli_");
  Config cfg;
  cfg.temp_root = test_dir;
  const handler::ConversionHandler handler(cfg, logger);
  const std::string pdf_file = tmp.File("doc.pdf").string();
  REQUIRE(test::WriteTestPdf(pdf_file, 2));

  SECTION("pdf file to zip") {
    Args args({"pdfjpg", pdf_file, "-o", tmp.File("pages.zip").string()});
    const Options opts(args.argc(), args.argv(), logger);
    auto resp = RunRequest(opts, handler, logger);
    REQUIRE(resp);
    REQUIRE(resp->status_code == kStatusOk);
    REQUIRE(WriteArchive(resp.value(), opts.GetOutputZip(), logger));
    auto zip_data = FileToVector(opts.GetOutputZip());
    REQUIRE(zip_data);
    auto entries = archive::ReadEntries(zip_data.value());
    REQUIRE(entries);
    REQUIRE(entries.Value().size() == 2);
    // existing archive is replaced
    REQUIRE(WriteArchive(resp.value(), opts.GetOutputZip(), logger));
  }
  SECTION("event file") {
    auto pdf = FileToVector(pdf_file);
    REQUIRE(pdf);
    const std::string event =
      std::string(R"({"body":")") + Base64Encode(pdf.value()) + "\"}";
    const std::string event_file = tmp.File("event.json").string();
    REQUIRE(VectorToFile(event_file, BytesVector(event.cbegin(), event.cend())));
    Args args({"pdfjpg", "--event", event_file});
    const Options opts(args.argc(), args.argv(), logger);
    auto resp = RunRequest(opts, handler, logger);
    REQUIRE(resp);
    REQUIRE(resp->status_code == kStatusOk);
  }
  SECTION("missing input file") {
    Args args({"pdfjpg", tmp.File("missing.pdf").string()});
    const Options opts(args.argc(), args.argv(), logger);
    REQUIRE_FALSE(RunRequest(opts, handler, logger));
  }
  SECTION("error response has no archive") {
    const auto resp = request::MakeErrorResponse(kStatusBadRequest, kErrNoBody,
                                                 std::nullopt);
    REQUIRE_FALSE(WriteArchive(resp, tmp.File("none.zip").string(), logger));
    REQUIRE_FALSE(std::filesystem::exists(tmp.File("none.zip")));
  }
}

TEST_CASE("ReadAll") {
  std::istringstream stream("{\"body\":\"QUJD\"}");
  REQUIRE(ReadAll(stream) == "{\"body\":\"QUJD\"}");
}
