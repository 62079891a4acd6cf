/* File: options.cpp
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

#include "options.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <utility>

namespace pdfjpg::cli {

Options::Options(int argc, char **&argv, std::shared_ptr<spdlog::logger> logger)
  : log_(std::move(logger)), description_("Allowed options") {
  description_.add_options()
    // clang-format off
      (kHelpTag, "produce this help message")
      (kEventTag, po::value<std::string>(), "invocation event JSON file, - for stdin")
      (kInputFileTag, po::value<std::string>(), "PDF file to convert")
      (kUrlTag, po::value<std::string>(), "URL of a PDF file to convert")
      (kOutputZipTag, po::value<std::string>(), "write the resulting ZIP archive to this file");
  // clang-format on
  try {
    pos_opt_desc_.add(kInputFileTagL, 1);
    po::store(po::command_line_parser(argc, argv)
                .options(description_)
                .positional(pos_opt_desc_)
                .run(),
              var_map_);
    po::notify(var_map_);
  } catch (
    const boost::wrapexcept<po::invalid_command_line_syntax> & /*ex*/) {
    log_->error("Wrong parameters, see --help");
    wrong_params_ = true;
  } catch (const boost::wrapexcept<po::unknown_option> &ex) {
    log_->error(std::string("Unknown option passed. ") + ex.what());
    wrong_params_ = true;
  } catch (const boost::wrapexcept<po::ambiguous_option> & /*ex*/) {
    wrong_params_ = true;
    log_->error("Ambiguous option passed,use - for short options and -- "
                "for full otions,--help for help");
  } catch (const po::error &ex) {
    wrong_params_ = true;
    log_->error(ex.what());
  }
}

bool Options::help() const {
  if (var_map_.count(kHelpTagL) > 0 || wrong_params_ ||
      !InputIsUnambiguous()) {
    std::cout << "Converts a PDF file to a ZIP archive of JPEG pages\n";
    // clang-format off
    std::cout << "Usage: pdfjpg"
              << " [--event event.json | --input-file file.pdf | --url https://host/file.pdf]"
              << " [--output-zip pages.zip]\n"
              << "Without an input option the event JSON is read from stdin,"
              << " the response JSON is printed to stdout\n";
    std::cout << description_ << "\n";
    // clang-format on
    return true;
  }
  return false;
}

bool Options::InputIsUnambiguous() const {
  const size_t inputs = var_map_.count(kEventTagL) +
                        var_map_.count(kInputFileTagL) +
                        var_map_.count(kUrlTagL);
  if (inputs > 1) {
    log_->error("Only one of --event, --input-file, --url can be set");
    return false;
  }
  return true;
}

InputMode Options::GetInputMode() const {
  if (var_map_.count(kInputFileTagL) > 0) {
    return InputMode::kPdfFile;
  }
  if (var_map_.count(kUrlTagL) > 0) {
    return InputMode::kUrl;
  }
  if (var_map_.count(kEventTagL) > 0 &&
      var_map_.at(kEventTagL).as<std::string>() != kStdinMark) {
    return InputMode::kEventFile;
  }
  return InputMode::kEventStdin;
}

std::string Options::ResolvePath(const std::string &path) const {
  std::string local_path = path;
  const char *home = getenv("HOME"); // NOLINT
  if (boost::starts_with(local_path, "~/") && home != nullptr) {
    std::string home_path = home;
    home_path += "/";
    boost::replace_first(local_path, "~/", home_path);
  }
  std::filesystem::path fs_path = local_path;
  std::error_code err_code;
  fs_path = std::filesystem::absolute(fs_path, err_code);
  if (err_code) {
    log_->error(err_code.message());
    return path;
  }
  return fs_path.lexically_normal().string();
}

std::string Options::GetEventFile() const {
  if (var_map_.count(kEventTagL) == 0) {
    return {};
  }
  return ResolvePath(var_map_.at(kEventTagL).as<std::string>());
}

std::string Options::GetInputFile() const {
  if (var_map_.count(kInputFileTagL) == 0) {
    return {};
  }
  return ResolvePath(var_map_.at(kInputFileTagL).as<std::string>());
}

std::string Options::GetUrl() const {
  if (var_map_.count(kUrlTagL) == 0) {
    return {};
  }
  return boost::trim_copy(var_map_.at(kUrlTagL).as<std::string>());
}

std::string Options::GetOutputZip() const {
  if (var_map_.count(kOutputZipTagL) == 0) {
    return {};
  }
  return ResolvePath(var_map_.at(kOutputZipTagL).as<std::string>());
}

} // namespace pdfjpg::cli
