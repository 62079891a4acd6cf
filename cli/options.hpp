/* File: options.hpp
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

#include <spdlog/spdlog.h>

#include <boost/program_options.hpp>
#include <memory>
#include <string>

namespace pdfjpg::cli {

namespace po = boost::program_options;

const char *const kEventTag = "event,e";
const char *const kEventTagL = "event";
const char *const kInputFileTag = "input-file,i";
const char *const kInputFileTagL = "input-file";
const char *const kUrlTag = "url,u";
const char *const kUrlTagL = "url";
const char *const kOutputZipTag = "output-zip,o";
const char *const kOutputZipTagL = "output-zip";
const char *const kHelpTag = "help,h";
const char *const kHelpTagL = "help";
const char *const kStdinMark = "-";

/// where the request comes from
enum class InputMode : int { kEventStdin, kEventFile, kPdfFile, kUrl };

class Options {
public:
  Options(int argc, char **&argv, std::shared_ptr<spdlog::logger> logger);

  /**
   * @brief Print usage if asked or if the options are wrong
   * @return true if usage was printed
   */
  [[nodiscard]] bool help() const;
  [[nodiscard]] bool WrongParams() const { return wrong_params_; }

  /// at most one input option is allowed
  [[nodiscard]] bool InputIsUnambiguous() const;

  [[nodiscard]] InputMode GetInputMode() const;
  [[nodiscard]] std::string GetEventFile() const;
  [[nodiscard]] std::string GetInputFile() const;
  [[nodiscard]] std::string GetUrl() const;
  /// empty if not set
  [[nodiscard]] std::string GetOutputZip() const;

private:
  [[nodiscard]] std::string ResolvePath(const std::string &path) const;

  std::shared_ptr<spdlog::logger> log_;
  po::positional_options_description pos_opt_desc_;
  po::options_description description_;
  bool wrong_params_ = false;
  po::variables_map var_map_;
};

} // namespace pdfjpg::cli
