/* File: scoped_temp.cpp
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

#include "scoped_temp.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace pdfjpg {

ScopedTempDir::ScopedTempDir(const std::string &parent,
                             const std::string &prefix) {
  namespace fs = std::filesystem;
  if (parent.empty() || !fs::is_directory(parent)) {
    throw std::runtime_error("[ScopedTempDir] parent is not a directory " +
                             parent);
  }
  std::string templ = (fs::path(parent) / prefix).string();
  templ += "XXXXXX";
  std::vector<char> buf(templ.cbegin(), templ.cend());
  buf.push_back('\0');
  if (mkdtemp(buf.data()) == nullptr) {
    throw std::runtime_error(std::string("[ScopedTempDir] mkdtemp failed: ") +
                             std::strerror(errno)); // NOLINT
  }
  path_ = buf.data();
}

ScopedTempDir::~ScopedTempDir() {
  std::error_code err_code;
  std::filesystem::remove_all(path_, err_code);
}

std::filesystem::path ScopedTempDir::MakeSubdir(const std::string &name) const {
  std::filesystem::path sub = path_ / name;
  std::error_code err_code;
  std::filesystem::create_directory(sub, err_code);
  if (err_code) {
    throw std::runtime_error("[ScopedTempDir] can't create directory " +
                             sub.string() + " " + err_code.message());
  }
  return sub;
}

} // namespace pdfjpg
