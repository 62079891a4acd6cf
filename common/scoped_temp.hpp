/* File: scoped_temp.hpp
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

#include <filesystem>
#include <string>

namespace pdfjpg {

/**
 * @brief A uniquely named directory removed with all its content on
 * destruction
 */
class ScopedTempDir {
public:
  /**
   * @brief Create a new directory <parent>/<prefix>XXXXXX
   * @param parent existing directory
   * @param prefix name prefix
   * @throws std::runtime_error if the directory can't be created
   */
  ScopedTempDir(const std::string &parent, const std::string &prefix);

  ScopedTempDir(const ScopedTempDir &) = delete;
  ScopedTempDir(ScopedTempDir &&) = delete;
  ScopedTempDir &operator=(const ScopedTempDir &) = delete;
  ScopedTempDir &operator=(ScopedTempDir &&) = delete;
  ~ScopedTempDir();

  [[nodiscard]] const std::filesystem::path &Path() const noexcept {
    return path_;
  }

  /**
   * @brief Path of a file inside the directory
   * @param name file name
   */
  [[nodiscard]] std::filesystem::path File(const std::string &name) const {
    return path_ / name;
  }

  /**
   * @brief Create a subdirectory that lives as long as this object
   * @param name directory name
   * @throws std::runtime_error
   */
  std::filesystem::path MakeSubdir(const std::string &name) const;

private:
  std::filesystem::path path_;
};

} // namespace pdfjpg
