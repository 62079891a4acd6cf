/* File: utils.hpp
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

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "common_defs.hpp"

namespace pdfjpg {

/**
 * @brief Load file to vector
 *
 * @return optional std::vector<unsigned char> - empty if fail
 */
std::optional<BytesVector> FileToVector(const std::string &path) noexcept;

/**
 * @brief Write bytes to a new file, owner read/write only
 * @param path file to create, must not exist
 * @param data bytes
 * @return true on success
 */
[[nodiscard]] bool VectorToFile(const std::string &path,
                                const BytesVector &data) noexcept;

/**
 * @brief Encode bytes to base64 (no line breaks)
 * @param data
 * @return std::string
 */
std::string Base64Encode(const BytesVector &data);

/**
 * @brief Decode base64 text
 * @details whitespace is skipped, the rest must be the standard alphabet
 * with correct padding
 * @param text
 * @return std::nullopt if the text is not valid base64
 */
std::optional<BytesVector> Base64Decode(std::string_view text);

} // namespace pdfjpg
