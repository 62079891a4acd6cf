/* File: utils.cpp
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

#include "utils.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

namespace pdfjpg {

namespace {

// EVP_*Block take int lengths, process big buffers by chunks
constexpr size_t kEncodeChunk = 3 * 1024 * 1024;
constexpr size_t kDecodeChunk = 4 * 1024 * 1024;

bool IsBase64Symbol(unsigned char symbol) noexcept {
  return std::isalnum(symbol) != 0 || symbol == '+' || symbol == '/';
}

} // namespace

std::optional<BytesVector> FileToVector(const std::string &path) noexcept {
  namespace fs = std::filesystem;
  std::error_code err_code;
  if (path.empty() || !fs::is_regular_file(path, err_code)) {
    return std::nullopt;
  }
  std::ifstream file(path, std::ios_base::binary);
  if (!file.is_open()) {
    return std::nullopt;
  }
  BytesVector res;
  try {
    const auto size = fs::file_size(path, err_code);
    if (!err_code) {
      res.reserve(size);
    }
    std::copy(std::istreambuf_iterator<char>(file),
              std::istreambuf_iterator<char>(), std::back_inserter(res));
  } catch ([[maybe_unused]] const std::exception & /*ex*/) {
    file.close();
    return std::nullopt;
  }
  file.close();
  return res;
}

bool VectorToFile(const std::string &path, const BytesVector &data) noexcept {
  namespace fs = std::filesystem;
  std::error_code err_code;
  if (path.empty() || fs::exists(path, err_code)) {
    return false;
  }
  try {
    {
      const std::ofstream ofile(path, std::ios_base::binary);
      if (!ofile.is_open()) {
        return false;
      }
    }
    fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace, err_code);
    if (err_code) {
      return false;
    }
    std::ofstream ofile(path, std::ios_base::binary | std::ios_base::trunc);
    if (!ofile.is_open()) {
      return false;
    }
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    ofile.write(reinterpret_cast<const char *>(data.data()),
                static_cast<std::streamsize>(data.size()));
    ofile.close();
    return !ofile.fail();
  } catch ([[maybe_unused]] const std::exception & /*ex*/) {
    return false;
  }
}

std::string Base64Encode(const BytesVector &data) {
  std::string res;
  res.reserve(((data.size() + 2) / 3) * 4);
  std::vector<unsigned char> buf(((kEncodeChunk + 2) / 3) * 4 + 1, 0x00);
  for (size_t offset = 0; offset < data.size(); offset += kEncodeChunk) {
    const size_t chunk_size = std::min(kEncodeChunk, data.size() - offset);
    const int written = EVP_EncodeBlock(buf.data(), data.data() + offset,
                                        static_cast<int>(chunk_size));
    if (written < 0) {
      throw std::runtime_error("[Base64Encode] EVP_EncodeBlock failed");
    }
    res.append(buf.cbegin(), buf.cbegin() + written);
  }
  return res;
}

std::optional<BytesVector> Base64Decode(std::string_view text) {
  std::string clean;
  clean.reserve(text.size());
  std::copy_if(text.cbegin(), text.cend(), std::back_inserter(clean),
               [](unsigned char symbol) { return std::isspace(symbol) == 0; });
  if (clean.size() % 4 != 0) {
    return std::nullopt;
  }
  // up to two '=' allowed, at the very end only
  const size_t first_pad = clean.find('=');
  const size_t padding =
    first_pad == std::string::npos ? 0 : clean.size() - first_pad;
  if (padding > 2 ||
      (padding > 0 && clean.find_first_not_of('=', first_pad) !=
                        std::string::npos)) {
    return std::nullopt;
  }
  if (!std::all_of(clean.cbegin(), clean.cend() - static_cast<long>(padding),
                   [](unsigned char symbol) {
                     return IsBase64Symbol(symbol);
                   })) {
    return std::nullopt;
  }
  BytesVector res;
  res.reserve(clean.size() / 4 * 3);
  std::vector<unsigned char> buf(kDecodeChunk / 4 * 3, 0x00);
  for (size_t offset = 0; offset < clean.size(); offset += kDecodeChunk) {
    const size_t chunk_size = std::min(kDecodeChunk, clean.size() - offset);
    const int written = EVP_DecodeBlock(
      buf.data(),
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
      reinterpret_cast<const unsigned char *>(clean.data() + offset),
      static_cast<int>(chunk_size));
    if (written < 0) {
      return std::nullopt;
    }
    res.insert(res.end(), buf.cbegin(), buf.cbegin() + written);
  }
  // EVP_DecodeBlock counts the padding as zero bytes
  res.resize(res.size() - padding);
  return res;
}

} // namespace pdfjpg
