/* File: zip_writer.hpp
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

#include <zip.h>

#include <cstddef>
#include <cstdint>
#include <list>
#include <string>
#include <vector>

#include "common_defs.hpp"
#include "rasterizer.hpp"
#include "result.hpp"

namespace pdfjpg::archive {

struct ZipEntryInfo {
  std::string name;
  uint64_t size = 0;
  uint64_t compressed_size = 0;
  uint16_t compression_method = 0;
};

/**
 * @brief Builds a ZIP archive in memory with libzip
 * @details Entries are stored in the order they were added, each one is
 * deflate-compressed.
 */
class ZipWriter {
public:
  /**
   * @brief Construct a new ZipWriter with an empty archive
   * @throws std::runtime_error if libzip fails to create the archive
   */
  ZipWriter();

  ZipWriter(const ZipWriter &) = delete;
  ZipWriter(ZipWriter &&) = delete;
  ZipWriter &operator=(const ZipWriter &) = delete;
  ZipWriter &operator=(ZipWriter &&) = delete;

  /// discards the archive if Finish was not called
  ~ZipWriter();

  /**
   * @brief Add a file
   * @param name entry name, must be unique
   * @param data file content
   * @return Done or kArchiveFailed
   */
  [[nodiscard]] Result<Done> AddFile(const std::string &name, BytesVector data);

  /**
   * @brief Close the archive and return its bytes
   * @return ZIP bytes or kArchiveFailed
   * @details the writer can't be used after this call
   */
  [[nodiscard]] Result<BytesVector> Finish();

  [[nodiscard]] size_t EntriesCount() const noexcept { return entries_; }

private:
  zip_source_t *source_ = nullptr;
  zip_t *archive_ = nullptr;
  // libzip reads the data on zip_close, addresses must be stable
  std::list<BytesVector> buffers_;
  size_t entries_ = 0;
};

/**
 * @brief Archive entry name for a page
 * @param page_number starts from 1
 * @return page_<n>.jpg
 */
std::string PageEntryName(size_t page_number);

/**
 * @brief Put the rendered pages into a ZIP archive
 * @param pages images ordered by page number
 * @return ZIP bytes or kArchiveFailed
 */
Result<BytesVector> BuildPageArchive(const std::vector<pdf::PageImage> &pages);

/**
 * @brief List the entries of a ZIP archive in directory order
 * @param zip_data archive bytes
 * @return entries or kArchiveFailed
 */
Result<std::vector<ZipEntryInfo>> ReadEntries(const BytesVector &zip_data);

/**
 * @brief Extract one entry
 * @param zip_data archive bytes
 * @param name entry name
 * @return uncompressed entry content or kArchiveFailed
 */
Result<BytesVector> ReadEntryData(const BytesVector &zip_data,
                                  const std::string &name);

} // namespace pdfjpg::archive
