/* File: rasterizer.hpp
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

#include <spdlog/logger.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "config.hpp"
#include "result.hpp"

namespace pdfjpg::pdf {

/// one rendered page, page_number starts from 1
struct PageImage {
  size_t page_number = 0;
  std::filesystem::path file;
};

/**
 * @brief Renders PDF pages to JPEG files with poppler
 */
class Rasterizer {
public:
  Rasterizer(const Config &cfg, std::shared_ptr<spdlog::logger> logger);

  /**
   * @brief Render every page to out_dir at kRenderDpi
   *
   * @param pdf_path source document
   * @param out_dir existing directory for the images
   * @param expected_pages page count reported by ProbePdf
   * @return images ordered by page number or kRenderFailed
   * @details Pages are interleaved between cfg.render_workers threads, each
   * thread opens its own document. The first failure stops all workers,
   * nothing is returned for partially rendered documents.
   */
  [[nodiscard]] Result<std::vector<PageImage>> RenderToJpeg(
    const std::string &pdf_path, const std::filesystem::path &out_dir,
    size_t expected_pages) const;

  /// engine name and version for logs
  [[nodiscard]] static std::string EngineVersion();

  [[nodiscard]] static std::string PageFileName(size_t page_number);

private:
  const Config &cfg_;
  std::shared_ptr<spdlog::logger> log_;
};

} // namespace pdfjpg::pdf
