/* File: pdf_probe.hpp
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
#include <memory>
#include <string>

#include "result.hpp"

namespace pdfjpg::pdf {

struct PdfInfo {
  size_t page_count = 0;
  std::string pdf_version;
  bool encrypted = false;
};

/**
 * @brief Check the document before rendering
 * @param path to file
 * @param log logger
 * @return PdfInfo or kRenderFailed
 * @details file must exist, be non-empty, not bigger than kMaxPdfFileSize,
 * start with a PDF header and open with qpdf; a document without pages is
 * a failure as well
 */
Result<PdfInfo> ProbePdf(const std::string &path,
                         const std::shared_ptr<spdlog::logger> &log);

} // namespace pdfjpg::pdf
