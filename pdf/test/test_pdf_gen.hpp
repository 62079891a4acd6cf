/* File: test_pdf_gen.hpp
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

#include <cstddef>
#include <string>

#include "common_defs.hpp"

namespace pdfjpg::test {

/**
 * @brief Build a small valid PDF with one line of text per page
 * @param pages number of pages
 * @return PDF bytes
 * @throws qpdf exceptions
 */
BytesVector MakeTestPdf(size_t pages);

/// write MakeTestPdf(pages) to a new file
bool WriteTestPdf(const std::string &path, size_t pages);

} // namespace pdfjpg::test
