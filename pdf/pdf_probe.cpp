/* File: pdf_probe.cpp
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

#include "pdf_probe.hpp"

#define POINTERHOLDER_TRANSITION 3 // NOLINT (cppcoreguidelines-macro-usage)
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFExc.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>

#include <boost/algorithm/string/predicate.hpp>
#include <exception>
#include <filesystem>
#include <fstream>
#include <string>

#include "common_defs.hpp"

namespace pdfjpg::pdf {

namespace {

constexpr size_t kHeaderProbeSize = 1024;

// the header may be preceded by junk, readers look at the first 1024 bytes
bool HasPdfHeader(const std::string &path) {
  std::ifstream ifile(path, std::ios_base::binary);
  if (!ifile.is_open()) {
    return false;
  }
  std::string read_buff(kHeaderProbeSize, '\0');
  ifile.read(read_buff.data(), static_cast<std::streamsize>(read_buff.size()));
  read_buff.resize(static_cast<size_t>(ifile.gcount()));
  return boost::contains(read_buff, "%PDF-");
}

} // namespace

Result<PdfInfo> ProbePdf(const std::string &path,
                         const std::shared_ptr<spdlog::logger> &log) {
  namespace fs = std::filesystem;
  const char *func_name = "[ProbePdf]";
  std::error_code err_code;
  if (path.empty() || !fs::is_regular_file(path, err_code)) {
    return MakeFailure(ErrorKind::kRenderFailed, "PDF file doesn't exist");
  }
  const auto file_size = fs::file_size(path, err_code);
  if (err_code || file_size == 0) {
    return MakeFailure(ErrorKind::kRenderFailed, "PDF file is empty");
  }
  if (file_size > kMaxPdfFileSize) {
    return MakeFailure(ErrorKind::kRenderFailed, "PDF file is too big");
  }
  if (!HasPdfHeader(path)) {
    return MakeFailure(ErrorKind::kRenderFailed, "Not a pdf file");
  }
  PdfInfo res;
  try {
    QPDF qpdf;
    qpdf.setSuppressWarnings(true);
    qpdf.processFile(path.c_str());
    res.page_count = QPDFPageDocumentHelper(qpdf).getAllPages().size();
    res.pdf_version = qpdf.getPDFVersion();
    res.encrypted = qpdf.isEncrypted();
  } catch (const QPDFExc &ex) {
    log->error("{} {}", func_name, ex.what());
    return MakeFailure(ErrorKind::kRenderFailed,
                       std::string("Unable to read PDF: ") +
                         ex.getMessageDetail());
  } catch (const std::exception &ex) {
    log->error("{} {}", func_name, ex.what());
    return MakeFailure(ErrorKind::kRenderFailed,
                       std::string("Unable to read PDF: ") + ex.what());
  }
  if (res.page_count == 0) {
    return MakeFailure(ErrorKind::kRenderFailed, "PDF has no pages");
  }
  log->debug("{} version {} pages {} encrypted {}", func_name,
             res.pdf_version, res.page_count, res.encrypted);
  return res;
}

} // namespace pdfjpg::pdf
