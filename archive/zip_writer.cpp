/* File: zip_writer.cpp
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

#include "zip_writer.hpp"

#include <cstdio>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "utils.hpp"

namespace pdfjpg::archive {

namespace {

using ZipSourcePtr =
  std::unique_ptr<zip_source_t, std::function<void(zip_source_t *)>>;
using ZipPtr = std::unique_ptr<zip_t, std::function<void(zip_t *)>>;

std::string ZipErrorString(zip_error_t *err) {
  std::string res = zip_error_strerror(err);
  zip_error_fini(err);
  return res;
}

} // namespace

ZipWriter::ZipWriter() {
  zip_error_t err;
  zip_error_init(&err);
  source_ = zip_source_buffer_create(nullptr, 0, 0, &err);
  if (source_ == nullptr) {
    throw std::runtime_error("[ZipWriter] can't create a buffer source: " +
                             ZipErrorString(&err));
  }
  archive_ = zip_open_from_source(source_, ZIP_TRUNCATE, &err);
  if (archive_ == nullptr) {
    zip_source_free(source_);
    source_ = nullptr;
    throw std::runtime_error("[ZipWriter] can't open an archive: " +
                             ZipErrorString(&err));
  }
  zip_error_fini(&err);
  // the source must survive zip_close to read the result
  zip_source_keep(source_);
}

ZipWriter::~ZipWriter() {
  if (archive_ != nullptr) {
    zip_discard(archive_);
  }
  if (source_ != nullptr) {
    zip_source_free(source_);
  }
}

Result<Done> ZipWriter::AddFile(const std::string &name, BytesVector data) {
  if (archive_ == nullptr) {
    return MakeFailure(ErrorKind::kArchiveFailed, "Archive is already closed");
  }
  const BytesVector &stored = buffers_.emplace_back(std::move(data));
  zip_source_t *file_source =
    zip_source_buffer(archive_, stored.data(), stored.size(), 0);
  if (file_source == nullptr) {
    return MakeFailure(ErrorKind::kArchiveFailed,
                       std::string("Can't create a source for ") + name + ": " +
                         zip_strerror(archive_));
  }
  const zip_int64_t index =
    zip_file_add(archive_, name.c_str(), file_source, ZIP_FL_ENC_UTF_8);
  if (index < 0) {
    zip_source_free(file_source);
    return MakeFailure(ErrorKind::kArchiveFailed,
                       std::string("Can't add ") + name + ": " +
                         zip_strerror(archive_));
  }
  if (zip_set_file_compression(archive_, static_cast<zip_uint64_t>(index),
                               ZIP_CM_DEFLATE, 0) != 0) {
    return MakeFailure(ErrorKind::kArchiveFailed,
                       std::string("Can't set compression for ") + name +
                         ": " + zip_strerror(archive_));
  }
  ++entries_;
  return Done{};
}

Result<BytesVector> ZipWriter::Finish() {
  if (archive_ == nullptr) {
    return MakeFailure(ErrorKind::kArchiveFailed, "Archive is already closed");
  }
  if (zip_close(archive_) != 0) {
    std::string msg = std::string("Can't close the archive: ") +
                      zip_strerror(archive_);
    zip_discard(archive_);
    archive_ = nullptr;
    return MakeFailure(ErrorKind::kArchiveFailed, std::move(msg));
  }
  archive_ = nullptr;
  buffers_.clear();
  if (zip_source_open(source_) != 0) {
    return MakeFailure(ErrorKind::kArchiveFailed,
                       std::string("Can't open the archive buffer: ") +
                         zip_error_strerror(zip_source_error(source_)));
  }
  BytesVector res;
  if (zip_source_seek(source_, 0, SEEK_END) != 0) {
    zip_source_close(source_);
    return MakeFailure(ErrorKind::kArchiveFailed,
                       "Can't seek the archive buffer");
  }
  const zip_int64_t size = zip_source_tell(source_);
  if (size < 0 || zip_source_seek(source_, 0, SEEK_SET) != 0) {
    zip_source_close(source_);
    return MakeFailure(ErrorKind::kArchiveFailed,
                       "Can't get the archive size");
  }
  res.resize(static_cast<size_t>(size));
  const zip_int64_t read =
    zip_source_read(source_, res.data(), static_cast<zip_uint64_t>(size));
  zip_source_close(source_);
  if (read != size) {
    return MakeFailure(ErrorKind::kArchiveFailed,
                       "Can't read the archive buffer");
  }
  return res;
}

std::string PageEntryName(size_t page_number) {
  return kArchiveEntryPrefix + std::to_string(page_number) +
         kArchiveEntrySuffix;
}

Result<BytesVector> BuildPageArchive(const std::vector<pdf::PageImage> &pages) {
  try {
    ZipWriter writer;
    for (size_t i = 0; i < pages.size(); ++i) {
      // the archive must be contiguous page_1..page_N
      if (pages[i].page_number != i + 1) {
        return MakeFailure(ErrorKind::kArchiveFailed,
                           "Pages are not ordered, expected page " +
                             std::to_string(i + 1));
      }
      auto image = FileToVector(pages[i].file.string());
      if (!image) {
        return MakeFailure(ErrorKind::kArchiveFailed,
                           "Can't read image " + pages[i].file.string());
      }
      auto add_res =
        writer.AddFile(PageEntryName(pages[i].page_number), std::move(*image));
      if (!add_res) {
        return add_res.Error();
      }
    }
    return writer.Finish();
  } catch (const std::exception &ex) {
    return MakeFailure(ErrorKind::kArchiveFailed, ex.what());
  }
}

Result<std::vector<ZipEntryInfo>> ReadEntries(const BytesVector &zip_data) {
  zip_error_t err;
  zip_error_init(&err);
  ZipSourcePtr source(
    zip_source_buffer_create(zip_data.data(), zip_data.size(), 0, &err),
    [](zip_source_t *ptr) { zip_source_free(ptr); });
  if (!source) {
    return MakeFailure(ErrorKind::kArchiveFailed, ZipErrorString(&err));
  }
  ZipPtr archive(zip_open_from_source(source.get(), ZIP_RDONLY, &err),
                 [](zip_t *ptr) { zip_discard(ptr); });
  if (!archive) {
    return MakeFailure(ErrorKind::kArchiveFailed, ZipErrorString(&err));
  }
  zip_error_fini(&err);
  // the archive owns the source now
  static_cast<void>(source.release());
  std::vector<ZipEntryInfo> res;
  const zip_int64_t count = zip_get_num_entries(archive.get(), 0);
  for (zip_int64_t i = 0; i < count; ++i) {
    zip_stat_t stat;
    zip_stat_init(&stat);
    if (zip_stat_index(archive.get(), static_cast<zip_uint64_t>(i), 0,
                       &stat) != 0) {
      return MakeFailure(ErrorKind::kArchiveFailed, zip_strerror(archive.get()));
    }
    ZipEntryInfo info;
    info.name = stat.name != nullptr ? stat.name : "";
    info.size = stat.size;
    info.compressed_size = stat.comp_size;
    info.compression_method = stat.comp_method;
    res.push_back(std::move(info));
  }
  return res;
}

Result<BytesVector> ReadEntryData(const BytesVector &zip_data,
                                  const std::string &name) {
  zip_error_t err;
  zip_error_init(&err);
  ZipSourcePtr source(
    zip_source_buffer_create(zip_data.data(), zip_data.size(), 0, &err),
    [](zip_source_t *ptr) { zip_source_free(ptr); });
  if (!source) {
    return MakeFailure(ErrorKind::kArchiveFailed, ZipErrorString(&err));
  }
  ZipPtr archive(zip_open_from_source(source.get(), ZIP_RDONLY, &err),
                 [](zip_t *ptr) { zip_discard(ptr); });
  if (!archive) {
    return MakeFailure(ErrorKind::kArchiveFailed, ZipErrorString(&err));
  }
  zip_error_fini(&err);
  static_cast<void>(source.release());
  zip_stat_t stat;
  zip_stat_init(&stat);
  if (zip_stat(archive.get(), name.c_str(), 0, &stat) != 0) {
    return MakeFailure(ErrorKind::kArchiveFailed, "No entry " + name);
  }
  using ZipFilePtr =
    std::unique_ptr<zip_file_t, std::function<void(zip_file_t *)>>;
  const ZipFilePtr file(zip_fopen(archive.get(), name.c_str(), 0),
                        [](zip_file_t *ptr) { zip_fclose(ptr); });
  if (!file) {
    return MakeFailure(ErrorKind::kArchiveFailed, zip_strerror(archive.get()));
  }
  BytesVector res(static_cast<size_t>(stat.size));
  const zip_int64_t read = zip_fread(file.get(), res.data(), stat.size);
  if (read < 0 || static_cast<zip_uint64_t>(read) != stat.size) {
    return MakeFailure(ErrorKind::kArchiveFailed, "Can't read entry " + name);
  }
  return res;
}

} // namespace pdfjpg::archive
