/* File: fetcher.cpp
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

#include "fetcher.hpp"

#include <curl/curl.h>

#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

#include "common_defs.hpp"

namespace pdfjpg::net {

namespace {

using CurlHandle = std::unique_ptr<CURL, std::function<void(CURL *)>>;

std::once_flag curl_init_flag;   // NOLINT
CURLcode curl_init_res = CURLE_OK; // NOLINT

size_t WriteToStream(char *ptr, size_t size, size_t nmemb, void *userdata) {
  auto *p_stream = static_cast<std::ofstream *>(userdata);
  const size_t total = size * nmemb;
  p_stream->write(ptr, static_cast<std::streamsize>(total));
  // a short count makes curl abort with CURLE_WRITE_ERROR
  return p_stream->good() ? total : 0;
}

void RemoveQuietly(const std::string &path) noexcept {
  std::error_code err_code;
  std::filesystem::remove(path, err_code);
}

} // namespace

Fetcher::Fetcher(const Config &cfg, std::shared_ptr<spdlog::logger> logger)
    : cfg_(cfg), log_(std::move(logger)) {
  std::call_once(curl_init_flag, []() {
    curl_init_res = curl_global_init(CURL_GLOBAL_DEFAULT);
  });
  if (curl_init_res != CURLE_OK) {
    throw std::runtime_error(std::string("[Fetcher] curl_global_init failed: ") +
                             curl_easy_strerror(curl_init_res));
  }
}

Result<Done> Fetcher::Download(const std::string &url,
                               const std::string &dest_path) const {
  const char *func_name = "[Fetcher::Download]";
  if (url.empty()) {
    return MakeFailure(ErrorKind::kFetchFailed, "Empty PDF URL");
  }
  const CurlHandle curl(curl_easy_init(),
                        [](CURL *ptr) { curl_easy_cleanup(ptr); });
  if (!curl) {
    return MakeFailure(ErrorKind::kFetchFailed, "Failed to create curl handle");
  }
  std::ofstream ofile(dest_path, std::ios_base::binary | std::ios_base::trunc);
  if (!ofile.is_open()) {
    return MakeFailure(ErrorKind::kFetchFailed,
                       "Can't create file " + dest_path);
  }
  std::string err_buf(CURL_ERROR_SIZE, '\0');
  CURL *handle = curl.get();
  CURLcode opt_res = CURLE_OK;
  auto set_opt = [handle, &opt_res](CURLoption option, auto value) {
    if (opt_res == CURLE_OK) {
      opt_res = curl_easy_setopt(handle, option, value);
    }
  };
  // clang-format off
  set_opt(CURLOPT_URL, url.c_str());
  set_opt(CURLOPT_WRITEFUNCTION, WriteToStream);
  set_opt(CURLOPT_WRITEDATA, &ofile);
  set_opt(CURLOPT_ERRORBUFFER, err_buf.data());
  set_opt(CURLOPT_PROTOCOLS_STR, cfg_.fetch_protocols.c_str());
  set_opt(CURLOPT_REDIR_PROTOCOLS_STR, cfg_.fetch_protocols.c_str());
  set_opt(CURLOPT_FOLLOWLOCATION, 1L);
  set_opt(CURLOPT_MAXREDIRS, kMaxRedirects);
  set_opt(CURLOPT_TIMEOUT, cfg_.fetch_timeout_sec);
  set_opt(CURLOPT_CONNECTTIMEOUT, kConnectTimeoutSec);
  set_opt(CURLOPT_MAXFILESIZE_LARGE, static_cast<curl_off_t>(kMaxPdfFileSize));
  set_opt(CURLOPT_USERAGENT, kUserAgent);
  set_opt(CURLOPT_NOSIGNAL, 1L);
  set_opt(CURLOPT_SSL_VERIFYPEER, 1L);
  set_opt(CURLOPT_SSL_VERIFYHOST, 2L);
  // clang-format on
  if (opt_res != CURLE_OK) {
    ofile.close();
    RemoveQuietly(dest_path);
    return MakeFailure(ErrorKind::kFetchFailed,
                       std::string("Failed to set up the download: ") +
                         curl_easy_strerror(opt_res));
  }
  log_->info("{} downloading PDF from URL: {}", func_name, url);
  const CURLcode curl_res = curl_easy_perform(handle);
  ofile.close();
  if (curl_res != CURLE_OK) {
    const std::string reason =
      err_buf.front() != '\0' ? std::string(err_buf.c_str())
                              : std::string(curl_easy_strerror(curl_res));
    log_->error("{} download failed for {}: {}", func_name, url, reason);
    RemoveQuietly(dest_path);
    return MakeFailure(ErrorKind::kFetchFailed,
                       "Failed to download " + url + ": " + reason);
  }
  long http_code = 0;
  if (curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &http_code) !=
      CURLE_OK) {
    http_code = 0;
  }
  // file:// and similar schemes report 0
  if (http_code >= 400) {
    log_->error("{} HTTP {} for {}", func_name, http_code, url);
    RemoveQuietly(dest_path);
    return MakeFailure(ErrorKind::kFetchFailed,
                       "Failed to download " + url + ": HTTP Error " +
                         std::to_string(http_code));
  }
  if (ofile.fail()) {
    RemoveQuietly(dest_path);
    return MakeFailure(ErrorKind::kFetchFailed,
                       "Failed to write " + dest_path);
  }
  log_->debug("{} saved to {}", func_name, dest_path);
  return Done{};
}

} // namespace pdfjpg::net
