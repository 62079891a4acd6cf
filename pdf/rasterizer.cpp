/* File: rasterizer.cpp
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

#include "rasterizer.hpp"

#include <poppler-document.h>
#include <poppler-global.h>
#include <poppler-image.h>
#include <poppler-page-renderer.h>
#include <poppler-page.h>
#include <poppler-version.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

#include "common_defs.hpp"

namespace pdfjpg::pdf {

namespace {

/// state shared by the render workers of one document
struct RenderJob {
  const std::string &pdf_path;
  const std::filesystem::path &out_dir;
  size_t page_count;
  size_t workers;
  std::vector<std::optional<std::filesystem::path>> slots;
  std::atomic<bool> failed{false};
  std::mutex err_mutex;
  std::string err_string;

  RenderJob(const std::string &path, const std::filesystem::path &dir,
            size_t pages, size_t n_workers)
      : pdf_path(path), out_dir(dir), page_count(pages), workers(n_workers),
        slots(pages) {}

  void Fail(const std::string &msg) {
    const std::lock_guard<std::mutex> lock(err_mutex);
    // keep the first error only
    if (!failed.exchange(true)) {
      err_string = msg;
    }
  }
};

/**
 * @brief Render pages worker_index, worker_index + workers, ...
 * @details Never throws, errors are stored in the job
 */
void RenderWorker(RenderJob &job, size_t worker_index) noexcept {
  try {
    const std::unique_ptr<poppler::document> doc(
      poppler::document::load_from_file(job.pdf_path));
    if (!doc) {
      job.Fail("poppler can't open the document");
      return;
    }
    if (doc->is_locked()) {
      job.Fail("PDF is password protected");
      return;
    }
    if (static_cast<size_t>(std::max(doc->pages(), 0)) != job.page_count) {
      job.Fail("Page count mismatch: expected " +
               std::to_string(job.page_count) + " got " +
               std::to_string(doc->pages()));
      return;
    }
    poppler::page_renderer renderer;
    renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
    renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);
    renderer.set_image_format(poppler::image::format_rgb24);
    for (size_t index = worker_index; index < job.page_count;
         index += job.workers) {
      if (job.failed.load()) {
        return;
      }
      // poppler pages start from 0
      const std::unique_ptr<poppler::page> page(
        doc->create_page(static_cast<int>(index)));
      if (!page) {
        job.Fail("Can't load page " + std::to_string(index + 1));
        return;
      }
      const poppler::image image =
        renderer.render_page(page.get(), kRenderDpi, kRenderDpi);
      if (!image.is_valid()) {
        job.Fail("Failed to render page " + std::to_string(index + 1));
        return;
      }
      const std::filesystem::path out_file =
        job.out_dir / Rasterizer::PageFileName(index + 1);
      if (!image.save(out_file.string(), kImageFormat, kRenderDpi)) {
        job.Fail("Failed to save page " + std::to_string(index + 1) +
                 " as " + kImageFormat);
        return;
      }
      job.slots[index] = out_file;
    }
  } catch (const std::exception &ex) {
    job.Fail(ex.what());
  }
}

} // namespace

Rasterizer::Rasterizer(const Config &cfg,
                       std::shared_ptr<spdlog::logger> logger)
    : cfg_(cfg), log_(std::move(logger)) {}

std::string Rasterizer::EngineVersion() {
  return "poppler " + poppler::version_string();
}

std::string Rasterizer::PageFileName(size_t page_number) {
  return "page-" + std::to_string(page_number) + ".jpg";
}

Result<std::vector<PageImage>> Rasterizer::RenderToJpeg(
  const std::string &pdf_path, const std::filesystem::path &out_dir,
  size_t expected_pages) const {
  const char *func_name = "[Rasterizer::RenderToJpeg]";
  if (expected_pages == 0) {
    return MakeFailure(ErrorKind::kRenderFailed, "PDF has no pages");
  }
  if (!poppler::page_renderer::can_render()) {
    return MakeFailure(ErrorKind::kRenderFailed,
                       "poppler is built without a raster backend");
  }
  const size_t workers =
    std::min(static_cast<size_t>(std::max(cfg_.render_workers, 1)),
             expected_pages);
  log_->info("{} converting PDF: {} pages {} workers {} dpi {}", func_name,
             pdf_path, expected_pages, workers, kRenderDpi);
  RenderJob job(pdf_path, out_dir, expected_pages, workers);
  if (workers == 1) {
    RenderWorker(job, 0);
  } else {
    std::vector<std::thread> threads;
    threads.reserve(workers);
    try {
      for (size_t i = 0; i < workers; ++i) {
        threads.emplace_back(RenderWorker, std::ref(job), i);
      }
    } catch (const std::system_error &ex) {
      job.Fail(std::string("Can't start a render worker: ") + ex.what());
    }
    for (auto &thread : threads) {
      thread.join();
    }
  }
  if (job.failed.load()) {
    log_->error("{} {}", func_name, job.err_string);
    return MakeFailure(ErrorKind::kRenderFailed, job.err_string);
  }
  std::vector<PageImage> res;
  res.reserve(expected_pages);
  for (size_t i = 0; i < job.slots.size(); ++i) {
    if (!job.slots[i]) {
      return MakeFailure(ErrorKind::kRenderFailed,
                         "Page " + std::to_string(i + 1) + " was not rendered");
    }
    res.push_back(PageImage{i + 1, std::move(job.slots[i].value())});
  }
  log_->info("{} successfully converted {} pages", func_name, res.size());
  return res;
}

} // namespace pdfjpg::pdf
