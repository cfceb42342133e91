#include "PDFDocument.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>

// Poppler C++ wrapper
#include <poppler-document.h>
#include <poppler-image.h>
#include <poppler-page-renderer.h>
#include <poppler-page.h>

namespace pdfdeck {

namespace {

std::unique_ptr<poppler::document> loadDocument(const std::string &path,
                                                std::string &errorMessage) {
  std::unique_ptr<poppler::document> doc(
      poppler::document::load_from_file(path));

  if (!doc) {
    errorMessage = "Failed to load PDF file: " + path;
    return nullptr;
  }

  if (doc->is_locked()) {
    errorMessage = "PDF file is password protected: " + path;
    return nullptr;
  }

  return doc;
}

} // namespace

bool PDFDocument::hasPdfSignature(const std::string &path) {
  std::string extension = std::filesystem::path(path).extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (extension != ".pdf") {
    return false;
  }

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return false;
  }

  char magic[4] = {0, 0, 0, 0};
  file.read(magic, sizeof(magic));
  return file.gcount() == 4 && std::string(magic, 4) == "%PDF";
}

PDFInfoResult PDFDocument::countPages(const std::string &path) {
  PDFInfoResult result;

  auto startTime = std::chrono::high_resolution_clock::now();

  try {
    std::unique_ptr<poppler::document> doc =
        loadDocument(path, result.errorMessage);

    if (doc) {
      result.pageCount = doc->pages();
      if (result.pageCount < 1) {
        result.errorMessage = "PDF has no pages";
      } else {
        result.success = true;
      }
    }
  } catch (const std::exception &e) {
    result.errorMessage =
        std::string("Error counting pages in PDF: ") + e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

PDFPageImageResult PDFDocument::renderPage(const std::string &path,
                                           int pageIndex, double dpi) {
  PDFPageImageResult result;
  result.dpi = dpi;
  result.pageNumber = pageIndex + 1;

  auto startTime = std::chrono::high_resolution_clock::now();

  try {
    std::unique_ptr<poppler::document> doc =
        loadDocument(path, result.errorMessage);
    if (!doc) {
      return result;
    }

    result.pageCount = doc->pages();
    if (result.pageCount < 1) {
      result.errorMessage = "PDF has no pages";
      return result;
    }

    if (pageIndex < 0 || pageIndex >= result.pageCount) {
      result.errorMessage = "Page " + std::to_string(pageIndex + 1) +
                            " out of range (document has " +
                            std::to_string(result.pageCount) + " pages)";
      return result;
    }

    // Create page renderer with antialiasing
    poppler::page_renderer renderer;
    renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
    renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);
    renderer.set_image_format(poppler::image::format_argb32);

    std::unique_ptr<poppler::page> page(doc->create_page(pageIndex));
    if (!page) {
      result.errorMessage =
          "Failed to create page " + std::to_string(pageIndex + 1);
      return result;
    }

    poppler::image popplerImage = renderer.render_page(page.get(), dpi, dpi);
    if (!popplerImage.is_valid()) {
      result.errorMessage =
          "Failed to render page " + std::to_string(pageIndex + 1);
      return result;
    }

    int width = popplerImage.width();
    int height = popplerImage.height();

    cv::Mat mat;
    switch (popplerImage.format()) {
    case poppler::image::format_argb32: {
      // ARGB32 is stored as BGRA in memory on little-endian hosts
      mat = cv::Mat(height, width, CV_8UC4,
                    const_cast<char *>(popplerImage.const_data()),
                    popplerImage.bytes_per_row())
                .clone();
      cv::cvtColor(mat, mat, cv::COLOR_BGRA2BGR);
      break;
    }
    case poppler::image::format_rgb24: {
      mat = cv::Mat(height, width, CV_8UC3,
                    const_cast<char *>(popplerImage.const_data()),
                    popplerImage.bytes_per_row())
                .clone();
      cv::cvtColor(mat, mat, cv::COLOR_RGB2BGR);
      break;
    }
    case poppler::image::format_bgr24: {
      mat = cv::Mat(height, width, CV_8UC3,
                    const_cast<char *>(popplerImage.const_data()),
                    popplerImage.bytes_per_row())
                .clone();
      break;
    }
    case poppler::image::format_gray8: {
      cv::Mat gray(height, width, CV_8UC1,
                   const_cast<char *>(popplerImage.const_data()),
                   popplerImage.bytes_per_row());
      cv::cvtColor(gray, mat, cv::COLOR_GRAY2BGR);
      break;
    }
    default:
      result.errorMessage = "Unsupported Poppler image format";
      return result;
    }

    result.image = mat;
    result.width = width;
    result.height = height;
    result.success = true;
  } catch (const std::exception &e) {
    result.errorMessage = std::string("Error rendering PDF page: ") + e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

} // namespace pdfdeck
