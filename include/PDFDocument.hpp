#ifndef PDFDECK_PDF_DOCUMENT_HPP
#define PDFDECK_PDF_DOCUMENT_HPP

#include <opencv2/opencv.hpp>

#include <string>

namespace pdfdeck {

/**
 * @brief Result of reading PDF metadata
 */
struct PDFInfoResult {
  bool success = false;        ///< Whether the document could be loaded
  std::string errorMessage;    ///< Error message if failed
  int pageCount = 0;           ///< Number of pages
  double processingTimeMs = 0; ///< Processing time in milliseconds
};

/**
 * @brief A rasterized PDF page
 */
struct PDFPageImageResult {
  bool success = false;        ///< Whether rendering succeeded
  std::string errorMessage;    ///< Error message if failed
  cv::Mat image;               ///< Rendered page, BGR
  int pageNumber = 0;          ///< 1-indexed page number
  int pageCount = 0;           ///< Number of pages in the document
  int width = 0;               ///< Width in pixels
  int height = 0;              ///< Height in pixels
  double dpi = 0;              ///< Resolution used for rendering
  double processingTimeMs = 0; ///< Processing time in milliseconds
};

/**
 * @brief PDF access through Poppler: signature check, page count, rendering
 */
class PDFDocument {
public:
  /**
   * @brief Check that a file looks like a PDF
   *
   * The name must end in ".pdf" (any case) and the file must start with the
   * four bytes "%PDF".
   *
   * @param path Path to the file
   * @return true if both checks pass
   */
  static bool hasPdfSignature(const std::string &path);

  /**
   * @brief Count the pages of a PDF file
   * @param path Path to the PDF file
   * @return PDFInfoResult with the page count
   */
  static PDFInfoResult countPages(const std::string &path);

  /**
   * @brief Render one page of a PDF file to an image
   *
   * The page is rendered with antialiasing at the given resolution. Pixel
   * thresholds used for title extraction assume 300 DPI.
   *
   * @param path Path to the PDF file
   * @param pageIndex 0-indexed page to render (default: first page)
   * @param dpi Resolution for rendering (default: 300 DPI)
   * @return PDFPageImageResult containing the rendered page
   */
  static PDFPageImageResult renderPage(const std::string &path,
                                       int pageIndex = 0, double dpi = 300.0);
};

} // namespace pdfdeck

#endif // PDFDECK_PDF_DOCUMENT_HPP
