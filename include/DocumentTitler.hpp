#ifndef PDFDECK_DOCUMENT_TITLER_HPP
#define PDFDECK_DOCUMENT_TITLER_HPP

#include "OCRProvider.hpp"
#include "TitleExtractor.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace pdfdeck {

/**
 * @brief Configuration for naming a deck after its source document
 */
struct DocumentTitlerConfig {
  double dpi = 300.0;                ///< Rasterization resolution for OCR
  OCRProviderConfig ocr;             ///< OCR engine options
  TitleExtractorConfig extractor;    ///< Thresholds at referenceDpi
  std::string deckExtension = ".pptx"; ///< Extension of the deck file
  std::size_t maxFileNameLength = 120; ///< Max bytes in the name part
  bool verbose = false;              ///< Trace each document on stderr
};

/**
 * @brief Title and deck file name chosen for one document
 */
struct DocumentTitleResult {
  bool success = false;       ///< Whether a usable name was produced
  std::string errorMessage;   ///< Error message if failed
  std::string sourcePath;     ///< Input document
  std::string title;          ///< Extracted title or filename fallback
  std::string deckFileName;   ///< Sanitized "<title><extension>"
  TitleSource source = TitleSource::None; ///< Stage that produced the title
  bool usedFileNameFallback = false; ///< Title came from the file name
  std::string ocrError;       ///< OCR/render failure that forced a fallback
  int pageCount = 0;          ///< Pages in the document (PDF input only)
  int tokenCount = 0;         ///< OCR tokens on the first page
  double processingTimeMs = 0; ///< Processing time in milliseconds
};

/**
 * @brief Names slide decks after the titles of their source PDFs
 *
 * Renders the first page, runs OCR, extracts the title and falls back to
 * the source file name when no title is found. The OCR engine is created
 * lazily and reused across documents, so one DocumentTitler must not be
 * shared between threads; use one instance per worker instead.
 */
class DocumentTitler {
public:
  DocumentTitler();

  /**
   * @brief Constructor with custom configuration
   */
  explicit DocumentTitler(const DocumentTitlerConfig &config);

  DocumentTitler(const DocumentTitler &) = delete;
  DocumentTitler &operator=(const DocumentTitler &) = delete;

  /**
   * @brief Choose the title and deck file name for a PDF file
   *
   * Non-PDF input and unreadable documents are reported as failures. OCR
   * problems on a readable PDF are not: the file name is used instead and
   * the reason is kept in ocrError.
   *
   * @param pdfPath Path to the PDF file
   * @return DocumentTitleResult for the document
   */
  DocumentTitleResult titleForPdf(const std::string &pdfPath);

  /**
   * @brief Choose the title and deck file name for an OCR token stream
   * @param tokens First-page tokens, rasterized at config().dpi
   * @param sourcePath Document the tokens came from (for the fallback)
   * @return DocumentTitleResult for the document
   */
  DocumentTitleResult titleForTokens(const TokenStream &tokens,
                                     const std::string &sourcePath) const;

  /**
   * @brief Name several PDFs; a failure on one never stops the others
   * @param pdfPaths Paths to PDF files
   * @return One result per input, in input order
   */
  std::vector<DocumentTitleResult>
  titleForPdfs(const std::vector<std::string> &pdfPaths);

  const DocumentTitlerConfig &getConfig() const;

private:
  void applyTitle(DocumentTitleResult &result, const TitleResult &title) const;

  bool ensureOcr(std::string &errorMessage);

  DocumentTitlerConfig m_config; ///< Current configuration
  TitleExtractor m_extractor;    ///< Extractor scaled to m_config.dpi
  OCRProvider m_ocr;             ///< OCR engine, initialized on first use
};

} // namespace pdfdeck

#endif // PDFDECK_DOCUMENT_TITLER_HPP
