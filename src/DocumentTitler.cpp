#include "DocumentTitler.hpp"

#include "FileNaming.hpp"
#include "PDFDocument.hpp"

#include <chrono>
#include <iostream>

namespace pdfdeck {

namespace {

const char *const kUntitled = "Untitled";

} // namespace

DocumentTitler::DocumentTitler() : DocumentTitler(DocumentTitlerConfig()) {}

DocumentTitler::DocumentTitler(const DocumentTitlerConfig &config)
    : m_config(config),
      m_extractor(config.extractor.scaledForDpi(config.dpi)),
      m_ocr(config.ocr) {}

bool DocumentTitler::ensureOcr(std::string &errorMessage) {
  if (m_ocr.isInitialized()) {
    return true;
  }
  if (!m_ocr.initialize()) {
    errorMessage = "OCR engine could not be initialized (language \"" +
                   m_config.ocr.language + "\")";
    return false;
  }
  return true;
}

void DocumentTitler::applyTitle(DocumentTitleResult &result,
                                const TitleResult &title) const {
  result.source = title.source;

  if (title.found) {
    result.title = title.title;
    result.deckFileName = deckFileName(result.title, m_config.deckExtension,
                                       m_config.maxFileNameLength);
  }

  // No title, or one made only of characters a file name cannot carry
  if (result.deckFileName.empty()) {
    result.usedFileNameFallback = true;
    result.title = fileStem(result.sourcePath);
    result.deckFileName = deckFileName(result.title, m_config.deckExtension,
                                       m_config.maxFileNameLength);
  }

  if (result.deckFileName.empty()) {
    result.title = kUntitled;
    result.deckFileName = std::string(kUntitled) + m_config.deckExtension;
  }

  result.success = true;

  if (m_config.verbose) {
    std::cerr << "DEBUG: " << result.sourcePath << " -> \"" << result.title
              << "\" (" << toString(result.source)
              << (result.usedFileNameFallback ? ", file name fallback" : "")
              << ")" << std::endl;
  }
}

DocumentTitleResult
DocumentTitler::titleForTokens(const TokenStream &tokens,
                               const std::string &sourcePath) const {
  auto startTime = std::chrono::high_resolution_clock::now();

  DocumentTitleResult result;
  result.sourcePath = sourcePath;
  result.tokenCount = static_cast<int>(tokens.size());

  applyTitle(result, m_extractor.analyzeTokens(tokens));

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

DocumentTitleResult DocumentTitler::titleForPdf(const std::string &pdfPath) {
  auto startTime = std::chrono::high_resolution_clock::now();

  DocumentTitleResult result;
  result.sourcePath = pdfPath;

  auto finish = [&]() {
    auto endTime = std::chrono::high_resolution_clock::now();
    result.processingTimeMs =
        std::chrono::duration<double, std::milli>(endTime - startTime).count();
    return result;
  };

  if (!PDFDocument::hasPdfSignature(pdfPath)) {
    result.errorMessage = "Not a PDF file: " + pdfPath;
    return finish();
  }

  PDFPageImageResult page = PDFDocument::renderPage(pdfPath, 0, m_config.dpi);
  result.pageCount = page.pageCount;

  if (!page.success) {
    // A document that cannot be opened at all has nothing to convert
    if (page.pageCount < 1) {
      result.errorMessage = page.errorMessage;
      return finish();
    }
    result.ocrError = page.errorMessage;
    applyTitle(result, TitleResult());
    return finish();
  }

  std::string ocrError;
  if (!ensureOcr(ocrError)) {
    result.ocrError = ocrError;
    applyTitle(result, TitleResult());
    return finish();
  }

  OCRTokensResult ocr = m_ocr.recognizeTokens(page.image);
  if (!ocr.success) {
    result.ocrError = ocr.errorMessage;
    applyTitle(result, TitleResult());
    return finish();
  }

  result.tokenCount = static_cast<int>(ocr.tokens.size());
  applyTitle(result, m_extractor.analyzeTokens(ocr.tokens));
  return finish();
}

std::vector<DocumentTitleResult>
DocumentTitler::titleForPdfs(const std::vector<std::string> &pdfPaths) {
  std::vector<DocumentTitleResult> results;
  results.reserve(pdfPaths.size());

  for (const auto &path : pdfPaths) {
    try {
      results.push_back(titleForPdf(path));
    } catch (const std::exception &e) {
      DocumentTitleResult failed;
      failed.sourcePath = path;
      failed.errorMessage = std::string("Error processing document: ") +
                            e.what();
      std::cerr << "Error processing " << path << ": " << e.what()
                << std::endl;
      results.push_back(failed);
    }
  }

  return results;
}

const DocumentTitlerConfig &DocumentTitler::getConfig() const {
  return m_config;
}

} // namespace pdfdeck
