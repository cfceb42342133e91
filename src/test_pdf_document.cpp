#include "DocumentTitler.hpp"
#include "PDFDocument.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

int failures = 0;

void check(bool condition, const std::string &description) {
  if (condition) {
    std::cout << "  ✓ " << description << "\n";
  } else {
    std::cerr << "  ✗ " << description << "\n";
    failures++;
  }
}

/**
 * @brief Build a PDF with blank US Letter pages and a correct xref table
 */
std::string blankPdf(int pageCount) {
  std::vector<std::string> objects;
  objects.push_back("<< /Type /Catalog /Pages 2 0 R >>");

  std::string kids;
  for (int i = 0; i < pageCount; ++i) {
    kids += std::to_string(3 + i) + " 0 R ";
  }
  objects.push_back("<< /Type /Pages /Kids [" + kids +
                    "] /Count " + std::to_string(pageCount) + " >>");
  for (int i = 0; i < pageCount; ++i) {
    objects.push_back(
        "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] >>");
  }

  std::string pdf = "%PDF-1.4\n";
  std::vector<size_t> offsets;
  for (size_t i = 0; i < objects.size(); ++i) {
    offsets.push_back(pdf.size());
    pdf += std::to_string(i + 1) + " 0 obj\n" + objects[i] + "\nendobj\n";
  }

  size_t xrefOffset = pdf.size();
  pdf += "xref\n0 " + std::to_string(objects.size() + 1) + "\n";
  pdf += "0000000000 65535 f \n";
  for (size_t offset : offsets) {
    char entry[32];
    std::snprintf(entry, sizeof(entry), "%010zu 00000 n \n", offset);
    pdf += entry;
  }
  pdf += "trailer\n<< /Size " + std::to_string(objects.size() + 1) +
         " /Root 1 0 R >>\nstartxref\n" + std::to_string(xrefOffset) +
         "\n%%EOF\n";
  return pdf;
}

void writeFile(const std::filesystem::path &path, const std::string &content) {
  std::ofstream file(path, std::ios::binary);
  file << content;
}

void addLine(pdfdeck::TokenStream &tokens, const std::string &text,
             int lineIndex, int top, int height) {
  std::istringstream words(text);
  std::string word;
  int left = 50;
  while (words >> word) {
    pdfdeck::Token token;
    token.text = word;
    token.confidence = 92.0f;
    token.lineIndex = lineIndex;
    token.top = top;
    token.left = left;
    token.width = static_cast<int>(word.size()) * height / 2;
    token.height = height;
    tokens.push_back(token);
    left += token.width + 8;
  }
}

} // namespace

int main() {
  std::cout << "=== PDF Document Test ===\n\n";

  std::filesystem::path dir =
      std::filesystem::temp_directory_path() / "pdfdeck_test_pdf_document";
  std::filesystem::create_directories(dir);

  const std::filesystem::path twoPages = dir / "Board Update.pdf";
  const std::filesystem::path upperCase = dir / "LEGACY.PDF";
  const std::filesystem::path notPdf = dir / "notes.pdf";
  const std::filesystem::path wrongExtension = dir / "report.txt";
  writeFile(twoPages, blankPdf(2));
  writeFile(upperCase, blankPdf(1));
  writeFile(notPdf, "PK\x03\x04 not really a pdf");
  writeFile(wrongExtension, blankPdf(1));

  std::cout << "PDF signature\n";
  check(pdfdeck::PDFDocument::hasPdfSignature(twoPages.string()),
        "real PDF is recognized");
  check(pdfdeck::PDFDocument::hasPdfSignature(upperCase.string()),
        "extension check ignores case");
  check(!pdfdeck::PDFDocument::hasPdfSignature(notPdf.string()),
        ".pdf name without %PDF magic is rejected");
  check(!pdfdeck::PDFDocument::hasPdfSignature(wrongExtension.string()),
        "%PDF content without .pdf name is rejected");
  check(!pdfdeck::PDFDocument::hasPdfSignature((dir / "missing.pdf").string()),
        "missing file is rejected");

  std::cout << "\nPage count and rendering\n";
  {
    auto info = pdfdeck::PDFDocument::countPages(twoPages.string());
    check(info.success && info.pageCount == 2, "two pages counted");

    auto broken = pdfdeck::PDFDocument::countPages(notPdf.string());
    check(!broken.success && !broken.errorMessage.empty(),
          "unloadable file reports an error");

    auto page = pdfdeck::PDFDocument::renderPage(twoPages.string(), 0, 72.0);
    check(page.success, "first page renders");
    check(page.width >= 611 && page.width <= 613 && page.height >= 791 &&
              page.height <= 793,
          "72 DPI render of US Letter is 612x792 (got " +
              std::to_string(page.width) + "x" + std::to_string(page.height) +
              ")");
    check(page.image.type() == CV_8UC3, "page image is 3-channel BGR");
    check(page.pageNumber == 1 && page.pageCount == 2, "page metadata");

    auto outOfRange =
        pdfdeck::PDFDocument::renderPage(twoPages.string(), 5, 72.0);
    check(!outOfRange.success && outOfRange.pageCount == 2,
          "page index past the end is an error");
  }

  std::cout << "\nDocument titles\n";
  {
    pdfdeck::DocumentTitlerConfig config;
    config.dpi = 72.0;
    config.ocr.detectOrientation = false;
    pdfdeck::DocumentTitler titler(config);
    check(titler.getConfig().dpi == 72.0 &&
              titler.getConfig().deckExtension == ".pptx",
          "titler keeps its configuration");

    // Blank pages carry no text: the file name is used either way
    auto blank = titler.titleForPdf(twoPages.string());
    check(blank.success && blank.usedFileNameFallback,
          "blank first page falls back to the file name");
    check(blank.title == "Board Update" &&
              blank.deckFileName == "Board Update.pptx",
          "deck is named after the file stem");
    check(blank.pageCount == 2, "page count is reported");

    auto rejected = titler.titleForPdf(notPdf.string());
    check(!rejected.success && !rejected.errorMessage.empty(),
          "non-PDF input is reported as a failure");

    auto batch = titler.titleForPdfs(
        {notPdf.string(), upperCase.string(), wrongExtension.string()});
    check(batch.size() == 3 && !batch[0].success && batch[1].success &&
              !batch[2].success,
          "one bad document does not stop the batch");
    check(batch.size() == 3 && batch[1].title == "LEGACY",
          "batch results keep input order");
  }

  std::cout << "\nTitles from token streams\n";
  {
    pdfdeck::DocumentTitlerConfig config;
    config.dpi = 150.0;
    pdfdeck::DocumentTitler titler(config);

    pdfdeck::TokenStream tokens;
    addLine(tokens, "Confidential", 0, 10, 30);
    addLine(tokens, "Network Security:", 1, 40, 18);
    addLine(tokens, "Zero Trust Rollout", 2, 62, 18);
    addLine(tokens, "March 2025 steering committee", 3, 140, 8);

    auto result = titler.titleForTokens(tokens, "/tmp/scan_0042.pdf");
    check(result.success && !result.usedFileNameFallback,
          "token stream yields a title");
    check(result.title == "Network Security: Zero Trust Rollout",
          "extractor thresholds follow the DPI (got \"" + result.title +
              "\")");
    check(result.deckFileName == "Network Security_ Zero Trust Rollout.pptx",
          "deck file name is sanitized");

    auto empty = titler.titleForTokens({}, "/tmp/scan_0042.pdf");
    check(empty.success && empty.usedFileNameFallback &&
              empty.title == "scan_0042",
          "empty token stream falls back to the file stem");

    pdfdeck::TokenStream dots;
    addLine(dots, ". . .", 0, 40, 20);
    auto unusable = titler.titleForTokens(dots, "/tmp/....pdf");
    check(unusable.success && unusable.deckFileName == "Untitled.pptx",
          "no usable title or stem gives an untitled deck");
  }

  std::error_code ignored;
  std::filesystem::remove_all(dir, ignored);

  std::cout << "\n";
  if (failures > 0) {
    std::cerr << failures << " check(s) failed\n";
    return 1;
  }
  std::cout << "=== All PDF document checks passed ===\n";
  return 0;
}
