#include "DocumentTitler.hpp"
#include "TokenTable.hpp"

#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " <input>... [options]\n"
      << "\nInfers a slide deck title from the first page of each PDF.\n"
      << "\nOptions:\n"
      << "  -l, --language <lang>   Set OCR language (default: eng)\n"
      << "  -d, --dpi <val>         Rasterization DPI (default: 300)\n"
      << "  -t, --tessdata <dir>    Tesseract tessdata directory\n"
      << "      --psm <mode>        Tesseract page segmentation mode (0-13)\n"
      << "      --preprocess        Binarize pages before OCR (scans)\n"
      << "      --band <px>         Header band height at 300 DPI\n"
      << "      --gap <px>          Max gap between title lines at 300 DPI\n"
      << "      --tsv               Inputs are Tesseract TSV token tables\n"
      << "      --list-langs        List installed OCR languages and exit\n"
      << "  -v, --verbose           Trace every stage on stderr\n"
      << "  -h, --help              Show this help message\n"
      << "\nExamples:\n"
      << "  " << programName << " report.pdf\n"
      << "  " << programName << " a.pdf b.pdf -l eng+deu --dpi 200\n"
      << "  " << programName << " page1.tsv --tsv\n";
}

namespace {

double parseNumber(const std::string &option, const std::string &value) {
  const std::string message =
      option + " expects a positive number, got \"" + value + "\"";

  size_t consumed = 0;
  double number = 0.0;
  try {
    number = std::stod(value, &consumed);
  } catch (const std::logic_error &) {
    throw std::invalid_argument(message);
  }

  if (consumed != value.size() || number <= 0) {
    throw std::invalid_argument(message);
  }
  return number;
}

void printResult(const pdfdeck::DocumentTitleResult &result) {
  std::cout << result.sourcePath << "\n";

  if (!result.success) {
    std::cout << "  Error:   " << result.errorMessage << "\n";
    return;
  }

  std::cout << "  Title:   " << result.title << "\n";
  std::cout << "  Source:  "
            << (result.usedFileNameFallback
                    ? std::string("file name")
                    : std::string(pdfdeck::toString(result.source)))
            << "\n";
  if (result.pageCount > 0) {
    std::cout << "  Pages:   " << result.pageCount << "\n";
  }
  if (!result.ocrError.empty()) {
    std::cout << "  OCR:     " << result.ocrError << "\n";
  }
  std::cout << "  Deck:    " << result.deckFileName << "\n";
  std::cout << "  Time:    " << std::fixed << std::setprecision(2)
            << result.processingTimeMs << " ms\n";
}

} // namespace

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  std::vector<std::string> inputs;
  pdfdeck::DocumentTitlerConfig config;
  bool tsvInput = false;
  bool listLanguages = false;

  // Parse command line arguments
  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      auto requireValue = [&]() -> std::string {
        if (i + 1 >= argc) {
          throw std::invalid_argument(arg + " requires an argument");
        }
        return argv[++i];
      };

      if (arg == "-h" || arg == "--help") {
        printUsage(argv[0]);
        return 0;
      } else if (arg == "-l" || arg == "--language") {
        config.ocr.language = requireValue();
      } else if (arg == "-d" || arg == "--dpi") {
        config.dpi = parseNumber(arg, requireValue());
      } else if (arg == "-t" || arg == "--tessdata") {
        config.ocr.tessDataPath = requireValue();
      } else if (arg == "--psm") {
        std::string value = requireValue();
        auto mode = pdfdeck::pageSegModeFromString(value);
        if (!mode) {
          throw std::invalid_argument(
              "--psm expects a mode from 0 to " +
              std::to_string(tesseract::PSM_COUNT - 1) + ", got \"" + value +
              "\"");
        }
        config.ocr.pageSegMode = *mode;
      } else if (arg == "--preprocess") {
        config.ocr.preprocessImage = true;
      } else if (arg == "--list-langs") {
        listLanguages = true;
      } else if (arg == "--band") {
        config.extractor.headerBandHeight = parseNumber(arg, requireValue());
      } else if (arg == "--gap") {
        config.extractor.maxLineGap = parseNumber(arg, requireValue());
      } else if (arg == "--tsv") {
        tsvInput = true;
      } else if (arg == "-v" || arg == "--verbose") {
        config.verbose = true;
        config.ocr.verbose = true;
        config.extractor.verbose = true;
      } else if (!arg.empty() && arg[0] != '-') {
        inputs.push_back(arg);
      } else {
        std::cerr << "Unknown option: " << arg << "\n";
        printUsage(argv[0]);
        return 1;
      }
    }
  } catch (const std::logic_error &e) {
    std::cerr << "Error: " << e.what() << "\n";
    printUsage(argv[0]);
    return 1;
  }

  if (listLanguages) {
    pdfdeck::OCRProvider provider(config.ocr);
    if (!provider.initialize()) {
      std::cerr << "Error: Tesseract could not be initialized\n";
      return 1;
    }
    for (const auto &language : provider.getAvailableLanguages()) {
      std::cout << language << "\n";
    }
    return 0;
  }

  if (inputs.empty()) {
    std::cerr << "Error: No input files provided\n";
    printUsage(argv[0]);
    return 1;
  }

  pdfdeck::DocumentTitler titler(config);
  int failures = 0;

  if (tsvInput) {
    for (const auto &path : inputs) {
      pdfdeck::TokenTableResult table = pdfdeck::loadTesseractTsv(path);
      pdfdeck::DocumentTitleResult result;
      if (table.success) {
        if (table.skippedRows > 0) {
          std::cerr << "Warning: skipped " << table.skippedRows
                    << " malformed rows in " << path << "\n";
        }
        result = titler.titleForTokens(table.tokens, path);
      } else {
        result.sourcePath = path;
        result.errorMessage = table.errorMessage;
      }
      printResult(result);
      if (!result.success) {
        failures++;
      }
    }
  } else {
    std::cout << "=== PDF Deck Titles ===\n"
              << "Tesseract version: "
              << pdfdeck::OCRProvider::getTesseractVersion() << "\n"
              << "OpenCV version: " << CV_VERSION << "\n"
              << "Language: " << titler.getConfig().ocr.language << "\n"
              << "DPI: " << titler.getConfig().dpi << "\n"
              << "Preprocessing: "
              << (titler.getConfig().ocr.preprocessImage ? "on" : "off")
              << "\n"
              << "=======================\n\n";

    for (const auto &result : titler.titleForPdfs(inputs)) {
      printResult(result);
      if (!result.success) {
        failures++;
      }
    }
  }

  if (failures > 0) {
    std::cerr << failures << " of " << inputs.size()
              << " inputs could not be named\n";
    return 1;
  }

  return 0;
}
