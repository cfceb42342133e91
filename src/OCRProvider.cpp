#include "OCRProvider.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace pdfdeck {

std::optional<tesseract::PageSegMode>
pageSegModeFromString(const std::string &value) {
  size_t consumed = 0;
  int mode = -1;
  try {
    mode = std::stoi(value, &consumed);
  } catch (const std::logic_error &) {
    return std::nullopt;
  }

  if (consumed != value.size() || mode < 0 || mode >= tesseract::PSM_COUNT) {
    return std::nullopt;
  }
  return static_cast<tesseract::PageSegMode>(mode);
}

OCRProvider::OCRProvider()
    : m_tesseract(std::make_unique<tesseract::TessBaseAPI>()), m_config(),
      m_initialized(false) {}

OCRProvider::OCRProvider(const OCRProviderConfig &config)
    : m_tesseract(std::make_unique<tesseract::TessBaseAPI>()), m_config(config),
      m_initialized(false) {}

OCRProvider::~OCRProvider() {
  if (m_tesseract) {
    m_tesseract->End();
  }
}

OCRProvider::OCRProvider(OCRProvider &&other) noexcept
    : m_tesseract(std::move(other.m_tesseract)),
      m_config(std::move(other.m_config)), m_initialized(other.m_initialized) {
  other.m_initialized = false;
}

OCRProvider &OCRProvider::operator=(OCRProvider &&other) noexcept {
  if (this != &other) {
    if (m_tesseract) {
      m_tesseract->End();
    }
    m_tesseract = std::move(other.m_tesseract);
    m_config = std::move(other.m_config);
    m_initialized = other.m_initialized;
    other.m_initialized = false;
  }
  return *this;
}

bool OCRProvider::initialize() {
  if (m_initialized) {
    return true;
  }

  if (!m_tesseract) {
    m_tesseract = std::make_unique<tesseract::TessBaseAPI>();
  }

  // nullptr lets Tesseract fall back to its compiled-in tessdata location
  const char *tessDataPath = nullptr;

  // Priority 1: Use config path if provided
  if (!m_config.tessDataPath.empty()) {
    tessDataPath = m_config.tessDataPath.c_str();
  }
  // Priority 2: Check TESSDATA_PREFIX environment variable
  else {
    const char *envPath = std::getenv("TESSDATA_PREFIX");
    if (envPath != nullptr) {
      tessDataPath = envPath;
    } else if (m_config.verbose) {
      std::cerr << "DEBUG: TESSDATA_PREFIX not set, using Tesseract default"
                << std::endl;
    }
  }

  int result = m_tesseract->Init(tessDataPath, m_config.language.c_str());

  if (result != 0) {
    std::cerr << "Failed to initialize Tesseract with language: "
              << m_config.language << std::endl;
    return false;
  }

  m_tesseract->SetPageSegMode(m_config.pageSegMode);
  m_initialized = true;
  return true;
}

bool OCRProvider::isInitialized() const { return m_initialized; }

OCRTokensResult OCRProvider::recognizeTokens(const std::string &imagePath) {
  cv::Mat image = cv::imread(imagePath);
  if (image.empty()) {
    OCRTokensResult result;
    result.errorMessage = "Failed to load image: " + imagePath;
    return result;
  }

  return recognizeTokens(image);
}

OCRTokensResult OCRProvider::recognizeTokens(const cv::Mat &image) {
  OCRTokensResult result;

  if (!m_initialized) {
    result.errorMessage =
        "OCR engine not initialized. Call initialize() first.";
    return result;
  }

  if (image.empty()) {
    result.errorMessage = "Input image is empty";
    return result;
  }

  auto startTime = std::chrono::high_resolution_clock::now();

  try {
    cv::Mat processedImage =
        m_config.preprocessImage ? preprocessImage(image) : image;

    if (m_config.detectOrientation) {
      result.rotationCode = findBestRotation(processedImage);
    }

    cv::Mat orientedImage;
    if (result.rotationCode != -1) {
      cv::rotate(processedImage, orientedImage, result.rotationCode);
    } else {
      orientedImage = processedImage;
    }

    setImage(orientedImage);

    // Must call Recognize before GetIterator
    if (m_tesseract->Recognize(nullptr) != 0) {
      result.errorMessage = "Tesseract recognition failed";
      return result;
    }

    std::unique_ptr<tesseract::ResultIterator> ri(m_tesseract->GetIterator());
    const tesseract::PageIteratorLevel level = tesseract::RIL_WORD;
    int lineIndex = -1;

    if (ri) {
      do {
        if (ri->IsAtBeginningOf(tesseract::RIL_TEXTLINE)) {
          lineIndex++;
        }

        std::unique_ptr<char[]> word(ri->GetUTF8Text(level));
        if (!word || *word.get() == '\0') {
          continue;
        }

        int x1 = 0, y1 = 0, x2 = 0, y2 = 0;
        if (!ri->BoundingBox(level, &x1, &y1, &x2, &y2)) {
          continue;
        }

        Token token;
        token.text = word.get();
        token.confidence = ri->Confidence(level);
        token.lineIndex = std::max(lineIndex, 0);
        token.left = x1;
        token.top = y1;
        token.width = x2 - x1;
        token.height = y2 - y1;

        result.tokens.push_back(token);
      } while (ri->Next(level));
    }

    result.lineCount = lineIndex + 1;
    result.success = true;

    if (m_config.verbose) {
      std::cerr << "DEBUG: OCR found " << result.tokens.size()
                << " words on " << result.lineCount << " lines" << std::endl;
    }
  } catch (const std::exception &e) {
    result.errorMessage = std::string("OCR analysis failed: ") + e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

bool OCRProvider::setLanguage(const std::string &language) {
  m_config.language = language;

  if (m_initialized) {
    m_tesseract->End();
    m_initialized = false;
    return initialize();
  }

  return true;
}

void OCRProvider::setPageSegMode(tesseract::PageSegMode mode) {
  m_config.pageSegMode = mode;
  if (m_initialized) {
    m_tesseract->SetPageSegMode(mode);
  }
}

const OCRProviderConfig &OCRProvider::getConfig() const { return m_config; }

void OCRProvider::setConfig(const OCRProviderConfig &config) {
  m_config = config;
  if (m_initialized) {
    m_tesseract->End();
    m_initialized = false;
  }
}

std::string OCRProvider::getTesseractVersion() {
  return tesseract::TessBaseAPI::Version();
}

std::vector<std::string> OCRProvider::getAvailableLanguages() const {
  std::vector<std::string> languages;

  if (m_initialized) {
    m_tesseract->GetAvailableLanguagesAsVector(&languages);
  }

  return languages;
}

cv::Mat OCRProvider::preprocessImage(const cv::Mat &image) {
  cv::Mat processed;

  if (image.channels() == 3) {
    cv::cvtColor(image, processed, cv::COLOR_BGR2GRAY);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, processed, cv::COLOR_BGRA2GRAY);
  } else {
    processed = image.clone();
  }

  cv::GaussianBlur(processed, processed, cv::Size(3, 3), 0);

  cv::adaptiveThreshold(processed, processed, 255,
                        cv::ADAPTIVE_THRESH_GAUSSIAN_C, cv::THRESH_BINARY, 11,
                        2);

  return processed;
}

void OCRProvider::setImage(const cv::Mat &image) {
  cv::Mat rgbImage;

  // Tesseract expects RGB
  if (image.channels() == 1) {
    cv::cvtColor(image, rgbImage, cv::COLOR_GRAY2RGB);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, rgbImage, cv::COLOR_BGRA2RGB);
  } else {
    cv::cvtColor(image, rgbImage, cv::COLOR_BGR2RGB);
  }

  // SetImage copies the pixels, so rgbImage may go out of scope
  m_tesseract->SetImage(rgbImage.data, rgbImage.cols, rgbImage.rows, 3,
                        static_cast<int>(rgbImage.step));
}

int OCRProvider::findBestRotation(const cv::Mat &image) {
  if (!m_initialized || image.empty()) {
    return -1;
  }

  const int rotations[] = {-1, cv::ROTATE_90_CLOCKWISE, cv::ROTATE_180,
                           cv::ROTATE_90_COUNTERCLOCKWISE};

  int bestRotation = -1;
  double bestConfidence = -1.0;

  for (int rotationCode : rotations) {
    cv::Mat testImage;
    if (rotationCode == -1) {
      testImage = image;
    } else {
      cv::rotate(image, testImage, rotationCode);
    }

    setImage(testImage);
    if (m_tesseract->Recognize(nullptr) != 0) {
      continue;
    }

    double totalConfidence = 0.0;
    int wordCount = 0;

    std::unique_ptr<tesseract::ResultIterator> ri(m_tesseract->GetIterator());
    if (ri) {
      const tesseract::PageIteratorLevel level = tesseract::RIL_WORD;
      do {
        std::unique_ptr<char[]> word(ri->GetUTF8Text(level));
        if (word && *word.get() != '\0') {
          totalConfidence += ri->Confidence(level);
          wordCount++;
        }
      } while (ri->Next(level));
    }

    double avgConfidence =
        (wordCount > 0) ? (totalConfidence / wordCount) : 0.0;

    if (m_config.verbose) {
      std::cerr << "DEBUG: rotation " << rotationCode << ": " << wordCount
                << " words, mean confidence " << avgConfidence << std::endl;
    }

    if (wordCount >= 1 && avgConfidence > bestConfidence) {
      bestConfidence = avgConfidence;
      bestRotation = rotationCode;
    }
  }

  return bestRotation;
}

} // namespace pdfdeck
