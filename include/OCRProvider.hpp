#ifndef PDFDECK_OCR_PROVIDER_HPP
#define PDFDECK_OCR_PROVIDER_HPP

#include "Token.hpp"

#include <opencv2/opencv.hpp>
#include <tesseract/baseapi.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pdfdeck {

/**
 * @brief Configuration options for OCR processing
 */
struct OCRProviderConfig {
  std::string language = "eng"; ///< Language code (e.g., "eng", "deu+eng")
  tesseract::PageSegMode pageSegMode =
      tesseract::PSM_AUTO;       ///< Page segmentation mode
  bool preprocessImage = false;  ///< Apply grayscale + adaptive threshold
  bool detectOrientation = true; ///< Try all four rotations, keep the best
  std::string tessDataPath =
      "";                        ///< Path to tessdata directory (empty = env)
  bool verbose = false;          ///< Trace recognition on stderr
};

/**
 * @brief Parse a Tesseract page segmentation mode number
 * @param value Decimal mode number, as given on the command line
 * @return Mode, or std::nullopt if value is not a number in [0, PSM_COUNT)
 */
std::optional<tesseract::PageSegMode>
pageSegModeFromString(const std::string &value);

/**
 * @brief Result of recognizing the words on one page
 */
struct OCRTokensResult {
  bool success = false;        ///< Whether OCR was successful
  std::string errorMessage;    ///< Error message if failed
  TokenStream tokens;          ///< Word tokens in engine order
  int lineCount = 0;           ///< Text lines reported by the engine
  int rotationCode = -1;       ///< Applied rotation (-1 = none)
  double processingTimeMs = 0; ///< Processing time in milliseconds
};

/**
 * @brief Word-level OCR of page images using Tesseract
 *
 * Produces the token stream consumed by TitleExtractor: one Token per
 * recognized word with its box, confidence and a line index that grows by
 * one at every new text line.
 *
 * Example usage:
 * @code
 * pdfdeck::OCRProvider provider;
 * if (provider.initialize()) {
 *     auto ocr = provider.recognizeTokens(pageImage);
 *     if (ocr.success) {
 *         auto title = extractor.extractTitle(ocr.tokens);
 *     }
 * }
 * @endcode
 */
class OCRProvider {
public:
  OCRProvider();

  /**
   * @brief Constructor with custom configuration
   * @param config OCR configuration options
   */
  explicit OCRProvider(const OCRProviderConfig &config);

  ~OCRProvider();

  // Tesseract API is not copyable
  OCRProvider(const OCRProvider &) = delete;
  OCRProvider &operator=(const OCRProvider &) = delete;

  OCRProvider(OCRProvider &&other) noexcept;
  OCRProvider &operator=(OCRProvider &&other) noexcept;

  /**
   * @brief Initialize the OCR engine
   *
   * The tessdata directory comes from the config, then the TESSDATA_PREFIX
   * environment variable, then Tesseract's compiled-in default.
   *
   * @return true if initialization was successful, false otherwise
   */
  bool initialize();

  /**
   * @brief Check if the OCR engine is initialized
   */
  bool isInitialized() const;

  /**
   * @brief Recognize the words of an image file
   * @param imagePath Path to the image file
   * @return OCRTokensResult with one token per word
   */
  OCRTokensResult recognizeTokens(const std::string &imagePath);

  /**
   * @brief Recognize the words of a page image
   * @param image Page image (gray, BGR or BGRA)
   * @return OCRTokensResult with one token per word
   */
  OCRTokensResult recognizeTokens(const cv::Mat &image);

  /**
   * @brief Set the OCR language (re-initializes if needed)
   * @param language Language code (e.g., "eng", "deu+eng" for multiple)
   * @return true if language was set successfully
   */
  bool setLanguage(const std::string &language);

  /**
   * @brief Set the page segmentation mode
   */
  void setPageSegMode(tesseract::PageSegMode mode);

  const OCRProviderConfig &getConfig() const;

  /**
   * @brief Set a new configuration (requires re-initialization)
   */
  void setConfig(const OCRProviderConfig &config);

  /**
   * @brief Get the Tesseract version string
   */
  static std::string getTesseractVersion();

  /**
   * @brief Get available languages
   * @return Vector of available language codes
   */
  std::vector<std::string> getAvailableLanguages() const;

private:
  /**
   * @brief Grayscale, denoise and binarize an image for OCR
   */
  cv::Mat preprocessImage(const cv::Mat &image);

  /**
   * @brief Hand an OpenCV image to Tesseract as RGB
   */
  void setImage(const cv::Mat &image);

  /**
   * @brief Find the best rotation for an image by trying all 4 orientations
   * @return Rotation code (-1 = no rotation, or cv::ROTATE_* constant)
   */
  int findBestRotation(const cv::Mat &image);

  std::unique_ptr<tesseract::TessBaseAPI>
      m_tesseract;           ///< Tesseract API instance
  OCRProviderConfig m_config; ///< Current configuration
  bool m_initialized;        ///< Initialization state
};

} // namespace pdfdeck

#endif // PDFDECK_OCR_PROVIDER_HPP
