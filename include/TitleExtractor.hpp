#ifndef PDFDECK_TITLE_EXTRACTOR_HPP
#define PDFDECK_TITLE_EXTRACTOR_HPP

#include "Token.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace re2 {
class RE2;
}

namespace pdfdeck {

/**
 * @brief Default case-insensitive boilerplate patterns (RE2 syntax)
 *
 * Vendor usage-policy notices, copyright and confidentiality stamps,
 * "Page N" headers/footers and lines made only of digits.
 */
std::vector<std::string> defaultBoilerplatePatterns();

/**
 * @brief Default presentation-type markers ("workshop", "webinar", ...)
 */
std::vector<std::string> defaultPresentationMarkers();

/**
 * @brief Tunable thresholds for title extraction
 *
 * Pixel values are calibrated for a 300 DPI rasterization. Use
 * scaledForDpi() when pages are rendered at another resolution.
 */
struct TitleExtractorConfig {
  double headerBandHeight = 300.0; ///< Height of the header band in pixels
  double titleSizeRatio = 0.8;     ///< Fraction of the band's max font size
  double maxLineGap = 30.0;        ///< Max gap between wrapped title lines
  double fontSizeTolerance = 5.0;  ///< Max font size delta inside a group
  int markerScanLimit = 5;         ///< Largest lines scanned for a marker
  double minCandidateConfidence = 0.0; ///< Min line confidence (0 = off)
  double minCandidateFontSize = 0.0;   ///< Min line font size (0 = off)
  double referenceDpi = 300.0;     ///< DPI the pixel values are tuned for
  std::vector<std::string> boilerplatePatterns =
      defaultBoilerplatePatterns(); ///< Lines matching these are ignored
  std::vector<std::string> presentationMarkers =
      defaultPresentationMarkers(); ///< Words that open "<marker>:" titles
  bool verbose = false;             ///< Trace each stage on stderr

  /**
   * @brief Copy of this config with pixel thresholds scaled to a DPI
   * @param dpi Resolution the page was rasterized at
   * @return Scaled configuration (unchanged if dpi is not positive)
   */
  TitleExtractorConfig scaledForDpi(double dpi) const;
};

/**
 * @brief Which stage of the pipeline produced a title
 */
enum class TitleSource {
  None,               ///< No title could be found
  TitleGroup,         ///< Best group of prominent header-band lines
  PresentationMarker, ///< Largest line carrying a "<marker>:" prefix
  LargestLine,        ///< Largest-font, topmost non-boilerplate line
  RawLine             ///< First raw line, boilerplate included
};

/**
 * @brief Human-readable name of a title source
 */
const char *toString(TitleSource source);

/**
 * @brief Result of title extraction with diagnostics
 */
struct TitleResult {
  bool found = false;          ///< Whether a title was produced
  std::string title;           ///< Trimmed title text
  TitleSource source = TitleSource::None; ///< Stage that produced the title
  TitleCandidateGroup group;   ///< Chosen group (TitleGroup source only)
  int lineCount = 0;           ///< Lines rebuilt from the token stream
  int survivingLineCount = 0;  ///< Lines left after boilerplate filtering
  double processingTimeMs = 0; ///< Processing time in milliseconds
  std::string errorMessage;    ///< Set when an internal error was caught
};

/**
 * @brief Infers a document title from the OCR tokens of its first page
 *
 * The pipeline rebuilds lines from the token stream, drops boilerplate,
 * groups prominent lines near the top of the page and assembles the
 * largest group into one string. When that yields nothing a fallback
 * ladder picks a presentation-marker line, then the largest line, then the
 * first raw line.
 *
 * Extraction never throws and holds no mutable state, so one instance can
 * be shared between threads. Patterns are compiled with RE2 and match in
 * time linear in the line length.
 *
 * Example usage:
 * @code
 * pdfdeck::TitleExtractor extractor;
 * auto title = extractor.extractTitle(tokens);
 * std::string name = title ? *title : pdfdeck::fileStem(pdfPath);
 * @endcode
 */
class TitleExtractor {
public:
  TitleExtractor();

  /**
   * @brief Constructor with custom configuration
   * @param config Thresholds and pattern sets
   */
  explicit TitleExtractor(const TitleExtractorConfig &config);

  /**
   * @brief Extract the title from one page's token stream
   * @param tokens OCR tokens in engine order
   * @return Title text, or std::nullopt if the page has no usable text
   */
  std::optional<std::string> extractTitle(const TokenStream &tokens) const;

  /**
   * @brief Extract the title and report how it was found
   * @param tokens OCR tokens in engine order
   * @return TitleResult with the title, its source and diagnostics
   */
  TitleResult analyzeTokens(const TokenStream &tokens) const;

  /**
   * @brief Fold a token stream into lines at each line index change
   *
   * Blank tokens are skipped. Font size, top, left, width and confidence are
   * computed from exactly the tokens that contributed text to each line.
   * Lines keep stream order.
   *
   * @param tokens OCR tokens in engine order
   * @return Reconstructed lines
   */
  static std::vector<Line> buildLines(const TokenStream &tokens);

  /**
   * @brief Check a line of text against the boilerplate patterns
   */
  bool isBoilerplate(const std::string &text) const;

  /**
   * @brief Remove boilerplate lines, keeping the order of the rest
   */
  std::vector<Line> filterBoilerplate(const std::vector<Line> &lines) const;

  /**
   * @brief Stable sort of lines by their top edge
   */
  static std::vector<Line> sortByTop(std::vector<Line> lines);

  /**
   * @brief Lines within headerBandHeight of the topmost line
   * @param sortedLines Lines sorted by top
   */
  std::vector<Line> headerBand(const std::vector<Line> &sortedLines) const;

  /**
   * @brief Select prominent header-band lines and merge adjacent ones
   *
   * A line is a candidate when its font size reaches titleSizeRatio of the
   * largest font in the band. Consecutive candidates join one group when the
   * gap below the previous line is under maxLineGap and their font sizes
   * differ by less than fontSizeTolerance.
   *
   * @param sortedLines Surviving lines sorted by top
   * @return Groups in top-to-bottom order (may be empty)
   */
  std::vector<TitleCandidateGroup>
  groupTitleCandidates(const std::vector<Line> &sortedLines) const;

  /**
   * @brief Group with the largest mean font size (topmost on ties)
   * @param groups Non-empty list of groups
   */
  static const TitleCandidateGroup &
  selectTitleGroup(const std::vector<TitleCandidateGroup> &groups);

  /**
   * @brief Join a group's lines top to bottom with single spaces
   */
  std::string assembleTitle(const TitleCandidateGroup &group) const;

  /**
   * @brief Check whether text opens with "<marker>:"
   */
  bool hasPresentationMarker(const std::string &text) const;

  /**
   * @brief Get the current configuration
   */
  const TitleExtractorConfig &getConfig() const;

  /**
   * @brief Replace the configuration and recompile its patterns
   */
  void setConfig(const TitleExtractorConfig &config);

private:
  void compilePatterns();

  TitleResult runPipeline(const TokenStream &tokens) const;

  std::optional<std::string>
  scanForMarker(const std::vector<Line> &byProminence) const;

  TitleExtractorConfig m_config; ///< Current configuration
  std::vector<std::shared_ptr<const re2::RE2>>
      m_boilerplate; ///< Compiled boilerplate patterns
  std::shared_ptr<const re2::RE2>
      m_markerPattern; ///< Compiled "<marker>:" prefix (null = no markers)
};

} // namespace pdfdeck

#endif // PDFDECK_TITLE_EXTRACTOR_HPP
