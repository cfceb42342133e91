#ifndef PDFDECK_TOKEN_HPP
#define PDFDECK_TOKEN_HPP

#include <string>
#include <vector>

namespace pdfdeck {

/**
 * @brief One OCR-recognized word on a rasterized page
 *
 * Coordinates are in pixels with the origin at the top-left corner of the
 * page image. The box height doubles as a font size estimate.
 */
struct Token {
  std::string text;       ///< Recognized text (may be empty or whitespace)
  float confidence = 0.0f; ///< OCR confidence (0-100)
  int lineIndex = 0;      ///< Engine-assigned line grouping
  int top = 0;            ///< Top edge in pixels
  int left = 0;           ///< Left edge in pixels
  int width = 0;          ///< Box width in pixels
  int height = 0;         ///< Box height in pixels
};

using TokenStream = std::vector<Token>;

/**
 * @brief A visual text line rebuilt from tokens sharing a line index
 */
struct Line {
  std::string text;        ///< Token texts joined by single spaces
  double fontSize = 0.0;   ///< Largest token height in the line
  double top = 0.0;        ///< Smallest token top
  double left = 0.0;       ///< Smallest token left
  double width = 0.0;      ///< Rightmost token edge minus left
  double confidence = 0.0; ///< Mean token confidence
  int lineIndex = 0;       ///< Line index shared by all tokens of the line
  int tokenCount = 0;      ///< Number of tokens that contributed text
};

/**
 * @brief A run of adjacent, similarly sized lines judged to form one title
 */
struct TitleCandidateGroup {
  std::vector<Line> lines; ///< Member lines, top to bottom
  double fontSize = 0.0;   ///< Mean font size of the member lines
  double top = 0.0;        ///< Top of the first line
  double bottom = 0.0;     ///< Bottom (top + font size) of the last line
};

} // namespace pdfdeck

#endif // PDFDECK_TOKEN_HPP
