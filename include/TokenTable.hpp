#ifndef PDFDECK_TOKEN_TABLE_HPP
#define PDFDECK_TOKEN_TABLE_HPP

#include "Token.hpp"

#include <istream>
#include <string>

namespace pdfdeck {

/**
 * @brief Result of converting an OCR token table into Token records
 */
struct TokenTableResult {
  bool success = false;      ///< Whether the table could be read
  std::string errorMessage;  ///< Error message if failed
  TokenStream tokens;        ///< Word tokens in table order
  int skippedRows = 0;       ///< Malformed rows that were ignored
  int lineCount = 0;         ///< Distinct lines seen in the table
};

/**
 * @brief Parse Tesseract's TSV output into tokens
 *
 * Expects the header row "level page_num block_num par_num line_num
 * word_num left top width height conf text". Only word rows (level 5)
 * become tokens. Tesseract restarts line_num in every block, so each
 * (page, block, paragraph, line) tuple is mapped to its own lineIndex in
 * order of first appearance.
 *
 * @param input Stream positioned at the header row
 * @return TokenTableResult with the parsed tokens
 */
TokenTableResult parseTesseractTsv(std::istream &input);

/**
 * @brief Load a Tesseract TSV file and parse it
 * @param path Path to a .tsv file written by tesseract
 * @return TokenTableResult with the parsed tokens
 */
TokenTableResult loadTesseractTsv(const std::string &path);

} // namespace pdfdeck

#endif // PDFDECK_TOKEN_TABLE_HPP
