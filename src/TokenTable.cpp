#include "TokenTable.hpp"

#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <tuple>
#include <vector>

namespace pdfdeck {

namespace {

const int kWordLevel = 5;
const size_t kMinColumns = 11;

const char *const kExpectedHeader[] = {
    "level", "page_num", "block_num", "par_num", "line_num", "word_num",
    "left",  "top",      "width",     "height",  "conf",     "text"};

std::vector<std::string> splitTabs(const std::string &row) {
  std::vector<std::string> fields;
  std::string field;
  std::istringstream stream(row);
  while (std::getline(stream, field, '\t')) {
    fields.push_back(field);
  }
  // getline drops an empty trailing field
  if (!row.empty() && row.back() == '\t') {
    fields.emplace_back();
  }
  return fields;
}

int toInt(const std::string &field) {
  size_t consumed = 0;
  int value = std::stoi(field, &consumed);
  if (consumed != field.size()) {
    throw std::invalid_argument("trailing characters in \"" + field + "\"");
  }
  return value;
}

float toFloat(const std::string &field) {
  size_t consumed = 0;
  float value = std::stof(field, &consumed);
  if (consumed != field.size()) {
    throw std::invalid_argument("trailing characters in \"" + field + "\"");
  }
  return value;
}

bool isExpectedHeader(const std::vector<std::string> &fields) {
  if (fields.size() < kMinColumns) {
    return false;
  }
  for (size_t i = 0; i < fields.size() && i < 12; ++i) {
    if (fields[i] != kExpectedHeader[i]) {
      return false;
    }
  }
  return true;
}

} // namespace

TokenTableResult parseTesseractTsv(std::istream &input) {
  TokenTableResult result;

  std::string row;
  bool haveHeader = false;

  // (page, block, paragraph, line) -> lineIndex
  std::map<std::tuple<int, int, int, int>, int> lineIndices;

  while (std::getline(input, row)) {
    if (!row.empty() && row.back() == '\r') {
      row.pop_back();
    }
    if (row.empty()) {
      continue;
    }

    std::vector<std::string> fields = splitTabs(row);

    if (!haveHeader) {
      if (!isExpectedHeader(fields)) {
        result.errorMessage = "Not a Tesseract TSV table: unexpected header \"" +
                              row.substr(0, 60) + "\"";
        return result;
      }
      haveHeader = true;
      continue;
    }

    if (fields.size() < kMinColumns) {
      result.skippedRows++;
      continue;
    }

    try {
      int level = toInt(fields[0]);
      if (level != kWordLevel) {
        continue;
      }

      auto key = std::make_tuple(toInt(fields[1]), toInt(fields[2]),
                                 toInt(fields[3]), toInt(fields[4]));

      Token token;
      token.left = toInt(fields[6]);
      token.top = toInt(fields[7]);
      token.width = toInt(fields[8]);
      token.height = toInt(fields[9]);
      token.confidence = toFloat(fields[10]);

      for (size_t i = 11; i < fields.size(); ++i) {
        if (i > 11) {
          token.text += ' ';
        }
        token.text += fields[i];
      }

      auto found = lineIndices.find(key);
      if (found == lineIndices.end()) {
        found = lineIndices
                    .emplace(key, static_cast<int>(lineIndices.size()))
                    .first;
      }
      token.lineIndex = found->second;

      result.tokens.push_back(token);
    } catch (const std::logic_error &) {
      // invalid_argument or out_of_range from a numeric column
      result.skippedRows++;
    }
  }

  if (!haveHeader) {
    result.errorMessage = "Token table is empty";
    return result;
  }

  result.lineCount = static_cast<int>(lineIndices.size());
  result.success = true;
  return result;
}

TokenTableResult loadTesseractTsv(const std::string &path) {
  std::ifstream file(path);
  if (!file) {
    TokenTableResult result;
    result.errorMessage = "Failed to open token table: " + path;
    return result;
  }
  return parseTesseractTsv(file);
}

} // namespace pdfdeck
