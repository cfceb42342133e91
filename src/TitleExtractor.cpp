#include "TitleExtractor.hpp"

#include <re2/re2.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <utility>

namespace pdfdeck {

namespace {

const char *const kWhitespace = " \t\n\r\f\v";

std::string trim(const std::string &text) {
  size_t start = text.find_first_not_of(kWhitespace);
  if (start == std::string::npos) {
    return "";
  }
  size_t end = text.find_last_not_of(kWhitespace);
  return text.substr(start, end - start + 1);
}

// Token text with control whitespace flattened to spaces, then trimmed
std::string cleanTokenText(const std::string &raw) {
  std::string text = raw;
  std::replace_if(
      text.begin(), text.end(),
      [](char c) {
        return c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
      },
      ' ');
  return trim(text);
}

double lineBottom(const Line &line) { return line.top + line.fontSize; }

std::shared_ptr<const re2::RE2> compileCaseless(const std::string &pattern) {
  re2::RE2::Options options;
  options.set_case_sensitive(false);
  options.set_log_errors(false);
  return std::make_shared<const re2::RE2>(pattern, options);
}

void updateGroupMetrics(TitleCandidateGroup &group) {
  double totalFont = 0.0;
  for (const auto &line : group.lines) {
    totalFont += line.fontSize;
    group.bottom = std::max(group.bottom, lineBottom(line));
  }
  group.fontSize = totalFont / static_cast<double>(group.lines.size());
  group.top = group.lines.front().top;
}

} // namespace

std::vector<std::string> defaultBoilerplatePatterns() {
  return {
      R"(gartner.*usage\s+policy)",
      R"(copyright|©)",
      R"(confidential)",
      R"(\bpage\s+\d+)",
      R"(^\s*\d+\s*$)",
  };
}

std::vector<std::string> defaultPresentationMarkers() {
  return {"workshop", "webinar", "seminar", "presentation"};
}

TitleExtractorConfig TitleExtractorConfig::scaledForDpi(double dpi) const {
  TitleExtractorConfig scaled = *this;
  if (dpi <= 0.0 || referenceDpi <= 0.0) {
    return scaled;
  }

  const double factor = dpi / referenceDpi;
  scaled.headerBandHeight = headerBandHeight * factor;
  scaled.maxLineGap = maxLineGap * factor;
  scaled.fontSizeTolerance = fontSizeTolerance * factor;
  scaled.minCandidateFontSize = minCandidateFontSize * factor;
  scaled.referenceDpi = dpi;
  return scaled;
}

const char *toString(TitleSource source) {
  switch (source) {
  case TitleSource::TitleGroup:
    return "title group";
  case TitleSource::PresentationMarker:
    return "presentation marker";
  case TitleSource::LargestLine:
    return "largest line";
  case TitleSource::RawLine:
    return "raw line";
  default:
    return "none";
  }
}

TitleExtractor::TitleExtractor() : m_config() { compilePatterns(); }

TitleExtractor::TitleExtractor(const TitleExtractorConfig &config)
    : m_config(config) {
  compilePatterns();
}

void TitleExtractor::compilePatterns() {
  m_boilerplate.clear();
  for (const auto &pattern : m_config.boilerplatePatterns) {
    auto compiled = compileCaseless(pattern);
    if (!compiled->ok()) {
      std::cerr << "Invalid boilerplate pattern \"" << pattern
                << "\": " << compiled->error() << std::endl;
      continue;
    }
    m_boilerplate.push_back(std::move(compiled));
  }

  std::string alternatives;
  for (const auto &marker : m_config.presentationMarkers) {
    if (marker.empty()) {
      continue;
    }
    if (!alternatives.empty()) {
      alternatives += '|';
    }
    alternatives += re2::RE2::QuoteMeta(marker);
  }

  m_markerPattern.reset();
  if (!alternatives.empty()) {
    auto compiled = compileCaseless("^\\s*(?:" + alternatives + ")\\s*:");
    if (compiled->ok()) {
      m_markerPattern = std::move(compiled);
    } else {
      std::cerr << "Invalid presentation markers: " << compiled->error()
                << std::endl;
    }
  }
}

std::optional<std::string>
TitleExtractor::extractTitle(const TokenStream &tokens) const {
  TitleResult result = analyzeTokens(tokens);
  if (!result.found) {
    return std::nullopt;
  }
  return result.title;
}

TitleResult TitleExtractor::analyzeTokens(const TokenStream &tokens) const {
  auto startTime = std::chrono::high_resolution_clock::now();

  TitleResult result;
  try {
    result = runPipeline(tokens);
  } catch (const std::exception &e) {
    result = TitleResult();
    result.errorMessage = std::string("Title extraction failed: ") + e.what();
    std::cerr << "Error extracting title: " << e.what() << std::endl;
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

TitleResult TitleExtractor::runPipeline(const TokenStream &tokens) const {
  TitleResult result;

  std::vector<Line> lines = buildLines(tokens);
  result.lineCount = static_cast<int>(lines.size());

  if (m_config.verbose) {
    std::cerr << "DEBUG: " << tokens.size() << " tokens folded into "
              << lines.size() << " lines" << std::endl;
  }

  if (lines.empty()) {
    return result;
  }

  std::vector<Line> surviving = filterBoilerplate(lines);
  result.survivingLineCount = static_cast<int>(surviving.size());

  if (m_config.verbose) {
    std::cerr << "DEBUG: " << surviving.size()
              << " lines left after boilerplate filtering" << std::endl;
  }

  // Everything is boilerplate: any text beats no text
  if (surviving.empty()) {
    result.found = true;
    result.title = lines.front().text;
    result.source = TitleSource::RawLine;
    return result;
  }

  std::vector<Line> sorted = sortByTop(surviving);
  std::vector<TitleCandidateGroup> groups = groupTitleCandidates(sorted);

  if (m_config.verbose) {
    std::cerr << "DEBUG: " << groups.size() << " title candidate groups"
              << std::endl;
  }

  if (!groups.empty()) {
    const TitleCandidateGroup &best = selectTitleGroup(groups);
    std::string title = assembleTitle(best);
    if (!title.empty()) {
      result.found = true;
      result.title = title;
      result.source = TitleSource::TitleGroup;
      result.group = best;
      return result;
    }
  }

  // Largest font first, topmost on ties
  std::vector<Line> byProminence = surviving;
  std::stable_sort(byProminence.begin(), byProminence.end(),
                   [](const Line &a, const Line &b) {
                     if (a.fontSize != b.fontSize) {
                       return a.fontSize > b.fontSize;
                     }
                     return a.top < b.top;
                   });

  std::optional<std::string> marked = scanForMarker(byProminence);
  if (marked) {
    result.found = true;
    result.title = *marked;
    result.source = TitleSource::PresentationMarker;
    return result;
  }

  result.found = true;
  result.title = byProminence.front().text;
  result.source = TitleSource::LargestLine;
  return result;
}

std::vector<Line> TitleExtractor::buildLines(const TokenStream &tokens) {
  std::vector<Line> lines;
  std::vector<std::pair<std::string, const Token *>> buffer;
  int currentIndex = 0;

  auto flush = [&]() {
    if (buffer.empty()) {
      return;
    }

    Line line;
    line.lineIndex = currentIndex;
    line.tokenCount = static_cast<int>(buffer.size());
    line.top = buffer.front().second->top;
    line.left = buffer.front().second->left;

    double right =
        line.left + static_cast<double>(buffer.front().second->width);
    double totalConfidence = 0.0;

    for (size_t i = 0; i < buffer.size(); ++i) {
      const Token &token = *buffer[i].second;
      if (i > 0) {
        line.text += ' ';
      }
      line.text += buffer[i].first;

      line.fontSize = std::max(line.fontSize, static_cast<double>(token.height));
      line.top = std::min(line.top, static_cast<double>(token.top));
      line.left = std::min(line.left, static_cast<double>(token.left));
      right = std::max(right, static_cast<double>(token.left) +
                                  static_cast<double>(token.width));
      totalConfidence += token.confidence;
    }

    line.width = right - line.left;
    line.confidence = totalConfidence / static_cast<double>(buffer.size());

    lines.push_back(line);
    buffer.clear();
  };

  for (const auto &token : tokens) {
    std::string text = cleanTokenText(token.text);
    if (text.empty()) {
      continue;
    }

    if (!buffer.empty() && token.lineIndex != currentIndex) {
      flush();
    }

    currentIndex = token.lineIndex;
    buffer.emplace_back(std::move(text), &token);
  }
  flush();

  return lines;
}

bool TitleExtractor::isBoilerplate(const std::string &text) const {
  for (const auto &pattern : m_boilerplate) {
    if (re2::RE2::PartialMatch(text, *pattern)) {
      return true;
    }
  }
  return false;
}

std::vector<Line>
TitleExtractor::filterBoilerplate(const std::vector<Line> &lines) const {
  std::vector<Line> kept;
  kept.reserve(lines.size());

  for (const auto &line : lines) {
    if (isBoilerplate(line.text)) {
      if (m_config.verbose) {
        std::cerr << "DEBUG: dropping boilerplate line \"" << line.text
                  << "\"" << std::endl;
      }
      continue;
    }
    kept.push_back(line);
  }

  return kept;
}

std::vector<Line> TitleExtractor::sortByTop(std::vector<Line> lines) {
  std::stable_sort(lines.begin(), lines.end(),
                   [](const Line &a, const Line &b) { return a.top < b.top; });
  return lines;
}

std::vector<Line>
TitleExtractor::headerBand(const std::vector<Line> &sortedLines) const {
  std::vector<Line> band;
  if (sortedLines.empty()) {
    return band;
  }

  const double limit = sortedLines.front().top + m_config.headerBandHeight;
  for (const auto &line : sortedLines) {
    if (line.top > limit) {
      break;
    }
    band.push_back(line);
  }

  return band;
}

std::vector<TitleCandidateGroup> TitleExtractor::groupTitleCandidates(
    const std::vector<Line> &sortedLines) const {
  std::vector<TitleCandidateGroup> groups;

  std::vector<Line> band = headerBand(sortedLines);

  double maxFontSize = 0.0;
  for (const auto &line : band) {
    maxFontSize = std::max(maxFontSize, line.fontSize);
  }

  if (maxFontSize <= 0.0) {
    return groups;
  }

  const double threshold = maxFontSize * m_config.titleSizeRatio;

  if (m_config.verbose) {
    std::cerr << "DEBUG: header band has " << band.size()
              << " lines, max font size " << maxFontSize
              << ", title threshold " << threshold << std::endl;
  }

  for (const auto &line : band) {
    if (line.fontSize <= 0.0 || line.fontSize < threshold ||
        line.fontSize < m_config.minCandidateFontSize ||
        line.confidence < m_config.minCandidateConfidence) {
      continue;
    }

    if (!groups.empty()) {
      TitleCandidateGroup &group = groups.back();
      const Line &previous = group.lines.back();

      double gap = line.top - lineBottom(previous);
      double sizeDelta = std::abs(line.fontSize - previous.fontSize);

      if (gap < m_config.maxLineGap &&
          sizeDelta < m_config.fontSizeTolerance) {
        group.lines.push_back(line);
        updateGroupMetrics(group);
        continue;
      }
    }

    TitleCandidateGroup group;
    group.lines.push_back(line);
    updateGroupMetrics(group);
    groups.push_back(group);
  }

  return groups;
}

const TitleCandidateGroup &TitleExtractor::selectTitleGroup(
    const std::vector<TitleCandidateGroup> &groups) {
  size_t bestIndex = 0;
  for (size_t i = 1; i < groups.size(); ++i) {
    if (groups[i].fontSize > groups[bestIndex].fontSize) {
      bestIndex = i;
    }
  }
  return groups[bestIndex];
}

std::string
TitleExtractor::assembleTitle(const TitleCandidateGroup &group) const {
  std::vector<Line> ordered = sortByTop(group.lines);

  std::string title;
  for (const auto &line : ordered) {
    if (!title.empty()) {
      title += ' ';
    }
    title += line.text;
  }
  title = trim(title);

  // "<marker>: ..." titles and colon-terminated label lines both keep every
  // line; the label and its payload read as one title.
  if (m_config.verbose && !title.empty()) {
    if (hasPresentationMarker(title)) {
      std::cerr << "DEBUG: title opens with a presentation marker"
                << std::endl;
    } else if (ordered.size() > 1 && !ordered.front().text.empty() &&
               ordered.front().text.back() == ':') {
      std::cerr << "DEBUG: title opens with a label line" << std::endl;
    }
  }

  return title;
}

bool TitleExtractor::hasPresentationMarker(const std::string &text) const {
  return m_markerPattern && re2::RE2::PartialMatch(text, *m_markerPattern);
}

std::optional<std::string>
TitleExtractor::scanForMarker(const std::vector<Line> &byProminence) const {
  size_t limit = std::min(
      byProminence.size(),
      static_cast<size_t>(std::max(0, m_config.markerScanLimit)));

  for (size_t i = 0; i < limit; ++i) {
    if (hasPresentationMarker(byProminence[i].text)) {
      return byProminence[i].text;
    }
  }
  return std::nullopt;
}

const TitleExtractorConfig &TitleExtractor::getConfig() const {
  return m_config;
}

void TitleExtractor::setConfig(const TitleExtractorConfig &config) {
  m_config = config;
  compilePatterns();
}

} // namespace pdfdeck
