#include "TitleExtractor.hpp"

#include <iomanip>
#include <iostream>
#include <string>

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

pdfdeck::Token makeToken(const std::string &text, int lineIndex, int top,
                         int left, int width, int height,
                         float confidence = 90.0f) {
  pdfdeck::Token token;
  token.text = text;
  token.lineIndex = lineIndex;
  token.top = top;
  token.left = left;
  token.width = width;
  token.height = height;
  token.confidence = confidence;
  return token;
}

pdfdeck::Line makeLine(const std::string &text, double top, double fontSize) {
  pdfdeck::Line line;
  line.text = text;
  line.top = top;
  line.fontSize = fontSize;
  line.confidence = 90.0;
  line.tokenCount = 1;
  return line;
}

void printLines(const std::vector<pdfdeck::Line> &lines) {
  for (const auto &line : lines) {
    std::cout << "    [" << std::setw(2) << line.lineIndex << "] top "
              << std::setw(5) << line.top << " size " << std::setw(4)
              << line.fontSize << "  \"" << line.text << "\"\n";
  }
}

} // namespace

int main() {
  std::cout << "=== Line Reconstruction and Grouping Test ===\n\n";

  pdfdeck::TitleExtractor extractor;

  std::cout << "Line reconstruction\n";
  {
    pdfdeck::TokenStream tokens = {
        makeToken("Annual", 7, 52, 100, 120, 28, 80.0f),
        makeToken("", 7, 0, 0, 0, 90, 0.0f),
        makeToken("Review", 7, 50, 240, 130, 30, 90.0f),
        makeToken("2024", 7, 51, 390, 90, 29, 100.0f),
        makeToken("Gamma", 3, 120, 100, 100, 20, 70.0f),
        makeToken("Delta", 7, 200, 100, 100, 18, 60.0f),
    };

    std::vector<pdfdeck::Line> lines =
        pdfdeck::TitleExtractor::buildLines(tokens);
    printLines(lines);

    check(lines.size() == 3, "a line index change starts a new line");
    if (lines.size() == 3) {
      const auto &first = lines[0];
      check(first.text == "Annual Review 2024",
            "texts are space-joined in stream order");
      check(first.fontSize == 30.0, "font size is the tallest token");
      check(first.top == 50.0, "top is the smallest token top");
      check(first.left == 100.0 && first.width == 380.0,
            "left/width span the token boxes");
      check(first.confidence == 90.0,
            "confidence is the mean over text-bearing tokens only");
      check(first.tokenCount == 3 && first.lineIndex == 7,
            "blank token does not count toward the line");
      check(lines[1].text == "Gamma" && lines[2].text == "Delta",
            "a repeated line index after a change is a separate line");
    }

    check(pdfdeck::TitleExtractor::buildLines({}).empty(),
          "no tokens, no lines");

    pdfdeck::TokenStream farRight = {
        makeToken("Edge", 0, 40, 2147483000, 1000, 30),
        makeToken("Case", 0, 40, 2147482000, 500, 30),
    };
    lines = pdfdeck::TitleExtractor::buildLines(farRight);
    check(lines.size() == 1 && lines[0].left == 2147482000.0 &&
              lines[0].width == 2000.0,
          "box span near INT_MAX does not overflow");
  }

  std::cout << "\nBoilerplate patterns\n";
  {
    struct Sample {
      const char *text;
      bool boilerplate;
    };
    const Sample samples[] = {
        {"Page 12", true},
        {"page 4 of 10", true},
        {"42", true},
        {"  7 ", true},
        {"Copyright 2024 Example Corp", true},
        {"© Example Corp", true},
        {"Strictly CONFIDENTIAL", true},
        {"Gartner, Inc. and/or its affiliates. Usage Policy", true},
        {"Pagination Strategies", false},
        {"Homepage 2 Redesign", false},
        {"Quarterly Results 2024", false},
        {"Workshop: Building Resilient Systems", false},
    };

    for (const auto &sample : samples) {
      check(extractor.isBoilerplate(sample.text) == sample.boilerplate,
            std::string("\"") + sample.text + "\" is " +
                (sample.boilerplate ? "" : "not ") + "boilerplate");
    }

    std::vector<pdfdeck::Line> lines = {makeLine("Page 1", 10, 12),
                                        makeLine("Title", 50, 30),
                                        makeLine("3", 900, 12)};
    auto kept = extractor.filterBoilerplate(lines);
    check(kept.size() == 1 && kept[0].text == "Title",
          "filtering keeps only non-boilerplate lines");
  }

  std::cout << "\nPresentation markers\n";
  {
    check(extractor.hasPresentationMarker("WEBINAR: Cloud Costs"),
          "markers match case-insensitively");
    check(extractor.hasPresentationMarker("Seminar : Tax Law"),
          "space before the colon is allowed");
    check(!extractor.hasPresentationMarker("Presentations: Q3"),
          "marker must be followed by a colon");
    check(!extractor.hasPresentationMarker("Our workshop: notes"),
          "marker must open the text");

    pdfdeck::TitleExtractorConfig config;
    config.presentationMarkers.clear();
    pdfdeck::TitleExtractor noMarkers(config);
    check(!noMarkers.hasPresentationMarker("Workshop: Anything"),
          "empty marker list matches nothing");
  }

  std::cout << "\nHeader band\n";
  {
    std::vector<pdfdeck::Line> sorted = pdfdeck::TitleExtractor::sortByTop(
        {makeLine("C", 420, 20), makeLine("A", 100, 20),
         makeLine("B", 400, 20), makeLine("A2", 100, 22)});
    check(sorted[0].text == "A" && sorted[1].text == "A2" &&
              sorted[2].text == "B" && sorted[3].text == "C",
          "sort by top is stable");

    auto band = extractor.headerBand(sorted);
    check(band.size() == 3 && band.back().text == "B",
          "band reaches exactly headerBandHeight below the first line");
    check(extractor.headerBand({}).empty(), "empty input, empty band");
  }

  std::cout << "\nAdjacency grouping\n";
  {
    auto groups = extractor.groupTitleCandidates(
        {makeLine("One", 50, 30), makeLine("Two", 109, 30)});
    check(groups.size() == 1, "29 px gap merges");

    groups = extractor.groupTitleCandidates(
        {makeLine("One", 50, 30), makeLine("Two", 110, 30)});
    check(groups.size() == 2, "30 px gap splits");

    groups = extractor.groupTitleCandidates(
        {makeLine("One", 50, 30), makeLine("Two", 85, 26)});
    check(groups.size() == 1, "4 px font delta merges");

    groups = extractor.groupTitleCandidates(
        {makeLine("One", 50, 30), makeLine("Two", 85, 25)});
    check(groups.size() == 2, "5 px font delta splits");

    groups = extractor.groupTitleCandidates(
        {makeLine("Big", 50, 40), makeLine("Small", 95, 20),
         makeLine("Big again", 120, 40)});
    check(groups.size() == 2 && groups[0].lines.size() == 1,
          "lines under the size threshold are not candidates");

    groups = extractor.groupTitleCandidates(
        {makeLine("One", 50, 30), makeLine("Two", 78, 30),
         makeLine("Three", 104, 28)});
    check(groups.size() == 1 && groups[0].lines.size() == 3,
          "overlapping and tight lines form one run");
    if (groups.size() == 1) {
      check(groups[0].top == 50.0 && groups[0].bottom == 132.0,
            "group spans first top to last bottom");
      std::cout << "    mean font size " << groups[0].fontSize << "\n";
    }

    groups = extractor.groupTitleCandidates(
        {makeLine("Zero", 50, 0), makeLine("Also zero", 80, 0)});
    check(groups.empty(), "zero font sizes give no candidates");

    pdfdeck::TitleExtractorConfig config;
    config.minCandidateFontSize = 32.0;
    pdfdeck::TitleExtractor gated(config);
    check(gated.groupTitleCandidates({makeLine("Title", 50, 30)}).empty(),
          "minimum font size gates candidacy");
  }

  std::cout << "\nSelection and assembly\n";
  {
    pdfdeck::TitleCandidateGroup small;
    small.lines = {makeLine("Small", 50, 20)};
    small.fontSize = 20;
    pdfdeck::TitleCandidateGroup large;
    large.lines = {makeLine("Large", 200, 30)};
    large.fontSize = 30;
    pdfdeck::TitleCandidateGroup alsoLarge;
    alsoLarge.lines = {makeLine("Also large", 300, 30)};
    alsoLarge.fontSize = 30;

    std::vector<pdfdeck::TitleCandidateGroup> groups = {small, large,
                                                        alsoLarge};
    const auto &best = pdfdeck::TitleExtractor::selectTitleGroup(groups);
    check(best.lines[0].text == "Large",
          "largest mean font wins, first on ties");

    pdfdeck::TitleCandidateGroup unordered;
    unordered.lines = {makeLine("Services", 120, 30),
                       makeLine("Digital Transformation in", 50, 30),
                       makeLine("Financial", 85, 30)};
    check(extractor.assembleTitle(unordered) ==
              "Digital Transformation in Financial Services",
          "assembly orders lines by top");
  }

  std::cout << "\n";
  if (failures > 0) {
    std::cerr << failures << " check(s) failed\n";
    return 1;
  }
  std::cout << "=== All line grouping checks passed ===\n";
  return 0;
}
