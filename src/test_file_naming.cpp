#include "FileNaming.hpp"

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

void expectName(const std::string &title, const std::string &expected,
                std::size_t maxLength = 120) {
  std::string actual = pdfdeck::sanitizeFileName(title, maxLength);
  check(actual == expected,
        "\"" + title + "\" -> \"" + actual + "\" (expected \"" + expected +
            "\")");
}

} // namespace

int main() {
  std::cout << "=== File Naming Test ===\n\n";

  std::cout << "Sanitizing titles\n";
  expectName("Digital Transformation", "Digital Transformation");
  expectName("Q3 Results: Growth/Decline?", "Q3 Results_ Growth_Decline_");
  expectName("a<b>c|d*e\"f\\g", "a_b_c_d_e_f_g");
  expectName("  Title\twith\n\nbreaks  ", "Title with breaks");
  expectName("...", "");
  expectName("..hidden.", "hidden");
  expectName("   ", "");
  expectName("Résumé Überblick", "Résumé Überblick");

  std::cout << "\nLength limits\n";
  {
    std::string longTitle(200, 'a');
    check(pdfdeck::sanitizeFileName(longTitle).size() == 120,
          "names are cut to the default limit");

    std::string accented;
    for (int i = 0; i < 70; ++i) {
      accented += "é";
    }
    std::string cut = pdfdeck::sanitizeFileName(accented, 121);
    check(cut.size() == 120, "cut backs up to a UTF-8 boundary");

    check(pdfdeck::sanitizeFileName("Annual Report 2024", 7) == "Annual",
          "trailing space left by the cut is trimmed");
  }

  std::cout << "\nFile stems and deck names\n";
  {
    check(pdfdeck::fileStem("/tmp/docs/report.final.pdf") == "report.final",
          "stem drops directory and last extension");
    check(pdfdeck::fileStem("slides.PDF") == "slides", "stem of a bare name");

    check(pdfdeck::deckFileName("Digital Transformation") ==
              "Digital Transformation.pptx",
          "deck name gets the .pptx extension");
    check(pdfdeck::deckFileName("???", ".odp") == "___.odp",
          "custom extension");
    check(pdfdeck::deckFileName("  . ").empty(),
          "unusable title gives an empty deck name");
  }

  std::cout << "\n";
  if (failures > 0) {
    std::cerr << failures << " check(s) failed\n";
    return 1;
  }
  std::cout << "=== All file naming checks passed ===\n";
  return 0;
}
