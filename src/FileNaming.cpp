#include "FileNaming.hpp"

#include <filesystem>

namespace pdfdeck {

namespace {

bool isReserved(unsigned char c) {
  switch (c) {
  case '/':
  case '\\':
  case ':':
  case '*':
  case '?':
  case '"':
  case '<':
  case '>':
  case '|':
    return true;
  default:
    return c < 0x20 || c == 0x7f;
  }
}

bool isSpace(unsigned char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
         c == '\v';
}

// Strip spaces and dots from both ends
std::string trimName(const std::string &name) {
  size_t start = name.find_first_not_of(" .");
  if (start == std::string::npos) {
    return "";
  }
  size_t end = name.find_last_not_of(" .");
  return name.substr(start, end - start + 1);
}

} // namespace

std::string sanitizeFileName(const std::string &title, std::size_t maxLength) {
  std::string name;
  name.reserve(title.size());

  bool pendingSpace = false;
  for (unsigned char c : title) {
    if (isSpace(c)) {
      pendingSpace = true;
      continue;
    }
    if (pendingSpace && !name.empty()) {
      name += ' ';
    }
    pendingSpace = false;
    name += isReserved(c) ? '_' : static_cast<char>(c);
  }

  name = trimName(name);

  if (name.size() > maxLength) {
    size_t cut = maxLength;
    // Back up over UTF-8 continuation bytes
    while (cut > 0 &&
           (static_cast<unsigned char>(name[cut]) & 0xC0) == 0x80) {
      --cut;
    }
    name = trimName(name.substr(0, cut));
  }

  return name;
}

std::string fileStem(const std::string &path) {
  return std::filesystem::path(path).stem().string();
}

std::string deckFileName(const std::string &title, const std::string &extension,
                         std::size_t maxLength) {
  std::string name = sanitizeFileName(title, maxLength);
  if (name.empty()) {
    return "";
  }
  return name + extension;
}

} // namespace pdfdeck
