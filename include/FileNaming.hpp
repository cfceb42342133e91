#ifndef PDFDECK_FILE_NAMING_HPP
#define PDFDECK_FILE_NAMING_HPP

#include <cstddef>
#include <string>

namespace pdfdeck {

/**
 * @brief Make a title safe to use as a file name
 *
 * Characters that are reserved on common file systems (/ \ : * ? " < > |)
 * and control characters become '_'. Whitespace runs collapse to a single
 * space, leading/trailing spaces and dots are removed and the result is cut
 * to maxLength bytes without splitting a UTF-8 sequence.
 *
 * @param title Raw title text
 * @param maxLength Maximum length in bytes (default: 120)
 * @return Sanitized name, empty if nothing usable remains
 */
std::string sanitizeFileName(const std::string &title,
                             std::size_t maxLength = 120);

/**
 * @brief File name of a path without directory and extension
 */
std::string fileStem(const std::string &path);

/**
 * @brief Deck file name for a title ("<sanitized title><extension>")
 * @param title Title text (sanitized here)
 * @param extension Extension including the dot (default: ".pptx")
 * @param maxLength Maximum length of the name part in bytes
 * @return File name, or an empty string if the title has no usable text
 */
std::string deckFileName(const std::string &title,
                         const std::string &extension = ".pptx",
                         std::size_t maxLength = 120);

} // namespace pdfdeck

#endif // PDFDECK_FILE_NAMING_HPP
