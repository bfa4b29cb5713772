#ifndef EXAM_TEXT_UTILS_HPP
#define EXAM_TEXT_UTILS_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace exam {

std::string trim(const std::string &text);
std::string toLower(std::string text);

/**
 * @brief Split on '\n', dropping '\r' and keeping empty lines
 */
std::vector<std::string> splitLines(const std::string &text);

std::string join(const std::vector<std::string> &parts,
                 const std::string &separator);

/**
 * @brief First @p maxChars bytes of @p text without splitting a UTF-8
 *        sequence
 */
std::string truncateUtf8(const std::string &text, std::size_t maxChars);

} // namespace exam

#endif // EXAM_TEXT_UTILS_HPP
