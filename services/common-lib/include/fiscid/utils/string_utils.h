/**
 * @file string_utils.h
 * @brief String manipulation utilities
 *
 * Common string operations used by the fiscid tools.
 */

#pragma once

#include <string>

namespace fiscid {
namespace utils {

/**
 * @brief Convert string to lowercase (ASCII only)
 *
 * @param str Input string
 * @return Lowercase string
 */
std::string toLower(const std::string& str);

/**
 * @brief Convert string to uppercase (ASCII only)
 *
 * @param str Input string
 * @return Uppercase string
 */
std::string toUpper(const std::string& str);

/**
 * @brief Trim whitespace from both ends
 *
 * @param str Input string
 * @return Trimmed string
 */
std::string trim(const std::string& str);

/**
 * @brief True if the string is empty or whitespace only
 */
bool isBlank(const std::string& str);

/**
 * @brief Remove every occurrence of the given characters
 *
 * @param str Input string
 * @param chars Characters to drop
 * @return String without those characters
 */
std::string removeChars(const std::string& str, const std::string& chars);

} // namespace utils
} // namespace fiscid
