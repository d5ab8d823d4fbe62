/**
 * @file json_file.h
 * @brief JSON document input/output for the import checker
 */

#pragma once

#include <string>
#include <json/json.h>

namespace fiscid {
namespace importer {

/**
 * @brief Parse a JSON document from text
 * @throws common::ParsingException with the reader's diagnostics
 */
Json::Value parseJson(const std::string& text);

/**
 * @brief Read and parse a JSON file
 * @throws common::ParsingException if the file cannot be read or parsed
 */
Json::Value readJsonFile(const std::string& path);

/**
 * @brief Serialize with two-space indentation, UTF-8 kept as-is
 */
std::string toJsonString(const Json::Value& value);

/**
 * @brief Write a JSON document to a file
 * @throws common::FiscidException if the file cannot be written
 */
void writeJsonFile(const std::string& path, const Json::Value& value);

} // namespace importer
} // namespace fiscid
