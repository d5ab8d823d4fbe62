/**
 * @file import_result.h
 * @brief Outcome of a dry-run import validation
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include <json/json.h>

namespace fiscid {
namespace importer {

/**
 * @brief Error or warning attached to a spreadsheet row
 */
struct RowIssue {
    int row = 0;              ///< Spreadsheet row number (index + 2)
    std::string field;
    std::string message;
    std::optional<std::string> value;

    Json::Value toJson() const;
};

/**
 * @brief Row whose identifier already belongs to a registered record
 */
struct DuplicateEntry {
    int row = 0;
    std::string field;
    long long existingId = 0;
    std::string existingName;
    std::string value;

    Json::Value toJson() const;
};

/**
 * @brief Batch validation report
 *
 * A row is skipped when it has at least one error or duplicate.
 * success = no errors and no duplicates.
 */
struct ImportResult {
    bool success = true;
    int totalRows = 0;
    int validRows = 0;
    int skipped = 0;
    std::vector<RowIssue> errors;
    std::vector<RowIssue> warnings;
    std::vector<DuplicateEntry> duplicates;

    Json::Value toJson() const;
};

} // namespace importer
} // namespace fiscid
