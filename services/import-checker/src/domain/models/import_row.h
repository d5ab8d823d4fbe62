/**
 * @file import_row.h
 * @brief Rows of an import batch (students, instructors, companies)
 *
 * Spreadsheet-derived rows, one JSON object each. Every field is kept as
 * the raw string found in the file; numeric cells are rendered as text.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include <json/json.h>

namespace fiscid {
namespace importer {

/**
 * @brief Kind of record being imported
 */
enum class RowKind {
    STUDENTS,
    INSTRUCTORS,
    COMPANIES
};

/**
 * @brief Convert RowKind to its command line name
 */
inline std::string rowKindToString(RowKind kind) {
    switch (kind) {
        case RowKind::STUDENTS:    return "students";
        case RowKind::INSTRUCTORS: return "instructors";
        case RowKind::COMPANIES:   return "companies";
        default:                   return "unknown";
    }
}

/**
 * @brief Parse a command line name ("students", "instructors", "companies")
 */
std::optional<RowKind> parseRowKind(const std::string& name);

/**
 * @brief Student or instructor row
 *
 * companyId is only meaningful for students; vatNumber, iban and
 * hourlyRate only for instructors.
 */
struct PersonRow {
    std::string firstName;
    std::string lastName;
    std::string email;
    std::string phone;
    std::string taxCode;
    std::string birthDate;
    std::string postalCode;
    std::string province;

    // Students
    std::string companyId;

    // Instructors
    std::string vatNumber;
    std::string iban;
    std::string hourlyRate;

    static PersonRow fromJson(const Json::Value& json);
};

/**
 * @brief Company row
 */
struct CompanyRow {
    std::string name;
    std::string vatNumber;
    std::string taxCode;
    std::string email;
    std::string pec;
    std::string phone;
    std::string postalCode;
    std::string province;
    std::string sdiCode;

    static CompanyRow fromJson(const Json::Value& json);
};

/**
 * @brief Read a JSON scalar as text
 *
 * Strings as-is, integers in decimal, reals as printed by iostream,
 * booleans as "true"/"false". Missing, null, arrays and objects give "".
 */
std::string scalarAsString(const Json::Value& value);

/**
 * @brief Extract the "rows" array of an import document
 * @throws common::ParsingException if the document has no "rows" array
 *         or an element is not an object
 */
const Json::Value& rowsOf(const Json::Value& document);

std::vector<PersonRow> parsePersonRows(const Json::Value& document);
std::vector<CompanyRow> parseCompanyRows(const Json::Value& document);

} // namespace importer
} // namespace fiscid
