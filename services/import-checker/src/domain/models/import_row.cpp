/**
 * @file import_row.cpp
 * @brief Import row parsing from JSON
 */

#include "import_row.h"
#include "exceptions.h"
#include <sstream>

namespace fiscid {
namespace importer {

std::optional<RowKind> parseRowKind(const std::string& name) {
    if (name == "students") return RowKind::STUDENTS;
    if (name == "instructors") return RowKind::INSTRUCTORS;
    if (name == "companies") return RowKind::COMPANIES;
    return std::nullopt;
}

std::string scalarAsString(const Json::Value& value) {
    if (value.isString()) {
        return value.asString();
    }
    if (value.isBool()) {
        return value.asBool() ? "true" : "false";
    }
    if (value.isInt64()) {
        return std::to_string(value.asInt64());
    }
    if (value.isUInt64()) {
        return std::to_string(value.asUInt64());
    }
    if (value.isDouble()) {
        std::ostringstream oss;
        oss << value.asDouble();
        return oss.str();
    }
    return "";
}

PersonRow PersonRow::fromJson(const Json::Value& json) {
    PersonRow row;
    row.firstName = scalarAsString(json["firstName"]);
    row.lastName = scalarAsString(json["lastName"]);
    row.email = scalarAsString(json["email"]);
    row.phone = scalarAsString(json["phone"]);
    row.taxCode = scalarAsString(json["taxCode"]);
    row.birthDate = scalarAsString(json["birthDate"]);
    row.postalCode = scalarAsString(json["postalCode"]);
    row.province = scalarAsString(json["province"]);
    row.companyId = scalarAsString(json["companyId"]);
    row.vatNumber = scalarAsString(json["vatNumber"]);
    row.iban = scalarAsString(json["iban"]);
    row.hourlyRate = scalarAsString(json["hourlyRate"]);
    return row;
}

CompanyRow CompanyRow::fromJson(const Json::Value& json) {
    CompanyRow row;
    row.name = scalarAsString(json["name"]);
    row.vatNumber = scalarAsString(json["vatNumber"]);
    row.taxCode = scalarAsString(json["taxCode"]);
    row.email = scalarAsString(json["email"]);
    row.pec = scalarAsString(json["pec"]);
    row.phone = scalarAsString(json["phone"]);
    row.postalCode = scalarAsString(json["postalCode"]);
    row.province = scalarAsString(json["province"]);
    row.sdiCode = scalarAsString(json["sdiCode"]);
    return row;
}

const Json::Value& rowsOf(const Json::Value& document) {
    if (!document.isObject() || !document.isMember("rows") || !document["rows"].isArray()) {
        throw common::ParsingException("import document has no 'rows' array");
    }

    const Json::Value& rows = document["rows"];
    for (Json::ArrayIndex i = 0; i < rows.size(); i++) {
        if (!rows[i].isObject()) {
            throw common::ParsingException("rows[" + std::to_string(i) + "] is not an object");
        }
    }
    return rows;
}

std::vector<PersonRow> parsePersonRows(const Json::Value& document) {
    std::vector<PersonRow> result;
    for (const auto& row : rowsOf(document)) {
        result.push_back(PersonRow::fromJson(row));
    }
    return result;
}

std::vector<CompanyRow> parseCompanyRows(const Json::Value& document) {
    std::vector<CompanyRow> result;
    for (const auto& row : rowsOf(document)) {
        result.push_back(CompanyRow::fromJson(row));
    }
    return result;
}

} // namespace importer
} // namespace fiscid
