/**
 * @file import_result.cpp
 * @brief JSON rendering of the import report
 */

#include "import_result.h"

namespace fiscid {
namespace importer {

Json::Value RowIssue::toJson() const {
    Json::Value json;
    json["row"] = row;
    json["field"] = field;
    json["message"] = message;
    if (value) {
        json["value"] = *value;
    }
    return json;
}

Json::Value DuplicateEntry::toJson() const {
    Json::Value json;
    json["row"] = row;
    json["field"] = field;
    json["existingId"] = static_cast<Json::Int64>(existingId);
    json["existingName"] = existingName;
    json["value"] = value;
    return json;
}

Json::Value ImportResult::toJson() const {
    Json::Value json;
    json["success"] = success;
    json["totalRows"] = totalRows;
    json["validRows"] = validRows;
    json["skipped"] = skipped;

    Json::Value errorsJson = Json::arrayValue;
    for (const auto& issue : errors) {
        errorsJson.append(issue.toJson());
    }
    json["errors"] = errorsJson;

    Json::Value warningsJson = Json::arrayValue;
    for (const auto& issue : warnings) {
        warningsJson.append(issue.toJson());
    }
    json["warnings"] = warningsJson;

    Json::Value duplicatesJson = Json::arrayValue;
    for (const auto& dup : duplicates) {
        duplicatesJson.append(dup.toJson());
    }
    json["duplicates"] = duplicatesJson;

    return json;
}

} // namespace importer
} // namespace fiscid
