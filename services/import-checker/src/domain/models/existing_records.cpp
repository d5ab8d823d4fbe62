/**
 * @file existing_records.cpp
 * @brief Existing record registry implementation
 */

#include "existing_records.h"
#include "import_row.h"
#include "exceptions.h"
#include <fiscid/codec/fiscal_code.h>
#include <fiscid/codec/vat_number.h>
#include <fiscid/utils/string_utils.h>
#include <functional>

namespace fiscid {
namespace importer {

namespace {

std::string taxCodeKey(const std::string& taxCode) {
    return codec::normalizeFiscalCode(taxCode);
}

std::string vatKey(const std::string& vatNumber) {
    return codec::normalizeVatNumber(vatNumber);
}

std::string emailKey(const std::string& email) {
    return utils::toLower(utils::trim(email));
}

void loadArray(const Json::Value& document, const char* key,
               const std::function<void(const ExistingRecord&)>& add) {
    if (!document.isMember(key)) {
        return;
    }
    const Json::Value& items = document[key];
    if (!items.isArray()) {
        throw common::ParsingException(std::string("registry field '") + key + "' is not an array");
    }
    for (Json::ArrayIndex i = 0; i < items.size(); i++) {
        if (!items[i].isObject()) {
            throw common::ParsingException(std::string("registry ") + key + "[" +
                                           std::to_string(i) + "] is not an object");
        }
        add(ExistingRecord::fromJson(items[i]));
    }
}

} // namespace

ExistingRecord ExistingRecord::fromJson(const Json::Value& json) {
    const Json::Value& id = json["id"];
    if (!id.isIntegral()) {
        throw common::ParsingException("registry record without an integer 'id'");
    }

    ExistingRecord record;
    record.id = id.asInt64();
    record.name = scalarAsString(json["name"]);
    record.taxCode = scalarAsString(json["taxCode"]);
    record.vatNumber = scalarAsString(json["vatNumber"]);
    record.email = scalarAsString(json["email"]);
    return record;
}

ExistingRecords ExistingRecords::fromJson(const Json::Value& document) {
    if (!document.isObject()) {
        throw common::ParsingException("registry document is not a JSON object");
    }

    ExistingRecords registry;
    loadArray(document, "records", [&registry](const ExistingRecord& r) { registry.addRecord(r); });
    loadArray(document, "companies", [&registry](const ExistingRecord& c) { registry.addCompany(c); });
    return registry;
}

void ExistingRecords::addRecord(const ExistingRecord& record) {
    size_t index = records_.size();
    records_.push_back(record);

    if (!utils::isBlank(record.taxCode)) {
        byTaxCode_.emplace(taxCodeKey(record.taxCode), index);
    }
    if (!utils::isBlank(record.vatNumber)) {
        byVatNumber_.emplace(vatKey(record.vatNumber), index);
    }
    if (!utils::isBlank(record.email)) {
        byEmail_.emplace(emailKey(record.email), index);
    }
}

void ExistingRecords::addCompany(const ExistingRecord& company) {
    companyIds_.insert(company.id);
}

const ExistingRecord* ExistingRecords::find(const std::map<std::string, size_t>& index,
                                            const std::string& key) const {
    auto it = index.find(key);
    return it == index.end() ? nullptr : &records_[it->second];
}

const ExistingRecord* ExistingRecords::findByTaxCode(const std::string& taxCode) const {
    return find(byTaxCode_, taxCodeKey(taxCode));
}

const ExistingRecord* ExistingRecords::findByVatNumber(const std::string& vatNumber) const {
    return find(byVatNumber_, vatKey(vatNumber));
}

const ExistingRecord* ExistingRecords::findByEmail(const std::string& email) const {
    return find(byEmail_, emailKey(email));
}

bool ExistingRecords::hasCompany(long long id) const {
    return companyIds_.count(id) > 0;
}

} // namespace importer
} // namespace fiscid
