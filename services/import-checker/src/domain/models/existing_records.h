/**
 * @file existing_records.h
 * @brief Registry of already-registered records used for duplicate detection
 *
 * Loaded from a JSON document:
 * @code
 * {
 *   "records":   [ { "id": 1, "name": "Mario Rossi", "taxCode": "...", "vatNumber": "...", "email": "..." } ],
 *   "companies": [ { "id": 7, "name": "ACME S.r.l.", "vatNumber": "..." } ]
 * }
 * @endcode
 * "records" holds entities of the kind being imported; "companies" holds
 * the companies students may be attached to. Both are optional.
 */

#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>
#include <json/json.h>

namespace fiscid {
namespace importer {

/**
 * @brief A registered record (person or company)
 */
struct ExistingRecord {
    long long id = 0;
    std::string name;
    std::string taxCode;
    std::string vatNumber;
    std::string email;

    /**
     * @throws common::ParsingException if "id" is missing or not an integer
     */
    static ExistingRecord fromJson(const Json::Value& json);
};

/**
 * @brief Lookup tables over existing records, keyed by normalized identifiers
 *
 * Tax codes are matched upper-case without whitespace, VAT numbers after
 * VAT normalization (so "IT 0123..." matches "0123..."), emails trimmed
 * and lower-case. The first record registering a key wins.
 */
class ExistingRecords {
public:
    ExistingRecords() = default;

    /**
     * @brief Build the registry from a JSON document (see file comment)
     * @throws common::ParsingException on a malformed document
     */
    static ExistingRecords fromJson(const Json::Value& document);

    void addRecord(const ExistingRecord& record);
    void addCompany(const ExistingRecord& company);

    const ExistingRecord* findByTaxCode(const std::string& taxCode) const;
    const ExistingRecord* findByVatNumber(const std::string& vatNumber) const;
    const ExistingRecord* findByEmail(const std::string& email) const;

    bool hasCompany(long long id) const;

    size_t recordCount() const { return records_.size(); }
    size_t companyCount() const { return companyIds_.size(); }

private:
    const ExistingRecord* find(const std::map<std::string, size_t>& index,
                               const std::string& key) const;

    std::vector<ExistingRecord> records_;
    std::map<std::string, size_t> byTaxCode_;
    std::map<std::string, size_t> byVatNumber_;
    std::map<std::string, size_t> byEmail_;
    std::set<long long> companyIds_;
};

} // namespace importer
} // namespace fiscid
