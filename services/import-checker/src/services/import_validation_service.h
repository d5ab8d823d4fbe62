/**
 * @file import_validation_service.h
 * @brief Dry-run validation of student, instructor and company import batches
 *
 * Checks every row of a batch without importing anything: required fields,
 * fiscal codes and VAT numbers through the codec library, contact field
 * formats, duplicates inside the file and against already-registered
 * records. Row problems are collected in an ImportResult; only whole-batch
 * problems throw.
 */

#pragma once

#include <set>
#include <string>
#include <vector>
#include <json/json.h>

#include "../domain/models/existing_records.h"
#include "../domain/models/import_result.h"
#include "../domain/models/import_row.h"

namespace fiscid {
namespace importer {

class RowChecker;

/**
 * @brief Validation policy
 */
struct ImportOptions {
    int maxRows = 0;              ///< Batch size limit; 0 = default for the row kind
    bool strictChecksum = false;  ///< Checksum mismatches become row errors
    bool checkNameMatch = true;   ///< Warn when a fiscal code does not fit first/last name
};

class ImportValidationService {
public:
    explicit ImportValidationService(ExistingRecords existing, ImportOptions options = {});

    /**
     * @brief Validate an import document ({ "rows": [...] })
     * @throws common::ParsingException if the document has no usable "rows" array
     * @throws common::ImportException if the batch is empty or too large
     */
    ImportResult validate(RowKind kind, const Json::Value& document) const;

    /// @throws common::ImportException if the batch is empty or too large
    ImportResult validateStudents(const std::vector<PersonRow>& rows) const;

    /// @throws common::ImportException if the batch is empty or too large
    ImportResult validateInstructors(const std::vector<PersonRow>& rows) const;

    /// @throws common::ImportException if the batch is empty or too large
    ImportResult validateCompanies(const std::vector<CompanyRow>& rows) const;

    /// Batch size limit used when ImportOptions::maxRows is 0
    static int defaultMaxRows(RowKind kind);

    const ImportOptions& options() const { return options_; }

private:
    void checkBatchSize(size_t rowCount, RowKind kind) const;
    ImportResult validatePersons(const std::vector<PersonRow>& rows, RowKind kind) const;

    void checkPersonTaxCode(RowChecker& checker, const PersonRow& row,
                            std::set<std::string>& seen) const;
    void checkCompanyTaxCode(RowChecker& checker, const CompanyRow& row,
                             std::set<std::string>& seen) const;
    void checkVatNumber(RowChecker& checker, const std::string& raw,
                        std::set<std::string>& seen) const;
    void checkEmail(RowChecker& checker, const std::string& raw,
                    std::set<std::string>& seen, bool duplicatesAreWarnings) const;
    void checkCompanyId(RowChecker& checker, const std::string& raw) const;
    void checkAddress(RowChecker& checker, const std::string& postalCode,
                      const std::string& province) const;
    void reportCodecWarnings(RowChecker& checker, const std::string& field,
                             bool checksumValid, const std::vector<std::string>& warnings,
                             const std::string& value) const;

    ExistingRecords existing_;
    ImportOptions options_;
};

} // namespace importer
} // namespace fiscid
