/**
 * @file import_validation_service.cpp
 * @brief Dry-run import validation implementation
 */

#include "import_validation_service.h"
#include "field_validators.h"
#include "exceptions.h"

#include <fiscid/codec/fiscal_code.h>
#include <fiscid/codec/tax_code.h>
#include <fiscid/codec/vat_number.h>
#include <fiscid/utils/string_utils.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace fiscid {
namespace importer {

namespace {

// Same text for both codecs
const std::string CHECKSUM_WARNING = "Attenzione: checksum non valido";

bool allDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
}

} // namespace

/**
 * @brief Collects the issues of one row into the batch result
 */
class RowChecker {
public:
    RowChecker(ImportResult& result, int rowNumber)
        : result_(result), rowNumber_(rowNumber) {}

    void error(const std::string& field, const std::string& message,
               const std::optional<std::string>& value = std::nullopt) {
        result_.errors.push_back({rowNumber_, field, message, value});
        hasError_ = true;
    }

    void warning(const std::string& field, const std::string& message,
                 const std::optional<std::string>& value = std::nullopt) {
        result_.warnings.push_back({rowNumber_, field, message, value});
    }

    void duplicate(const std::string& field, const ExistingRecord& existing, const std::string& value) {
        result_.duplicates.push_back({rowNumber_, field, existing.id, existing.name, value});
        hasError_ = true;
    }

    bool hasError() const { return hasError_; }
    int rowNumber() const { return rowNumber_; }

private:
    ImportResult& result_;
    int rowNumber_;
    bool hasError_ = false;
};

// =============================================================================
// Batch entry points
// =============================================================================

ImportValidationService::ImportValidationService(ExistingRecords existing, ImportOptions options)
    : existing_(std::move(existing)), options_(options) {}

int ImportValidationService::defaultMaxRows(RowKind kind) {
    return kind == RowKind::INSTRUCTORS ? 500 : 1000;
}

void ImportValidationService::checkBatchSize(size_t rowCount, RowKind kind) const {
    if (rowCount == 0) {
        throw common::ImportException("Nessun dato da importare");
    }

    int maxRows = options_.maxRows > 0 ? options_.maxRows : defaultMaxRows(kind);
    if (rowCount > static_cast<size_t>(maxRows)) {
        throw common::ImportException("Massimo " + std::to_string(maxRows) + " righe per importazione");
    }
}

ImportResult ImportValidationService::validate(RowKind kind, const Json::Value& document) const {
    switch (kind) {
        case RowKind::STUDENTS:    return validateStudents(parsePersonRows(document));
        case RowKind::INSTRUCTORS: return validateInstructors(parsePersonRows(document));
        case RowKind::COMPANIES:   return validateCompanies(parseCompanyRows(document));
    }
    throw common::ImportException("Tipo di importazione non supportato");
}

ImportResult ImportValidationService::validateStudents(const std::vector<PersonRow>& rows) const {
    return validatePersons(rows, RowKind::STUDENTS);
}

ImportResult ImportValidationService::validateInstructors(const std::vector<PersonRow>& rows) const {
    return validatePersons(rows, RowKind::INSTRUCTORS);
}

// =============================================================================
// Students and instructors
// =============================================================================

ImportResult ImportValidationService::validatePersons(const std::vector<PersonRow>& rows,
                                                      RowKind kind) const {
    checkBatchSize(rows.size(), kind);

    ImportResult result;
    result.totalRows = static_cast<int>(rows.size());

    std::set<std::string> seenTaxCodes;
    std::set<std::string> seenVatNumbers;
    std::set<std::string> seenEmails;

    for (size_t i = 0; i < rows.size(); i++) {
        const PersonRow& row = rows[i];
        RowChecker checker(result, static_cast<int>(i) + 2);  // header is row 1

        if (utils::isBlank(row.firstName)) {
            checker.error("firstName", "Il nome è obbligatorio");
        }
        if (utils::isBlank(row.lastName)) {
            checker.error("lastName", "Il cognome è obbligatorio");
        }

        checkPersonTaxCode(checker, row, seenTaxCodes);

        if (kind == RowKind::INSTRUCTORS) {
            checkVatNumber(checker, row.vatNumber, seenVatNumbers);
        }

        checkEmail(checker, row.email, seenEmails, false);

        std::string phone = utils::trim(row.phone);
        if (!phone.empty() && !validators::isValidPhone(phone)) {
            checker.warning("phone", "Formato telefono non standard", phone);
        }

        std::string birthDate = utils::trim(row.birthDate);
        if (!birthDate.empty() && !validators::parseDate(birthDate)) {
            checker.error("birthDate", "Formato data non valido (usare DD/MM/YYYY o YYYY-MM-DD)", birthDate);
        }

        if (kind == RowKind::INSTRUCTORS) {
            std::string rate = utils::trim(row.hourlyRate);
            if (!rate.empty() && !validators::isValidHourlyRate(rate)) {
                checker.error("hourlyRate", "Tariffa oraria non valida (deve essere un numero positivo)", rate);
            }
        }

        checkAddress(checker, row.postalCode, row.province);

        if (kind == RowKind::INSTRUCTORS) {
            std::string iban = utils::trim(row.iban);
            if (!iban.empty() && !validators::isValidIban(iban)) {
                checker.warning("iban", "IBAN non valido (formato italiano atteso)", iban);
            }
        }

        if (kind == RowKind::STUDENTS) {
            checkCompanyId(checker, row.companyId);
        }

        if (checker.hasError()) {
            result.skipped++;
            spdlog::debug("Row {} skipped", checker.rowNumber());
        }
    }

    result.validRows = result.totalRows - result.skipped;
    result.success = result.errors.empty() && result.duplicates.empty();

    spdlog::info("Validated {} {} rows: {} valid, {} skipped, {} duplicates, {} warnings",
                 result.totalRows, rowKindToString(kind), result.validRows, result.skipped,
                 result.duplicates.size(), result.warnings.size());
    return result;
}

void ImportValidationService::checkPersonTaxCode(RowChecker& checker, const PersonRow& row,
                                                 std::set<std::string>& seen) const {
    std::string taxCode = codec::normalizeFiscalCode(row.taxCode);
    if (taxCode.empty()) {
        return;
    }

    codec::FiscalCodeValidationResult validation = codec::validateFiscalCode(taxCode);
    if (!validation.isValid) {
        checker.error("taxCode", "Codice Fiscale non valido: " + codec::joinMessages(validation.errors), taxCode);
        return;
    }
    reportCodecWarnings(checker, "taxCode", validation.isChecksumValid, validation.warnings, taxCode);

    if (const ExistingRecord* existing = existing_.findByTaxCode(taxCode)) {
        checker.duplicate("taxCode", *existing, taxCode);
    }
    if (!seen.insert(taxCode).second) {
        checker.error("taxCode", "Codice Fiscale duplicato nel file", taxCode);
    }

    // Cross-checks against the declared personal data (warnings only)
    if (options_.checkNameMatch && !utils::isBlank(row.firstName) && !utils::isBlank(row.lastName) &&
        !codec::matchesName(taxCode, row.lastName, row.firstName)) {
        checker.warning("taxCode", "Il codice fiscale non corrisponde a nome e cognome", taxCode);
    }

    auto declared = validators::parseDate(utils::trim(row.birthDate));
    if (declared) {
        // Years compared modulo 100: the century in the code is a guess
        codec::ReverseEngineeredIdentity identity = codec::reverseFiscalCode(taxCode);
        if (identity.birthYear && identity.birthMonth && identity.birthDay &&
            (*identity.birthYear % 100 != declared->year % 100 ||
             *identity.birthMonth != declared->month ||
             *identity.birthDay != declared->day)) {
            checker.warning("birthDate", "Data di nascita non coerente con il codice fiscale",
                            codec::formatBirthDate(*declared));
        }
    }
}

void ImportValidationService::checkCompanyId(RowChecker& checker, const std::string& raw) const {
    std::string companyId = utils::trim(raw);
    if (companyId.empty()) {
        checker.error("companyId", "L'azienda è obbligatoria");
        return;
    }

    if (!allDigits(companyId)) {
        checker.error("companyId", "ID azienda non valido (deve essere un numero)", companyId);
        return;
    }

    long long id = 0;
    try {
        id = std::stoll(companyId);
    } catch (const std::out_of_range&) {
        checker.error("companyId", "ID azienda non valido (deve essere un numero)", companyId);
        return;
    }

    if (!existing_.hasCompany(id)) {
        checker.error("companyId", "Azienda con ID " + std::to_string(id) + " non trovata", companyId);
    }
}

// =============================================================================
// Companies
// =============================================================================

ImportResult ImportValidationService::validateCompanies(const std::vector<CompanyRow>& rows) const {
    checkBatchSize(rows.size(), RowKind::COMPANIES);

    ImportResult result;
    result.totalRows = static_cast<int>(rows.size());

    std::set<std::string> seenVatNumbers;
    std::set<std::string> seenTaxCodes;
    std::set<std::string> seenEmails;

    for (size_t i = 0; i < rows.size(); i++) {
        const CompanyRow& row = rows[i];
        RowChecker checker(result, static_cast<int>(i) + 2);

        if (utils::isBlank(row.name)) {
            checker.error("name", "Il nome azienda è obbligatorio");
        }

        checkVatNumber(checker, row.vatNumber, seenVatNumbers);
        checkCompanyTaxCode(checker, row, seenTaxCodes);
        checkEmail(checker, row.email, seenEmails, true);

        std::string pec = utils::toLower(utils::trim(row.pec));
        if (!pec.empty() && !validators::isValidEmail(pec)) {
            checker.error("pec", "PEC non valida", pec);
        }

        std::string phone = utils::trim(row.phone);
        if (!phone.empty() && !validators::isValidPhone(phone)) {
            checker.warning("phone", "Formato telefono non standard", phone);
        }

        checkAddress(checker, row.postalCode, row.province);

        std::string sdiCode = utils::trim(row.sdiCode);
        if (!sdiCode.empty() && !validators::isValidSdiCode(sdiCode)) {
            checker.warning("sdiCode", "Codice SDI non valido", sdiCode);
        }

        if (checker.hasError()) {
            result.skipped++;
            spdlog::debug("Row {} skipped", checker.rowNumber());
        }
    }

    result.validRows = result.totalRows - result.skipped;
    result.success = result.errors.empty() && result.duplicates.empty();

    spdlog::info("Validated {} companies rows: {} valid, {} skipped, {} duplicates, {} warnings",
                 result.totalRows, result.validRows, result.skipped,
                 result.duplicates.size(), result.warnings.size());
    return result;
}

void ImportValidationService::checkCompanyTaxCode(RowChecker& checker, const CompanyRow& row,
                                                  std::set<std::string>& seen) const {
    codec::TaxCodeValidationResult validation = codec::validateTaxCode(row.taxCode);
    if (validation.kind == codec::TaxCodeKind::UNKNOWN) {
        return;  // optional field left empty
    }

    const std::string& taxCode = validation.normalized;
    if (!validation.isValid) {
        checker.error("taxCode", "Codice Fiscale non valido: " + codec::joinMessages(validation.errors), taxCode);
        return;
    }
    reportCodecWarnings(checker, "taxCode", validation.isChecksumValid, validation.warnings, taxCode);

    if (const ExistingRecord* existing = existing_.findByTaxCode(taxCode)) {
        checker.duplicate("taxCode", *existing, taxCode);
    }
    if (!seen.insert(taxCode).second) {
        checker.error("taxCode", "Codice Fiscale duplicato nel file", taxCode);
    }
}

// =============================================================================
// Shared field checks
// =============================================================================

void ImportValidationService::checkVatNumber(RowChecker& checker, const std::string& raw,
                                             std::set<std::string>& seen) const {
    std::string trimmed = utils::trim(raw);
    if (trimmed.empty()) {
        return;
    }

    codec::VatValidationResult validation = codec::validateVatNumber(trimmed);
    if (!validation.isValid) {
        checker.error("vatNumber", "P.IVA non valida: " + codec::joinMessages(validation.errors), trimmed);
        return;
    }

    const std::string& vatNumber = validation.formatted;
    reportCodecWarnings(checker, "vatNumber", validation.isChecksumValid, validation.warnings, vatNumber);

    if (const ExistingRecord* existing = existing_.findByVatNumber(vatNumber)) {
        checker.duplicate("vatNumber", *existing, vatNumber);
    }
    if (!seen.insert(vatNumber).second) {
        checker.error("vatNumber", "P.IVA duplicata nel file", vatNumber);
    }
}

void ImportValidationService::checkEmail(RowChecker& checker, const std::string& raw,
                                         std::set<std::string>& seen, bool duplicatesAreWarnings) const {
    std::string email = utils::toLower(utils::trim(raw));
    if (email.empty()) {
        return;
    }

    if (!validators::isValidEmail(email)) {
        checker.error("email", "Email non valida", email);
        return;
    }

    // Companies may share a mailbox (e.g. the same accountant): warn only
    if (const ExistingRecord* existing = existing_.findByEmail(email)) {
        if (duplicatesAreWarnings) {
            checker.warning("email", "Email già presente per: " + existing->name, email);
        } else {
            checker.duplicate("email", *existing, email);
        }
    }
    if (!seen.insert(email).second) {
        if (duplicatesAreWarnings) {
            checker.warning("email", "Email duplicata nel file", email);
        } else {
            checker.error("email", "Email duplicata nel file", email);
        }
    }
}

void ImportValidationService::checkAddress(RowChecker& checker, const std::string& postalCode,
                                           const std::string& province) const {
    std::string cap = utils::trim(postalCode);
    if (!cap.empty() && !validators::isValidPostalCode(cap)) {
        checker.warning("postalCode", "CAP non valido (deve essere 5 cifre)", cap);
    }

    std::string prov = utils::trim(province);
    if (!prov.empty() && !validators::isValidProvince(prov)) {
        checker.warning("province", "Provincia non valida (deve essere 2 lettere)", prov);
    }
}

void ImportValidationService::reportCodecWarnings(RowChecker& checker, const std::string& field,
                                                  bool checksumValid,
                                                  const std::vector<std::string>& warnings,
                                                  const std::string& value) const {
    bool checksumIsError = !checksumValid && options_.strictChecksum;
    if (checksumIsError) {
        checker.error(field, "Checksum non valido", value);
    }

    for (const auto& warning : warnings) {
        if (checksumIsError && warning == CHECKSUM_WARNING) {
            continue;
        }
        checker.warning(field, warning, value);
    }
}

} // namespace importer
} // namespace fiscid
