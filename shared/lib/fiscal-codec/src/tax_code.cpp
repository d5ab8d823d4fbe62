/**
 * @file tax_code.cpp
 * @brief Tax code dispatch between personal and numeric codes
 */

#include "fiscid/codec/tax_code.h"
#include "fiscid/codec/fiscal_code.h"
#include "fiscid/codec/vat_number.h"
#include <algorithm>

namespace fiscid::codec {

TaxCodeValidationResult validateTaxCode(const std::string& taxCode) {
    TaxCodeValidationResult result;

    // Same normal form for both shapes: no whitespace, upper case
    std::string normalized = normalizeFiscalCode(taxCode);
    result.normalized = normalized;

    if (normalized.empty()) {
        result.errors.push_back("Codice fiscale mancante");
        return result;
    }

    bool numeric = std::all_of(normalized.begin(), normalized.end(),
                               [](char c) { return c >= '0' && c <= '9'; });

    if (numeric && normalized.size() == VAT_NUMBER_LENGTH) {
        VatValidationResult vat = validateVatNumber(normalized);
        result.kind = TaxCodeKind::COMPANY;
        result.isValid = vat.isValid;
        result.isChecksumValid = vat.isChecksumValid;
        result.errors = std::move(vat.errors);
        result.warnings = std::move(vat.warnings);
        return result;
    }

    FiscalCodeValidationResult person = validateFiscalCode(normalized);
    result.kind = TaxCodeKind::PERSON;
    result.isValid = person.isValid;
    result.isChecksumValid = person.isChecksumValid;
    result.errors = std::move(person.errors);
    result.warnings = std::move(person.warnings);
    return result;
}

} // namespace fiscid::codec
