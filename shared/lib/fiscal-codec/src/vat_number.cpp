/**
 * @file vat_number.cpp
 * @brief Partita IVA normalization, checksum and sub-field extraction
 */

#include "fiscid/codec/vat_number.h"
#include <algorithm>
#include <cctype>

namespace fiscid::codec {

namespace {

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

bool allDigits(const std::string& s) {
    return std::all_of(s.begin(), s.end(), isDigit);
}

// Provincial offices 001-100 plus the special codes 120 and 121.
// New codes are issued occasionally, so a miss only warns.
bool isKnownOfficeCode(int office) {
    return (office >= 1 && office <= 100) || office == 120 || office == 121;
}

} // namespace

std::string normalizeVatNumber(const std::string& vat) {
    std::string result;
    result.reserve(vat.size());
    for (char c : vat) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isspace(uc) || c == '-') continue;
        result += static_cast<char>(std::toupper(uc));
    }

    if (result.compare(0, 2, "IT") == 0) {
        result.erase(0, 2);
    }
    return result;
}

bool isWellFormedVatNumber(const std::string& normalized) {
    return normalized.size() == VAT_NUMBER_LENGTH && allDigits(normalized);
}

std::optional<int> computeVatCheckDigit(const std::string& digits) {
    if (digits.size() < VAT_NUMBER_LENGTH - 1) {
        return std::nullopt;
    }

    int sum = 0;
    for (size_t i = 0; i < VAT_NUMBER_LENGTH - 1; i++) {
        if (!isDigit(digits[i])) return std::nullopt;
        int digit = digits[i] - '0';

        // i odd = even 1-indexed position: doubled, digits of the product summed
        if (i % 2 == 1) {
            digit *= 2;
            if (digit > 9) digit -= 9;
        }
        sum += digit;
    }

    int remainder = sum % 10;
    return remainder == 0 ? 0 : 10 - remainder;
}

bool isVatChecksumValid(const std::string& normalized) {
    if (!isWellFormedVatNumber(normalized)) return false;

    auto expected = computeVatCheckDigit(normalized);
    return expected && *expected == normalized[VAT_NUMBER_LENGTH - 1] - '0';
}

VatValidationResult validateVatNumber(const std::string& vat) {
    VatValidationResult result;

    if (vat.empty()) {
        result.errors.push_back("Partita IVA mancante");
        return result;
    }

    std::string normalized = normalizeVatNumber(vat);
    result.formatted = normalized;

    if (normalized.size() != VAT_NUMBER_LENGTH) {
        result.errors.push_back("Lunghezza non valida: " + std::to_string(normalized.size()) +
                                " cifre (richieste 11)");
        return result;
    }

    if (!allDigits(normalized)) {
        result.errors.push_back("Formato non valido: la partita IVA deve contenere solo cifre");
        return result;
    }

    if (normalized == "00000000000") {
        result.errors.push_back("Partita IVA non valida: tutti zeri");
        return result;
    }

    result.isChecksumValid = isVatChecksumValid(normalized);
    if (!result.isChecksumValid) {
        result.warnings.push_back("Attenzione: checksum non valido");
    }

    int office = std::stoi(normalized.substr(7, 3));
    if (!isKnownOfficeCode(office)) {
        result.warnings.push_back("Codice ufficio provinciale insolito");
    }

    result.isValid = true;
    return result;
}

std::optional<VatNumberInfo> extractVatInfo(const std::string& vat) {
    std::string normalized = normalizeVatNumber(vat);
    if (!isWellFormedVatNumber(normalized)) {
        return std::nullopt;
    }

    VatNumberInfo info;
    info.taxpayerCode = normalized.substr(0, 7);
    info.officeCode = normalized.substr(7, 3);
    info.checkDigit = normalized.substr(10, 1);
    return info;
}

std::string formatVatNumber(const std::string& vat) {
    std::string normalized = normalizeVatNumber(vat);
    if (isWellFormedVatNumber(normalized)) {
        return "IT" + normalized;
    }
    return vat;
}

bool sameVatNumber(const std::string& lhs, const std::string& rhs) {
    return normalizeVatNumber(lhs) == normalizeVatNumber(rhs);
}

} // namespace fiscid::codec
