/**
 * @file types.h
 * @brief Common types for the fiscal identifier codec library
 *
 * Result structs and value types shared by the Codice Fiscale,
 * Partita IVA and tax code modules.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace fiscid::codec {

/// @brief Sex encoded in the day field of a fiscal code
enum class Sex {
    MALE,    ///< Day field 01-40
    FEMALE   ///< Day field 41-71 (day + 40)
};

/// @brief Kind of identifier found in a "codice fiscale" field
enum class TaxCodeKind {
    PERSON,   ///< 16-character personal fiscal code
    COMPANY,  ///< 11-digit numeric code (same rules as Partita IVA)
    UNKNOWN   ///< Empty input
};

/// @brief Calendar date of birth
struct BirthDate {
    int year = 0;
    int month = 0;  ///< 1-12
    int day = 0;    ///< 1-31

    /// @brief ISO 8601 rendering (YYYY-MM-DD)
    std::string toIsoString() const;

    bool operator==(const BirthDate& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const BirthDate& other) const { return !(*this == other); }
};

/// @brief Entry of the cadastral code table
struct Municipality {
    std::string cadastralCode;  ///< e.g. "H501"
    std::string name;           ///< e.g. "ROMA"
    std::string province;       ///< e.g. "RM" ("EE" for foreign states)
};

/// @brief Codice Fiscale validation result
///
/// isValid only covers the format. A wrong checksum is a warning so that
/// real codes with a quirky check character are still accepted.
struct FiscalCodeValidationResult {
    bool isValid = false;
    bool isChecksumValid = false;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

/// @brief Data derived from a fiscal code (best effort, never authoritative)
struct ReverseEngineeredIdentity {
    std::optional<BirthDate> birthDate;   ///< Set only when year, month and day resolved
    std::optional<int> birthYear;
    std::optional<int> birthMonth;
    std::optional<int> birthDay;
    std::optional<std::string> birthPlace;    ///< Municipality name, or "Codice: XXXX"
    std::optional<std::string> province;      ///< Two-letter province code
    std::optional<std::string> cadastralCode; ///< Positions 12-15
    std::optional<Sex> sex;
    std::vector<std::string> warnings;        ///< e.g. unknown municipality
};

/// @brief Partita IVA validation result
struct VatValidationResult {
    bool isValid = false;
    bool isChecksumValid = false;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::string formatted;  ///< Normalized 11-digit string
};

/// @brief Sub-fields of a Partita IVA
struct VatNumberInfo {
    std::string taxpayerCode;  ///< Digits 1-7
    std::string officeCode;    ///< Digits 8-10 (provincial office)
    std::string checkDigit;    ///< Digit 11
};

/// @brief Result of validating a "codice fiscale" field that may hold either identifier
struct TaxCodeValidationResult {
    TaxCodeKind kind = TaxCodeKind::UNKNOWN;
    bool isValid = false;
    bool isChecksumValid = false;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::string normalized;
};

/// @brief Join messages with "; " (for log lines and report cells)
inline std::string joinMessages(const std::vector<std::string>& messages) {
    std::string result;
    for (size_t i = 0; i < messages.size(); i++) {
        if (i > 0) result += "; ";
        result += messages[i];
    }
    return result;
}

/// @brief Convert Sex to its fiscal code letter ("M" / "F")
inline std::string sexToString(Sex s) {
    switch (s) {
        case Sex::MALE:   return "M";
        case Sex::FEMALE: return "F";
    }
    return "UNKNOWN";
}

/// @brief Convert TaxCodeKind to string
inline std::string taxCodeKindToString(TaxCodeKind k) {
    switch (k) {
        case TaxCodeKind::PERSON:  return "PERSON";
        case TaxCodeKind::COMPANY: return "COMPANY";
        case TaxCodeKind::UNKNOWN: return "UNKNOWN";
    }
    return "UNKNOWN";
}

} // namespace fiscid::codec
