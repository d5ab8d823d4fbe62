/**
 * @file field_validators.h
 * @brief Format checks for contact and registry fields of import rows
 *
 * Empty values are handled by the caller: these functions only judge
 * non-empty input.
 */

#pragma once

#include <optional>
#include <string>
#include <fiscid/codec/types.h>

namespace fiscid {
namespace importer {
namespace validators {

/// local@domain.tld, no whitespace, exactly one '@'
bool isValidEmail(const std::string& email);

/// Optional '+', then 6-15 digits once spaces, '-', '.', '(' and ')' are removed
bool isValidPhone(const std::string& phone);

/// CAP: exactly 5 digits
bool isValidPostalCode(const std::string& postalCode);

/// Two letters, any case
bool isValidProvince(const std::string& province);

/// SDI recipient code: 6-7 letters or digits, any case
bool isValidSdiCode(const std::string& sdiCode);

/// Italian IBAN: IT, 2 check digits, CIN letter, 22 digits (spaces ignored)
bool isValidIban(const std::string& iban);

/// Number in [0, 10000], decimal comma accepted
bool isValidHourlyRate(const std::string& rate);

/**
 * @brief Parse a birth date in DD/MM/YYYY, YYYY-MM-DD or DD-MM-YYYY form
 * @return Date, or std::nullopt if the format is unknown or the date does not exist
 */
std::optional<codec::BirthDate> parseDate(const std::string& date);

} // namespace validators
} // namespace importer
} // namespace fiscid
