/**
 * @file vat_number.h
 * @brief Partita IVA (Italian VAT number) codec
 *
 * Pure functions, no I/O. A VAT number is 11 digits:
 * taxpayer code (7) + provincial office code (3) + check digit (1).
 */

#pragma once

#include <optional>
#include <string>
#include "types.h"

namespace fiscid::codec {

/// @brief Length of a Partita IVA
inline constexpr size_t VAT_NUMBER_LENGTH = 11;

/**
 * @brief Upper-case, strip whitespace and hyphens, drop a leading "IT"
 */
std::string normalizeVatNumber(const std::string& vat);

/**
 * @brief True if the normalized value is exactly 11 decimal digits
 */
bool isWellFormedVatNumber(const std::string& normalized);

/**
 * @brief Compute the check digit from the first 10 digits
 *
 * Odd positions (1-indexed) are summed as-is; even positions are doubled,
 * minus 9 when the result exceeds 9. The check digit completes the total
 * to a multiple of 10.
 *
 * @param digits At least 10 decimal digits (only the first 10 are used)
 * @return Check digit 0-9, or std::nullopt if the input is not numeric
 */
std::optional<int> computeVatCheckDigit(const std::string& digits);

/**
 * @brief True if an 11-digit value carries the expected check digit
 */
bool isVatChecksumValid(const std::string& normalized);

/**
 * @brief Full validation: format and all-zero errors block, checksum and
 *        office code warn
 */
VatValidationResult validateVatNumber(const std::string& vat);

/**
 * @brief Split a VAT number into taxpayer, office and check digit
 * @return Sub-fields, or std::nullopt if the normalized value is not 11 digits
 */
std::optional<VatNumberInfo> extractVatInfo(const std::string& vat);

/**
 * @brief Prefix the normalized number with "IT"
 * @return "IT" + 11 digits, or the input unchanged if not well formed
 */
std::string formatVatNumber(const std::string& vat);

/**
 * @brief Compare two VAT numbers after normalization
 */
bool sameVatNumber(const std::string& lhs, const std::string& rhs);

} // namespace fiscid::codec
