/**
 * @file fiscal_code.h
 * @brief Codice Fiscale (Italian personal fiscal code) codec
 *
 * Pure functions, no I/O. A fiscal code is 16 characters:
 *
 *   RSS MRA 80 A 01 H501 U
 *   |   |   |  | |  |    +-- check character
 *   |   |   |  | |  +------- cadastral code of birth place
 *   |   |   |  | +---------- day of birth (+40 for women)
 *   |   |   |  +------------ month letter
 *   |   |   +--------------- year of birth (two digits)
 *   |   +------------------- given name fragment
 *   +----------------------- surname fragment
 *
 * Positions 7, 8, 10, 11, 13, 14 and 15 may carry omocodia letters
 * (L=0 M=1 N=2 P=3 Q=4 R=5 S=6 T=7 U=8 V=9) that stand in for digits.
 */

#pragma once

#include <optional>
#include <string>
#include "types.h"

namespace fiscid::codec {

/// @brief Length of a personal fiscal code
inline constexpr size_t FISCAL_CODE_LENGTH = 16;

/**
 * @brief Upper-case and strip every whitespace character
 */
std::string normalizeFiscalCode(const std::string& code);

/**
 * @brief Check the positional grammar of a normalized code
 *
 * [A-Z]{6} [A-Z0-9]{2} [A-Z] [A-Z0-9]{2} [A-Z] [A-Z0-9]{3} [A-Z]
 */
bool isWellFormedFiscalCode(const std::string& normalized);

/**
 * @brief Replace omocodia letters with digits at the seven numeric positions
 *
 * Characters already numeric, and letters outside the substitution table,
 * are left unchanged. Idempotent. Inputs shorter than 16 characters are
 * decoded as far as they go.
 */
std::string decodeOmocodia(const std::string& normalized);

/**
 * @brief True if at least one numeric position carries an omocodia letter
 */
bool hasOmocodia(const std::string& normalized);

/**
 * @brief Compute the check character from the first 15 characters
 *
 * The sum is taken over the literal characters (not omocodia-decoded).
 *
 * @param code At least 15 characters; normalized before use
 * @return Check letter, or std::nullopt if fewer than 15 characters remain
 *         or one of them is outside A-Z0-9
 */
std::optional<char> computeCheckCharacter(const std::string& code);

/**
 * @brief True if the 16th character matches the computed check character
 */
bool isChecksumValid(const std::string& code);

/**
 * @brief Full validation: format errors block, checksum and omocodia warn
 */
FiscalCodeValidationResult validateFiscalCode(const std::string& code);

/**
 * @brief Derive birth date, sex and birth place from a code
 *
 * The two-digit year is placed in the 1900s when it exceeds
 * (current year mod 100) + 5, otherwise in the 2000s.
 *
 * @param code Raw code (normalized internally)
 * @return Identity; all fields empty when the code is not well formed
 */
ReverseEngineeredIdentity reverseFiscalCode(const std::string& code);

/**
 * @brief Same as reverseFiscalCode(code) with an explicit reference year
 *        for the century heuristic
 */
ReverseEngineeredIdentity reverseFiscalCode(const std::string& code, int referenceYear);

/**
 * @brief True if the date exists in the Gregorian calendar (leap years included)
 */
bool isValidCalendarDate(const BirthDate& date);

/**
 * @brief Render a birth date in Italian form (DD/MM/YYYY)
 */
std::string formatBirthDate(const BirthDate& date);

/**
 * @brief Generate the 6-letter surname + name fragment
 *
 * Consonants first, then vowels, padded with X. For the given name, when it
 * has more than 3 consonants the 1st, 3rd and 4th are used.
 */
std::string generateNameFragment(const std::string& surname, const std::string& name);

/**
 * @brief True if the first 6 characters of the code match surname and name
 *
 * False when the normalized code is not 16 characters long or either name is blank.
 */
bool matchesName(const std::string& code, const std::string& surname, const std::string& name);

/**
 * @brief Build a complete fiscal code (forward encoding)
 *
 * @param surname Surname
 * @param name Given name
 * @param birthDate Date of birth (must be a real calendar date)
 * @param sex Sex
 * @param cadastralCode Birth place code (letter + 3 digits)
 * @return 16-character code, or std::nullopt on invalid date or place code
 */
std::optional<std::string> generateFiscalCode(
    const std::string& surname,
    const std::string& name,
    const BirthDate& birthDate,
    Sex sex,
    const std::string& cadastralCode);

} // namespace fiscid::codec
