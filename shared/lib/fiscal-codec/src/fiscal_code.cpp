/**
 * @file fiscal_code.cpp
 * @brief Codice Fiscale validation, checksum and reverse engineering
 */

#include "fiscid/codec/fiscal_code.h"
#include "fiscid/codec/municipality_table.h"
#include <array>
#include <cctype>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace fiscid::codec {

namespace {

// Month letters, index 0 = January
constexpr const char* MONTH_LETTERS = "ABCDEHLMPRST";

// Omocodia letters, index = digit they replace
constexpr const char* OMOCODIA_LETTERS = "LMNPQRSTUV";

// 0-indexed positions that may carry omocodia letters
constexpr std::array<size_t, 7> OMOCODIA_POSITIONS = {6, 7, 9, 10, 12, 13, 14};

// Odd-position values (1-indexed), index 0-25 = A-Z; digits 0-9 share the A-J values
constexpr std::array<int, 26> ODD_VALUES = {
    1, 0, 5, 7, 9, 13, 15, 17, 19, 21,    // A-J / 0-9
    2, 4, 18, 20, 11, 3, 6, 8, 12, 14,    // K-T
    16, 10, 22, 25, 24, 23                // U-Z
};

bool isUpperLetter(char c) {
    return c >= 'A' && c <= 'Z';
}

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

bool isAlnum(char c) {
    return isUpperLetter(c) || isDigit(c);
}

// Position classes: true = letter only, false = letter or digit
constexpr std::array<bool, FISCAL_CODE_LENGTH> LETTER_ONLY = {
    true, true, true, true, true, true,   // surname + name
    false, false,                         // year
    true,                                 // month
    false, false,                         // day + sex
    true, false, false, false,            // cadastral code
    true                                  // check character
};

int evenValue(char c) {
    return isDigit(c) ? c - '0' : c - 'A';
}

int oddValue(char c) {
    return ODD_VALUES[isDigit(c) ? c - '0' : c - 'A'];
}

std::optional<int> parseTwoDigits(const std::string& s, size_t pos) {
    if (pos + 1 >= s.size() || !isDigit(s[pos]) || !isDigit(s[pos + 1])) {
        return std::nullopt;
    }
    return (s[pos] - '0') * 10 + (s[pos + 1] - '0');
}

// Characters, not bytes: UTF-8 continuation bytes are not counted
size_t characterCount(const std::string& s) {
    size_t count = 0;
    for (char c : s) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) count++;
    }
    return count;
}

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
    static constexpr std::array<int, 12> DAYS = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeapYear(year)) return 29;
    return DAYS[month - 1];
}

int currentYear() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tmNow{};
    localtime_r(&now, &tmNow);
    return tmNow.tm_year + 1900;
}

std::string padNumber(int value, int width) {
    std::ostringstream oss;
    oss << std::setw(width) << std::setfill('0') << value;
    return oss.str();
}

} // namespace

std::string BirthDate::toIsoString() const {
    return padNumber(year, 4) + "-" + padNumber(month, 2) + "-" + padNumber(day, 2);
}

std::string normalizeFiscalCode(const std::string& code) {
    std::string result;
    result.reserve(code.size());
    for (char c : code) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isspace(uc)) continue;
        result += static_cast<char>(std::toupper(uc));
    }
    return result;
}

bool isWellFormedFiscalCode(const std::string& normalized) {
    if (normalized.size() != FISCAL_CODE_LENGTH) return false;

    for (size_t i = 0; i < FISCAL_CODE_LENGTH; i++) {
        char c = normalized[i];
        if (LETTER_ONLY[i] ? !isUpperLetter(c) : !isAlnum(c)) {
            return false;
        }
    }
    return true;
}

std::string decodeOmocodia(const std::string& normalized) {
    std::string result = normalized;
    for (size_t pos : OMOCODIA_POSITIONS) {
        if (pos >= result.size()) break;
        const char* hit = std::strchr(OMOCODIA_LETTERS, result[pos]);
        if (hit && *hit != '\0') {
            result[pos] = static_cast<char>('0' + (hit - OMOCODIA_LETTERS));
        }
    }
    return result;
}

bool hasOmocodia(const std::string& normalized) {
    return decodeOmocodia(normalized) != normalized;
}

std::optional<char> computeCheckCharacter(const std::string& code) {
    std::string normalized = normalizeFiscalCode(code);
    if (normalized.size() < FISCAL_CODE_LENGTH - 1) {
        return std::nullopt;
    }

    int sum = 0;
    for (size_t i = 0; i < FISCAL_CODE_LENGTH - 1; i++) {
        char c = normalized[i];
        if (!isAlnum(c)) return std::nullopt;
        // i is 0-indexed: i odd means an even 1-indexed position
        sum += (i % 2 == 1) ? evenValue(c) : oddValue(c);
    }
    return static_cast<char>('A' + sum % 26);
}

bool isChecksumValid(const std::string& code) {
    std::string normalized = normalizeFiscalCode(code);
    if (normalized.size() != FISCAL_CODE_LENGTH) return false;

    auto expected = computeCheckCharacter(normalized);
    return expected && *expected == normalized[FISCAL_CODE_LENGTH - 1];
}

FiscalCodeValidationResult validateFiscalCode(const std::string& code) {
    FiscalCodeValidationResult result;

    std::string normalized = normalizeFiscalCode(code);
    if (normalized.empty()) {
        result.errors.push_back("Codice fiscale mancante");
        return result;
    }

    size_t length = characterCount(normalized);
    if (length != FISCAL_CODE_LENGTH) {
        result.errors.push_back("Lunghezza non valida: " + std::to_string(length) +
                                " caratteri (richiesti 16)");
        return result;
    }

    if (!isWellFormedFiscalCode(normalized)) {
        result.errors.push_back("Formato non valido");
        return result;
    }

    result.isChecksumValid = isChecksumValid(normalized);
    if (!result.isChecksumValid) {
        result.warnings.push_back("Attenzione: checksum non valido");
    }

    if (hasOmocodia(normalized)) {
        result.warnings.push_back("Codice fiscale con omocodia rilevata");
    }

    result.isValid = true;
    return result;
}

ReverseEngineeredIdentity reverseFiscalCode(const std::string& code) {
    return reverseFiscalCode(code, currentYear());
}

ReverseEngineeredIdentity reverseFiscalCode(const std::string& code, int referenceYear) {
    ReverseEngineeredIdentity result;

    std::string normalized = normalizeFiscalCode(code);
    if (!isWellFormedFiscalCode(normalized)) {
        return result;
    }
    std::string decoded = decodeOmocodia(normalized);

    // Year: positions 7-8. Known to misplace people older than ~95 years.
    if (auto yy = parseTwoDigits(decoded, 6)) {
        int pivot = referenceYear % 100 + 5;
        result.birthYear = (*yy > pivot) ? 1900 + *yy : 2000 + *yy;
    }

    // Month: position 9, read from the raw code (it is never omocodic)
    if (const char* hit = std::strchr(MONTH_LETTERS, normalized[8]); hit && *hit != '\0') {
        result.birthMonth = static_cast<int>(hit - MONTH_LETTERS) + 1;
    }

    // Day and sex: positions 10-11, women carry day + 40
    if (auto dd = parseTwoDigits(decoded, 9)) {
        int day = *dd;
        if (day > 40) {
            result.sex = Sex::FEMALE;
            day -= 40;
        } else {
            result.sex = Sex::MALE;
        }
        if (day > 0) {
            result.birthDay = day;
        }
    }

    if (result.birthYear && result.birthMonth && result.birthDay) {
        BirthDate date{*result.birthYear, *result.birthMonth, *result.birthDay};
        if (isValidCalendarDate(date)) {
            result.birthDate = date;
        }
    }

    // Birth place: positions 12-15, digits 13-15 may be omocodic.
    // Looked up decoded; a miss is reported as written in the code.
    std::string cadastral = decoded.substr(11, 4);
    result.cadastralCode = cadastral;

    if (auto municipality = findMunicipality(cadastral)) {
        result.birthPlace = municipality->name;
        result.province = municipality->province;
    } else {
        std::string literal = normalized.substr(11, 4);
        result.birthPlace = "Codice: " + literal;
        result.warnings.push_back("Codice catastale " + literal +
                                  " non presente nella tabella comuni");
    }

    return result;
}

bool isValidCalendarDate(const BirthDate& date) {
    if (date.year < 1 || date.month < 1 || date.month > 12 || date.day < 1) return false;
    return date.day <= daysInMonth(date.year, date.month);
}

std::string formatBirthDate(const BirthDate& date) {
    return padNumber(date.day, 2) + "/" + padNumber(date.month, 2) + "/" + padNumber(date.year, 4);
}

std::optional<std::string> generateFiscalCode(
    const std::string& surname,
    const std::string& name,
    const BirthDate& birthDate,
    Sex sex,
    const std::string& cadastralCode) {

    if (!isValidCalendarDate(birthDate)) {
        return std::nullopt;
    }

    std::string place = normalizeFiscalCode(cadastralCode);
    if (place.size() != 4 || !isUpperLetter(place[0]) ||
        !isDigit(place[1]) || !isDigit(place[2]) || !isDigit(place[3])) {
        return std::nullopt;
    }

    std::string code = generateNameFragment(surname, name);
    code += padNumber(birthDate.year % 100, 2);
    code += MONTH_LETTERS[birthDate.month - 1];
    code += padNumber(birthDate.day + (sex == Sex::FEMALE ? 40 : 0), 2);
    code += place;

    auto check = computeCheckCharacter(code);
    if (!check) {
        return std::nullopt;
    }
    code += *check;
    return code;
}

} // namespace fiscid::codec
