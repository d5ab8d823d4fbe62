/**
 * @file name_fragment.cpp
 * @brief Surname / given name fragment of the Codice Fiscale
 */

#include "fiscid/codec/fiscal_code.h"
#include <cctype>

namespace fiscid::codec {

namespace {

/**
 * @brief Map a Latin-1 supplement letter (second byte of a 0xC3 UTF-8
 *        sequence) to its unaccented base letter
 * @return Base letter, or '\0' for anything that is not a Latin letter
 */
char foldLatin1(unsigned char second) {
    // Upper and lower case blocks differ by 0x20
    unsigned char c = (second >= 0xA0) ? static_cast<unsigned char>(second - 0x20) : second;
    if (c >= 0x80 && c <= 0x85) return 'A';
    if (c == 0x87) return 'C';
    if (c >= 0x88 && c <= 0x8B) return 'E';
    if (c >= 0x8C && c <= 0x8F) return 'I';
    if (c == 0x91) return 'N';
    if (c >= 0x92 && c <= 0x96) return 'O';
    if (c >= 0x99 && c <= 0x9C) return 'U';
    if (c == 0x9D) return 'Y';
    return '\0';
}

/**
 * @brief Upper-case letters of a name, accents folded, everything else dropped
 *
 * "D'Amico" -> "DAMICO", "Niccolò" -> "NICCOLO"
 */
std::string lettersOnly(const std::string& str) {
    std::string result;
    result.reserve(str.size());

    for (size_t i = 0; i < str.size(); i++) {
        unsigned char c = static_cast<unsigned char>(str[i]);
        if (c < 0x80) {
            if (std::isalpha(c)) {
                result += static_cast<char>(std::toupper(c));
            }
        } else if (c == 0xC3 && i + 1 < str.size()) {
            char base = foldLatin1(static_cast<unsigned char>(str[++i]));
            if (base != '\0') {
                result += base;
            }
        }
        // Other multi-byte sequences carry no letter of the A-Z alphabet
    }
    return result;
}

bool isVowel(char c) {
    return c == 'A' || c == 'E' || c == 'I' || c == 'O' || c == 'U';
}

std::string fragment(const std::string& str, bool isGivenName) {
    std::string consonants;
    std::string vowels;
    for (char c : lettersOnly(str)) {
        if (isVowel(c)) {
            vowels += c;
        } else {
            consonants += c;
        }
    }

    // Given names with more than 3 consonants skip the second one
    if (isGivenName && consonants.size() > 3) {
        return std::string{consonants[0], consonants[2], consonants[3]};
    }

    return (consonants + vowels + "XXX").substr(0, 3);
}

bool isBlank(const std::string& str) {
    for (char c : str) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // namespace

std::string generateNameFragment(const std::string& surname, const std::string& name) {
    return fragment(surname, false) + fragment(name, true);
}

bool matchesName(const std::string& code, const std::string& surname, const std::string& name) {
    if (isBlank(surname) || isBlank(name)) return false;

    std::string normalized = normalizeFiscalCode(code);
    if (normalized.size() != FISCAL_CODE_LENGTH) return false;

    return normalized.compare(0, 6, generateNameFragment(surname, name)) == 0;
}

} // namespace fiscid::codec
