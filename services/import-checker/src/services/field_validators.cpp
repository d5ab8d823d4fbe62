/**
 * @file field_validators.cpp
 * @brief Field format checks
 */

#include "field_validators.h"
#include <fiscid/codec/fiscal_code.h>
#include <fiscid/utils/string_utils.h>
#include <algorithm>
#include <regex>
#include <stdexcept>

namespace fiscid {
namespace importer {
namespace validators {

namespace {

const std::regex EMAIL_PATTERN(R"(^[^\s@]+@[^\s@]+\.[^\s@]+$)");
const std::regex PHONE_PATTERN(R"(^\+?\d{6,15}$)");
const std::regex POSTAL_CODE_PATTERN(R"(^\d{5}$)");
const std::regex PROVINCE_PATTERN(R"(^[A-Za-z]{2}$)");
const std::regex SDI_PATTERN(R"(^[A-Za-z0-9]{6,7}$)");
const std::regex IBAN_PATTERN(R"(^IT\d{2}[A-Z]\d{22}$)");
const std::regex RATE_PATTERN(R"(^\d+(\.\d+)?$)");

const std::regex DATE_IT_SLASH(R"(^(\d{2})/(\d{2})/(\d{4})$)");
const std::regex DATE_IT_DASH(R"(^(\d{2})-(\d{2})-(\d{4})$)");
const std::regex DATE_ISO(R"(^(\d{4})-(\d{2})-(\d{2})$)");

} // namespace

bool isValidEmail(const std::string& email) {
    return std::regex_match(email, EMAIL_PATTERN);
}

bool isValidPhone(const std::string& phone) {
    return std::regex_match(utils::removeChars(phone, " \t-.()"), PHONE_PATTERN);
}

bool isValidPostalCode(const std::string& postalCode) {
    return std::regex_match(postalCode, POSTAL_CODE_PATTERN);
}

bool isValidProvince(const std::string& province) {
    return std::regex_match(province, PROVINCE_PATTERN);
}

bool isValidSdiCode(const std::string& sdiCode) {
    return std::regex_match(sdiCode, SDI_PATTERN);
}

bool isValidIban(const std::string& iban) {
    return std::regex_match(utils::toUpper(utils::removeChars(iban, " \t")), IBAN_PATTERN);
}

bool isValidHourlyRate(const std::string& rate) {
    std::string cleaned = utils::trim(rate);
    std::replace(cleaned.begin(), cleaned.end(), ',', '.');
    if (!std::regex_match(cleaned, RATE_PATTERN)) {
        return false;
    }
    try {
        return std::stod(cleaned) <= 10000.0;
    } catch (const std::out_of_range&) {
        return false;
    }
}

std::optional<codec::BirthDate> parseDate(const std::string& date) {
    std::smatch match;
    codec::BirthDate result;

    if (std::regex_match(date, match, DATE_IT_SLASH) || std::regex_match(date, match, DATE_IT_DASH)) {
        result.day = std::stoi(match[1].str());
        result.month = std::stoi(match[2].str());
        result.year = std::stoi(match[3].str());
    } else if (std::regex_match(date, match, DATE_ISO)) {
        result.year = std::stoi(match[1].str());
        result.month = std::stoi(match[2].str());
        result.day = std::stoi(match[3].str());
    } else {
        return std::nullopt;
    }

    if (!codec::isValidCalendarDate(result)) {
        return std::nullopt;
    }
    return result;
}

} // namespace validators
} // namespace importer
} // namespace fiscid
