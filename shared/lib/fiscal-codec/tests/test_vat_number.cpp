/**
 * @file test_vat_number.cpp
 * @brief Unit tests for vat_number: normalization, checksum, office code
 */

#include <gtest/gtest.h>
#include <fiscid/codec/vat_number.h>

using namespace fiscid::codec;

class VatNumberTest : public ::testing::Test {
protected:
    // Correct check digit and a known office code: no warnings at all
    const std::string CLEAN_VAT = "01234560017";   // office 001
    const std::string OFFICE_100 = "01234561007";
    const std::string OFFICE_120 = "12345671205";
    const std::string OFFICE_121 = "01234561213";

    // Correct check digit, office code outside the known ranges
    const std::string OFFICE_890 = "12345678903";
    const std::string OFFICE_999 = "12345679992";
};

// ============================================================================
// Normalization
// ============================================================================

TEST_F(VatNumberTest, Normalize_StripsPrefixSpacesHyphens) {
    EXPECT_EQ(normalizeVatNumber("IT 12345678-903"), "12345678903");
    EXPECT_EQ(normalizeVatNumber("it12345678903"), "12345678903");
    EXPECT_EQ(normalizeVatNumber(" 123 456 789 03 "), "12345678903");
}

TEST_F(VatNumberTest, Normalize_OnlyLeadingPrefixDropped) {
    EXPECT_EQ(normalizeVatNumber("123IT"), "123IT");
}

TEST_F(VatNumberTest, WellFormed) {
    EXPECT_TRUE(isWellFormedVatNumber(CLEAN_VAT));
    EXPECT_FALSE(isWellFormedVatNumber("0123456001"));
    EXPECT_FALSE(isWellFormedVatNumber("0123456001A"));
    EXPECT_FALSE(isWellFormedVatNumber("IT01234560017"));
}

// ============================================================================
// Check digit
// ============================================================================

TEST_F(VatNumberTest, CheckDigit_KnownValues) {
    EXPECT_EQ(computeVatCheckDigit("1234567890").value_or(-1), 3);
    EXPECT_EQ(computeVatCheckDigit("0123456789").value_or(-1), 7);
    EXPECT_EQ(computeVatCheckDigit("0000000001").value_or(-1), 8);
    EXPECT_EQ(computeVatCheckDigit("0112233440").value_or(-1), 0);
}

TEST_F(VatNumberTest, CheckDigit_UsesOnlyFirstTenDigits) {
    EXPECT_EQ(computeVatCheckDigit("12345678909").value_or(-1), 3);
}

TEST_F(VatNumberTest, CheckDigit_RejectsBadInput) {
    EXPECT_FALSE(computeVatCheckDigit("123456789").has_value());
    EXPECT_FALSE(computeVatCheckDigit("12345A7890").has_value());
    EXPECT_FALSE(computeVatCheckDigit("").has_value());
}

TEST_F(VatNumberTest, Checksum_TextbookExample) {
    for (char d = '0'; d <= '9'; d++) {
        std::string vat = OFFICE_890.substr(0, 10) + d;
        EXPECT_EQ(isVatChecksumValid(vat), d == '3') << vat;
    }
}

TEST_F(VatNumberTest, Checksum_OnlyOneDigitPasses) {
    for (char d = '0'; d <= '9'; d++) {
        std::string vat = CLEAN_VAT.substr(0, 10) + d;
        EXPECT_EQ(isVatChecksumValid(vat), d == '7') << vat;
    }
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(VatNumberTest, Validate_Clean) {
    for (const auto& vat : {CLEAN_VAT, OFFICE_100, OFFICE_120, OFFICE_121}) {
        auto result = validateVatNumber(vat);
        EXPECT_TRUE(result.isValid) << vat;
        EXPECT_TRUE(result.isChecksumValid) << vat;
        EXPECT_TRUE(result.errors.empty()) << vat;
        EXPECT_TRUE(result.warnings.empty()) << vat;
        EXPECT_EQ(result.formatted, vat);
    }
}

TEST_F(VatNumberTest, Validate_WithPrefixAndSeparators) {
    auto result = validateVatNumber("IT 0123456-0017");
    EXPECT_TRUE(result.isValid);
    EXPECT_TRUE(result.isChecksumValid);
    EXPECT_EQ(result.formatted, CLEAN_VAT);
}

TEST_F(VatNumberTest, Validate_Missing) {
    auto result = validateVatNumber("");
    EXPECT_FALSE(result.isValid);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0], "Partita IVA mancante");
}

TEST_F(VatNumberTest, Validate_WrongLength) {
    auto result = validateVatNumber("0123456001");
    EXPECT_FALSE(result.isValid);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_NE(result.errors[0].find("10 cifre"), std::string::npos);
    EXPECT_NE(result.errors[0].find("richieste 11"), std::string::npos);
}

TEST_F(VatNumberTest, Validate_WhitespaceOnlyIsWrongLength) {
    auto result = validateVatNumber("   ");
    EXPECT_FALSE(result.isValid);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_NE(result.errors[0].find("0 cifre"), std::string::npos);
}

TEST_F(VatNumberTest, Validate_NonDigits) {
    auto result = validateVatNumber("0123456001A");
    EXPECT_FALSE(result.isValid);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0], "Formato non valido: la partita IVA deve contenere solo cifre");
}

TEST_F(VatNumberTest, Validate_AllZeros) {
    auto result = validateVatNumber("00000000000");
    EXPECT_FALSE(result.isValid);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0], "Partita IVA non valida: tutti zeri");
}

TEST_F(VatNumberTest, Validate_WrongChecksumIsOnlyAWarning) {
    auto result = validateVatNumber("01234560018");
    EXPECT_TRUE(result.isValid);
    EXPECT_FALSE(result.isChecksumValid);
    EXPECT_TRUE(result.errors.empty());
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0], "Attenzione: checksum non valido");
}

TEST_F(VatNumberTest, Validate_UnusualOfficeCode) {
    for (const auto& vat : {OFFICE_890, OFFICE_999, std::string("01234560009"), std::string("01234561015")}) {
        auto result = validateVatNumber(vat);
        EXPECT_TRUE(result.isValid) << vat;
        EXPECT_TRUE(result.isChecksumValid) << vat;
        ASSERT_EQ(result.warnings.size(), 1u) << vat;
        EXPECT_EQ(result.warnings[0], "Codice ufficio provinciale insolito") << vat;
    }
}

TEST_F(VatNumberTest, Validate_ChecksumAndOfficeWarningsTogether) {
    auto result = validateVatNumber("12345679990");
    EXPECT_TRUE(result.isValid);
    EXPECT_FALSE(result.isChecksumValid);
    EXPECT_EQ(result.warnings.size(), 2u);
}

// ============================================================================
// Sub-fields and formatting
// ============================================================================

TEST_F(VatNumberTest, ExtractInfo) {
    auto info = extractVatInfo("IT12345671205");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->taxpayerCode, "1234567");
    EXPECT_EQ(info->officeCode, "120");
    EXPECT_EQ(info->checkDigit, "5");
}

TEST_F(VatNumberTest, ExtractInfo_Malformed) {
    EXPECT_FALSE(extractVatInfo("1234567120").has_value());
    EXPECT_FALSE(extractVatInfo("").has_value());
}

TEST_F(VatNumberTest, Format) {
    EXPECT_EQ(formatVatNumber("0123456 0017"), "IT01234560017");
    EXPECT_EQ(formatVatNumber("IT01234560017"), "IT01234560017");
    EXPECT_EQ(formatVatNumber("abc"), "abc");
}

TEST_F(VatNumberTest, SameVatNumber) {
    EXPECT_TRUE(sameVatNumber("IT01234560017", "0123456-0017"));
    EXPECT_FALSE(sameVatNumber(CLEAN_VAT, OFFICE_100));
}
