/**
 * @file test_tax_code.cpp
 * @brief Unit tests for validateTaxCode (personal vs numeric codes)
 */

#include <gtest/gtest.h>
#include <fiscid/codec/tax_code.h>
#include "test_helpers.h"

using namespace fiscid::codec;
using namespace test_helpers;

class TaxCodeTest : public ::testing::Test {};

TEST_F(TaxCodeTest, PersonalCode) {
    auto result = validateTaxCode(ROSSI_MARIO);
    EXPECT_EQ(result.kind, TaxCodeKind::PERSON);
    EXPECT_TRUE(result.isValid);
    EXPECT_TRUE(result.isChecksumValid);
    EXPECT_EQ(result.normalized, ROSSI_MARIO);
}

TEST_F(TaxCodeTest, PersonalCode_Normalized) {
    auto result = validateTaxCode(" rssmra80a01h501u ");
    EXPECT_EQ(result.kind, TaxCodeKind::PERSON);
    EXPECT_TRUE(result.isValid);
    EXPECT_EQ(result.normalized, ROSSI_MARIO);
}

TEST_F(TaxCodeTest, CompanyCode) {
    auto result = validateTaxCode("01234560017");
    EXPECT_EQ(result.kind, TaxCodeKind::COMPANY);
    EXPECT_TRUE(result.isValid);
    EXPECT_TRUE(result.isChecksumValid);
    EXPECT_TRUE(result.warnings.empty());
}

TEST_F(TaxCodeTest, CompanyCode_WrongChecksumWarns) {
    auto result = validateTaxCode("01234560018");
    EXPECT_EQ(result.kind, TaxCodeKind::COMPANY);
    EXPECT_TRUE(result.isValid);
    EXPECT_FALSE(result.isChecksumValid);
    ASSERT_EQ(result.warnings.size(), 1u);
}

TEST_F(TaxCodeTest, CompanyCode_AllZerosRejected) {
    auto result = validateTaxCode("00000000000");
    EXPECT_EQ(result.kind, TaxCodeKind::COMPANY);
    EXPECT_FALSE(result.isValid);
    EXPECT_FALSE(result.errors.empty());
}

TEST_F(TaxCodeTest, OtherDigitCountsArePersonalCodes) {
    // 10 or 12 digits are not company codes: reported as personal code length errors
    auto result = validateTaxCode("0123456001");
    EXPECT_EQ(result.kind, TaxCodeKind::PERSON);
    EXPECT_FALSE(result.isValid);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_NE(result.errors[0].find("richiesti 16"), std::string::npos);
}

TEST_F(TaxCodeTest, Empty) {
    auto result = validateTaxCode("   ");
    EXPECT_EQ(result.kind, TaxCodeKind::UNKNOWN);
    EXPECT_FALSE(result.isValid);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0], "Codice fiscale mancante");
}

TEST_F(TaxCodeTest, KindToString) {
    EXPECT_EQ(taxCodeKindToString(TaxCodeKind::PERSON), "PERSON");
    EXPECT_EQ(taxCodeKindToString(TaxCodeKind::COMPANY), "COMPANY");
    EXPECT_EQ(taxCodeKindToString(TaxCodeKind::UNKNOWN), "UNKNOWN");
    EXPECT_EQ(sexToString(Sex::MALE), "M");
    EXPECT_EQ(sexToString(Sex::FEMALE), "F");
}

TEST_F(TaxCodeTest, JoinMessages) {
    EXPECT_EQ(joinMessages({}), "");
    EXPECT_EQ(joinMessages({"a"}), "a");
    EXPECT_EQ(joinMessages({"a", "b"}), "a; b");
}
