/**
 * @file test_municipality_table.cpp
 * @brief Unit tests for the cadastral code lookup
 */

#include <gtest/gtest.h>
#include <fiscid/codec/municipality_table.h>

using namespace fiscid::codec;

class MunicipalityTableTest : public ::testing::Test {};

TEST_F(MunicipalityTableTest, FindsItalianMunicipality) {
    auto m = findMunicipality("H501");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->cadastralCode, "H501");
    EXPECT_EQ(m->name, "ROMA");
    EXPECT_EQ(m->province, "RM");
}

TEST_F(MunicipalityTableTest, CaseInsensitive) {
    auto m = findMunicipality("f205");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->name, "MILANO");
    EXPECT_EQ(m->cadastralCode, "F205");
}

TEST_F(MunicipalityTableTest, FirstAndLastEntries) {
    auto first = findMunicipality("A001");
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->name, "ABANO TERME");

    auto last = findMunicipality("Z404");
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->name, "STATI UNITI D'AMERICA");
}

TEST_F(MunicipalityTableTest, AdjacentCodesAreDistinct) {
    auto emilia = findMunicipality("H223");
    auto calabria = findMunicipality("H224");
    ASSERT_TRUE(emilia.has_value());
    ASSERT_TRUE(calabria.has_value());
    EXPECT_EQ(emilia->province, "RE");
    EXPECT_EQ(calabria->province, "RC");
}

TEST_F(MunicipalityTableTest, ForeignStatesUseProvinceEE) {
    for (const char* code : {"Z100", "Z110", "Z112", "Z114", "Z129", "Z131", "Z133", "Z330", "Z404"}) {
        auto m = findMunicipality(code);
        ASSERT_TRUE(m.has_value()) << code;
        EXPECT_EQ(m->province, "EE") << code;
    }
}

TEST_F(MunicipalityTableTest, MissIsNotAnError) {
    EXPECT_FALSE(findMunicipality("H999").has_value());
    EXPECT_FALSE(findMunicipality("A000").has_value());
    EXPECT_FALSE(findMunicipality("Z999").has_value());
    EXPECT_FALSE(findMunicipality("").has_value());
    EXPECT_FALSE(findMunicipality("H5011").has_value());
}

TEST_F(MunicipalityTableTest, TableIsNotEmpty) {
    EXPECT_GT(municipalityCount(), 0u);
}
