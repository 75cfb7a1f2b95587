/**
 * @file test_munsell_color.cpp
 * @brief Unit tests for MunsellColor and Munsell notation parsing
 */

#include <gtest/gtest.h>
#include <MunsellSpace/Core/MunsellColor.h>
#include <MunsellSpace/Core/Exception.h>

#include <cmath>

using namespace MunsellSpace;

// =============================================================================
// Construction
// =============================================================================

TEST(MunsellColorTest, DefaultIsBlack) {
    MunsellColor c;
    EXPECT_TRUE(c.IsNeutral());
    EXPECT_DOUBLE_EQ(c.Value(), 0.0);
    EXPECT_EQ(c.ToString(), "N 0.0");
}

TEST(MunsellColorTest, ChromaticFields) {
    MunsellColor c(HueFamily::YR, 2.5, 6.0, 8.0);
    EXPECT_EQ(c.Family(), HueFamily::YR);
    EXPECT_DOUBLE_EQ(c.HueNumber(), 2.5);
    EXPECT_DOUBLE_EQ(c.Value(), 6.0);
    EXPECT_DOUBLE_EQ(c.Chroma(), 8.0);
    EXPECT_DOUBLE_EQ(c.HuePosition(), 12.5);
    EXPECT_FALSE(c.IsNeutral());
}

TEST(MunsellColorTest, HueTenIsZeroOfNextFamily) {
    MunsellColor c(HueFamily::Y, 10.0, 5.0, 4.0);
    EXPECT_EQ(c.Family(), HueFamily::GY);
    EXPECT_DOUBLE_EQ(c.HueNumber(), 0.0);

    MunsellColor wrap(HueFamily::RP, 10.0, 5.0, 4.0);
    EXPECT_EQ(wrap.Family(), HueFamily::R);
    EXPECT_DOUBLE_EQ(wrap.HuePosition(), 0.0);
}

TEST(MunsellColorTest, ZeroChromaIsNeutral) {
    MunsellColor c(HueFamily::B, 5.0, 4.0, 0.0);
    EXPECT_TRUE(c.IsNeutral());
    EXPECT_EQ(c, MunsellColor::Neutral(4.0));
}

TEST(MunsellColorTest, RejectsOutOfRange) {
    EXPECT_THROW(MunsellColor(HueFamily::R, 10.5, 5.0, 4.0), InvalidArgumentException);
    EXPECT_THROW(MunsellColor(HueFamily::R, 5.0, 10.5, 4.0), InvalidArgumentException);
    EXPECT_THROW(MunsellColor(HueFamily::R, 5.0, 5.0, -1.0), InvalidArgumentException);
    EXPECT_THROW(MunsellColor(HueFamily::R, 5.0, 5.0, std::nan("")), InvalidArgumentException);
}

TEST(MunsellColorTest, FromHuePosition) {
    MunsellColor c = MunsellColor::FromHuePosition(47.5, 5.0, 6.0);
    EXPECT_EQ(c.Family(), HueFamily::G);
    EXPECT_DOUBLE_EQ(c.HueNumber(), 7.5);

    MunsellColor wrapped = MunsellColor::FromHuePosition(-2.5, 5.0, 6.0);
    EXPECT_EQ(wrapped.Family(), HueFamily::RP);
    EXPECT_DOUBLE_EQ(wrapped.HueNumber(), 7.5);

    MunsellColor full = MunsellColor::FromHuePosition(100.0, 5.0, 6.0);
    EXPECT_EQ(full.Family(), HueFamily::R);
    EXPECT_DOUBLE_EQ(full.HueNumber(), 0.0);
}

// =============================================================================
// Formatting
// =============================================================================

TEST(MunsellColorTest, ToString) {
    EXPECT_EQ(MunsellColor(HueFamily::R, 5.0, 4.0, 14.0).ToString(), "5.0R 4.0/14.0");
    EXPECT_EQ(MunsellColor(HueFamily::PB, 7.5, 3.25, 10.0).ToString(2), "7.50PB 3.25/10.00");
    EXPECT_EQ(MunsellColor::Neutral(5.0).ToString(), "N 5.0");
}

TEST(MunsellColorTest, ToStringRoundingCarriesFamily) {
    MunsellColor c(HueFamily::Y, 9.97, 5.0, 4.0);
    EXPECT_EQ(c.ToString(1), "0.0GY 5.0/4.0");
}

// =============================================================================
// Parsing
// =============================================================================

TEST(ParseMunsellTest, Chromatic) {
    MunsellColor c = ParseMunsell("5R 4/14");
    EXPECT_EQ(c.Family(), HueFamily::R);
    EXPECT_DOUBLE_EQ(c.HueNumber(), 5.0);
    EXPECT_DOUBLE_EQ(c.Value(), 4.0);
    EXPECT_DOUBLE_EQ(c.Chroma(), 14.0);
}

TEST(ParseMunsellTest, FlexibleSpacingAndCase) {
    EXPECT_EQ(ParseMunsell("5R4/14"), ParseMunsell("5R 4.0/14.0"));
    EXPECT_EQ(ParseMunsell("2.5 yr 6.0/8.0"), MunsellColor(HueFamily::YR, 2.5, 6.0, 8.0));
    EXPECT_EQ(ParseMunsell("  7.5PB 3 / 10  "), MunsellColor(HueFamily::PB, 7.5, 3.0, 10.0));
}

TEST(ParseMunsellTest, Neutral) {
    EXPECT_EQ(ParseMunsell("N 5"), MunsellColor::Neutral(5.0));
    EXPECT_EQ(ParseMunsell("N5"), MunsellColor::Neutral(5.0));
    EXPECT_EQ(ParseMunsell("N 5/"), MunsellColor::Neutral(5.0));
    EXPECT_EQ(ParseMunsell("n 9.5/0"), MunsellColor::Neutral(9.5));
}

TEST(ParseMunsellTest, RoundTripThroughToString) {
    MunsellColor c(HueFamily::BG, 2.5, 7.0, 6.0);
    EXPECT_EQ(ParseMunsell(c.ToString(3)), c);
}

TEST(ParseMunsellTest, Malformed) {
    EXPECT_THROW(ParseMunsell(""), ParseException);
    EXPECT_THROW(ParseMunsell("5 4/14"), ParseException);       // No family
    EXPECT_THROW(ParseMunsell("5XX 4/14"), ParseException);     // Unknown family
    EXPECT_THROW(ParseMunsell("5R 4 14"), ParseException);      // No slash
    EXPECT_THROW(ParseMunsell("5R 4/"), ParseException);        // No chroma
    EXPECT_THROW(ParseMunsell("5R 4/14 extra"), ParseException);
    EXPECT_THROW(ParseMunsell("12R 4/14"), ParseException);     // Hue > 10
    EXPECT_THROW(ParseMunsell("5R 11/4"), ParseException);      // Value > 10
    EXPECT_THROW(ParseMunsell("N 5/2"), ParseException);        // Neutral with chroma
}

TEST(HueFamilyTest, ParseAndName) {
    EXPECT_EQ(ParseHueFamily("pb"), HueFamily::PB);
    EXPECT_STREQ(HueFamilyName(HueFamily::GY), "GY");
    EXPECT_EQ(HueFamilyFromIndex(10), HueFamily::R);
    EXPECT_EQ(HueFamilyFromIndex(-1), HueFamily::RP);
    EXPECT_THROW(ParseHueFamily("PR"), ParseException);
}
