/**
 * @file test_color_space_converter.cpp
 * @brief Unit tests for RGB / XYZ / xyY / Lab conversions and profiles
 */

#include <gtest/gtest.h>
#include <MunsellSpace/Color/ColorSpaceConverter.h>
#include <MunsellSpace/Color/Illuminant.h>
#include <MunsellSpace/Color/RgbProfile.h>
#include <MunsellSpace/Core/Exception.h>

#include <cmath>
#include <type_traits>

using namespace MunsellSpace;
using namespace MunsellSpace::Color;

// =============================================================================
// Illuminants
// =============================================================================

TEST(IlluminantTest, WhitePoints) {
    const WhitePoint& d65 = GetWhitePoint(Illuminant::D65);
    EXPECT_DOUBLE_EQ(d65.X, 0.95047);
    EXPECT_DOUBLE_EQ(d65.Y, 1.0);

    Point2d c = IlluminantChromaticity(Illuminant::C);
    EXPECT_NEAR(c.x, 0.31006, 1e-4);
    EXPECT_NEAR(c.y, 0.31616, 1e-4);
}

TEST(IlluminantTest, Names) {
    EXPECT_EQ(ToString(Illuminant::D50), "D50");
    EXPECT_EQ(ParseIlluminant("d65"), Illuminant::D65);
    EXPECT_EQ(ParseIlluminant("F11"), Illuminant::F11);
    EXPECT_THROW(ParseIlluminant("D93"), InvalidArgumentException);
}

TEST(IlluminantTest, ParseIgnoresCase) {
    EXPECT_EQ(ParseIlluminant("c"), Illuminant::C);
    EXPECT_EQ(ParseIlluminant("f2"), Illuminant::F2);
    EXPECT_EQ(ParseIlluminant("d50"), ParseIlluminant("D50"));
    EXPECT_THROW(ParseIlluminant(""), InvalidArgumentException);
    EXPECT_THROW(ParseIlluminant("d65\xE9"), InvalidArgumentException);
}

TEST(IlluminantTest, XyzCarriesExplicitWhite) {
    static_assert(!std::is_default_constructible<CieXyz>::value,
                  "CieXyz must name its illuminant");
    static_assert(!std::is_constructible<CieXyz, double, double, double>::value,
                  "CieXyz must name its illuminant");

    CieXyz xyz(0.2, 0.3, 0.4, Illuminant::A);
    EXPECT_EQ(xyz.illuminant, Illuminant::A);
}

// =============================================================================
// Profiles
// =============================================================================

TEST(RgbProfileTest, ParseNames) {
    EXPECT_EQ(ParseRgbProfile("sRGB"), RgbProfile::SRgb);
    EXPECT_EQ(ParseRgbProfile("display-p3"), RgbProfile::DisplayP3);
    EXPECT_EQ(ParseRgbProfile("Adobe RGB"), RgbProfile::AdobeRgb);
    EXPECT_EQ(ParseRgbProfile("ProPhoto"), RgbProfile::ProPhotoRgb);
    EXPECT_EQ(ParseRgbProfile("bt_2020"), RgbProfile::Rec2020);
    EXPECT_THROW(ParseRgbProfile("cmyk"), InvalidArgumentException);
}

TEST(RgbProfileTest, NamesRoundTrip) {
    for (RgbProfile p : {RgbProfile::SRgb, RgbProfile::DisplayP3, RgbProfile::P3,
                         RgbProfile::AdobeRgb, RgbProfile::ProPhotoRgb, RgbProfile::Rec2020}) {
        EXPECT_EQ(ParseRgbProfile(ToString(p)), p);
    }
}

TEST(RgbProfileTest, Whites) {
    EXPECT_EQ(ProfileWhite(RgbProfile::SRgb), Illuminant::D65);
    EXPECT_EQ(ProfileWhite(RgbProfile::ProPhotoRgb), Illuminant::D50);
}

TEST(RgbProfileTest, SRgbMatrix) {
    const auto& M = RgbToXyzMatrix(RgbProfile::SRgb);
    EXPECT_NEAR(M(0, 0), 0.4124, 1e-3);
    EXPECT_NEAR(M(1, 0), 0.2126, 1e-3);
    EXPECT_NEAR(M(1, 1), 0.7152, 1e-3);
    EXPECT_NEAR(M(2, 2), 0.9505, 1e-3);

    // White row sums reproduce the profile white
    const WhitePoint& d65 = GetWhitePoint(Illuminant::D65);
    EXPECT_NEAR(M(0, 0) + M(0, 1) + M(0, 2), d65.X, 1e-12);
    EXPECT_NEAR(M(2, 0) + M(2, 1) + M(2, 2), d65.Z, 1e-12);
}

TEST(RgbProfileTest, DegeneratePrimaries) {
    WhitePoint white = GetWhitePoint(Illuminant::D65);
    EXPECT_THROW(ComputePrimaryMatrix({0.3, 0.3}, {0.4, 0.4}, {0.5, 0.5}, white),
                 InvalidArgumentException);
    EXPECT_THROW(ComputePrimaryMatrix({0.64, 0.0}, {0.3, 0.6}, {0.15, 0.06}, white),
                 InvalidArgumentException);
}

TEST(RgbProfileTest, TransferFunctions) {
    EXPECT_NEAR(LinearizeChannel(RgbProfile::SRgb, 0.5), 0.214041, 1e-6);
    EXPECT_NEAR(LinearizeChannel(RgbProfile::SRgb, 0.02), 0.02 / 12.92, 1e-12);
    EXPECT_NEAR(LinearizeChannel(RgbProfile::P3, 0.5), std::pow(0.5, 2.2), 1e-12);

    for (RgbProfile p : {RgbProfile::SRgb, RgbProfile::AdobeRgb, RgbProfile::ProPhotoRgb,
                         RgbProfile::Rec2020}) {
        for (double v : {0.0, 0.01, 0.3, 0.75, 1.0}) {
            EXPECT_NEAR(EncodeChannel(p, LinearizeChannel(p, v)), v, 1e-9) << ToString(p);
        }
    }
}

// =============================================================================
// RGB <-> XYZ
// =============================================================================

TEST(ColorSpaceConverterTest, WhiteAndBlack) {
    CieXyz white = ToXyz(RgbColor(1.0, 1.0, 1.0));
    EXPECT_EQ(white.illuminant, Illuminant::D65);
    EXPECT_NEAR(white.X, 0.95047, 1e-9);
    EXPECT_NEAR(white.Y, 1.0, 1e-9);
    EXPECT_NEAR(white.Z, 1.08883, 1e-9);

    CieXyz black = ToXyz(0, 0, 0);
    EXPECT_DOUBLE_EQ(black.Y, 0.0);
}

TEST(ColorSpaceConverterTest, SRgbRed) {
    CieXyz red = ToXyz(255, 0, 0);
    EXPECT_NEAR(red.X, 0.4124, 1e-3);
    EXPECT_NEAR(red.Y, 0.2126, 1e-3);
    EXPECT_NEAR(red.Z, 0.0193, 1e-3);
}

TEST(ColorSpaceConverterTest, InvalidChannel) {
    EXPECT_THROW(ToXyz(RgbColor(1.2, 0.0, 0.0)), InvalidChannelException);
    EXPECT_THROW(ToXyz(RgbColor(0.0, -0.1, 0.0)), InvalidChannelException);
    EXPECT_THROW(ToXyz(RgbColor(0.0, 0.0, std::nan(""))), InvalidChannelException);
    EXPECT_THROW(FromXyz(CieXyz(std::nan(""), 0.5, 0.5, Illuminant::D65)),
                 InvalidChannelException);
}

TEST(ColorSpaceConverterTest, RoundTrip) {
    for (RgbProfile p : {RgbProfile::SRgb, RgbProfile::DisplayP3, RgbProfile::ProPhotoRgb}) {
        RgbColor rgb(0.2, 0.5, 0.8, p);
        RgbConversion back = FromXyz(ToXyz(rgb), p);
        EXPECT_FALSE(back.wasClipped);
        EXPECT_NEAR(back.rgb.r, 0.2, 1e-9);
        EXPECT_NEAR(back.rgb.g, 0.5, 1e-9);
        EXPECT_NEAR(back.rgb.b, 0.8, 1e-9);
    }
}

TEST(ColorSpaceConverterTest, CrossProfileWhite) {
    // sRGB white adapted to the D50 ProPhoto white
    RgbConversion out = FromXyz(ToXyz(RgbColor(1.0, 1.0, 1.0)), RgbProfile::ProPhotoRgb);
    EXPECT_NEAR(out.rgb.r, 1.0, 1e-6);
    EXPECT_NEAR(out.rgb.g, 1.0, 1e-6);
    EXPECT_NEAR(out.rgb.b, 1.0, 1e-6);
}

TEST(ColorSpaceConverterTest, OutOfGamutIsClipped) {
    RgbConversion out = FromXyz(CieXyz(0.1, 0.5, 0.9, Illuminant::D65));
    EXPECT_TRUE(out.wasClipped);
    EXPECT_GE(out.rgb.r, 0.0);
    EXPECT_LE(out.rgb.b, 1.0);
}

// =============================================================================
// xyY and Lab
// =============================================================================

TEST(ColorSpaceConverterTest, XyYRoundTrip) {
    CieXyz xyz(0.3, 0.4, 0.5, Illuminant::C);
    CieXyY xyY = XyzToXyY(xyz);
    EXPECT_NEAR(xyY.x, 0.25, 1e-12);
    EXPECT_NEAR(xyY.y, 0.4 / 1.2, 1e-12);
    EXPECT_DOUBLE_EQ(xyY.Y, 0.4);
    EXPECT_EQ(xyY.illuminant, Illuminant::C);

    CieXyz back = XyYToXyz(xyY);
    EXPECT_NEAR(back.X, 0.3, 1e-12);
    EXPECT_NEAR(back.Z, 0.5, 1e-12);
}

TEST(ColorSpaceConverterTest, BlackXyYUsesWhiteChromaticity) {
    CieXyY xyY = XyzToXyY(CieXyz(0.0, 0.0, 0.0, Illuminant::C));
    Point2d c = IlluminantChromaticity(Illuminant::C);
    EXPECT_DOUBLE_EQ(xyY.x, c.x);
    EXPECT_DOUBLE_EQ(xyY.y, c.y);
    EXPECT_DOUBLE_EQ(xyY.Y, 0.0);

    CieXyz zero = XyYToXyz(CieXyY(0.3, 0.0, 0.5));
    EXPECT_DOUBLE_EQ(zero.Y, 0.0);
}

TEST(ColorSpaceConverterTest, LabOfWhiteIsNeutral) {
    const WhitePoint& c = GetWhitePoint(Illuminant::C);
    CieLab lab = XyzToLab(CieXyz(c.X, c.Y, c.Z, Illuminant::C));
    EXPECT_NEAR(lab.L, 100.0, 1e-9);
    EXPECT_NEAR(lab.a, 0.0, 1e-9);
    EXPECT_NEAR(lab.b, 0.0, 1e-9);
}

TEST(ColorSpaceConverterTest, LabToLch) {
    CieLch lch = LabToLch(CieLab(50.0, 0.0, -20.0));
    EXPECT_DOUBLE_EQ(lch.L, 50.0);
    EXPECT_NEAR(lch.C, 20.0, 1e-12);
    EXPECT_NEAR(lch.h, 270.0, 1e-9);
}

// =============================================================================
// Hex
// =============================================================================

TEST(HexTest, Parse) {
    RgbColor c = ParseHex("#BE0032");
    EXPECT_DOUBLE_EQ(c.r, 190.0 / 255.0);
    EXPECT_DOUBLE_EQ(c.g, 0.0);
    EXPECT_DOUBLE_EQ(c.b, 50.0 / 255.0);
    EXPECT_EQ(c.profile, RgbProfile::SRgb);

    RgbColor shortForm = ParseHex("f0a", RgbProfile::DisplayP3);
    EXPECT_DOUBLE_EQ(shortForm.r, 1.0);
    EXPECT_DOUBLE_EQ(shortForm.b, 170.0 / 255.0);
    EXPECT_EQ(shortForm.profile, RgbProfile::DisplayP3);
}

TEST(HexTest, Malformed) {
    EXPECT_THROW(ParseHex(""), ParseException);
    EXPECT_THROW(ParseHex("#12345"), ParseException);
    EXPECT_THROW(ParseHex("#GG0000"), ParseException);
}

TEST(HexTest, Format) {
    EXPECT_EQ(ToHex(ParseHex("#be0032")), "#BE0032");
    EXPECT_EQ(ToHex(RgbColor(1.5, -0.2, 0.5)), "#FF0080");
}
