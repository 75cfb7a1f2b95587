/**
 * @file test_cartesian_mapper.cpp
 * @brief Unit tests for the Munsell <-> Cartesian mapping
 */

#include <gtest/gtest.h>
#include <MunsellSpace/Geometry/CartesianMapper.h>
#include <MunsellSpace/Core/Constants.h>
#include <MunsellSpace/Core/Exception.h>

#include <cmath>

using namespace MunsellSpace;
using namespace MunsellSpace::Geometry;

TEST(CartesianMapperTest, HueNumber40) {
    EXPECT_DOUBLE_EQ(HueNumber40(MunsellColor(HueFamily::R, 5.0, 5.0, 4.0)), 2.0);
    EXPECT_DOUBLE_EQ(HueNumber40(MunsellColor(HueFamily::RP, 7.5, 5.0, 4.0)), 39.0);
    EXPECT_DOUBLE_EQ(HueNumber40(MunsellColor(HueFamily::R, 0.0, 5.0, 4.0)), 0.0);
    EXPECT_DOUBLE_EQ(HueNumber40(MunsellColor::Neutral(5.0)), 0.0);
    EXPECT_NEAR(HueAngle40(MunsellColor(HueFamily::Y, 5.0, 5.0, 4.0)), 10.0 * 9.0 * DEG_TO_RAD,
                1e-12);
}

TEST(CartesianMapperTest, ToCartesian) {
    Point3d p = ToCartesian(MunsellColor(HueFamily::R, 5.0, 5.0, 10.0));
    EXPECT_NEAR(p.x, 10.0 * std::cos(18.0 * DEG_TO_RAD), 1e-12);
    EXPECT_NEAR(p.y, 10.0 * std::sin(18.0 * DEG_TO_RAD), 1e-12);
    EXPECT_DOUBLE_EQ(p.z, 5.0);

    // 10RP sits on the positive x axis
    Point3d rp = ToCartesian(MunsellColor(HueFamily::RP, 10.0, 3.0, 6.0));
    EXPECT_NEAR(rp.x, 6.0, 1e-12);
    EXPECT_NEAR(rp.y, 0.0, 1e-12);

    Point3d n = ToCartesian(MunsellColor::Neutral(7.5));
    EXPECT_DOUBLE_EQ(n.x, 0.0);
    EXPECT_DOUBLE_EQ(n.y, 0.0);
    EXPECT_DOUBLE_EQ(n.z, 7.5);
}

TEST(CartesianMapperTest, RadiusGrowsWithChroma) {
    for (double position : {0.0, 12.5, 37.5, 62.5, 87.5, 97.5}) {
        for (double value : {1.0, 5.0, 9.0}) {
            double previous = -1.0;
            for (double chroma = 0.5; chroma <= 20.0; chroma += 0.5) {
                Point3d p = ToCartesian(MunsellColor::FromHuePosition(position, value, chroma));
                double radius = std::hypot(p.x, p.y);
                EXPECT_GT(radius, previous) << position << " " << value << "/" << chroma;
                EXPECT_DOUBLE_EQ(p.z, value);
                previous = radius;
            }
        }
    }
}

TEST(CartesianMapperTest, FromCartesianRoundTrip) {
    for (double position : {1.0, 17.5, 33.3, 50.0, 78.0, 99.0}) {
        MunsellColor source = MunsellColor::FromHuePosition(position, 4.5, 7.0);
        MunsellColor back = FromCartesian(ToCartesian(source));
        EXPECT_NEAR(back.HuePosition(), source.HuePosition(), 1e-9) << position;
        EXPECT_NEAR(back.Chroma(), 7.0, 1e-12);
        EXPECT_DOUBLE_EQ(back.Value(), 4.5);
    }
}

TEST(CartesianMapperTest, FromCartesianNeutralAxis) {
    MunsellColor n = FromCartesian(Point3d(0.0, 0.0, 3.0));
    EXPECT_TRUE(n.IsNeutral());
    EXPECT_DOUBLE_EQ(n.Value(), 3.0);
    EXPECT_TRUE(FromCartesian(Point3d(1e-12, 0.0, 3.0)).IsNeutral());
}

TEST(CartesianMapperTest, FromCartesianInvalid) {
    EXPECT_THROW(FromCartesian(Point3d(1.0, 0.0, 10.5)), InvalidArgumentException);
    EXPECT_THROW(FromCartesian(Point3d(1.0, 0.0, -0.5)), InvalidArgumentException);
    EXPECT_THROW(FromCartesian(Point3d(std::nan(""), 0.0, 5.0)), InvalidArgumentException);
}
