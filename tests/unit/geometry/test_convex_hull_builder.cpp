/**
 * @file test_convex_hull_builder.cpp
 * @brief Unit tests for outer / inner hull construction
 */

#include <gtest/gtest.h>
#include <MunsellSpace/Geometry/ConvexHullBuilder.h>
#include <MunsellSpace/Geometry/CartesianMapper.h>
#include <MunsellSpace/Core/Exception.h>

#include <cstdint>
#include <vector>

using namespace MunsellSpace;
using namespace MunsellSpace::Geometry;

namespace {

std::vector<Point3d> Cube(double half, const Point3d& center = Point3d()) {
    std::vector<Point3d> pts;
    for (int i = 0; i < 8; ++i) {
        pts.push_back(center + Point3d((i & 1) ? half : -half, (i & 2) ? half : -half,
                                       (i & 4) ? half : -half));
    }
    return pts;
}

// Eight hues 45 degrees apart on two value planes
void AddRing(std::vector<MunsellColor>& samples, double chroma, double valueLo, double valueHi) {
    for (double value : {valueLo, valueHi}) {
        for (int k = 0; k < 8; ++k) {
            samples.push_back(MunsellColor::FromHuePosition(k * 12.5, value, chroma));
        }
    }
}

// Deterministic scattered cloud inside [-5, 5] x [-5, 5] x [1, 9]
std::vector<Point3d> Scatter(size_t count, uint64_t seed) {
    auto next = [&seed]() {
        seed = seed * 6364136223846793005ULL + 1442695040888963407ULL;
        return static_cast<double>(seed >> 11) / 9007199254740992.0;
    };
    std::vector<Point3d> pts;
    pts.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        double x = next() * 10.0 - 5.0;
        double y = next() * 10.0 - 5.0;
        double z = next() * 8.0 + 1.0;
        pts.emplace_back(x, y, z);
    }
    return pts;
}

} // anonymous namespace

TEST(ConvexHullBuilderTest, OuterHull) {
    std::vector<Point3d> pts = Cube(2.0);
    std::vector<Point3d> inner = Cube(1.0);
    pts.insert(pts.end(), inner.begin(), inner.end());

    Polyhedron outer = OuterHull(pts, "outer");
    EXPECT_EQ(outer.Name(), "outer");
    EXPECT_EQ(outer.VertexCount(), 8u);
    EXPECT_EQ(outer.SampleCount(), 16u);
    EXPECT_NEAR(outer.Volume(), 64.0, 1e-9);

    std::vector<size_t> vertices = OuterHullVertices(pts);
    std::vector<size_t> expected{0, 1, 2, 3, 4, 5, 6, 7};
    EXPECT_EQ(vertices, expected);
}

TEST(ConvexHullBuilderTest, InnerHullDropsOuterLayer) {
    std::vector<Point3d> pts = Cube(2.0);
    std::vector<Point3d> inner = Cube(1.0);
    pts.insert(pts.end(), inner.begin(), inner.end());
    pts.push_back(Point3d(0.2, 0.1, 0.0));

    Polyhedron hull = InnerHull(pts, "inner");
    EXPECT_EQ(hull.VertexCount(), 8u);
    EXPECT_EQ(hull.SampleCount(), 17u);
    EXPECT_NEAR(hull.Volume(), 8.0, 1e-9);
    EXPECT_TRUE(hull.Contains(Point3d(0.9, 0.9, 0.9)));
    EXPECT_FALSE(hull.Contains(Point3d(1.5, 0.0, 0.0)));
}

TEST(ConvexHullBuilderTest, InnerHullRemovesDuplicatesOfOuterVertices) {
    std::vector<Point3d> pts = Cube(2.0);
    std::vector<Point3d> inner = Cube(1.0);
    pts.insert(pts.end(), inner.begin(), inner.end());
    // Repeated outer corner is removed along with the original
    pts.push_back(Point3d(2.0, 2.0, 2.0));

    Polyhedron hull = InnerHull(pts, "inner");
    EXPECT_NEAR(hull.Volume(), 8.0, 1e-9);
}

TEST(ConvexHullBuilderTest, InnerHullNeedsFourPoints) {
    std::vector<Point3d> pts = Cube(2.0);
    pts.push_back(Point3d(0.0, 0.0, 0.0));
    pts.push_back(Point3d(0.5, 0.0, 0.0));
    pts.push_back(Point3d(0.0, 0.5, 0.0));
    EXPECT_THROW(InnerHull(pts, "thin"), InsufficientDataException);

    // Four remaining points on one plane have no volume
    pts.push_back(Point3d(0.5, 0.5, 0.0));
    EXPECT_THROW(InnerHull(pts, "flat"), InsufficientDataException);
}

TEST(ConvexHullBuilderTest, BuildFromMunsell) {
    std::vector<MunsellColor> samples;
    AddRing(samples, 8.0, 3.0, 7.0);
    AddRing(samples, 4.0, 4.0, 6.0);

    Polyhedron poly = BuildFromMunsell(samples, "core");
    EXPECT_EQ(poly.Name(), "core");
    EXPECT_EQ(poly.VertexCount(), 16u);
    EXPECT_EQ(poly.SampleCount(), 32u);

    EXPECT_TRUE(poly.Contains(ToCartesian(MunsellColor::Neutral(5.0))));
    EXPECT_TRUE(poly.Contains(ToCartesian(MunsellColor(HueFamily::R, 5.0, 5.0, 2.0))));
    EXPECT_FALSE(poly.Contains(ToCartesian(MunsellColor(HueFamily::R, 5.0, 5.0, 6.0))));
    EXPECT_FALSE(poly.Contains(ToCartesian(MunsellColor::Neutral(6.5))));
}

TEST(ConvexHullBuilderTest, HullContainsEveryVertex) {
    std::vector<Point3d> pts = Scatter(200, 12345);

    Polyhedron outer = OuterHull(pts, "outer");
    Polyhedron inner = InnerHull(pts, "inner");
    ASSERT_GT(outer.VertexCount(), 4u);
    ASSERT_GT(inner.VertexCount(), 4u);
    EXPECT_LT(inner.Volume(), outer.Volume());

    for (const Polyhedron* poly : {&outer, &inner}) {
        for (size_t i = 0; i < poly->Vertices().size(); ++i) {
            EXPECT_TRUE(poly->Contains(poly->Vertices()[i])) << poly->Name() << " vertex " << i;
        }
    }
}

TEST(ConvexHullBuilderTest, MunsellHullContainsEveryVertex) {
    std::vector<MunsellColor> samples;
    AddRing(samples, 8.0, 3.0, 7.0);
    AddRing(samples, 4.0, 4.0, 6.0);
    samples.push_back(MunsellColor::Neutral(5.0));

    Polyhedron poly = BuildFromMunsell(samples, "core");
    for (const Point3d& v : poly.Vertices()) {
        EXPECT_TRUE(poly.Contains(v)) << v.x << ", " << v.y << ", " << v.z;
    }
    for (const MunsellColor& sample : samples) {
        EXPECT_TRUE(poly.Contains(ToCartesian(sample))) << sample.ToString(2);
    }
}
