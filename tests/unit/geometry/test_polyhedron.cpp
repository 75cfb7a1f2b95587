/**
 * @file test_polyhedron.cpp
 * @brief Unit tests for Polyhedron, PolyhedronIO and PolyhedronIndex
 */

#include <gtest/gtest.h>
#include <MunsellSpace/Geometry/Polyhedron.h>
#include <MunsellSpace/Geometry/PolyhedronIO.h>
#include <MunsellSpace/Geometry/PolyhedronIndex.h>
#include <MunsellSpace/Geometry/ConvexHullBuilder.h>
#include <MunsellSpace/Geometry/CartesianMapper.h>
#include <MunsellSpace/Core/Exception.h>
#include <MunsellSpace/Platform/FileIO.h>

#include <cmath>
#include <string>
#include <vector>

using namespace MunsellSpace;
using namespace MunsellSpace::Geometry;

namespace {

// Axis-aligned box as a hull polyhedron
Polyhedron MakeBox(const std::string& name, const Point3d& lo, const Point3d& hi) {
    std::vector<Point3d> pts;
    for (int i = 0; i < 8; ++i) {
        pts.emplace_back((i & 1) ? hi.x : lo.x, (i & 2) ? hi.y : lo.y, (i & 4) ? hi.z : lo.z);
    }
    return OuterHull(pts, name);
}

// Unit right tetrahedron with every face wound inward
Polyhedron MakeInwardTetra() {
    std::vector<Point3d> v{{0, 0, 0}, {1, 0, 0}, {0, 1, 0}, {0, 0, 1}};
    std::vector<TriangleFace> f{{0, 1, 2}, {0, 3, 1}, {0, 2, 3}, {1, 3, 2}};
    return Polyhedron("tetra", v, f);
}

} // anonymous namespace

// =============================================================================
// Polyhedron
// =============================================================================

TEST(PolyhedronTest, BoxMeasures) {
    Polyhedron box = MakeBox("box", {0, 0, 0}, {2, 2, 2});
    EXPECT_EQ(box.Name(), "box");
    EXPECT_EQ(box.VertexCount(), 8u);
    EXPECT_EQ(box.FaceCount(), 12u);
    EXPECT_EQ(box.EdgeCount(), 18u);
    EXPECT_EQ(box.SampleCount(), 8u);
    EXPECT_NEAR(box.Volume(), 8.0, 1e-12);
    EXPECT_NEAR(box.Centroid().x, 1.0, 1e-12);
    EXPECT_NEAR(box.Centroid().z, 1.0, 1e-12);
    EXPECT_NEAR(box.Size(), std::sqrt(12.0), 1e-12);
}

TEST(PolyhedronTest, Containment) {
    Polyhedron box = MakeBox("box", {0, 0, 0}, {2, 2, 2});
    EXPECT_TRUE(box.Contains({1.0, 1.0, 1.0}));
    EXPECT_TRUE(box.Contains({2.0, 1.0, 1.0}));         // Face
    EXPECT_TRUE(box.Contains({0.0, 0.0, 0.0}));         // Vertex
    EXPECT_FALSE(box.Contains({2.001, 1.0, 1.0}));
    EXPECT_FALSE(box.Contains({std::nan(""), 1.0, 1.0}));

    EXPECT_NEAR(box.SignedDistance({1.0, 1.0, 1.5}), -0.5, 1e-12);
    EXPECT_NEAR(box.SignedDistance({1.0, 1.0, 3.0}), 1.0, 1e-12);
    EXPECT_TRUE(Contains({0.5, 0.5, 0.5}, box));
}

TEST(PolyhedronTest, InwardFacesAreReoriented) {
    Polyhedron tetra = MakeInwardTetra();
    EXPECT_NEAR(tetra.Volume(), 1.0 / 6.0, 1e-12);
    EXPECT_NEAR(tetra.Centroid().x, 0.25, 1e-12);
    EXPECT_TRUE(tetra.Contains({0.1, 0.1, 0.1}));
    EXPECT_FALSE(tetra.Contains({0.5, 0.5, 0.5}));
}

TEST(PolyhedronTest, InvalidConstruction) {
    std::vector<Point3d> v{{0, 0, 0}, {1, 0, 0}, {0, 1, 0}, {0, 0, 1}};
    std::vector<TriangleFace> f{{0, 1, 2}, {0, 3, 1}, {0, 2, 3}, {1, 3, 2}};

    EXPECT_THROW(Polyhedron("p", {v[0], v[1], v[2]}, f), InvalidArgumentException);
    EXPECT_THROW(Polyhedron("p", v, {f[0], f[1]}), InvalidArgumentException);
    EXPECT_THROW(Polyhedron("p", v, {f[0], f[1], f[2], TriangleFace(0, 1, 4)}),
                 InvalidArgumentException);

    std::vector<Point3d> bad = v;
    bad[2].y = std::nan("");
    EXPECT_THROW(Polyhedron("p", bad, f), InvalidArgumentException);

    Polyhedron empty;
    EXPECT_TRUE(empty.Empty());
    EXPECT_EQ(empty.EdgeCount(), 0u);
    EXPECT_FALSE(empty.Contains({0, 0, 0}));
}

// =============================================================================
// Text format
// =============================================================================

class PolyhedronIOTest : public ::testing::Test {
protected:
    std::vector<std::string> lines{
        "# two overlays",
        "polyhedron tetra samples 12",
        "v 0 0 0",
        "v 1 0 0   # trailing comment",
        "v 0 1 0",
        "v 0 0 1",
        "f 0 1 2",
        "f 0 3 1",
        "f 0 2 3",
        "f 1 3 2",
        "end",
        "",
        "polyhedron ring",
        "m 5R 5/4",
        "m 5Y 5/4",
        "m 5B 5/4",
        "m N 7",
        "f 0 1 2",
        "f 0 1 3",
        "f 1 2 3",
        "f 0 2 3",
        "end",
    };
};

TEST_F(PolyhedronIOTest, Parse) {
    std::vector<Polyhedron> polys = ParsePolyhedra(lines);
    ASSERT_EQ(polys.size(), 2u);

    EXPECT_EQ(polys[0].Name(), "tetra");
    EXPECT_EQ(polys[0].SampleCount(), 12u);
    EXPECT_NEAR(polys[0].Volume(), 1.0 / 6.0, 1e-12);

    EXPECT_EQ(polys[1].Name(), "ring");
    EXPECT_EQ(polys[1].SampleCount(), 0u);
    Point3d expected = ToCartesian(MunsellColor(HueFamily::Y, 5.0, 5.0, 4.0));
    EXPECT_NEAR(polys[1].Vertices()[1].x, expected.x, 1e-12);
    EXPECT_NEAR(polys[1].Vertices()[3].z, 7.0, 1e-12);
}

TEST_F(PolyhedronIOTest, FormatThenParse) {
    std::vector<Polyhedron> polys = ParsePolyhedra(lines);
    std::vector<std::string> text = FormatPolyhedra(polys);
    EXPECT_EQ(text[0], "polyhedron tetra samples 12");
    EXPECT_EQ(text[1], "v 0 0 0");

    std::vector<Polyhedron> back = ParsePolyhedra(text);
    ASSERT_EQ(back.size(), 2u);
    EXPECT_EQ(back[1].Vertices()[2], polys[1].Vertices()[2]);
    EXPECT_NEAR(back[1].Volume(), polys[1].Volume(), 1e-12);
}

TEST_F(PolyhedronIOTest, SaveAndLoad) {
    std::string path = Platform::JoinPath(MUNSELLSPACE_TEST_OUTPUT_DIR, "polyhedra_test.txt");
    SavePolyhedra(path, ParsePolyhedra(lines));
    std::vector<Polyhedron> loaded = LoadPolyhedra(path);
    ASSERT_EQ(loaded.size(), 2u);
    EXPECT_EQ(loaded[0].FaceCount(), 4u);

    EXPECT_THROW(LoadPolyhedra("/nonexistent/polyhedra.txt"), IOException);
}

TEST(PolyhedronIOErrorTest, Malformed) {
    EXPECT_THROW(ParsePolyhedra({"v 0 0 0"}), ParseException);
    EXPECT_THROW(ParsePolyhedra({"polyhedron a", "v 0 0 0"}), ParseException);
    EXPECT_THROW(ParsePolyhedra({"polyhedron a", "polyhedron b"}), ParseException);
    EXPECT_THROW(ParsePolyhedra({"polyhedron"}), ParseException);
    EXPECT_THROW(ParsePolyhedra({"polyhedron a samples x"}), ParseException);
    EXPECT_THROW(ParsePolyhedra({"polyhedron a", "v 0 0"}), ParseException);
    EXPECT_THROW(ParsePolyhedra({"polyhedron a", "v 0 zero 0"}), ParseException);
    EXPECT_THROW(ParsePolyhedra({"polyhedron a", "f 0 1 -2"}), ParseException);
    EXPECT_THROW(ParsePolyhedra({"polyhedron a", "m 5Q 5/4"}), ParseException);
    EXPECT_THROW(ParsePolyhedra({"polyhedron a", "q 1"}), ParseException);
    // Too few vertices for a solid
    EXPECT_THROW(ParsePolyhedra({"polyhedron a", "v 0 0 0", "end"}), ParseException);
}

// =============================================================================
// Index
// =============================================================================

class PolyhedronIndexTest : public ::testing::Test {
protected:
    PolyhedronIndex index{{MakeBox("low", {-1, -1, 0}, {1, 1, 5}),
                           MakeBox("high", {-1, -1, 4}, {1, 1, 10}),
                           MakeBox("red", {2, -1, 0}, {6, 1, 10})}};
};

TEST_F(PolyhedronIndexTest, Lookup) {
    EXPECT_EQ(index.Size(), 3u);
    std::vector<std::string> names{"high", "low", "red"};
    EXPECT_EQ(index.Names(), names);

    ASSERT_NE(index.Find("red"), nullptr);
    EXPECT_NEAR(index.Find("red")->Volume(), 80.0, 1e-9);
    EXPECT_EQ(index.Find("blue"), nullptr);

    EXPECT_TRUE(index.Contains({0, 0, 2}, "low"));
    EXPECT_FALSE(index.Contains({0, 0, 2}, "high"));
    EXPECT_THROW(index.Contains({0, 0, 2}, "blue"), InvalidArgumentException);
}

TEST_F(PolyhedronIndexTest, MatchingOverlays) {
    std::vector<std::string> both{"high", "low"};
    EXPECT_EQ(index.MatchingOverlays(Point3d(0, 0, 4.5)), both);
    EXPECT_TRUE(index.MatchingOverlays(Point3d(0, 5, 4.5)).empty());

    // 10RP 5/4 maps onto the positive x axis
    std::vector<std::string> red{"red"};
    EXPECT_EQ(index.MatchingOverlays(MunsellColor(HueFamily::RP, 10.0, 5.0, 4.0)), red);
    std::vector<std::string> neutral{"low"};
    EXPECT_EQ(index.MatchingOverlays(MunsellColor::Neutral(2.0)), neutral);
}

TEST_F(PolyhedronIndexTest, ClosestOverlay) {
    const Polyhedron* nearest = index.ClosestOverlay({0, 0, 9});
    ASSERT_NE(nearest, nullptr);
    EXPECT_EQ(nearest->Name(), "high");
    EXPECT_EQ(index.ClosestOverlay({7, 0, 5})->Name(), "red");
    EXPECT_EQ(PolyhedronIndex().ClosestOverlay({0, 0, 0}), nullptr);
}

TEST(PolyhedronIndexErrorTest, DuplicateNames) {
    std::vector<Polyhedron> polys{MakeBox("a", {0, 0, 0}, {1, 1, 1}),
                                  MakeBox("a", {2, 2, 2}, {3, 3, 3})};
    EXPECT_THROW(PolyhedronIndex{polys}, InvalidArgumentException);
}

TEST(PolyhedronIndexAssetTest, DefaultLoads) {
    if (!Platform::FileExists(PolyhedronIndex::DefaultPath())) {
        GTEST_SKIP() << "polyhedra asset not installed at " << PolyhedronIndex::DefaultPath();
    }
    const PolyhedronIndex& index = PolyhedronIndex::Default();
    EXPECT_FALSE(index.Empty());
    for (const auto& poly : index.Polyhedra()) {
        EXPECT_GT(poly.Volume(), 0.0) << poly.Name();
        EXPECT_TRUE(poly.Contains(poly.Centroid())) << poly.Name();
    }
}
