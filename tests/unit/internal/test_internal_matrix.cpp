/**
 * @file test_internal_matrix.cpp
 * @brief Unit tests for Internal/Matrix module
 */

#include <MunsellSpace/Internal/Matrix.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>

using namespace MunsellSpace::Internal;

namespace {

double MaxAbsDiff(const Vec3& a, const Vec3& b) {
    return std::max({std::abs(a[0] - b[0]), std::abs(a[1] - b[1]), std::abs(a[2] - b[2])});
}

} // anonymous namespace

class MatrixTest : public ::testing::Test {
protected:
    static constexpr double EPS = 1e-12;
};

// =============================================================================
// Vec3 Tests
// =============================================================================

TEST_F(MatrixTest, Vec3DefaultIsZero) {
    Vec3 v;
    EXPECT_DOUBLE_EQ(v[0], 0.0);
    EXPECT_DOUBLE_EQ(v[1], 0.0);
    EXPECT_DOUBLE_EQ(v[2], 0.0);
}

TEST_F(MatrixTest, Vec3Arithmetic) {
    Vec3 a(1.0, 2.0, 3.0);
    Vec3 b(4.0, 5.0, 6.0);
    EXPECT_DOUBLE_EQ(a.Dot(b), 32.0);
    EXPECT_DOUBLE_EQ((b - a)[2], 3.0);
    EXPECT_DOUBLE_EQ((a * 2.0)[1], 4.0);
    EXPECT_DOUBLE_EQ(Vec3(2.0, 3.0, 6.0).Norm(), 7.0);
}

// =============================================================================
// Mat33 Tests
// =============================================================================

TEST_F(MatrixTest, IdentityAndDiagonal) {
    Mat33 I = Mat33::Identity();
    Vec3 v(0.25, 0.5, 0.75);
    EXPECT_LT(MaxAbsDiff(I * v, v), EPS);

    Mat33 D = Mat33::Diagonal({2.0, 3.0, 4.0});
    EXPECT_DOUBLE_EQ(D.Determinant(), 24.0);
}

TEST_F(MatrixTest, MultiplyAndTranspose) {
    Mat33 A = {1, 2, 3,
               4, 5, 6,
               7, 8, 10};
    Mat33 At = A.Transpose();
    EXPECT_DOUBLE_EQ(At(0, 1), 4.0);
    EXPECT_DOUBLE_EQ(At(2, 0), 3.0);

    Mat33 P = A * Mat33::Identity();
    for (int i = 0; i < 3; ++i) {
        for (int j = 0; j < 3; ++j) {
            EXPECT_DOUBLE_EQ(P(i, j), A(i, j));
        }
    }
}

TEST_F(MatrixTest, Inverse) {
    Mat33 A = {1, 2, 3,
               0, 1, 4,
               5, 6, 0};
    EXPECT_DOUBLE_EQ(A.Determinant(), 1.0);
    Mat33 R = A * A.Inverse();
    for (int i = 0; i < 3; ++i) {
        for (int j = 0; j < 3; ++j) {
            EXPECT_NEAR(R(i, j), i == j ? 1.0 : 0.0, 1e-10);
        }
    }
}

TEST_F(MatrixTest, SingularInverseIsZero) {
    Mat33 S = {1, 2, 3,
               2, 4, 6,
               1, 1, 1};
    EXPECT_FALSE(S.IsInvertible());
    Mat33 Z = S.Inverse();
    EXPECT_DOUBLE_EQ(Z(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(Z(2, 2), 0.0);
}

TEST_F(MatrixTest, FromColumns) {
    Mat33 M = Mat33::FromColumns({1, 2, 3}, {4, 5, 6}, {7, 8, 9});
    EXPECT_DOUBLE_EQ(M(0, 1), 4.0);
    EXPECT_DOUBLE_EQ(M(2, 0), 3.0);
    EXPECT_DOUBLE_EQ(M.Col(2)[1], 8.0);
}

// =============================================================================
// Solve2x2 Tests
// =============================================================================

TEST_F(MatrixTest, Solve2x2) {
    double x0 = 0.0, x1 = 0.0;
    ASSERT_TRUE(Solve2x2(2.0, 1.0, 1.0, 3.0, 5.0, 10.0, x0, x1));
    EXPECT_NEAR(x0, 1.0, EPS);
    EXPECT_NEAR(x1, 3.0, EPS);
}

TEST_F(MatrixTest, Solve2x2Singular) {
    double x0 = 7.0, x1 = 7.0;
    EXPECT_FALSE(Solve2x2(1.0, 2.0, 2.0, 4.0, 1.0, 1.0, x0, x1));
    EXPECT_DOUBLE_EQ(x0, 7.0);
}
