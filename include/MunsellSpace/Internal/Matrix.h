#pragma once

/**
 * @file Matrix.h
 * @brief Small fixed-size vector and matrix types for colorimetry
 *
 * This module provides:
 * - Vec3: three-component vector (XYZ, RGB, LMS cone responses)
 * - Mat33: 3x3 row-major matrix (primaries, adaptation transforms)
 * - 2x2 linear solve for the Newton inversion step
 *
 * Used by:
 * - RgbProfile.h (RGB <-> XYZ matrices)
 * - ChromaticAdapter.h (von Kries style transforms)
 * - NewtonInversion (2x2 Jacobian solve)
 *
 * Design principles:
 * - Stack storage, row-major
 * - Double precision only
 */

#include <cmath>
#include <initializer_list>

namespace MunsellSpace::Internal {

// =============================================================================
// Constants
// =============================================================================

/// Tolerance for matrix singularity detection
constexpr double MATRIX_SINGULAR_THRESHOLD = 1e-10;

// =============================================================================
// Vec3
// =============================================================================

/**
 * @brief Three-component vector
 */
class Vec3 {
public:
    Vec3() = default;
    Vec3(double a, double b, double c) : data_{a, b, c} {}

    double& operator[](int i) { return data_[i]; }
    const double& operator[](int i) const { return data_[i]; }

    Vec3 operator+(const Vec3& v) const {
        return {data_[0] + v[0], data_[1] + v[1], data_[2] + v[2]};
    }

    Vec3 operator-(const Vec3& v) const {
        return {data_[0] - v[0], data_[1] - v[1], data_[2] - v[2]};
    }

    Vec3 operator*(double s) const {
        return {data_[0] * s, data_[1] * s, data_[2] * s};
    }

    double Dot(const Vec3& v) const {
        return data_[0] * v[0] + data_[1] * v[1] + data_[2] * v[2];
    }

    double Norm() const { return std::sqrt(Dot(*this)); }

private:
    double data_[3] = {0.0, 0.0, 0.0};
};

// =============================================================================
// Mat33
// =============================================================================

/**
 * @brief 3x3 matrix, row-major storage
 */
class Mat33 {
public:
    /// Default constructor (zero matrix)
    Mat33() = default;

    /// Construct from initializer list (row-major order)
    Mat33(std::initializer_list<double> init) {
        int i = 0;
        for (auto val : init) {
            if (i >= 9) break;
            data_[i++] = val;
        }
    }

    double& operator()(int row, int col) { return data_[row * 3 + col]; }
    const double& operator()(int row, int col) const { return data_[row * 3 + col]; }

    Vec3 Row(int i) const { return {data_[i * 3], data_[i * 3 + 1], data_[i * 3 + 2]}; }
    Vec3 Col(int j) const { return {data_[j], data_[3 + j], data_[6 + j]}; }

    Mat33 operator*(const Mat33& other) const {
        Mat33 result;
        for (int i = 0; i < 3; ++i) {
            for (int j = 0; j < 3; ++j) {
                double sum = 0.0;
                for (int k = 0; k < 3; ++k) {
                    sum += data_[i * 3 + k] * other(k, j);
                }
                result(i, j) = sum;
            }
        }
        return result;
    }

    Vec3 operator*(const Vec3& v) const {
        return {Row(0).Dot(v), Row(1).Dot(v), Row(2).Dot(v)};
    }

    Mat33 Transpose() const {
        Mat33 result;
        for (int i = 0; i < 3; ++i) {
            for (int j = 0; j < 3; ++j) {
                result(j, i) = data_[i * 3 + j];
            }
        }
        return result;
    }

    double Determinant() const {
        double a = data_[0], b = data_[1], c = data_[2];
        double d = data_[3], e = data_[4], f = data_[5];
        double g = data_[6], h = data_[7], i = data_[8];
        return a * (e * i - f * h) - b * (d * i - f * g) + c * (d * h - e * g);
    }

    /// Inverse via adjugate; zero matrix if singular
    Mat33 Inverse() const {
        double det = Determinant();
        if (std::abs(det) < MATRIX_SINGULAR_THRESHOLD) {
            return Zero();
        }
        double invDet = 1.0 / det;
        double a = data_[0], b = data_[1], c = data_[2];
        double d = data_[3], e = data_[4], f = data_[5];
        double g = data_[6], h = data_[7], i = data_[8];

        return {(e * i - f * h) * invDet, (c * h - b * i) * invDet, (b * f - c * e) * invDet,
                (f * g - d * i) * invDet, (a * i - c * g) * invDet, (c * d - a * f) * invDet,
                (d * h - e * g) * invDet, (b * g - a * h) * invDet, (a * e - b * d) * invDet};
    }

    bool IsInvertible(double eps = MATRIX_SINGULAR_THRESHOLD) const {
        return std::abs(Determinant()) > eps;
    }

    static Mat33 Zero() { return Mat33(); }

    static Mat33 Identity() {
        return Diagonal({1.0, 1.0, 1.0});
    }

    static Mat33 Diagonal(const Vec3& diag) {
        Mat33 result;
        for (int i = 0; i < 3; ++i) result(i, i) = diag[i];
        return result;
    }

    /// Build from three column vectors
    static Mat33 FromColumns(const Vec3& c0, const Vec3& c1, const Vec3& c2) {
        return {c0[0], c1[0], c2[0],
                c0[1], c1[1], c2[1],
                c0[2], c1[2], c2[2]};
    }

private:
    double data_[9] = {0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0};
};

// =============================================================================
// 2x2 Solve
// =============================================================================

/**
 * @brief Solve [a b; c d] * [x0 x1]^T = [r0 r1]^T by Cramer's rule
 * @return false if the system is singular
 */
inline bool Solve2x2(double a, double b, double c, double d,
                     double r0, double r1, double& x0, double& x1) {
    double det = a * d - b * c;
    if (std::abs(det) < MATRIX_SINGULAR_THRESHOLD) {
        return false;
    }
    x0 = (r0 * d - b * r1) / det;
    x1 = (a * r1 - c * r0) / det;
    return true;
}

} // namespace MunsellSpace::Internal
