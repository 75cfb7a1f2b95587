#pragma once

/**
 * @file Types.h
 * @brief Core geometric type definitions for MunsellSpace
 *
 * Provides:
 * - Point2d: value-chroma plane points, xy chromaticities
 * - Point3d: Munsell Cartesian coordinates
 * - Segment2d: polygon edges
 */

#include <MunsellSpace/Core/Export.h>

#include <cmath>

namespace MunsellSpace {

// =============================================================================
// 2D Point Type
// =============================================================================

/**
 * @brief 2D point with double precision
 */
struct MUNSELLSPACE_API Point2d {
    double x = 0.0;
    double y = 0.0;

    Point2d() = default;
    Point2d(double x_, double y_) : x(x_), y(y_) {}

    bool IsValid() const { return std::isfinite(x) && std::isfinite(y); }

    /// Vector addition
    Point2d operator+(const Point2d& other) const {
        return {x + other.x, y + other.y};
    }

    /// Vector subtraction
    Point2d operator-(const Point2d& other) const {
        return {x - other.x, y - other.y};
    }

    /// Scalar multiplication
    Point2d operator*(double s) const {
        return {x * s, y * s};
    }

    /// Euclidean norm
    double Norm() const {
        return std::sqrt(x * x + y * y);
    }

    /// Dot product
    double Dot(const Point2d& other) const {
        return x * other.x + y * other.y;
    }

    /// Cross product (2D: returns scalar)
    double Cross(const Point2d& other) const {
        return x * other.y - y * other.x;
    }

    /// Distance to another point
    double DistanceTo(const Point2d& other) const {
        return (*this - other).Norm();
    }

    bool operator==(const Point2d& other) const {
        return x == other.x && y == other.y;
    }
    bool operator!=(const Point2d& other) const { return !(*this == other); }
};

// =============================================================================
// 3D Point Type
// =============================================================================

/**
 * @brief 3D point with double precision
 */
struct MUNSELLSPACE_API Point3d {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    Point3d() = default;
    Point3d(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    bool IsValid() const { return std::isfinite(x) && std::isfinite(y) && std::isfinite(z); }

    Point3d operator+(const Point3d& other) const {
        return {x + other.x, y + other.y, z + other.z};
    }

    Point3d operator-(const Point3d& other) const {
        return {x - other.x, y - other.y, z - other.z};
    }

    Point3d operator*(double s) const {
        return {x * s, y * s, z * s};
    }

    double Norm() const {
        return std::sqrt(x * x + y * y + z * z);
    }

    double Dot(const Point3d& other) const {
        return x * other.x + y * other.y + z * other.z;
    }

    Point3d Cross(const Point3d& other) const {
        return {y * other.z - z * other.y,
                z * other.x - x * other.z,
                x * other.y - y * other.x};
    }

    double DistanceTo(const Point3d& other) const {
        return (*this - other).Norm();
    }

    bool operator==(const Point3d& other) const {
        return x == other.x && y == other.y && z == other.z;
    }
    bool operator!=(const Point3d& other) const { return !(*this == other); }
};

// =============================================================================
// Segment Type
// =============================================================================

/**
 * @brief 2D line segment
 */
struct MUNSELLSPACE_API Segment2d {
    Point2d p1;
    Point2d p2;

    Segment2d() = default;
    Segment2d(const Point2d& start, const Point2d& end) : p1(start), p2(end) {}

    /// Segment length
    double Length() const { return p1.DistanceTo(p2); }

    /// Direction vector (not normalized)
    Point2d Direction() const { return p2 - p1; }

    /// Distance from point to segment
    double DistanceToPoint(const Point2d& p) const;

    /// Project point onto segment line (returns parameter t, 0=p1, 1=p2)
    double ProjectPoint(const Point2d& p) const;

    /// Get point on segment at parameter t (0=p1, 1=p2)
    Point2d PointAt(double t) const {
        return p1 + Direction() * t;
    }
};

} // namespace MunsellSpace
