#pragma once

/**
 * @file ConvexHull3d.h
 * @brief Incremental 3D convex hull
 *
 * Starts from a maximal tetrahedron and inserts the remaining points in input
 * order, so the result is deterministic for a given input. Points within the
 * tolerance of a face are treated as inside and never become vertices.
 */

#include <MunsellSpace/Core/Types.h>

#include <cstddef>
#include <vector>

namespace MunsellSpace::Internal {

/// Hull tolerance relative to the bounding-box diagonal
constexpr double HULL_RELATIVE_TOLERANCE = 1e-9;

/**
 * @brief Hull triangle (input point indices), counter-clockwise seen from outside
 */
struct HullFace3d {
    size_t a = 0;
    size_t b = 0;
    size_t c = 0;
};

/**
 * @brief Compute the convex hull of a point set
 *
 * @return Triangular faces of the hull, referencing input indices
 * @throws InsufficientDataException if fewer than 4 points are given or the
 *         points are coincident, collinear or coplanar
 */
std::vector<HullFace3d> ConvexHull3d(const std::vector<Point3d>& points);

/**
 * @brief Input indices of the hull vertices, ascending
 * @throws InsufficientDataException as ConvexHull3d
 */
std::vector<size_t> ConvexHull3dIndices(const std::vector<Point3d>& points);

} // namespace MunsellSpace::Internal
