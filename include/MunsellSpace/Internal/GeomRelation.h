#pragma once

/**
 * @file GeomRelation.h
 * @brief Point-polygon relationship functions
 *
 * Used by the ISCC-NBS classifier, whose regions are polygons in the
 * (chroma, value) plane.
 */

#include <MunsellSpace/Core/Types.h>

#include <vector>

namespace MunsellSpace::Internal {

// =============================================================================
// Constants
// =============================================================================

constexpr double RELATION_TOLERANCE = 1e-9;

// =============================================================================
// Enumerations
// =============================================================================

/**
 * @brief Relationship between point and polygon
 */
enum class PointPolygonRelation {
    Inside,         ///< Point is inside polygon
    OnBoundary,     ///< Point is on polygon edge
    Outside         ///< Point is outside polygon
};

// =============================================================================
// Point-Polygon Relationships
// =============================================================================

/**
 * @brief Check if point lies on a segment within tolerance
 */
bool PointOnSegment(const Point2d& point, const Segment2d& segment,
                    double tolerance = RELATION_TOLERANCE);

/**
 * @brief Check if point is inside a general polygon (convex or concave)
 *
 * The polygon is implicitly closed (last vertex connects to first).
 *
 * @return PointPolygonRelation enum
 */
PointPolygonRelation PointInPolygon(const Point2d& point, const std::vector<Point2d>& polygon,
                                     double tolerance = RELATION_TOLERANCE);

/**
 * @brief Check if point is on polygon boundary
 */
bool PointOnPolygonBoundary(const Point2d& point, const std::vector<Point2d>& polygon,
                            double tolerance = RELATION_TOLERANCE);

/**
 * @brief Minimum distance from point to any polygon edge
 * @return Distance (0 when the point is on an edge); +inf for an empty polygon
 */
double PointToPolygonBoundaryDistance(const Point2d& point, const std::vector<Point2d>& polygon);

/**
 * @brief Indices of the edges (i, i+1) that pass through the point
 */
std::vector<int> EdgesThroughPoint(const Point2d& point, const std::vector<Point2d>& polygon,
                                   double tolerance = RELATION_TOLERANCE);

} // namespace MunsellSpace::Internal
