#pragma once

/**
 * @file ConvexHullBuilder.h
 * @brief Polyhedron construction from sample point clouds
 *
 * Overlay polyhedra are built as the inner hull of the samples: the outer
 * convex hull vertices are discarded as outliers and the remaining points
 * are hulled again.
 *
 * @code
 * std::vector<MunsellColor> samples = ...;
 * Polyhedron teal = BuildFromMunsell(samples, "teal");
 * bool inside = teal.Contains(ToCartesian(color));
 * @endcode
 */

#include <MunsellSpace/Core/Export.h>
#include <MunsellSpace/Core/MunsellColor.h>
#include <MunsellSpace/Core/Types.h>
#include <MunsellSpace/Geometry/Polyhedron.h>

#include <string>
#include <vector>

namespace MunsellSpace::Geometry {

/**
 * @brief Convex hull of the points as a polyhedron
 *
 * Vertices are the hull vertices in ascending input order; sampleCount is
 * points.size().
 *
 * @throws InsufficientDataException for fewer than 4 points or degenerate
 *         (coincident, collinear, coplanar) input
 */
MUNSELLSPACE_API Polyhedron OuterHull(const std::vector<Point3d>& points, const std::string& name);

/**
 * @brief Input indices of the outer hull vertices, ascending
 * @throws InsufficientDataException as OuterHull
 */
MUNSELLSPACE_API std::vector<size_t> OuterHullVertices(const std::vector<Point3d>& points);

/**
 * @brief Hull of the points left after removing the outer hull vertices
 *
 * Points equal to an outer hull vertex are removed too. Peels exactly one
 * layer; sampleCount is points.size().
 *
 * @throws InsufficientDataException if fewer than 4 non-coplanar points
 *         remain
 */
MUNSELLSPACE_API Polyhedron InnerHull(const std::vector<Point3d>& points, const std::string& name);

/**
 * @brief Map Munsell samples to Cartesian space and build the inner hull
 * @throws InsufficientDataException as InnerHull
 */
MUNSELLSPACE_API Polyhedron BuildFromMunsell(const std::vector<MunsellColor>& samples,
                                             const std::string& name);

} // namespace MunsellSpace::Geometry
