#pragma once

/**
 * @file CartesianMapper.h
 * @brief Munsell (H, V, C) <-> Cartesian (x, y, z)
 *
 * The hue circle has 40 steps of 9 degrees:
 * - h40 = HuePosition / 2.5, in [0, 40)
 * - theta = 9 deg * h40
 * - h40 = 0 at 10RP (= 0R), 2 at 5R, 4 at 10R
 *
 * x = C cos(theta), y = C sin(theta), z = V
 */

#include <MunsellSpace/Core/Export.h>
#include <MunsellSpace/Core/MunsellColor.h>
#include <MunsellSpace/Core/Types.h>

namespace MunsellSpace::Geometry {

/// Radius below which a Cartesian point is taken to lie on the neutral axis
constexpr double NEUTRAL_AXIS_TOLERANCE = 1e-10;

/// Hue on the 40-step circle, [0, 40)
MUNSELLSPACE_API double HueNumber40(const MunsellColor& color);

/// Hue angle on the 40-step circle in radians, [0, 2pi)
MUNSELLSPACE_API double HueAngle40(const MunsellColor& color);

/**
 * @brief Munsell color -> Cartesian point
 */
MUNSELLSPACE_API Point3d ToCartesian(const MunsellColor& color);

/**
 * @brief Cartesian point -> Munsell color
 * @throws InvalidArgumentException if z lies outside [0, 10] or a coordinate
 *         is not finite
 */
MUNSELLSPACE_API MunsellColor FromCartesian(const Point3d& point);

} // namespace MunsellSpace::Geometry
