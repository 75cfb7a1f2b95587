#pragma once

/**
 * @file MunsellMath.h
 * @brief Hue-angle and value-scale helpers shared by the renotation code
 *
 * Hue positions follow MunsellColor::HuePosition(): R=[0,10), YR=[10,20), ...
 * RP=[90,100). Renotation hue steps are 2.5 units apart, step 0 = 0R = 10RP.
 *
 * The hue angle is the non-uniform angular scale used to interpolate between
 * renotation hues: hue breakpoints [0,2,3,4,5,6,8,9,10] (in family units,
 * starting at 5R) map to degrees [0,45,70,135,160,225,255,315,360].
 */

#include <MunsellSpace/Core/Export.h>

namespace MunsellSpace::Renotation {

// =============================================================================
// Hue Helpers
// =============================================================================

/**
 * @brief Hue position -> hue angle in degrees [0, 360)
 */
MUNSELLSPACE_API double HueAngle(double huePosition);

/**
 * @brief Hue angle in degrees -> hue position [0, 100)
 */
MUNSELLSPACE_API double HuePositionFromAngle(double hueAngle);

/**
 * @brief Renotation hue step nearest to a position (0..39)
 */
MUNSELLSPACE_API int HueStepFromPosition(double huePosition);

/// Hue position of a renotation hue step
MUNSELLSPACE_API double PositionFromHueStep(int hueStep);

/// True if the position lies on a 2.5 step (within 1e-9)
MUNSELLSPACE_API bool IsStandardHue(double huePosition);

/**
 * @brief Bounding renotation hues of a position
 * @param[out] cwPosition Clockwise (lower) bounding position
 * @param[out] ccwPosition Counter-clockwise (upper) bounding position
 *
 * A standard hue bounds itself on both sides.
 */
MUNSELLSPACE_API void BoundingHuePositions(double huePosition, double& cwPosition,
                                           double& ccwPosition);

/**
 * @brief Bounding renotation hue steps of a position
 */
MUNSELLSPACE_API void BoundingHueSteps(double huePosition, int& cwStep, int& ccwStep);

/**
 * @brief ASTM hue scale (0R mapped to 100) used by the interpolation method table
 */
MUNSELLSPACE_API double AstmHue(double huePosition);

// =============================================================================
// Value Scale (ASTM D1535)
// =============================================================================

/**
 * @brief Munsell value -> relative luminance Y in percent (0..100)
 *
 * Y = 1.1914V - 0.22533V^2 + 0.23352V^3 - 0.020484V^4 + 0.00081939V^5
 */
MUNSELLSPACE_API double LuminanceFromValue(double value);

/**
 * @brief Relative luminance Y in percent -> Munsell value [0, 10]
 *
 * Newton iteration on the ASTM D1535 quintic (at most 100 steps,
 * tolerance 1e-10), clamped to [0, 10].
 */
MUNSELLSPACE_API double ValueFromLuminance(double luminance);

} // namespace MunsellSpace::Renotation
