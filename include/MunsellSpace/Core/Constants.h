#pragma once

/**
 * @file Constants.h
 * @brief Mathematical and colorimetric constants for MunsellSpace
 */

namespace MunsellSpace {

// =============================================================================
// Mathematical Constants
// =============================================================================

constexpr double PI = 3.14159265358979323846;
constexpr double TWO_PI = 2.0 * PI;
constexpr double DEG_TO_RAD = PI / 180.0;
constexpr double RAD_TO_DEG = 180.0 / PI;

/// General floating point tolerance
constexpr double EPSILON = 1e-12;

// =============================================================================
// Munsell System Constants
// =============================================================================

/// Number of hue families on the Munsell circle
constexpr int MUNSELL_FAMILY_COUNT = 10;

/// Hue-position circumference (10 families x 10 hue units)
constexpr double MUNSELL_HUE_CIRCLE = 100.0;

/// Renotation hue step (2.5 hue units, 40 steps per circle)
constexpr double MUNSELL_HUE_STEP = 2.5;
constexpr int MUNSELL_HUE_STEP_COUNT = 40;

/// Degrees per step on the 40-step Cartesian hue circle
constexpr double MUNSELL_DEGREES_PER_STEP = 9.0;

/// Munsell value range
constexpr double MUNSELL_VALUE_MIN = 0.0;
constexpr double MUNSELL_VALUE_MAX = 10.0;

/// Tabulated renotation value planes
constexpr int RENOTATION_VALUE_MIN = 1;
constexpr int RENOTATION_VALUE_MAX = 9;

// =============================================================================
// Helpers
// =============================================================================

/// Positive modulo for floating point (result in [0, m))
inline double PositiveMod(double a, double m) {
    double r = a - m * static_cast<double>(static_cast<long long>(a / m));
    if (r < 0.0) r += m;
    if (r >= m) r -= m;
    return r;
}

} // namespace MunsellSpace
