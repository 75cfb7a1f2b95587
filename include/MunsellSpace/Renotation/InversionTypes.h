#pragma once

/**
 * @file InversionTypes.h
 * @brief Parameter and result types for xyY -> Munsell inversion
 */

#include <MunsellSpace/Core/Export.h>
#include <MunsellSpace/Core/MunsellColor.h>
#include <MunsellSpace/Core/Types.h>

#include <string>

namespace MunsellSpace::Renotation {

// =============================================================================
// Constants
// =============================================================================

/// Default convergence threshold on the xy residual
constexpr double DEFAULT_INVERSION_TOLERANCE = 1e-7;

/// Default outer iteration budget
constexpr int DEFAULT_INVERSION_MAX_ITERATIONS = 64;

/// Default budget of each inner bracketing loop
constexpr int DEFAULT_INVERSION_MAX_INNER_ITERATIONS = 16;

/// Distance from the neutral point below which a color is achromatic
constexpr double ACHROMATIC_THRESHOLD = 1e-3;

// =============================================================================
// Enumerations
// =============================================================================

/**
 * @brief Available inversion search strategies
 */
enum class InversionMethod {
    Bracketing,     ///< Alternating hue / chroma bracketing search
    Newton          ///< Damped 2D Newton iteration on (hue, chroma)
};

MUNSELLSPACE_API std::string ToString(InversionMethod method);

/**
 * @brief Parse strategy name ("bracketing", "newton"; case-insensitive)
 * @throws InvalidArgumentException for unknown names
 */
MUNSELLSPACE_API InversionMethod ParseInversionMethod(const std::string& name);

// =============================================================================
// Parameters
// =============================================================================

/**
 * @brief Inversion search parameters
 */
struct MUNSELLSPACE_API InversionParams {
    double tolerance = DEFAULT_INVERSION_TOLERANCE;             ///< xy residual to stop at
    int maxIterations = DEFAULT_INVERSION_MAX_ITERATIONS;       ///< Outer iteration budget
    int maxInnerIterations = DEFAULT_INVERSION_MAX_INNER_ITERATIONS; ///< Per inner loop
    bool trace = false;                                         ///< Print iterations to stderr

    InversionParams& SetTolerance(double t) { tolerance = t; return *this; }
    InversionParams& SetMaxIterations(int n) { maxIterations = n; return *this; }
    InversionParams& SetMaxInnerIterations(int n) { maxInnerIterations = n; return *this; }
    InversionParams& SetTrace(bool enable) { trace = enable; return *this; }

    /**
     * @brief Check parameter ranges
     * @throws InvalidArgumentException if tolerance <= 0 or an iteration count < 1
     */
    void Validate() const;
};

// =============================================================================
// Search State and Result
// =============================================================================

/**
 * @brief Problem handed to an inversion strategy
 */
struct InversionStart {
    Point2d target;             ///< Target xy (illuminant C)
    double value = 0.0;         ///< Munsell value, already solved from Y
    double huePosition = 0.0;   ///< Initial hue position estimate
    double chroma = 0.0;        ///< Initial chroma estimate
};

/**
 * @brief Inversion outcome
 */
struct InversionResult {
    MunsellColor color;         ///< Best estimate found
    bool converged = false;     ///< Residual fell below tolerance
    int iterations = 0;         ///< Outer iterations used
    double residual = 0.0;      ///< Final xy distance to the target
};

} // namespace MunsellSpace::Renotation
