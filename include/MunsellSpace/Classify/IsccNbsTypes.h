#pragma once

/**
 * @file IsccNbsTypes.h
 * @brief ISCC-NBS region, color metadata and match types
 */

#include <MunsellSpace/Core/Export.h>
#include <MunsellSpace/Core/Types.h>

#include <string>
#include <vector>

namespace MunsellSpace::Classify {

// =============================================================================
// Enumerations
// =============================================================================

/**
 * @brief Which end of a region's cyclic hue range is inclusive
 */
enum class BoundaryPolicy {
    Method1,    ///< [start, end): include start, exclude end
    Method2     ///< (start, end]: exclude start, include end
};

MUNSELLSPACE_API std::string ToString(BoundaryPolicy policy);

/**
 * @brief Parse "method1" / "method2" (also "1" / "2"; case-insensitive)
 * @throws InvalidArgumentException for unknown names
 */
MUNSELLSPACE_API BoundaryPolicy ParseBoundaryPolicy(const std::string& name);

// =============================================================================
// Table Types
// =============================================================================

/// Color number range of the ISCC-NBS system
constexpr int ISCC_NBS_FIRST_COLOR = 1;
constexpr int ISCC_NBS_LAST_COLOR = 267;

/// Neutral color numbers
constexpr int ISCC_NBS_WHITE = 263;
constexpr int ISCC_NBS_LIGHT_GRAY = 264;
constexpr int ISCC_NBS_MEDIUM_GRAY = 265;
constexpr int ISCC_NBS_DARK_GRAY = 266;
constexpr int ISCC_NBS_BLACK = 267;

/**
 * @brief One polygon of an ISCC-NBS color over a hue range
 *
 * The polygon lives in the (chroma, value) plane: x = chroma, y = value.
 */
struct IsccNbsRegion {
    int colorNumber = 0;
    int polygonGroup = 0;
    double hueStart = 0.0;          ///< Hue position [0, 100)
    double hueEnd = 0.0;            ///< Hue position [0, 100)
    std::vector<Point2d> polygon;
};

/**
 * @brief Per-color naming metadata
 */
struct IsccNbsColorInfo {
    int number = 0;
    std::string name;               ///< e.g. "red"
    std::string formatter;          ///< e.g. "vivid {0}"; "{1}" is the -ish form
    std::string extendedName;       ///< Alternative, more familiar name
    std::string shade;

    /// formatter applied to name
    std::string Descriptor() const;

    /// formatter applied to extendedName
    std::string ExtendedDescriptor() const;
};

/**
 * @brief Classification result
 */
struct IsccNbsMatch {
    int colorNumber = 0;
    std::string descriptor;         ///< e.g. "vivid red"
    std::string name;               ///< e.g. "red"
    std::string extendedDescriptor;
    std::string shade;
    bool exact = true;              ///< false for a nearest-region fallback
    double distance = 0.0;          ///< (chroma, value) distance to the region, 0 when exact
};

// =============================================================================
// Descriptor Helpers
// =============================================================================

/**
 * @brief "-ish" form of a color name ("red" -> "reddish", "olive" -> "olive")
 *
 * Unknown names are returned unchanged.
 */
MUNSELLSPACE_API std::string IshForm(const std::string& name);

/**
 * @brief Expand a formatter template: {0} -> name, {1} -> IshForm(name)
 */
MUNSELLSPACE_API std::string FormatDescriptor(const std::string& formatter, const std::string& name);

} // namespace MunsellSpace::Classify
