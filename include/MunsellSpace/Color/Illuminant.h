#pragma once

/**
 * @file Illuminant.h
 * @brief CIE standard illuminants and their white points
 *
 * White points are CIE 1931 2-degree observer tristimulus values normalized
 * to Y = 1. Munsell renotation data is defined under illuminant C.
 */

#include <MunsellSpace/Core/Export.h>
#include <MunsellSpace/Core/Types.h>

#include <string>

namespace MunsellSpace::Color {

/**
 * @brief Standard illuminants
 */
enum class Illuminant {
    A,      ///< Incandescent / tungsten, 2856 K
    B,      ///< Direct sunlight (obsolete)
    C,      ///< Average daylight; Munsell reference
    D50,    ///< Horizon light, ICC profile connection space
    D55,    ///< Mid-morning daylight
    D65,    ///< Noon daylight; sRGB reference
    D75,    ///< North sky daylight
    E,      ///< Equal energy
    F2,     ///< Cool white fluorescent
    F7,     ///< Broadband daylight fluorescent
    F11     ///< Narrow tri-band fluorescent
};

/**
 * @brief Tristimulus white point (Y = 1)
 */
struct WhitePoint {
    double X = 1.0;
    double Y = 1.0;
    double Z = 1.0;

    WhitePoint() = default;
    WhitePoint(double X_, double Y_, double Z_) : X(X_), Y(Y_), Z(Z_) {}

    /// CIE xy chromaticity of the white
    Point2d Chromaticity() const {
        double sum = X + Y + Z;
        return {X / sum, Y / sum};
    }
};

/// White point of an illuminant
MUNSELLSPACE_API const WhitePoint& GetWhitePoint(Illuminant illuminant);

/// xy chromaticity of an illuminant
MUNSELLSPACE_API Point2d IlluminantChromaticity(Illuminant illuminant);

/// Canonical name ("C", "D65", ...)
MUNSELLSPACE_API std::string ToString(Illuminant illuminant);

/**
 * @brief Parse illuminant name (case-insensitive)
 * @throws InvalidArgumentException for unknown names
 */
MUNSELLSPACE_API Illuminant ParseIlluminant(const std::string& name);

} // namespace MunsellSpace::Color
