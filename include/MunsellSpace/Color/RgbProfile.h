#pragma once

/**
 * @file RgbProfile.h
 * @brief Fixed set of RGB working spaces
 *
 * Each profile is defined by its primary chromaticities, reference white and
 * transfer function. The RGB -> XYZ matrix is derived from the primaries and
 * white (normalized primary matrix) and cached on first use.
 */

#include <MunsellSpace/Color/Illuminant.h>
#include <MunsellSpace/Core/Export.h>
#include <MunsellSpace/Core/Types.h>
#include <MunsellSpace/Internal/Matrix.h>

#include <string>

namespace MunsellSpace::Color {

/**
 * @brief Supported RGB profiles
 */
enum class RgbProfile {
    SRgb,           ///< IEC 61966-2-1, D65, piecewise sRGB curve
    DisplayP3,      ///< P3 primaries, D65, sRGB curve
    P3,             ///< P3 primaries, D65, pure power 2.2
    AdobeRgb,       ///< Adobe RGB (1998), D65, power 563/256
    ProPhotoRgb,    ///< ROMM RGB, D50, power 1.8
    Rec2020         ///< ITU-R BT.2020, D65, BT.2020 curve
};

/**
 * @brief Transfer function family
 */
enum class TransferFunction {
    SRgb,       ///< Piecewise linear + 2.4 power
    Gamma,      ///< Pure power law
    Rec2020     ///< BT.2020 piecewise (alpha 1.0993, beta 0.0181)
};

/**
 * @brief Static description of a profile
 */
struct RgbProfileInfo {
    const char* name = "";
    Point2d red;
    Point2d green;
    Point2d blue;
    Illuminant white = Illuminant::D65;
    TransferFunction transfer = TransferFunction::SRgb;
    double gamma = 2.2;             ///< Exponent for TransferFunction::Gamma
};

/// Profile description
MUNSELLSPACE_API const RgbProfileInfo& GetProfileInfo(RgbProfile profile);

/// Reference white of a profile
MUNSELLSPACE_API Illuminant ProfileWhite(RgbProfile profile);

/// Canonical name ("sRGB", "Display P3", ...)
MUNSELLSPACE_API std::string ToString(RgbProfile profile);

/**
 * @brief Parse profile name (case-insensitive, spaces/dashes/underscores ignored)
 * @throws InvalidArgumentException for unknown names
 */
MUNSELLSPACE_API RgbProfile ParseRgbProfile(const std::string& name);

/**
 * @brief Linear RGB -> XYZ matrix (white maps to the profile white, Y = 1)
 */
MUNSELLSPACE_API const Internal::Mat33& RgbToXyzMatrix(RgbProfile profile);

/// Inverse of RgbToXyzMatrix
MUNSELLSPACE_API const Internal::Mat33& XyzToRgbMatrix(RgbProfile profile);

/**
 * @brief Derive the normalized primary matrix from chromaticities
 * @throws InvalidArgumentException if the primaries are degenerate
 */
MUNSELLSPACE_API Internal::Mat33 ComputePrimaryMatrix(const Point2d& red, const Point2d& green,
                                                      const Point2d& blue, const WhitePoint& white);

/// Encoded channel [0,1] -> linear light
MUNSELLSPACE_API double LinearizeChannel(RgbProfile profile, double encoded);

/// Linear light [0,1] -> encoded channel
MUNSELLSPACE_API double EncodeChannel(RgbProfile profile, double linear);

} // namespace MunsellSpace::Color
