#pragma once

/**
 * @file ColorSpaceConverter.h
 * @brief Device RGB <-> CIE XYZ and related colorimetric conversions
 *
 * Provides:
 * - RGB (any supported profile) <-> XYZ, with gamut clipping report
 * - XYZ <-> xyY
 * - XYZ -> L*a*b* -> LCh(ab)
 * - Hex string parsing / formatting
 */

#include <MunsellSpace/Color/ChromaticAdapter.h>
#include <MunsellSpace/Color/ColorTypes.h>
#include <MunsellSpace/Core/Export.h>

#include <cstdint>
#include <string>

namespace MunsellSpace::Color {

// =============================================================================
// RGB <-> XYZ
// =============================================================================

/**
 * @brief Encoded RGB -> XYZ relative to the profile white
 * @param rgb Channels in [0, 1], tagged with a profile
 * @return XYZ tagged with the profile's reference white
 * @throws InvalidChannelException if a channel is outside [0, 1] or non-finite
 */
MUNSELLSPACE_API CieXyz ToXyz(const RgbColor& rgb);

/**
 * @brief 8-bit RGB -> XYZ
 */
MUNSELLSPACE_API CieXyz ToXyz(uint8_t r, uint8_t g, uint8_t b,
                              RgbProfile profile = RgbProfile::SRgb);

/**
 * @brief XYZ -> encoded RGB
 *
 * XYZ tagged with a white other than the profile's is adapted first with
 * @p method. Linear channels outside [0, 1] (beyond 1e-9) are clipped and
 * reported through RgbConversion::wasClipped.
 *
 * @throws InvalidChannelException if a component is non-finite
 */
MUNSELLSPACE_API RgbConversion FromXyz(const CieXyz& xyz, RgbProfile profile = RgbProfile::SRgb,
                                       AdaptationMethod method = AdaptationMethod::Bradford);

// =============================================================================
// XYZ <-> xyY
// =============================================================================

/**
 * @brief XYZ -> xyY; black maps to the chromaticity of its illuminant
 */
MUNSELLSPACE_API CieXyY XyzToXyY(const CieXyz& xyz);

/**
 * @brief xyY -> XYZ; y == 0 yields black
 */
MUNSELLSPACE_API CieXyz XyYToXyz(const CieXyY& xyY);

// =============================================================================
// L*a*b*
// =============================================================================

/**
 * @brief XYZ -> L*a*b* against an explicit white
 */
MUNSELLSPACE_API CieLab XyzToLab(const CieXyz& xyz, const WhitePoint& white);

/**
 * @brief XYZ -> L*a*b* against the white of the xyz tag
 */
MUNSELLSPACE_API CieLab XyzToLab(const CieXyz& xyz);

/**
 * @brief L*a*b* -> LCh(ab), hue in degrees [0, 360)
 */
MUNSELLSPACE_API CieLch LabToLch(const CieLab& lab);

// =============================================================================
// Hex
// =============================================================================

/**
 * @brief Parse "#RRGGBB", "RRGGBB", "#RGB" or "RGB"
 * @throws ParseException for malformed input
 */
MUNSELLSPACE_API RgbColor ParseHex(const std::string& hex, RgbProfile profile = RgbProfile::SRgb);

/**
 * @brief Format as "#RRGGBB" (uppercase, channels rounded and clamped)
 */
MUNSELLSPACE_API std::string ToHex(const RgbColor& rgb);

} // namespace MunsellSpace::Color
