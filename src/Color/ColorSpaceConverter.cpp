/**
 * @file ColorSpaceConverter.cpp
 * @brief RGB / XYZ / xyY / Lab conversions
 */

#include <MunsellSpace/Color/ColorSpaceConverter.h>
#include <MunsellSpace/Core/Constants.h>
#include <MunsellSpace/Core/Exception.h>
#include <MunsellSpace/Core/Validate.h>
#include <MunsellSpace/Platform/FileIO.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>

namespace MunsellSpace::Color {

namespace {

// Lab constants
constexpr double LAB_EPSILON = 0.008856;    // (6/29)^3
constexpr double LAB_KAPPA = 903.3;         // (29/3)^3

// Linear channels may overshoot [0,1] by this much before counting as clipped
constexpr double GAMUT_TOLERANCE = 1e-9;

inline double LabF(double t) {
    return (t > LAB_EPSILON) ? std::cbrt(t) : (LAB_KAPPA * t + 16.0) / 116.0;
}

inline uint8_t ClampU8(double val) {
    return static_cast<uint8_t>(std::lround(std::clamp(val, 0.0, 1.0) * 255.0));
}

int HexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

} // anonymous namespace

// =============================================================================
// RgbColor
// =============================================================================

void RgbColor::ToU8(uint8_t& r8, uint8_t& g8, uint8_t& b8) const {
    r8 = ClampU8(r);
    g8 = ClampU8(g);
    b8 = ClampU8(b);
}

// =============================================================================
// RGB <-> XYZ
// =============================================================================

CieXyz ToXyz(const RgbColor& rgb) {
    Validate::RequireChannel(rgb.r, 0.0, 1.0, "r", "ToXyz");
    Validate::RequireChannel(rgb.g, 0.0, 1.0, "g", "ToXyz");
    Validate::RequireChannel(rgb.b, 0.0, 1.0, "b", "ToXyz");

    Internal::Vec3 linear(LinearizeChannel(rgb.profile, rgb.r),
                          LinearizeChannel(rgb.profile, rgb.g),
                          LinearizeChannel(rgb.profile, rgb.b));
    Internal::Vec3 xyz = RgbToXyzMatrix(rgb.profile) * linear;
    return CieXyz(xyz[0], xyz[1], xyz[2], ProfileWhite(rgb.profile));
}

CieXyz ToXyz(uint8_t r, uint8_t g, uint8_t b, RgbProfile profile) {
    return ToXyz(RgbColor::FromU8(r, g, b, profile));
}

RgbConversion FromXyz(const CieXyz& xyz, RgbProfile profile, AdaptationMethod method) {
    Validate::RequireFiniteChannel(xyz.X, "X", "FromXyz");
    Validate::RequireFiniteChannel(xyz.Y, "Y", "FromXyz");
    Validate::RequireFiniteChannel(xyz.Z, "Z", "FromXyz");

    CieXyz source = ChromaticAdapter(method).Adapt(xyz, ProfileWhite(profile));
    Internal::Vec3 linear = XyzToRgbMatrix(profile) * Internal::Vec3(source.X, source.Y, source.Z);

    RgbConversion result;
    for (int i = 0; i < 3; ++i) {
        if (linear[i] < -GAMUT_TOLERANCE || linear[i] > 1.0 + GAMUT_TOLERANCE) {
            result.wasClipped = true;
        }
        linear[i] = std::clamp(linear[i], 0.0, 1.0);
    }

    result.rgb = RgbColor(EncodeChannel(profile, linear[0]),
                          EncodeChannel(profile, linear[1]),
                          EncodeChannel(profile, linear[2]), profile);
    return result;
}

// =============================================================================
// XYZ <-> xyY
// =============================================================================

CieXyY XyzToXyY(const CieXyz& xyz) {
    double sum = xyz.X + xyz.Y + xyz.Z;
    if (std::abs(sum) < EPSILON) {
        Point2d white = IlluminantChromaticity(xyz.illuminant);
        return CieXyY(white.x, white.y, 0.0, xyz.illuminant);
    }
    return CieXyY(xyz.X / sum, xyz.Y / sum, xyz.Y, xyz.illuminant);
}

CieXyz XyYToXyz(const CieXyY& xyY) {
    if (xyY.y <= 0.0) {
        return CieXyz(0.0, 0.0, 0.0, xyY.illuminant);
    }
    double X = xyY.x * xyY.Y / xyY.y;
    double Z = (1.0 - xyY.x - xyY.y) * xyY.Y / xyY.y;
    return CieXyz(X, xyY.Y, Z, xyY.illuminant);
}

// =============================================================================
// L*a*b*
// =============================================================================

CieLab XyzToLab(const CieXyz& xyz, const WhitePoint& white) {
    double fx = LabF(xyz.X / white.X);
    double fy = LabF(xyz.Y / white.Y);
    double fz = LabF(xyz.Z / white.Z);
    return CieLab(116.0 * fy - 16.0, 500.0 * (fx - fy), 200.0 * (fy - fz));
}

CieLab XyzToLab(const CieXyz& xyz) {
    return XyzToLab(xyz, GetWhitePoint(xyz.illuminant));
}

CieLch LabToLch(const CieLab& lab) {
    double C = std::hypot(lab.a, lab.b);
    double h = PositiveMod(std::atan2(lab.b, lab.a) * RAD_TO_DEG, 360.0);
    return CieLch(lab.L, C, h);
}

// =============================================================================
// Hex
// =============================================================================

RgbColor ParseHex(const std::string& hex, RgbProfile profile) {
    std::string s = Platform::TrimString(hex);
    if (!s.empty() && s[0] == '#') {
        s = s.substr(1);
    }
    if (s.size() != 6 && s.size() != 3) {
        throw ParseException("hex color must have 3 or 6 digits: '" + hex + "'");
    }

    int digits[6];
    for (size_t i = 0; i < s.size(); ++i) {
        digits[i] = HexDigit(s[i]);
        if (digits[i] < 0) {
            throw ParseException("invalid hex digit in '" + hex + "'");
        }
    }

    if (s.size() == 3) {
        return RgbColor::FromU8(static_cast<uint8_t>(digits[0] * 17),
                                static_cast<uint8_t>(digits[1] * 17),
                                static_cast<uint8_t>(digits[2] * 17), profile);
    }
    return RgbColor::FromU8(static_cast<uint8_t>(digits[0] * 16 + digits[1]),
                            static_cast<uint8_t>(digits[2] * 16 + digits[3]),
                            static_cast<uint8_t>(digits[4] * 16 + digits[5]), profile);
}

std::string ToHex(const RgbColor& rgb) {
    uint8_t r8, g8, b8;
    rgb.ToU8(r8, g8, b8);
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02X%02X%02X", r8, g8, b8);
    return buf;
}

} // namespace MunsellSpace::Color
