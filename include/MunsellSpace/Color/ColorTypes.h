#pragma once

/**
 * @file ColorTypes.h
 * @brief Tagged colorimetric value types
 *
 * Tristimulus and chromaticity values carry the illuminant they are relative
 * to; adaptation always reads the tag and never assumes a white.
 * XYZ and xyY use Y on a 0..1 scale.
 */

#include <MunsellSpace/Color/Illuminant.h>
#include <MunsellSpace/Color/RgbProfile.h>

#include <cstdint>

namespace MunsellSpace::Color {

/**
 * @brief CIE XYZ tristimulus (Y = 1 for the perfect diffuser)
 *
 * The reference white is part of the value and must be given explicitly.
 */
struct CieXyz {
    double X = 0.0;
    double Y = 0.0;
    double Z = 0.0;
    Illuminant illuminant;

    CieXyz(double X_, double Y_, double Z_, Illuminant ill)
        : X(X_), Y(Y_), Z(Z_), illuminant(ill) {}
};

/**
 * @brief CIE xyY (chromaticity + luminance)
 */
struct CieXyY {
    double x = 0.0;
    double y = 0.0;
    double Y = 0.0;
    Illuminant illuminant = Illuminant::C;

    CieXyY() = default;
    CieXyY(double x_, double y_, double Y_, Illuminant ill = Illuminant::C)
        : x(x_), y(y_), Y(Y_), illuminant(ill) {}
};

/**
 * @brief CIE L*a*b* (L in 0..100)
 */
struct CieLab {
    double L = 0.0;
    double a = 0.0;
    double b = 0.0;

    CieLab() = default;
    CieLab(double L_, double a_, double b_) : L(L_), a(a_), b(b_) {}
};

/**
 * @brief CIE LCh(ab), hue in degrees [0, 360)
 */
struct CieLch {
    double L = 0.0;
    double C = 0.0;
    double h = 0.0;

    CieLch() = default;
    CieLch(double L_, double C_, double h_) : L(L_), C(C_), h(h_) {}
};

/**
 * @brief Encoded RGB triple, channels in [0, 1]
 */
struct RgbColor {
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;
    RgbProfile profile = RgbProfile::SRgb;

    RgbColor() = default;
    RgbColor(double r_, double g_, double b_, RgbProfile p = RgbProfile::SRgb)
        : r(r_), g(g_), b(b_), profile(p) {}

    /// Build from 8-bit channels
    static RgbColor FromU8(uint8_t r8, uint8_t g8, uint8_t b8,
                           RgbProfile p = RgbProfile::SRgb) {
        return {r8 / 255.0, g8 / 255.0, b8 / 255.0, p};
    }

    /// Round each channel to 8 bits (clamped)
    void ToU8(uint8_t& r8, uint8_t& g8, uint8_t& b8) const;
};

/**
 * @brief Result of XYZ -> RGB, with gamut clipping flag
 */
struct RgbConversion {
    RgbColor rgb;
    bool wasClipped = false;    ///< True if any linear channel left [0,1]
};

} // namespace MunsellSpace::Color
