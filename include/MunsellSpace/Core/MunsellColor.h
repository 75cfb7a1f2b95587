#pragma once

/**
 * @file MunsellColor.h
 * @brief Munsell color value type and notation parsing
 *
 * A Munsell color is a hue (family + hue number), a value (lightness) and a
 * chroma (colorfulness). Notation examples:
 * - "5R 4.0/14.0"    chromatic
 * - "2.5YR 6/8"      chromatic, integer fields
 * - "N 5.0"          neutral (chroma 0)
 *
 * Hue positions put the ten families on a 0..100 circle:
 * R=[0,10), YR=[10,20), Y=[20,30), ... RP=[90,100). Position 0 is 0R, which is
 * the same hue as 10RP.
 */

#include <MunsellSpace/Core/Export.h>

#include <string>

namespace MunsellSpace {

// =============================================================================
// Hue Family
// =============================================================================

/**
 * @brief The ten Munsell hue families in circle order
 */
enum class HueFamily {
    R = 0,   ///< Red
    YR,      ///< Yellow-Red
    Y,       ///< Yellow
    GY,      ///< Green-Yellow
    G,       ///< Green
    BG,      ///< Blue-Green
    B,       ///< Blue
    PB,      ///< Purple-Blue
    P,       ///< Purple
    RP       ///< Red-Purple
};

/// Short family code ("R", "YR", ...)
MUNSELLSPACE_API const char* HueFamilyName(HueFamily family);

/**
 * @brief Parse a family code (case-insensitive)
 * @throws ParseException for an unknown code
 */
MUNSELLSPACE_API HueFamily ParseHueFamily(const std::string& code);

/// Family by circle index (wraps modulo 10)
MUNSELLSPACE_API HueFamily HueFamilyFromIndex(int index);

// =============================================================================
// MunsellColor
// =============================================================================

/**
 * @brief Immutable Munsell color (hue, value, chroma)
 *
 * The constructor normalizes hue number 10 to 0 of the next family
 * (10Y == 0GY). Chroma 0 yields a neutral color whose hue fields read R/0.
 */
class MUNSELLSPACE_API MunsellColor {
public:
    /// Neutral black (N 0)
    MunsellColor() = default;

    /**
     * @brief Construct a chromatic (or neutral, if chroma == 0) color
     * @param family Hue family
     * @param hueNumber Hue number in [0, 10]
     * @param value Munsell value in [0, 10]
     * @param chroma Munsell chroma >= 0
     * @throws InvalidArgumentException if a field is out of range or non-finite
     */
    MunsellColor(HueFamily family, double hueNumber, double value, double chroma);

    /// Neutral color N value
    static MunsellColor Neutral(double value);

    /**
     * @brief Build from a continuous hue position
     * @param position Hue position, any real (taken modulo 100)
     */
    static MunsellColor FromHuePosition(double position, double value, double chroma);

    HueFamily Family() const { return family_; }
    double HueNumber() const { return hueNumber_; }
    double Value() const { return value_; }
    double Chroma() const { return chroma_; }

    bool IsNeutral() const { return chroma_ == 0.0; }

    /// Continuous hue position in [0, 100)
    double HuePosition() const;

    /**
     * @brief Format in Munsell notation
     * @param precision Decimal places for every field
     * @return "5.0R 4.0/14.0" or "N 5.0"
     */
    std::string ToString(int precision = 1) const;

    bool operator==(const MunsellColor& other) const {
        return family_ == other.family_ && hueNumber_ == other.hueNumber_ &&
               value_ == other.value_ && chroma_ == other.chroma_;
    }
    bool operator!=(const MunsellColor& other) const { return !(*this == other); }

private:
    HueFamily family_ = HueFamily::R;
    double hueNumber_ = 0.0;
    double value_ = 0.0;
    double chroma_ = 0.0;
};

/**
 * @brief Parse Munsell notation
 *
 * Accepts "5R 4/14", "5R4/14", "2.5 YR 6.0/8.0", "N 5", "N5", "N 5/", "N 5/0".
 * Whitespace between fields is optional and family codes are case-insensitive.
 *
 * @throws ParseException for malformed text or out-of-range fields
 */
MUNSELLSPACE_API MunsellColor ParseMunsell(const std::string& notation);

} // namespace MunsellSpace
