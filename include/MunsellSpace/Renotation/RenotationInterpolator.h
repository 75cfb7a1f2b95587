#pragma once

/**
 * @file RenotationInterpolator.h
 * @brief Forward Munsell -> CIE xyY conversion over the renotation grid
 *
 * Interpolation order:
 * 1. Hue: between the two bounding 2.5-step hues at the same value and even
 *    chroma, by hue angle. Each cell is interpolated either linearly in xy or
 *    radially (polar about illuminant C), chosen by the ovoid method table.
 * 2. Chroma: linearly between bracketing even chromas; below chroma 2 towards
 *    the neutral point.
 * 3. Value: between bracketing integer planes, linearly in luminance Y.
 *    Plane 0 and plane 10 are the neutral point.
 *
 * All chromaticities are relative to illuminant C.
 */

#include <MunsellSpace/Color/ColorTypes.h>
#include <MunsellSpace/Core/Export.h>
#include <MunsellSpace/Core/MunsellColor.h>
#include <MunsellSpace/Core/Types.h>
#include <MunsellSpace/Renotation/RenotationTable.h>

namespace MunsellSpace::Renotation {

// =============================================================================
// Constants
// =============================================================================

/// Chroma may exceed the maximum by this much before counting as out of gamut
constexpr double GAMUT_CHROMA_TOLERANCE = 1e-9;

/// Neutral point of the renotation data (illuminant C chromaticity)
constexpr double NEUTRAL_X = 0.31006;
constexpr double NEUTRAL_Y = 0.31616;

inline Point2d NeutralChromaticity() { return {NEUTRAL_X, NEUTRAL_Y}; }

/**
 * @brief Per-cell hue interpolation scheme
 */
enum class HueInterpolation {
    Linear,     ///< Interpolate x and y directly
    Radial      ///< Interpolate radius and angle about illuminant C
};

/**
 * @brief Interpolation scheme for a hue position at an integer value plane
 *        and even chroma (Centore ovoid table)
 */
MUNSELLSPACE_API HueInterpolation InterpolationMethod(double huePosition, int value, int chroma);

/**
 * @brief Forward renotation model
 *
 * Holds a non-owning reference to a RenotationTable, which must outlive the
 * interpolator. All methods are const and re-entrant.
 */
class MUNSELLSPACE_API RenotationInterpolator {
public:
    /// Interpolator over the default renotation table
    RenotationInterpolator();

    explicit RenotationInterpolator(const RenotationTable& table) : table_(&table) {}

    const RenotationTable& Table() const { return *table_; }

    /**
     * @brief Munsell color -> xy chromaticity
     * @throws OutOfGamutException if chroma exceeds MaxChroma(hue, value)
     */
    Point2d ToXy(const MunsellColor& color) const;

    /**
     * @brief Munsell color -> xyY (Y on 0..1, tagged illuminant C)
     * @throws OutOfGamutException if chroma exceeds MaxChroma(hue, value)
     */
    Color::CieXyY ToXyY(const MunsellColor& color) const;

    /**
     * @brief As ToXy, but extrapolates linearly past the tabulated chroma
     *
     * Beyond the highest tabulated even chroma of a cell, the last two
     * tabulated chromas define the line (the neutral point stands in for
     * chroma 0 when only chroma 2 exists).
     *
     * @throws OutOfGamutException if a needed cell has no data at all
     */
    Point2d ToXyExtrapolated(const MunsellColor& color) const;

    /**
     * @brief Raw-field variant used by the inversion search
     * @param huePosition Any real (taken modulo 100)
     * @param value Munsell value [0, 10]
     * @param chroma Chroma >= 0
     */
    Point2d ToXyExtrapolated(double huePosition, double value, double chroma) const;

    /**
     * @brief Maximum chroma available at a hue and value
     *
     * Minimum over the bounding hues and bounding value planes. Above value
     * 9 the plane-9 maximum tapers linearly in luminance to 0 at value 10;
     * below value 1 the plane-1 maximum tapers to 0 at value 0.
     */
    double MaxChroma(double huePosition, double value) const;

private:
    Point2d XyAtGrid(int hueStep, int value, int chroma) const;
    Point2d XyAtEvenChroma(double huePosition, int value, int chroma) const;
    Point2d XyAtIntegerValue(double huePosition, int value, double chroma) const;
    Point2d Compute(double huePosition, double value, double chroma) const;
    int MaxChromaAtPlane(double huePosition, int value) const;

    const RenotationTable* table_;
};

} // namespace MunsellSpace::Renotation
