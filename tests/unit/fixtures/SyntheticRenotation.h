#pragma once

/**
 * @file SyntheticRenotation.h
 * @brief Analytic renotation grid shared by the unit tests
 *
 * Every hue step, value 1..9 and even chroma up to maxChroma is placed on a
 * circle about the neutral point:
 *   x = NEUTRAL_X + 0.01 * C * cos(HueAngle(p))
 *   y = NEUTRAL_Y + 0.01 * C * sin(HueAngle(p))
 * so grid lookups, odd chromas and chroma extrapolation have closed-form
 * answers at standard hues.
 */

#include <MunsellSpace/Core/Constants.h>
#include <MunsellSpace/Core/Types.h>
#include <MunsellSpace/Renotation/MunsellMath.h>
#include <MunsellSpace/Renotation/RenotationInterpolator.h>
#include <MunsellSpace/Renotation/RenotationTable.h>

#include <cmath>
#include <utility>
#include <vector>

namespace MunsellSpace::TestData {

constexpr double SYNTHETIC_RADIUS_PER_CHROMA = 0.01;

inline Point2d SyntheticXy(double huePosition, double chroma) {
    double theta = Renotation::HueAngle(huePosition) * DEG_TO_RAD;
    return {Renotation::NEUTRAL_X + SYNTHETIC_RADIUS_PER_CHROMA * chroma * std::cos(theta),
            Renotation::NEUTRAL_Y + SYNTHETIC_RADIUS_PER_CHROMA * chroma * std::sin(theta)};
}

inline Renotation::RenotationTable MakeSyntheticRenotation(int maxChroma = 12) {
    std::vector<Renotation::RenotationEntry> entries;
    for (int step = 0; step < MUNSELL_HUE_STEP_COUNT; ++step) {
        double position = Renotation::PositionFromHueStep(step);
        for (int value = RENOTATION_VALUE_MIN; value <= RENOTATION_VALUE_MAX; ++value) {
            double Y = Renotation::LuminanceFromValue(value) / 100.0;
            for (int chroma = 2; chroma <= maxChroma; chroma += 2) {
                Point2d xy = SyntheticXy(position, chroma);
                entries.emplace_back(step, value, chroma, xy.x, xy.y, Y);
            }
        }
    }
    return Renotation::RenotationTable(std::move(entries));
}

} // namespace MunsellSpace::TestData
