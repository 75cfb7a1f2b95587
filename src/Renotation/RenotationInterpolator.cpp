/**
 * @file RenotationInterpolator.cpp
 * @brief Forward renotation interpolation
 */

#include <MunsellSpace/Renotation/RenotationInterpolator.h>
#include <MunsellSpace/Renotation/MunsellMath.h>
#include <MunsellSpace/Core/Constants.h>
#include <MunsellSpace/Core/Exception.h>

#include <algorithm>
#include <climits>
#include <cmath>
#include <cstdio>
#include <string>

namespace MunsellSpace::Renotation {

namespace {

// =============================================================================
// Ovoid Method Table
// =============================================================================

struct RadialRange {
    double lo;
    double hi;
};

// Radial interpolation applies inside any of the open ASTM hue ranges
struct OvoidRule {
    int value;
    int chromaMin;
    int chromaMax;
    int rangeCount;
    RadialRange ranges[3];
};

const OvoidRule OVOID_RULES[] = {
    {1, 2, 2, 2,         {{15.0, 30.0}, {60.0, 85.0}}},
    {1, 4, 4, 2,         {{12.5, 27.5}, {57.5, 80.0}}},
    {1, 6, 6, 1,         {{55.0, 80.0}}},
    {1, 8, 8, 1,         {{67.5, 77.5}}},
    {1, 10, INT_MAX, 1,  {{72.5, 77.5}}},

    {2, 2, 2, 2,         {{15.0, 27.5}, {77.5, 80.0}}},
    {2, 4, 4, 2,         {{12.5, 30.0}, {62.5, 80.0}}},
    {2, 6, 6, 2,         {{7.5, 22.5}, {62.5, 80.0}}},
    {2, 8, 8, 2,         {{7.5, 15.0}, {60.0, 80.0}}},
    {2, 10, INT_MAX, 1,  {{65.0, 77.5}}},

    {3, 2, 2, 2,         {{10.0, 37.5}, {65.0, 85.0}}},
    {3, 4, 4, 2,         {{5.0, 37.5}, {55.0, 72.5}}},
    {3, 6, 10, 2,        {{7.5, 37.5}, {57.5, 82.5}}},
    {3, 12, INT_MAX, 2,  {{7.5, 42.5}, {57.5, 80.0}}},

    {4, 2, 4, 2,         {{7.5, 42.5}, {57.5, 85.0}}},
    {4, 6, 8, 2,         {{7.5, 40.0}, {57.5, 82.5}}},
    {4, 10, INT_MAX, 2,  {{7.5, 40.0}, {57.5, 80.0}}},

    {5, 2, 2, 2,         {{5.0, 37.5}, {55.0, 85.0}}},
    {5, 4, 8, 2,         {{2.5, 42.5}, {55.0, 85.0}}},
    {5, 10, INT_MAX, 2,  {{2.5, 42.5}, {55.0, 82.5}}},

    {6, 2, 4, 2,         {{5.0, 37.5}, {55.0, 87.5}}},
    {6, 6, 6, 2,         {{5.0, 42.5}, {57.5, 87.5}}},
    {6, 8, 10, 2,        {{5.0, 42.5}, {60.0, 85.0}}},
    {6, 12, 14, 2,       {{5.0, 42.5}, {60.0, 82.5}}},
    {6, 16, INT_MAX, 2,  {{5.0, 42.5}, {60.0, 80.0}}},

    {7, 2, 6, 2,         {{5.0, 42.5}, {60.0, 85.0}}},
    {7, 8, 8, 2,         {{5.0, 42.5}, {60.0, 82.5}}},
    {7, 10, 10, 3,       {{30.0, 42.5}, {5.0, 25.0}, {60.0, 82.5}}},
    {7, 12, 12, 3,       {{30.0, 42.5}, {7.5, 27.5}, {80.0, 82.5}}},
    {7, 14, INT_MAX, 3,  {{32.5, 40.0}, {7.5, 15.0}, {80.0, 82.5}}},

    {8, 2, 12, 2,        {{5.0, 40.0}, {60.0, 85.0}}},
    {8, 14, INT_MAX, 3,  {{32.5, 40.0}, {5.0, 15.0}, {60.0, 85.0}}},

    {9, 2, 4, 2,         {{5.0, 40.0}, {55.0, 80.0}}},
    {9, 6, 14, 1,        {{5.0, 42.5}}},
    {9, 16, INT_MAX, 1,  {{35.0, 42.5}}},
};

// Even chroma test with a little slack for accumulated rounding
bool IsEvenChroma(double chroma) {
    double half = chroma / 2.0;
    return std::abs(half - std::round(half)) < 1e-12;
}

Point2d Lerp(const Point2d& a, const Point2d& b, double t) {
    return a + (b - a) * t;
}

std::string CellName(int hueStep, int value) {
    MunsellColor color = MunsellColor::FromHuePosition(PositionFromHueStep(hueStep),
                                                       static_cast<double>(value), 2.0);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%g%s %d", color.HueNumber(),
                  HueFamilyName(color.Family()), value);
    return buf;
}

} // anonymous namespace

HueInterpolation InterpolationMethod(double huePosition, int value, int chroma) {
    double astm = AstmHue(huePosition);
    int c = 2 * static_cast<int>(std::lround(chroma / 2.0));
    for (const auto& rule : OVOID_RULES) {
        if (rule.value != value || c < rule.chromaMin || c > rule.chromaMax) continue;
        for (int i = 0; i < rule.rangeCount; ++i) {
            if (astm > rule.ranges[i].lo && astm < rule.ranges[i].hi) {
                return HueInterpolation::Radial;
            }
        }
        return HueInterpolation::Linear;
    }
    return HueInterpolation::Linear;
}

// =============================================================================
// RenotationInterpolator
// =============================================================================

RenotationInterpolator::RenotationInterpolator()
    : table_(&RenotationTable::Default()) {}

Point2d RenotationInterpolator::XyAtGrid(int hueStep, int value, int chroma) const {
    if (const RenotationEntry* e = table_->Find(hueStep, value, chroma)) {
        return {e->x, e->y};
    }

    int maxC = table_->MaxChroma(hueStep, value);
    if (maxC == 0) {
        throw OutOfGamutException("no renotation data at " + CellName(hueStep, value));
    }
    if (chroma < maxC) {
        throw InsufficientDataException("renotation grid has no chroma " + std::to_string(chroma) +
                                        " at " + CellName(hueStep, value));
    }

    // Linear extrapolation from the last two tabulated chromas
    const RenotationEntry* last = table_->Find(hueStep, value, maxC);
    Point2d lastXy(last->x, last->y);
    Point2d prevXy = NeutralChromaticity();
    if (maxC > 2) {
        const RenotationEntry* prev = table_->Find(hueStep, value, maxC - 2);
        if (prev == nullptr) {
            throw InsufficientDataException("renotation grid has no chroma " +
                                            std::to_string(maxC - 2) + " at " +
                                            CellName(hueStep, value));
        }
        prevXy = Point2d(prev->x, prev->y);
    }
    double t = (chroma - maxC) / 2.0;
    return lastXy + (lastXy - prevXy) * t;
}

Point2d RenotationInterpolator::XyAtEvenChroma(double huePosition, int value, int chroma) const {
    const Point2d neutral = NeutralChromaticity();
    if (chroma <= 0) {
        return neutral;
    }
    if (IsStandardHue(huePosition)) {
        return XyAtGrid(HueStepFromPosition(huePosition), value, chroma);
    }

    double cw = 0.0, ccw = 0.0;
    BoundingHuePositions(huePosition, cw, ccw);
    Point2d xyMinus = XyAtGrid(HueStepFromPosition(cw), value, chroma);
    Point2d xyPlus = XyAtGrid(HueStepFromPosition(ccw), value, chroma);

    Point2d dMinus = xyMinus - neutral;
    Point2d dPlus = xyPlus - neutral;
    double rhoMinus = dMinus.Norm();
    double rhoPlus = dPlus.Norm();
    double phiMinus = std::atan2(dMinus.y, dMinus.x) * RAD_TO_DEG;
    double phiPlus = std::atan2(dPlus.y, dPlus.x) * RAD_TO_DEG;

    double lower = HueAngle(cw);
    double angle = HueAngle(huePosition);
    double upper = HueAngle(ccw);

    if (phiMinus - phiPlus > 180.0) {
        phiPlus += 360.0;
    }
    if (lower == 0.0) {
        lower = 360.0;
    }
    if (lower > upper) {
        if (lower > angle) {
            lower -= 360.0;
        } else {
            lower -= 360.0;
            angle -= 360.0;
        }
    }

    double t = (upper == lower) ? 0.0 : std::clamp((angle - lower) / (upper - lower), 0.0, 1.0);

    if (InterpolationMethod(huePosition, value, chroma) == HueInterpolation::Linear) {
        return Lerp(xyMinus, xyPlus, t);
    }

    double rho = rhoMinus + t * (rhoPlus - rhoMinus);
    double phi = (phiMinus + t * (phiPlus - phiMinus)) * DEG_TO_RAD;
    return {neutral.x + rho * std::cos(phi), neutral.y + rho * std::sin(phi)};
}

Point2d RenotationInterpolator::XyAtIntegerValue(double huePosition, int value, double chroma) const {
    if (value <= 0 || value >= 10 || chroma <= 0.0) {
        return NeutralChromaticity();
    }

    if (IsEvenChroma(chroma)) {
        return XyAtEvenChroma(huePosition, value, static_cast<int>(std::lround(chroma)));
    }

    int chromaLo = 2 * static_cast<int>(std::floor(chroma / 2.0));
    int chromaHi = chromaLo + 2;
    Point2d xyLo = XyAtEvenChroma(huePosition, value, chromaLo);
    Point2d xyHi = XyAtEvenChroma(huePosition, value, chromaHi);
    return Lerp(xyLo, xyHi, (chroma - chromaLo) / 2.0);
}

Point2d RenotationInterpolator::Compute(double huePosition, double value, double chroma) const {
    if (chroma <= 0.0) {
        return NeutralChromaticity();
    }

    double p = PositiveMod(huePosition, MUNSELL_HUE_CIRCLE);
    int valueLo = static_cast<int>(std::floor(value));
    int valueHi = static_cast<int>(std::ceil(value));
    if (valueLo == valueHi) {
        return XyAtIntegerValue(p, valueLo, chroma);
    }

    Point2d xyLo = XyAtIntegerValue(p, valueLo, chroma);
    Point2d xyHi = XyAtIntegerValue(p, valueHi, chroma);

    double lum = LuminanceFromValue(value);
    double lumLo = LuminanceFromValue(valueLo);
    double lumHi = LuminanceFromValue(valueHi);
    return Lerp(xyLo, xyHi, (lum - lumLo) / (lumHi - lumLo));
}

int RenotationInterpolator::MaxChromaAtPlane(double huePosition, int value) const {
    if (IsStandardHue(huePosition)) {
        return table_->MaxChroma(HueStepFromPosition(huePosition), value);
    }
    int cwStep = 0, ccwStep = 0;
    BoundingHueSteps(huePosition, cwStep, ccwStep);
    return std::min(table_->MaxChroma(cwStep, value), table_->MaxChroma(ccwStep, value));
}

double RenotationInterpolator::MaxChroma(double huePosition, double value) const {
    if (value <= MUNSELL_VALUE_MIN || value >= MUNSELL_VALUE_MAX) {
        return 0.0;
    }

    if (value > RENOTATION_VALUE_MAX) {
        double top = MaxChromaAtPlane(huePosition, RENOTATION_VALUE_MAX);
        double lumTop = LuminanceFromValue(RENOTATION_VALUE_MAX);
        double lumWhite = LuminanceFromValue(MUNSELL_VALUE_MAX);
        return top * (lumWhite - LuminanceFromValue(value)) / (lumWhite - lumTop);
    }
    if (value < RENOTATION_VALUE_MIN) {
        double bottom = MaxChromaAtPlane(huePosition, RENOTATION_VALUE_MIN);
        return bottom * LuminanceFromValue(value) / LuminanceFromValue(RENOTATION_VALUE_MIN);
    }

    int valueLo = static_cast<int>(std::floor(value));
    int valueHi = static_cast<int>(std::ceil(value));
    return std::min(MaxChromaAtPlane(huePosition, valueLo), MaxChromaAtPlane(huePosition, valueHi));
}

Point2d RenotationInterpolator::ToXy(const MunsellColor& color) const {
    if (color.IsNeutral()) {
        return NeutralChromaticity();
    }
    double maxChroma = MaxChroma(color.HuePosition(), color.Value());
    if (color.Chroma() > maxChroma + GAMUT_CHROMA_TOLERANCE) {
        char buf[64];
        std::snprintf(buf, sizeof(buf), " exceeds maximum chroma %.4g", maxChroma);
        throw OutOfGamutException(color.ToString(2) + buf);
    }
    return Compute(color.HuePosition(), color.Value(), color.Chroma());
}

Color::CieXyY RenotationInterpolator::ToXyY(const MunsellColor& color) const {
    Point2d xy = ToXy(color);
    return Color::CieXyY(xy.x, xy.y, LuminanceFromValue(color.Value()) / 100.0, Color::Illuminant::C);
}

Point2d RenotationInterpolator::ToXyExtrapolated(const MunsellColor& color) const {
    if (color.IsNeutral()) {
        return NeutralChromaticity();
    }
    return Compute(color.HuePosition(), color.Value(), color.Chroma());
}

Point2d RenotationInterpolator::ToXyExtrapolated(double huePosition, double value, double chroma) const {
    return Compute(huePosition, std::clamp(value, MUNSELL_VALUE_MIN, MUNSELL_VALUE_MAX),
                   std::max(0.0, chroma));
}

} // namespace MunsellSpace::Renotation
