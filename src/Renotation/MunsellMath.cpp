/**
 * @file MunsellMath.cpp
 * @brief Hue angle, luminance and value functions of the Munsell system
 */

#include <MunsellSpace/Renotation/MunsellMath.h>
#include <MunsellSpace/Core/Constants.h>

#include <algorithm>
#include <cmath>

namespace MunsellSpace::Renotation {

namespace {

constexpr int HUE_BREAKPOINT_COUNT = 9;
constexpr double HUE_BREAKPOINTS[HUE_BREAKPOINT_COUNT] = {0, 2, 3, 4, 5, 6, 8, 9, 10};
constexpr double HUE_ANGLE_BREAKPOINTS[HUE_BREAKPOINT_COUNT] = {0, 45, 70, 135, 160, 225, 255, 315, 360};

constexpr double STANDARD_HUE_TOLERANCE = 1e-9;

constexpr int VALUE_MAX_ITERATIONS = 100;
constexpr double VALUE_TOLERANCE = 1e-10;

// Piecewise linear interpolation with clamping at the ends
double Interpolate(double x, const double* xs, const double* ys, int n) {
    if (x <= xs[0]) return ys[0];
    if (x >= xs[n - 1]) return ys[n - 1];
    for (int i = 1; i < n; ++i) {
        if (x <= xs[i]) {
            double t = (x - xs[i - 1]) / (xs[i] - xs[i - 1]);
            return ys[i - 1] + t * (ys[i] - ys[i - 1]);
        }
    }
    return ys[n - 1];
}

double LuminanceDerivative(double v) {
    return 1.1914 - 2.0 * 0.22533 * v + 3.0 * 0.23352 * v * v -
           4.0 * 0.020484 * v * v * v + 5.0 * 0.00081939 * v * v * v * v;
}

} // anonymous namespace

// =============================================================================
// Hue Helpers
// =============================================================================

double HueAngle(double huePosition) {
    // Family units measured from 5R
    double singleHue = PositiveMod(huePosition / 10.0 - 0.5, 10.0);
    return PositiveMod(Interpolate(singleHue, HUE_BREAKPOINTS, HUE_ANGLE_BREAKPOINTS,
                                   HUE_BREAKPOINT_COUNT), 360.0);
}

double HuePositionFromAngle(double hueAngle) {
    double angle = PositiveMod(hueAngle, 360.0);
    double singleHue = Interpolate(angle, HUE_ANGLE_BREAKPOINTS, HUE_BREAKPOINTS,
                                   HUE_BREAKPOINT_COUNT);
    return PositiveMod((singleHue + 0.5) * 10.0, MUNSELL_HUE_CIRCLE);
}

int HueStepFromPosition(double huePosition) {
    double p = PositiveMod(huePosition, MUNSELL_HUE_CIRCLE);
    int step = static_cast<int>(std::lround(p / MUNSELL_HUE_STEP));
    return step % MUNSELL_HUE_STEP_COUNT;
}

double PositionFromHueStep(int hueStep) {
    int step = hueStep % MUNSELL_HUE_STEP_COUNT;
    if (step < 0) step += MUNSELL_HUE_STEP_COUNT;
    return step * MUNSELL_HUE_STEP;
}

bool IsStandardHue(double huePosition) {
    double p = PositiveMod(huePosition, MUNSELL_HUE_CIRCLE);
    double r = p - MUNSELL_HUE_STEP * std::round(p / MUNSELL_HUE_STEP);
    return std::abs(r) <= STANDARD_HUE_TOLERANCE;
}

void BoundingHuePositions(double huePosition, double& cwPosition, double& ccwPosition) {
    double p = PositiveMod(huePosition, MUNSELL_HUE_CIRCLE);
    if (IsStandardHue(p)) {
        cwPosition = ccwPosition = PositionFromHueStep(HueStepFromPosition(p));
        return;
    }
    cwPosition = MUNSELL_HUE_STEP * std::floor(p / MUNSELL_HUE_STEP);
    ccwPosition = PositiveMod(cwPosition + MUNSELL_HUE_STEP, MUNSELL_HUE_CIRCLE);
}

void BoundingHueSteps(double huePosition, int& cwStep, int& ccwStep) {
    double cw = 0.0, ccw = 0.0;
    BoundingHuePositions(huePosition, cw, ccw);
    cwStep = HueStepFromPosition(cw);
    ccwStep = HueStepFromPosition(ccw);
}

double AstmHue(double huePosition) {
    double p = PositiveMod(huePosition, MUNSELL_HUE_CIRCLE);
    return (p == 0.0) ? MUNSELL_HUE_CIRCLE : p;
}

// =============================================================================
// Value Scale
// =============================================================================

double LuminanceFromValue(double value) {
    double v = value;
    return v * (1.1914 + v * (-0.22533 + v * (0.23352 + v * (-0.020484 + v * 0.00081939))));
}

double ValueFromLuminance(double luminance) {
    if (luminance <= 0.0) return MUNSELL_VALUE_MIN;

    double v = std::clamp(10.0 * std::sqrt(luminance / 100.0), MUNSELL_VALUE_MIN, MUNSELL_VALUE_MAX);
    for (int iter = 0; iter < VALUE_MAX_ITERATIONS; ++iter) {
        double f = LuminanceFromValue(v) - luminance;
        double df = LuminanceDerivative(v);
        if (std::abs(df) < EPSILON) break;
        double step = f / df;
        v = std::clamp(v - step, MUNSELL_VALUE_MIN, MUNSELL_VALUE_MAX);
        if (std::abs(step) < VALUE_TOLERANCE) break;
    }
    return v;
}

} // namespace MunsellSpace::Renotation
