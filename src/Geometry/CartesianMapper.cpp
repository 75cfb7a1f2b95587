/**
 * @file CartesianMapper.cpp
 * @brief Munsell <-> Cartesian mapping on the 40-step hue circle
 */

#include <MunsellSpace/Geometry/CartesianMapper.h>
#include <MunsellSpace/Core/Constants.h>
#include <MunsellSpace/Core/Validate.h>

#include <cmath>

namespace MunsellSpace::Geometry {

namespace {

constexpr double RADIANS_PER_STEP = MUNSELL_DEGREES_PER_STEP * DEG_TO_RAD;

} // anonymous namespace

double HueNumber40(const MunsellColor& color) {
    if (color.IsNeutral()) return 0.0;
    return PositiveMod(color.HuePosition() / MUNSELL_HUE_STEP, MUNSELL_HUE_STEP_COUNT);
}

double HueAngle40(const MunsellColor& color) {
    return HueNumber40(color) * RADIANS_PER_STEP;
}

Point3d ToCartesian(const MunsellColor& color) {
    if (color.IsNeutral()) {
        return {0.0, 0.0, color.Value()};
    }
    double theta = HueAngle40(color);
    return {color.Chroma() * std::cos(theta), color.Chroma() * std::sin(theta), color.Value()};
}

MunsellColor FromCartesian(const Point3d& point) {
    MUNSELLSPACE_REQUIRE_FINITE(point.x);
    MUNSELLSPACE_REQUIRE_FINITE(point.y);
    MUNSELLSPACE_REQUIRE_RANGE(point.z, MUNSELL_VALUE_MIN, MUNSELL_VALUE_MAX);

    double chroma = std::hypot(point.x, point.y);
    if (chroma < NEUTRAL_AXIS_TOLERANCE) {
        return MunsellColor::Neutral(point.z);
    }

    double theta = PositiveMod(std::atan2(point.y, point.x), TWO_PI);
    double h40 = theta / RADIANS_PER_STEP;
    return MunsellColor::FromHuePosition(h40 * MUNSELL_HUE_STEP, point.z, chroma);
}

} // namespace MunsellSpace::Geometry
