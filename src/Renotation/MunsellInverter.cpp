/**
 * @file MunsellInverter.cpp
 * @brief xyY -> Munsell inversion front end and strategy factory
 */

#include <MunsellSpace/Renotation/MunsellInverter.h>
#include <MunsellSpace/Renotation/MunsellMath.h>
#include <MunsellSpace/Color/ChromaticAdapter.h>
#include <MunsellSpace/Color/ColorSpaceConverter.h>
#include <MunsellSpace/Core/Constants.h>
#include <MunsellSpace/Core/Exception.h>
#include <MunsellSpace/Core/Validate.h>

#include <cctype>
#include <cmath>
#include <cstdio>
#include <string>
#include <utility>

namespace MunsellSpace::Renotation {

// =============================================================================
// InversionMethod / InversionParams
// =============================================================================

std::string ToString(InversionMethod method) {
    switch (method) {
        case InversionMethod::Bracketing: return "Bracketing";
        case InversionMethod::Newton: return "Newton";
    }
    return "unknown";
}

InversionMethod ParseInversionMethod(const std::string& name) {
    std::string lower;
    for (char c : name) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (lower == "bracketing") return InversionMethod::Bracketing;
    if (lower == "newton") return InversionMethod::Newton;

    throw InvalidArgumentException("Unknown inversion method: " + name);
}

void InversionParams::Validate() const {
    MUNSELLSPACE_REQUIRE_POSITIVE(tolerance);
    MUNSELLSPACE_REQUIRE_MIN(maxIterations, 1);
    MUNSELLSPACE_REQUIRE_MIN(maxInnerIterations, 1);
}

std::shared_ptr<const InversionStrategy> CreateInversionStrategy(InversionMethod method) {
    switch (method) {
        case InversionMethod::Bracketing: return std::make_shared<BracketingInversion>();
        case InversionMethod::Newton: return std::make_shared<NewtonInversion>();
    }
    throw InvalidArgumentException("unknown inversion method enumerator");
}

// =============================================================================
// MunsellInverter
// =============================================================================

MunsellInverter::MunsellInverter()
    : model_(), strategy_(CreateInversionStrategy(InversionMethod::Bracketing)) {}

MunsellInverter::MunsellInverter(const RenotationInterpolator& model, InversionMethod method)
    : model_(model), strategy_(CreateInversionStrategy(method)) {}

MunsellInverter::MunsellInverter(const RenotationInterpolator& model,
                                 std::shared_ptr<const InversionStrategy> strategy)
    : model_(model), strategy_(std::move(strategy)) {
    if (!strategy_) {
        throw InvalidArgumentException("MunsellInverter: strategy must not be null");
    }
}

InversionStart MunsellInverter::InitialEstimate(const Color::CieXyY& xyY, double value) {
    // Reference white with the chromaticity of the renotation neutral point
    const Color::WhitePoint white(NEUTRAL_X / NEUTRAL_Y, 1.0,
                                  (1.0 - NEUTRAL_X - NEUTRAL_Y) / NEUTRAL_Y);

    Color::CieXyz xyz = Color::XyYToXyz(xyY);
    Color::CieLch lch = Color::LabToLch(Color::XyzToLab(xyz, white));

    InversionStart start;
    start.target = Point2d(xyY.x, xyY.y);
    start.value = value;
    start.huePosition = PositiveMod(lch.h / 3.6, MUNSELL_HUE_CIRCLE);
    start.chroma = (lch.C / 5.0) * (5.0 / 5.5);
    return start;
}

InversionResult MunsellInverter::Invert(const Color::CieXyY& xyY,
                                        const InversionParams& params) const {
    params.Validate();
    Validate::RequireFiniteChannel(xyY.x, "x", "MunsellInverter::Invert");
    Validate::RequireFiniteChannel(xyY.y, "y", "MunsellInverter::Invert");
    Validate::RequireFiniteChannel(xyY.Y, "Y", "MunsellInverter::Invert");
    if (xyY.Y < 0.0) {
        throw InvalidChannelException("MunsellInverter::Invert: Y must be >= 0, got " +
                                      std::to_string(xyY.Y));
    }
    if (xyY.illuminant != Color::Illuminant::C) {
        throw InvalidArgumentException("MunsellInverter::Invert: xyY must be relative to "
                                       "illuminant C, got " + Color::ToString(xyY.illuminant));
    }

    InversionResult result;

    double value = ValueFromLuminance(xyY.Y * 100.0);
    double rounded = std::round(value);
    if (std::abs(value - rounded) < VALUE_SNAP_TOLERANCE) {
        value = rounded;
    }

    if (value <= 0.0) {
        result.color = MunsellColor::Neutral(0.0);
        result.converged = true;
        return result;
    }
    if (xyY.y <= 0.0) {
        throw InvalidChannelException("MunsellInverter::Invert: y must be > 0 for a non-black "
                                      "color, got " + std::to_string(xyY.y));
    }

    double rho = Point2d(xyY.x, xyY.y).DistanceTo(NeutralChromaticity());
    if (rho < ACHROMATIC_THRESHOLD) {
        result.color = MunsellColor::Neutral(value);
        result.converged = true;
        result.residual = rho;
        return result;
    }

    InversionStart start = InitialEstimate(xyY, value);
    result = strategy_->Solve(start, model_, params);

    if (params.trace) {
        std::fprintf(stderr, "[MunsellInverter] %s: %s after %d iterations (residual=%.3e)\n",
                     strategy_->Name(), result.converged ? "converged" : "not converged",
                     result.iterations, result.residual);
    }
    return result;
}

InversionResult MunsellInverter::Invert(const Color::CieXyz& xyz,
                                        const InversionParams& params) const {
    Validate::RequireFiniteChannel(xyz.X, "X", "MunsellInverter::Invert");
    Validate::RequireFiniteChannel(xyz.Y, "Y", "MunsellInverter::Invert");
    Validate::RequireFiniteChannel(xyz.Z, "Z", "MunsellInverter::Invert");

    Color::CieXyz adapted = Color::ChromaticAdapter().Adapt(xyz, Color::Illuminant::C);
    return Invert(Color::XyzToXyY(adapted), params);
}

MunsellColor MunsellInverter::InvertStrict(const Color::CieXyY& xyY,
                                           const InversionParams& params) const {
    InversionResult result = Invert(xyY, params);
    if (!result.converged) {
        char buf[160];
        std::snprintf(buf, sizeof(buf),
                      "xyY(%.6f, %.6f, %.6f) after %d iterations, residual %.3e, best %s",
                      xyY.x, xyY.y, xyY.Y, result.iterations, result.residual,
                      result.color.ToString(2).c_str());
        throw ConvergenceException(buf);
    }
    return result.color;
}

} // namespace MunsellSpace::Renotation
