/**
 * @file BracketingInversion.cpp
 * @brief Alternating hue / chroma bracketing search
 */

#include <MunsellSpace/Renotation/InversionStrategy.h>
#include <MunsellSpace/Renotation/MunsellMath.h>
#include <MunsellSpace/Core/Constants.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>
#include <utility>
#include <vector>

namespace MunsellSpace::Renotation {

namespace {

// Search bounds on chroma; the forward model extrapolates up to the ceiling
constexpr double MIN_SEARCH_CHROMA = 1e-6;
constexpr double CHROMA_CEILING = 50.0;

constexpr double RHO_EQUAL_TOLERANCE = 1e-14;

struct Polar {
    double rho;
    double phi;     ///< Degrees (-180, 180]
};

Polar ToPolar(const Point2d& xy) {
    Point2d d = xy - NeutralChromaticity();
    return {d.Norm(), std::atan2(d.y, d.x) * RAD_TO_DEG};
}

// Signed angular difference phi - phiTarget wrapped to (-180, 180]
double PhiDifference(double phiTarget, double phi) {
    double d = PositiveMod(360.0 - phiTarget + phi, 360.0);
    return (d > 180.0) ? d - 360.0 : d;
}

int Sign(double v) {
    return (v > 0.0) - (v < 0.0);
}

double ClampChroma(double chroma) {
    return std::clamp(chroma, MIN_SEARCH_CHROMA, CHROMA_CEILING);
}

// Piecewise linear through (x, y) samples, extrapolating past the ends
double InterpolateAt(std::vector<std::pair<double, double>> samples, double x) {
    std::sort(samples.begin(), samples.end());
    size_t n = samples.size();
    if (n == 1) return samples[0].second;

    size_t i = 0;
    if (x >= samples[n - 1].first) {
        i = n - 2;
    } else {
        while (i + 2 < n && x > samples[i + 1].first) ++i;
    }
    const auto& a = samples[i];
    const auto& b = samples[i + 1];
    if (b.first == a.first) return a.second;
    return a.second + (x - a.first) * (b.second - a.second) / (b.first - a.first);
}

struct BestEstimate {
    double huePosition = 0.0;
    double chroma = 0.0;
    double residual = std::numeric_limits<double>::infinity();

    void Offer(double h, double c, double r) {
        if (r < residual) {
            huePosition = h;
            chroma = c;
            residual = r;
        }
    }
};

} // anonymous namespace

InversionResult BracketingInversion::Solve(const InversionStart& start,
                                           const RenotationInterpolator& model,
                                           const InversionParams& params) const {
    const double value = start.value;
    const Polar input = ToPolar(start.target);

    auto evaluate = [&](double h, double c) {
        return model.ToXyExtrapolated(h, value, c);
    };

    double hue = PositiveMod(start.huePosition, MUNSELL_HUE_CIRCLE);
    double chroma = ClampChroma(start.chroma);

    BestEstimate best;
    best.Offer(hue, chroma, evaluate(hue, chroma).DistanceTo(start.target));

    InversionResult result;
    bool converged = false;
    int iter = 0;

    while (iter < params.maxIterations && !converged) {
        ++iter;

        // ---- Hue: bracket the angular error and solve for zero ----
        double hueAngleCurrent = HueAngle(hue);
        Polar current = ToPolar(evaluate(hue, chroma));

        std::vector<std::pair<double, double>> phiSamples;  // (phi difference, hue angle delta)
        phiSamples.emplace_back(PhiDifference(input.phi, current.phi), 0.0);
        double phiMin = phiSamples[0].first;
        double phiMax = phiSamples[0].first;

        bool bracketFailed = false;
        bool extrapolate = false;
        int inner = 0;
        while (Sign(phiMin) == Sign(phiMax) && !extrapolate) {
            if (++inner > params.maxInnerIterations) {
                bracketFailed = true;
                break;
            }
            double delta = inner * (input.phi - current.phi);
            double angleInner = PositiveMod(hueAngleCurrent + delta, 360.0);
            double angleDelta = PositiveMod(delta, 360.0);
            if (angleDelta > 180.0) angleDelta -= 360.0;

            if (phiSamples.size() >= 2) {
                extrapolate = true;
                break;
            }
            Polar sample = ToPolar(evaluate(HuePositionFromAngle(angleInner), chroma));
            double diff = PhiDifference(input.phi, sample.phi);
            phiSamples.emplace_back(diff, angleDelta);
            phiMin = std::min(phiMin, diff);
            phiMax = std::max(phiMax, diff);
        }
        if (bracketFailed) break;

        double angleDeltaNew = PositiveMod(InterpolateAt(phiSamples, 0.0), 360.0);
        hue = HuePositionFromAngle(PositiveMod(hueAngleCurrent + angleDeltaNew, 360.0));

        double residual = evaluate(hue, chroma).DistanceTo(start.target);
        best.Offer(hue, chroma, residual);
        if (params.trace) {
            std::fprintf(stderr, "[MunsellInverter] iter %d: hue=%.6f chroma=%.6f residual=%.3e\n",
                         iter, hue, chroma, residual);
        }
        if (residual < params.tolerance) {
            converged = true;
            break;
        }

        // ---- Chroma: bracket the target radius and interpolate ----
        current = ToPolar(evaluate(hue, chroma));
        if (std::abs(current.rho - input.rho) > RHO_EQUAL_TOLERANCE) {
            std::vector<std::pair<double, double>> rhoSamples;   // (rho, chroma)
            rhoSamples.emplace_back(current.rho, chroma);
            double rhoMin = current.rho;
            double rhoMax = current.rho;

            inner = 0;
            while (!(rhoMin < input.rho && input.rho < rhoMax)) {
                if (++inner > params.maxInnerIterations) {
                    bracketFailed = true;
                    break;
                }
                double chromaInner = ClampChroma(std::pow(input.rho / current.rho, inner) * chroma);
                Polar sample = ToPolar(evaluate(hue, chromaInner));
                rhoSamples.emplace_back(sample.rho, chromaInner);
                rhoMin = std::min(rhoMin, sample.rho);
                rhoMax = std::max(rhoMax, sample.rho);
            }
            if (bracketFailed) break;

            chroma = ClampChroma(InterpolateAt(rhoSamples, input.rho));
        }

        residual = evaluate(hue, chroma).DistanceTo(start.target);
        best.Offer(hue, chroma, residual);
        if (params.trace) {
            std::fprintf(stderr, "[MunsellInverter] iter %d: hue=%.6f chroma=%.6f residual=%.3e\n",
                         iter, hue, chroma, residual);
        }
        if (residual < params.tolerance) {
            converged = true;
        }
    }

    result.color = MunsellColor::FromHuePosition(best.huePosition, value, best.chroma);
    result.converged = converged;
    result.iterations = iter;
    result.residual = best.residual;
    return result;
}

} // namespace MunsellSpace::Renotation
