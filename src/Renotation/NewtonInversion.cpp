/**
 * @file NewtonInversion.cpp
 * @brief Damped Newton search on (hue position, chroma)
 */

#include <MunsellSpace/Renotation/InversionStrategy.h>
#include <MunsellSpace/Core/Constants.h>
#include <MunsellSpace/Internal/Matrix.h>

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace MunsellSpace::Renotation {

namespace {

constexpr double HUE_DIFF_STEP = 1e-3;
constexpr double CHROMA_DIFF_STEP = 1e-3;

constexpr double CHROMA_CEILING = 50.0;

// Largest hue change accepted in a single step (hue position units)
constexpr double MAX_HUE_STEP = 10.0;

constexpr int MAX_STEP_HALVINGS = 8;

} // anonymous namespace

InversionResult NewtonInversion::Solve(const InversionStart& start,
                                       const RenotationInterpolator& model,
                                       const InversionParams& params) const {
    const double value = start.value;
    const Point2d target = start.target;

    auto evaluate = [&](double h, double c) {
        return model.ToXyExtrapolated(h, value, c);
    };

    double hue = PositiveMod(start.huePosition, MUNSELL_HUE_CIRCLE);
    double chroma = std::clamp(start.chroma, 0.0, CHROMA_CEILING);
    Point2d xy = evaluate(hue, chroma);
    double residual = xy.DistanceTo(target);

    bool converged = residual < params.tolerance;
    int iter = 0;

    while (!converged && iter < params.maxIterations) {
        ++iter;

        // Forward-difference Jacobian, stepping chroma backwards at the ceiling
        double dc = (chroma + CHROMA_DIFF_STEP <= CHROMA_CEILING) ? CHROMA_DIFF_STEP : -CHROMA_DIFF_STEP;
        Point2d dHue = (evaluate(hue + HUE_DIFF_STEP, chroma) - xy) * (1.0 / HUE_DIFF_STEP);
        Point2d dChroma = (evaluate(hue, chroma + dc) - xy) * (1.0 / dc);

        double stepHue = 0.0;
        double stepChroma = 0.0;
        if (!Internal::Solve2x2(dHue.x, dChroma.x, dHue.y, dChroma.y,
                                target.x - xy.x, target.y - xy.y, stepHue, stepChroma)) {
            break;
        }
        stepHue = std::clamp(stepHue, -MAX_HUE_STEP, MAX_HUE_STEP);

        // Halve the step until the residual decreases
        double lambda = 1.0;
        bool accepted = false;
        for (int k = 0; k < MAX_STEP_HALVINGS; ++k) {
            double h = PositiveMod(hue + lambda * stepHue, MUNSELL_HUE_CIRCLE);
            double c = std::clamp(chroma + lambda * stepChroma, 0.0, CHROMA_CEILING);
            Point2d candidate = evaluate(h, c);
            double r = candidate.DistanceTo(target);
            if (r < residual) {
                hue = h;
                chroma = c;
                xy = candidate;
                residual = r;
                accepted = true;
                break;
            }
            lambda *= 0.5;
        }
        if (!accepted) break;

        if (params.trace) {
            std::fprintf(stderr, "[MunsellInverter] iter %d: hue=%.6f chroma=%.6f residual=%.3e\n",
                         iter, hue, chroma, residual);
        }
        converged = residual < params.tolerance;
    }

    InversionResult result;
    result.color = MunsellColor::FromHuePosition(hue, value, chroma);
    result.converged = converged;
    result.iterations = iter;
    result.residual = residual;
    return result;
}

} // namespace MunsellSpace::Renotation
