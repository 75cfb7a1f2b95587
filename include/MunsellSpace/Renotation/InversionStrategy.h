#pragma once

/**
 * @file InversionStrategy.h
 * @brief Pluggable search strategies for xyY -> Munsell inversion
 *
 * A strategy receives the target chromaticity, the (already solved) Munsell
 * value and an initial (hue, chroma) estimate, and searches hue and chroma
 * against the forward renotation model. Strategies are stateless; all
 * per-call state lives on the stack.
 */

#include <MunsellSpace/Core/Export.h>
#include <MunsellSpace/Renotation/InversionTypes.h>
#include <MunsellSpace/Renotation/RenotationInterpolator.h>

#include <memory>

namespace MunsellSpace::Renotation {

/**
 * @brief Strategy interface
 */
class MUNSELLSPACE_API InversionStrategy {
public:
    virtual ~InversionStrategy() = default;

    /**
     * @brief Search hue and chroma
     *
     * Must be deterministic and bounded by params. When the budget runs out
     * or a bracket cannot be formed, returns the best estimate seen with
     * converged = false.
     */
    virtual InversionResult Solve(const InversionStart& start,
                                  const RenotationInterpolator& model,
                                  const InversionParams& params) const = 0;

    /// Strategy name for diagnostics
    virtual const char* Name() const = 0;
};

/**
 * @brief Alternating hue / chroma bracketing search
 *
 * Each outer iteration:
 * 1. Hue: step the hue angle by multiples of the angular error until the
 *    sign of the phi difference changes (or two samples exist), then
 *    interpolate / extrapolate the hue angle at zero difference.
 * 2. Chroma: scale chroma by (rho_target / rho_current)^i until rho_target
 *    is bracketed, then interpolate chroma at rho_target.
 */
class MUNSELLSPACE_API BracketingInversion : public InversionStrategy {
public:
    InversionResult Solve(const InversionStart& start, const RenotationInterpolator& model,
                          const InversionParams& params) const override;

    const char* Name() const override { return "Bracketing"; }
};

/**
 * @brief Damped Newton iteration on (hue position, chroma)
 *
 * Jacobian by forward differences of the extrapolating forward model.
 * Each step is halved until the residual decreases.
 */
class MUNSELLSPACE_API NewtonInversion : public InversionStrategy {
public:
    InversionResult Solve(const InversionStart& start, const RenotationInterpolator& model,
                          const InversionParams& params) const override;

    const char* Name() const override { return "Newton"; }
};

/**
 * @brief Create the strategy for a method
 */
MUNSELLSPACE_API std::shared_ptr<const InversionStrategy> CreateInversionStrategy(InversionMethod method);

} // namespace MunsellSpace::Renotation
