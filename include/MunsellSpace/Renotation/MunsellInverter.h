#pragma once

/**
 * @file MunsellInverter.h
 * @brief CIE xyY (illuminant C) -> Munsell coordinates
 *
 * Value is solved directly from Y with the ASTM D1535 polynomial. Colors
 * within ACHROMATIC_THRESHOLD of the neutral point are returned as neutral
 * grays. For chromatic colors an initial (hue, chroma) estimate is derived
 * from CIE LCh(ab) and refined by an InversionStrategy against the forward
 * renotation model.
 *
 * @code
 * MunsellInverter inverter;
 * auto result = inverter.Invert(CieXyY(0.4, 0.35, 0.2));
 * if (result.converged) {
 *     std::cout << result.color.ToString(2) << "\n";
 * }
 * @endcode
 */

#include <MunsellSpace/Color/ColorTypes.h>
#include <MunsellSpace/Core/Export.h>
#include <MunsellSpace/Core/MunsellColor.h>
#include <MunsellSpace/Renotation/InversionStrategy.h>
#include <MunsellSpace/Renotation/InversionTypes.h>
#include <MunsellSpace/Renotation/RenotationInterpolator.h>

#include <memory>

namespace MunsellSpace::Renotation {

/// Solved values within this distance of an integer are snapped to it
constexpr double VALUE_SNAP_TOLERANCE = 1e-3;

class MUNSELLSPACE_API MunsellInverter {
public:
    /// Bracketing search over the default renotation table
    MunsellInverter();

    explicit MunsellInverter(const RenotationInterpolator& model,
                             InversionMethod method = InversionMethod::Bracketing);

    /// Inverter with a caller-supplied strategy
    MunsellInverter(const RenotationInterpolator& model,
                    std::shared_ptr<const InversionStrategy> strategy);

    const RenotationInterpolator& Model() const { return model_; }
    const InversionStrategy& Strategy() const { return *strategy_; }

    /**
     * @brief Invert an xyY color (Y on 0..1)
     *
     * Never throws on non-convergence; the best estimate is returned with
     * converged = false.
     *
     * @throws InvalidChannelException if a component is not finite, Y < 0,
     *         or y <= 0 for a non-black color
     * @throws InvalidArgumentException if xyY is not relative to illuminant C
     *         or params are out of range
     */
    InversionResult Invert(const Color::CieXyY& xyY,
                           const InversionParams& params = InversionParams()) const;

    /**
     * @brief Invert an XYZ color (Y on 0..1)
     *
     * XYZ tagged with another illuminant is Bradford-adapted to illuminant C
     * first. Use ChromaticAdapter directly for other adaptation methods.
     *
     * @throws InvalidChannelException if a component is not finite
     */
    InversionResult Invert(const Color::CieXyz& xyz,
                           const InversionParams& params = InversionParams()) const;

    /**
     * @brief Invert and require convergence
     * @throws ConvergenceException if the search does not converge
     */
    MunsellColor InvertStrict(const Color::CieXyY& xyY,
                              const InversionParams& params = InversionParams()) const;

    /**
     * @brief Starting point of the search
     *
     * Hue position from the CIE LCh(ab) hue angle (h / 3.6) and chroma from
     * C* / 5.5, both against illuminant C.
     *
     * @param xyY Target (illuminant C)
     * @param value Munsell value already solved from Y
     */
    static InversionStart InitialEstimate(const Color::CieXyY& xyY, double value);

private:
    RenotationInterpolator model_;
    std::shared_ptr<const InversionStrategy> strategy_;
};

} // namespace MunsellSpace::Renotation
