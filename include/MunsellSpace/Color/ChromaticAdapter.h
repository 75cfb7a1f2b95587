#pragma once

/**
 * @file ChromaticAdapter.h
 * @brief von Kries style chromatic adaptation between illuminants
 *
 * Adaptation matrix: M^-1 * diag(rho_dst / rho_src) * M, where M maps XYZ
 * to a cone-like response space and rho are the responses of the whites.
 */

#include <MunsellSpace/Color/ColorTypes.h>
#include <MunsellSpace/Color/Illuminant.h>
#include <MunsellSpace/Core/Export.h>
#include <MunsellSpace/Internal/Matrix.h>

#include <string>

namespace MunsellSpace::Color {

/**
 * @brief Cone response model used for adaptation
 */
enum class AdaptationMethod {
    Bradford,       ///< Lam/Rigg (1985), ICC default
    CAT02,          ///< CIECAM02 transform
    VonKries,       ///< Hunt-Pointer-Estevez cone fundamentals
    XYZScaling      ///< Identity response (scale XYZ directly)
};

/// Canonical name ("Bradford", "CAT02", "VonKries", "XYZScaling")
MUNSELLSPACE_API std::string ToString(AdaptationMethod method);

/**
 * @brief Parse method name (case-insensitive)
 * @throws InvalidArgumentException for unknown names
 */
MUNSELLSPACE_API AdaptationMethod ParseAdaptationMethod(const std::string& name);

/// XYZ -> cone response matrix for a method
MUNSELLSPACE_API const Internal::Mat33& ConeResponseMatrix(AdaptationMethod method);

/**
 * @brief Chromatic adaptation transform
 *
 * Stateless apart from the chosen method; safe to share between threads.
 */
class MUNSELLSPACE_API ChromaticAdapter {
public:
    explicit ChromaticAdapter(AdaptationMethod method = AdaptationMethod::Bradford)
        : method_(method) {}

    AdaptationMethod Method() const { return method_; }

    /**
     * @brief Full 3x3 adaptation matrix from one white to another
     */
    Internal::Mat33 Matrix(Illuminant from, Illuminant to) const;

    /**
     * @brief Adapt XYZ from one white to another
     *
     * The source white is given explicitly; the xyz tag is ignored. The result
     * is tagged with @p to. Identical whites return the values unchanged.
     *
     * @throws InvalidChannelException if a component is non-finite
     */
    CieXyz Adapt(const CieXyz& xyz, Illuminant from, Illuminant to) const;

    /**
     * @brief Adapt XYZ from its tagged illuminant to @p to
     */
    CieXyz Adapt(const CieXyz& xyz, Illuminant to) const {
        return Adapt(xyz, xyz.illuminant, to);
    }

private:
    AdaptationMethod method_;
};

} // namespace MunsellSpace::Color
