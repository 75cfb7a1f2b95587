#pragma once

/**
 * @file ConverterConfig.h
 * @brief Configuration of the RGB <-> Munsell pipeline
 */

#include <MunsellSpace/Classify/IsccNbsTypes.h>
#include <MunsellSpace/Color/ChromaticAdapter.h>
#include <MunsellSpace/Color/Illuminant.h>
#include <MunsellSpace/Color/RgbProfile.h>
#include <MunsellSpace/Core/Export.h>
#include <MunsellSpace/Renotation/InversionTypes.h>

#include <optional>

namespace MunsellSpace::Pipeline {

/**
 * @brief Pipeline settings
 *
 * @code
 * auto config = ConverterConfig()
 *     .SetProfile(Color::RgbProfile::DisplayP3)
 *     .SetAdaptationMethod(Color::AdaptationMethod::CAT02)
 *     .SetBoundaryPolicy(Classify::BoundaryPolicy::Method1);
 * @endcode
 */
struct MUNSELLSPACE_API ConverterConfig {
    Color::RgbProfile profile = Color::RgbProfile::SRgb;        ///< Device profile of 8-bit / hex input
    std::optional<Color::Illuminant> sourceIlluminant;          ///< Defaults to the profile white
    Color::Illuminant illuminant = Color::Illuminant::C;        ///< Illuminant the Munsell data is read under
    Color::AdaptationMethod adaptationMethod = Color::AdaptationMethod::Bradford;
    Classify::BoundaryPolicy boundaryPolicy = Classify::BoundaryPolicy::Method2;
    double convergenceTolerance = Renotation::DEFAULT_INVERSION_TOLERANCE;
    int maxIterations = Renotation::DEFAULT_INVERSION_MAX_ITERATIONS;
    Renotation::InversionMethod strategy = Renotation::InversionMethod::Bracketing;

    ConverterConfig& SetProfile(Color::RgbProfile p) { profile = p; return *this; }
    ConverterConfig& SetSourceIlluminant(Color::Illuminant ill) { sourceIlluminant = ill; return *this; }
    ConverterConfig& SetIlluminant(Color::Illuminant ill) { illuminant = ill; return *this; }
    ConverterConfig& SetAdaptationMethod(Color::AdaptationMethod m) { adaptationMethod = m; return *this; }
    ConverterConfig& SetBoundaryPolicy(Classify::BoundaryPolicy p) { boundaryPolicy = p; return *this; }
    ConverterConfig& SetConvergenceTolerance(double t) { convergenceTolerance = t; return *this; }
    ConverterConfig& SetMaxIterations(int n) { maxIterations = n; return *this; }
    ConverterConfig& SetStrategy(Renotation::InversionMethod m) { strategy = m; return *this; }

    /// Source illuminant for a profile: the override, or the profile white
    Color::Illuminant SourceIlluminantFor(Color::RgbProfile p) const {
        return sourceIlluminant.value_or(Color::ProfileWhite(p));
    }

    /// Inversion parameters derived from the tolerance and iteration budget
    Renotation::InversionParams InversionParams() const {
        return Renotation::InversionParams()
            .SetTolerance(convergenceTolerance)
            .SetMaxIterations(maxIterations);
    }

    /**
     * @throws InvalidArgumentException if the tolerance is not positive or
     *         maxIterations < 1
     */
    void Validate() const;
};

} // namespace MunsellSpace::Pipeline
