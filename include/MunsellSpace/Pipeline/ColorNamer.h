#pragma once

/**
 * @file ColorNamer.h
 * @brief ISCC-NBS designation plus non-basic overlay names for a color
 */

#include <MunsellSpace/Classify/IsccNbsClassifier.h>
#include <MunsellSpace/Color/ColorTypes.h>
#include <MunsellSpace/Core/Export.h>
#include <MunsellSpace/Core/MunsellColor.h>
#include <MunsellSpace/Geometry/PolyhedronIndex.h>
#include <MunsellSpace/Pipeline/MunsellConverter.h>

#include <string>
#include <vector>

namespace MunsellSpace::Pipeline {

/**
 * @brief Names of one color
 */
struct ColorName {
    MunsellColor munsell;                   ///< Munsell coordinates that were named
    bool converged = true;                  ///< Inversion converged (always true for Munsell input)
    Classify::IsccNbsMatch iscc;            ///< ISCC-NBS designation
    std::vector<std::string> overlays;      ///< Containing overlay polyhedra, sorted
};

/**
 * @brief Naming facade
 *
 * Holds non-owning references to the classifier and the overlay index; both
 * must outlive the namer.
 */
class MUNSELLSPACE_API ColorNamer {
public:
    /**
     * @brief Namer over the installed tables
     * @throws IOException if an asset is missing
     */
    ColorNamer();

    ColorNamer(const MunsellConverter& converter, const Classify::IsccNbsClassifier& classifier,
               const Geometry::PolyhedronIndex& overlays);

    const MunsellConverter& Converter() const { return converter_; }

    /// Name Munsell coordinates
    ColorName Name(const MunsellColor& color) const;

    /// Convert and name an RGB color
    ColorName Name(const Color::RgbColor& rgb) const;

    /**
     * @brief Convert and name a hex color in the configured profile
     * @throws ParseException for malformed hex
     */
    ColorName NameHex(const std::string& hex) const;

private:
    ColorName NameResult(const Renotation::InversionResult& result) const;

    MunsellConverter converter_;
    const Classify::IsccNbsClassifier* classifier_;
    const Geometry::PolyhedronIndex* overlays_;
};

} // namespace MunsellSpace::Pipeline
