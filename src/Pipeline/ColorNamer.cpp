/**
 * @file ColorNamer.cpp
 * @brief Naming facade
 */

#include <MunsellSpace/Pipeline/ColorNamer.h>

namespace MunsellSpace::Pipeline {

ColorNamer::ColorNamer()
    : converter_(),
      classifier_(&Classify::IsccNbsClassifier::Default()),
      overlays_(&Geometry::PolyhedronIndex::Default()) {}

ColorNamer::ColorNamer(const MunsellConverter& converter,
                       const Classify::IsccNbsClassifier& classifier,
                       const Geometry::PolyhedronIndex& overlays)
    : converter_(converter), classifier_(&classifier), overlays_(&overlays) {}

ColorName ColorNamer::Name(const MunsellColor& color) const {
    ColorName name;
    name.munsell = color;
    name.iscc = classifier_->Classify(color, converter_.Config().boundaryPolicy);
    name.overlays = overlays_->MatchingOverlays(color);
    return name;
}

ColorName ColorNamer::NameResult(const Renotation::InversionResult& result) const {
    ColorName name = Name(result.color);
    name.converged = result.converged;
    return name;
}

ColorName ColorNamer::Name(const Color::RgbColor& rgb) const {
    return NameResult(converter_.Convert(rgb));
}

ColorName ColorNamer::NameHex(const std::string& hex) const {
    return NameResult(converter_.ConvertHex(hex));
}

} // namespace MunsellSpace::Pipeline
