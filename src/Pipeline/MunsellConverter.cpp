/**
 * @file MunsellConverter.cpp
 * @brief RGB <-> Munsell pipeline
 */

#include <MunsellSpace/Pipeline/MunsellConverter.h>
#include <MunsellSpace/Color/ColorSpaceConverter.h>
#include <MunsellSpace/Color/RgbProfile.h>
#include <MunsellSpace/Core/Validate.h>

#include <exception>

namespace MunsellSpace::Pipeline {

void ConverterConfig::Validate() const {
    MUNSELLSPACE_REQUIRE_POSITIVE(convergenceTolerance);
    MUNSELLSPACE_REQUIRE_MIN(maxIterations, 1);
}

MunsellConverter::MunsellConverter()
    : MunsellConverter(ConverterConfig(), Renotation::RenotationTable::Default()) {}

MunsellConverter::MunsellConverter(const ConverterConfig& config)
    : MunsellConverter(config, Renotation::RenotationTable::Default()) {}

MunsellConverter::MunsellConverter(const ConverterConfig& config,
                                   const Renotation::RenotationTable& table)
    : config_(config),
      model_(table),
      inverter_(model_, config.strategy),
      adapter_(config.adaptationMethod) {
    config_.Validate();
}

Color::CieXyY MunsellConverter::ToRenotationXyY(const Color::RgbColor& rgb) const {
    Color::CieXyz xyz = Color::ToXyz(rgb);
    Color::Illuminant source = config_.SourceIlluminantFor(rgb.profile);
    Color::CieXyz adapted = adapter_.Adapt(xyz, source, config_.illuminant);

    Color::CieXyY xyY = Color::XyzToXyY(adapted);
    xyY.illuminant = Color::Illuminant::C;
    return xyY;
}

Renotation::InversionResult MunsellConverter::Convert(const Color::RgbColor& rgb) const {
    return inverter_.Invert(ToRenotationXyY(rgb), config_.InversionParams());
}

Renotation::InversionResult MunsellConverter::Convert(uint8_t r, uint8_t g, uint8_t b) const {
    return Convert(Color::RgbColor::FromU8(r, g, b, config_.profile));
}

Renotation::InversionResult MunsellConverter::ConvertHex(const std::string& hex) const {
    return Convert(Color::ParseHex(hex, config_.profile));
}

std::vector<Renotation::InversionResult> MunsellConverter::ConvertBatch(
    const std::vector<Color::RgbColor>& colors) const {
    // Channel validation happens here, before the parallel section
    std::vector<Color::CieXyY> targets;
    targets.reserve(colors.size());
    for (const auto& rgb : colors) {
        targets.push_back(ToRenotationXyY(rgb));
    }

    const Renotation::InversionParams params = config_.InversionParams();
    const int64_t count = static_cast<int64_t>(targets.size());
    std::vector<Renotation::InversionResult> results(targets.size());
    std::vector<std::exception_ptr> errors(targets.size());

    #pragma omp parallel for schedule(dynamic)
    for (int64_t i = 0; i < count; ++i) {
        try {
            results[i] = inverter_.Invert(targets[i], params);
        } catch (...) {
            errors[i] = std::current_exception();
        }
    }

    for (const auto& error : errors) {
        if (error) std::rethrow_exception(error);
    }
    return results;
}

MunsellColor MunsellConverter::ToMunsell(const Color::RgbColor& rgb) const {
    return inverter_.InvertStrict(ToRenotationXyY(rgb), config_.InversionParams());
}

Color::CieXyz MunsellConverter::ToXyz(const MunsellColor& color) const {
    Color::CieXyY xyY = model_.ToXyY(color);
    xyY.illuminant = config_.illuminant;
    Color::CieXyz xyz = Color::XyYToXyz(xyY);
    return adapter_.Adapt(xyz, config_.illuminant, config_.SourceIlluminantFor(config_.profile));
}

Color::RgbConversion MunsellConverter::ToRgb(const MunsellColor& color) const {
    Color::CieXyz xyz = ToXyz(color);
    // The source illuminant is the viewing white of the profile
    xyz.illuminant = Color::ProfileWhite(config_.profile);
    return Color::FromXyz(xyz, config_.profile, config_.adaptationMethod);
}

} // namespace MunsellSpace::Pipeline
