#pragma once

/**
 * @file MunsellConverter.h
 * @brief RGB <-> Munsell conversion pipeline
 *
 * Forward: RGB -> XYZ (profile white) -> adapt to the configured illuminant
 * -> xyY -> MunsellInverter.
 *
 * Reverse: Munsell -> xyY (renotation) -> XYZ -> adapt to the source
 * illuminant -> RGB (clipped, with wasClipped reported).
 *
 * The renotation data is read under the configured illuminant: with an
 * illuminant other than C the adapted chromaticities are handed to the
 * renotation model unchanged.
 *
 * @code
 * MunsellConverter converter;
 * auto result = converter.ConvertHex("#BE0032");
 * std::cout << result.color.ToString() << "\n";
 * @endcode
 */

#include <MunsellSpace/Color/ChromaticAdapter.h>
#include <MunsellSpace/Color/ColorTypes.h>
#include <MunsellSpace/Core/Export.h>
#include <MunsellSpace/Core/MunsellColor.h>
#include <MunsellSpace/Pipeline/ConverterConfig.h>
#include <MunsellSpace/Renotation/InversionTypes.h>
#include <MunsellSpace/Renotation/MunsellInverter.h>
#include <MunsellSpace/Renotation/RenotationInterpolator.h>
#include <MunsellSpace/Renotation/RenotationTable.h>

#include <cstdint>
#include <string>
#include <vector>

namespace MunsellSpace::Pipeline {

class MUNSELLSPACE_API MunsellConverter {
public:
    /// Default configuration over the default renotation table
    MunsellConverter();

    /// Custom configuration over the default renotation table
    explicit MunsellConverter(const ConverterConfig& config);

    /**
     * @brief Custom configuration and table
     *
     * The table must outlive the converter.
     *
     * @throws InvalidArgumentException if the configuration is invalid
     */
    MunsellConverter(const ConverterConfig& config, const Renotation::RenotationTable& table);

    const ConverterConfig& Config() const { return config_; }
    const Renotation::RenotationInterpolator& Model() const { return model_; }

    /**
     * @brief Chromaticity handed to the inverter for an RGB color
     *
     * The RGB color's own profile decides the primaries and the default
     * source illuminant.
     *
     * @throws InvalidChannelException for channels outside [0, 1]
     */
    Color::CieXyY ToRenotationXyY(const Color::RgbColor& rgb) const;

    /**
     * @brief RGB -> Munsell
     * @throws InvalidChannelException for channels outside [0, 1]
     */
    Renotation::InversionResult Convert(const Color::RgbColor& rgb) const;

    /// 8-bit RGB in the configured profile -> Munsell
    Renotation::InversionResult Convert(uint8_t r, uint8_t g, uint8_t b) const;

    /**
     * @brief Hex string in the configured profile -> Munsell
     * @throws ParseException for malformed hex
     */
    Renotation::InversionResult ConvertHex(const std::string& hex) const;

    /**
     * @brief Convert many colors
     *
     * Inversions run in parallel when OpenMP is available; results are in
     * input order and identical to calling Convert on each color.
     *
     * @throws InvalidChannelException for channels outside [0, 1]
     */
    std::vector<Renotation::InversionResult> ConvertBatch(const std::vector<Color::RgbColor>& colors) const;

    /**
     * @brief As Convert, but requires convergence
     * @throws ConvergenceException if the inversion does not converge
     */
    MunsellColor ToMunsell(const Color::RgbColor& rgb) const;

    /**
     * @brief Munsell -> XYZ under the source illuminant of the configured profile
     * @throws OutOfGamutException if the chroma exceeds the renotation data
     */
    Color::CieXyz ToXyz(const MunsellColor& color) const;

    /**
     * @brief Munsell -> RGB in the configured profile
     * @throws OutOfGamutException if the chroma exceeds the renotation data
     */
    Color::RgbConversion ToRgb(const MunsellColor& color) const;

private:
    ConverterConfig config_;
    Renotation::RenotationInterpolator model_;
    Renotation::MunsellInverter inverter_;
    Color::ChromaticAdapter adapter_;
};

} // namespace MunsellSpace::Pipeline
