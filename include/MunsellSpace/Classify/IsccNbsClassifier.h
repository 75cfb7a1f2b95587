#pragma once

/**
 * @file IsccNbsClassifier.h
 * @brief ISCC-NBS color designation from Munsell coordinates
 *
 * Chromatic colors:
 * 1. Candidate regions are those whose cyclic hue range covers the hue
 *    position (inclusive end chosen by BoundaryPolicy).
 * 2. The first candidate, in table order, whose (chroma, value) polygon
 *    contains the point wins. Boundary points follow a half-open rule on
 *    each axis: (min, max], or [0, max] when min is 0.
 * 3. Without a containing polygon, the candidate nearest to the point (by
 *    polygon edge distance) is returned with exact = false.
 *
 * Neutral colors are classified by value bands: black (0, 2.5],
 * dark gray (2.5, 4.5], medium gray (4.5, 6.5], light gray (6.5, 8.5],
 * white (8.5, 10]. Value 0 is black.
 *
 * @code
 * const auto& classifier = IsccNbsClassifier::Default();
 * auto match = classifier.Classify(ParseMunsell("5R 4/14"));
 * std::cout << match.descriptor << "\n";   // "vivid red"
 * @endcode
 */

#include <MunsellSpace/Classify/IsccNbsTypes.h>
#include <MunsellSpace/Core/Export.h>
#include <MunsellSpace/Core/MunsellColor.h>

#include <map>
#include <string>
#include <vector>

namespace MunsellSpace::Classify {

/// Coordinates are rounded to this many decimals before classification
constexpr int ISCC_NBS_COORDINATE_DECIMALS = 4;

/**
 * @brief Parse a region hue such as "9RP", "10BG" or "4R" to a hue position
 *
 * The misspelled family "PR" is read as "RP". A hue number of 10 is 0 of the
 * next family.
 *
 * @throws ParseException for malformed text or an unknown family
 */
MUNSELLSPACE_API double ParseRegionHue(const std::string& text);

/**
 * @brief Cyclic hue range membership
 *
 * With span = (end - start) mod 100 and offset = (hue - start) mod 100,
 * Method1 accepts 0 <= offset < span and Method2 accepts 0 < offset <= span.
 * A range with start == end covers the whole circle.
 */
MUNSELLSPACE_API bool HueInRange(double huePosition, double start, double end, BoundaryPolicy policy);

class MUNSELLSPACE_API IsccNbsClassifier {
public:
    IsccNbsClassifier() = default;

    /**
     * @brief Build from in-memory tables
     * @throws InvalidArgumentException if a region has fewer than 3 points, a
     *         color number is out of range, or a region refers to a color
     *         without metadata
     */
    IsccNbsClassifier(std::vector<IsccNbsRegion> regions, std::vector<IsccNbsColorInfo> colors);

    /**
     * @brief Parse the two CSV tables (header rows optional)
     * @throws ParseException on malformed rows
     */
    static IsccNbsClassifier Parse(const std::vector<std::string>& definitionLines,
                                   const std::vector<std::string>& colorLines);

    /**
     * @throws IOException if a file cannot be read
     * @throws ParseException on malformed rows
     */
    static IsccNbsClassifier LoadFromFiles(const std::string& definitionsPath,
                                           const std::string& colorsPath);

    static std::string DefaultDefinitionsPath();
    static std::string DefaultColorsPath();

    /**
     * @brief Process-wide classifier over the installed tables
     * @throws IOException if the tables are missing
     */
    static const IsccNbsClassifier& Default();

    /**
     * @brief Classify a color
     * @throws InsufficientDataException if no region or metadata can serve
     *         the color
     */
    IsccNbsMatch Classify(const MunsellColor& color,
                          BoundaryPolicy policy = BoundaryPolicy::Method2) const;

    /**
     * @brief Every color number whose region contains the color, sorted, unique
     *
     * Empty when the color falls in a gap.
     */
    std::vector<int> FindAll(const MunsellColor& color,
                             BoundaryPolicy policy = BoundaryPolicy::Method2) const;

    /// Metadata for a color number, nullptr if absent
    const IsccNbsColorInfo* Info(int colorNumber) const;

    const std::vector<IsccNbsRegion>& Regions() const { return regions_; }
    size_t ColorCount() const { return colors_.size(); }
    bool Empty() const { return regions_.empty(); }

    /// Neutral color number for a value in [0, 10]
    static int NeutralColorNumber(double value);

private:
    IsccNbsMatch MakeMatch(int colorNumber, bool exact, double distance) const;

    std::vector<IsccNbsRegion> regions_;
    std::map<int, IsccNbsColorInfo> colors_;
};

} // namespace MunsellSpace::Classify
