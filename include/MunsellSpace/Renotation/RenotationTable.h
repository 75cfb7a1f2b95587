#pragma once

/**
 * @file RenotationTable.h
 * @brief Munsell renotation grid (hue step x value x even chroma -> xyY)
 *
 * Data file format (RIT "real.dat"):
 * @code
 *   h     V  C  x      y      Y
 *   10RP  1  2  0.3629 0.2710 1.210
 *   2.5R  1  2  ...
 * @endcode
 * One header line, then whitespace-separated rows. Y is in percent. Only
 * integer value planes 1..9 and even integer chromas are kept; other rows
 * are skipped. Chromaticities are relative to illuminant C.
 */

#include <MunsellSpace/Core/Export.h>

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace MunsellSpace::Renotation {

/**
 * @brief One renotation sample
 */
struct RenotationEntry {
    int hueStep = 0;    ///< 0..39 in 2.5 hue units; 0 = 10RP = 0R
    int value = 1;      ///< 1..9
    int chroma = 2;     ///< Even, >= 2
    double x = 0.0;     ///< CIE x (illuminant C)
    double y = 0.0;     ///< CIE y (illuminant C)
    double Y = 0.0;     ///< Luminance, 0..1

    RenotationEntry() = default;
    RenotationEntry(int hueStep_, int value_, int chroma_, double x_, double y_, double Y_)
        : hueStep(hueStep_), value(value_), chroma(chroma_), x(x_), y(y_), Y(Y_) {}
};

/**
 * @brief Immutable renotation grid with O(1) lookup
 */
class MUNSELLSPACE_API RenotationTable {
public:
    /// Empty table
    RenotationTable() = default;

    /**
     * @brief Build from entries
     * @throws InvalidArgumentException for out-of-range keys or duplicates
     */
    explicit RenotationTable(std::vector<RenotationEntry> entries);

    /**
     * @brief Parse "real.dat" text lines
     * @throws ParseException for malformed rows
     */
    static RenotationTable Parse(const std::vector<std::string>& lines);

    /**
     * @brief Load a "real.dat" file
     * @throws IOException if the file cannot be read
     * @throws ParseException for malformed rows
     */
    static RenotationTable LoadFromFile(const std::string& path);

    /**
     * @brief Process-wide table loaded from the configured renotation asset
     * @throws IOException if the asset is not installed
     */
    static const RenotationTable& Default();

    /// Configured path of the default asset
    static std::string DefaultPath();

    /**
     * @brief Find a grid entry
     * @return Pointer into the table, or nullptr if absent
     */
    const RenotationEntry* Find(int hueStep, int value, int chroma) const;

    /**
     * @brief Highest tabulated chroma for a hue step and value plane
     * @return 0 if the cell has no data
     */
    int MaxChroma(int hueStep, int value) const;

    const std::vector<RenotationEntry>& Entries() const { return entries_; }
    size_t Size() const { return entries_.size(); }
    bool Empty() const { return entries_.empty(); }

private:
    static int64_t Key(int hueStep, int value, int chroma);

    std::vector<RenotationEntry> entries_;
    std::unordered_map<int64_t, size_t> index_;
    std::vector<int> maxChroma_;    ///< [hueStep * 10 + value]
};

} // namespace MunsellSpace::Renotation
