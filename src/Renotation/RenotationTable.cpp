/**
 * @file RenotationTable.cpp
 * @brief Renotation table loading, parsing and lookup
 */

#include <MunsellSpace/Renotation/RenotationTable.h>
#include <MunsellSpace/Renotation/MunsellMath.h>
#include <MunsellSpace/Core/Constants.h>
#include <MunsellSpace/Core/Exception.h>
#include <MunsellSpace/Core/MunsellColor.h>
#include <MunsellSpace/Platform/FileIO.h>
#include <MunsellSpace/MunsellSpaceConfig.h>

#include <algorithm>
#include <cctype>
#include <cmath>

namespace MunsellSpace::Renotation {

namespace {

constexpr int VALUE_SLOTS = RENOTATION_VALUE_MAX + 1;

// "2.5R" / "10RP" -> hue position; throws ParseException
double ParseRenotationHue(const std::string& token, size_t lineNo) {
    size_t split = 0;
    while (split < token.size() &&
           (std::isdigit(static_cast<unsigned char>(token[split])) || token[split] == '.')) {
        ++split;
    }

    double hue = 0.0;
    if (split == 0 || !Platform::ParseDouble(token.substr(0, split), hue) || hue < 0.0 || hue > 10.0) {
        throw ParseException("renotation line " + std::to_string(lineNo) +
                             ": invalid hue '" + token + "'");
    }
    HueFamily family = ParseHueFamily(token.substr(split));
    double position = static_cast<int>(family) * 10.0 + hue;
    if (!IsStandardHue(position)) {
        throw ParseException("renotation line " + std::to_string(lineNo) +
                             ": hue '" + token + "' is not on a 2.5 step");
    }
    return position;
}

bool IsIntegral(double v) {
    return std::abs(v - std::round(v)) < 1e-9;
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

RenotationTable::RenotationTable(std::vector<RenotationEntry> entries)
    : entries_(std::move(entries)),
      maxChroma_(MUNSELL_HUE_STEP_COUNT * VALUE_SLOTS, 0) {
    index_.reserve(entries_.size());
    for (size_t i = 0; i < entries_.size(); ++i) {
        const auto& e = entries_[i];
        if (e.hueStep < 0 || e.hueStep >= MUNSELL_HUE_STEP_COUNT ||
            e.value < RENOTATION_VALUE_MIN || e.value > RENOTATION_VALUE_MAX ||
            e.chroma < 2 || e.chroma % 2 != 0) {
            throw InvalidArgumentException(
                "RenotationTable: entry out of range (hueStep " + std::to_string(e.hueStep) +
                ", value " + std::to_string(e.value) + ", chroma " + std::to_string(e.chroma) + ")");
        }
        if (!index_.emplace(Key(e.hueStep, e.value, e.chroma), i).second) {
            throw InvalidArgumentException(
                "RenotationTable: duplicate entry (hueStep " + std::to_string(e.hueStep) +
                ", value " + std::to_string(e.value) + ", chroma " + std::to_string(e.chroma) + ")");
        }
        int& maxC = maxChroma_[e.hueStep * VALUE_SLOTS + e.value];
        maxC = std::max(maxC, e.chroma);
    }
}

RenotationTable RenotationTable::Parse(const std::vector<std::string>& lines) {
    std::vector<RenotationEntry> entries;
    entries.reserve(lines.size());

    for (size_t i = 0; i < lines.size(); ++i) {
        size_t lineNo = i + 1;
        std::string line = Platform::TrimString(lines[i]);
        if (line.empty() || line[0] == '#') continue;

        auto tokens = Platform::SplitWhitespace(line);
        // Header row
        if (tokens[0] == "h" || tokens[0] == "H") continue;

        if (tokens.size() != 6) {
            throw ParseException("renotation line " + std::to_string(lineNo) +
                                 ": expected 6 fields, got " + std::to_string(tokens.size()));
        }

        double position = ParseRenotationHue(tokens[0], lineNo);
        double fields[5];
        for (int k = 0; k < 5; ++k) {
            if (!Platform::ParseDouble(tokens[k + 1], fields[k])) {
                throw ParseException("renotation line " + std::to_string(lineNo) +
                                     ": invalid number '" + tokens[k + 1] + "'");
            }
        }
        double value = fields[0];
        double chroma = fields[1];

        // Fractional value planes and odd chromas are not part of the grid
        if (!IsIntegral(value) || value < RENOTATION_VALUE_MIN || value > RENOTATION_VALUE_MAX) continue;
        if (!IsIntegral(chroma) || chroma < 2.0) continue;
        int c = static_cast<int>(std::lround(chroma));
        if (c % 2 != 0) continue;

        entries.emplace_back(HueStepFromPosition(position), static_cast<int>(std::lround(value)), c,
                             fields[2], fields[3], fields[4] / 100.0);
    }

    try {
        return RenotationTable(std::move(entries));
    } catch (const InvalidArgumentException& e) {
        throw ParseException(e.what());
    }
}

RenotationTable RenotationTable::LoadFromFile(const std::string& path) {
    std::vector<std::string> lines;
    if (!Platform::ReadTextLines(path, lines)) {
        throw IOException("cannot read renotation data '" + path + "'");
    }
    return Parse(lines);
}

std::string RenotationTable::DefaultPath() {
    return MUNSELLSPACE_RENOTATION_FILE;
}

const RenotationTable& RenotationTable::Default() {
    static const RenotationTable table = LoadFromFile(DefaultPath());
    return table;
}

// =============================================================================
// Queries
// =============================================================================

int64_t RenotationTable::Key(int hueStep, int value, int chroma) {
    return (static_cast<int64_t>(hueStep) * VALUE_SLOTS + value) * 1000 + chroma;
}

const RenotationEntry* RenotationTable::Find(int hueStep, int value, int chroma) const {
    auto it = index_.find(Key(hueStep, value, chroma));
    if (it == index_.end()) return nullptr;
    return &entries_[it->second];
}

int RenotationTable::MaxChroma(int hueStep, int value) const {
    if (hueStep < 0 || hueStep >= MUNSELL_HUE_STEP_COUNT ||
        value < RENOTATION_VALUE_MIN || value > RENOTATION_VALUE_MAX || maxChroma_.empty()) {
        return 0;
    }
    return maxChroma_[hueStep * VALUE_SLOTS + value];
}

} // namespace MunsellSpace::Renotation
