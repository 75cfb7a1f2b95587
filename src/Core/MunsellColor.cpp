/**
 * @file MunsellColor.cpp
 * @brief MunsellColor implementation
 */

#include <MunsellSpace/Core/MunsellColor.h>
#include <MunsellSpace/Core/Constants.h>
#include <MunsellSpace/Core/Exception.h>
#include <MunsellSpace/Core/Validate.h>
#include <MunsellSpace/Platform/FileIO.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>

namespace MunsellSpace {

namespace {

const char* const FAMILY_NAMES[MUNSELL_FAMILY_COUNT] = {
    "R", "YR", "Y", "GY", "G", "BG", "B", "PB", "P", "RP"
};

// Positions this close below a family boundary snap to the boundary
constexpr double HUE_SNAP_TOLERANCE = 1e-9;

std::string FormatFixed(double v, int precision) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", precision, v);
    return buf;
}

double RoundTo(double v, int precision) {
    double scale = std::pow(10.0, precision);
    return std::round(v * scale) / scale;
}

} // anonymous namespace

// =============================================================================
// Hue Family
// =============================================================================

const char* HueFamilyName(HueFamily family) {
    return FAMILY_NAMES[static_cast<int>(family)];
}

HueFamily ParseHueFamily(const std::string& code) {
    std::string upper;
    for (char c : code) {
        upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    for (int i = 0; i < MUNSELL_FAMILY_COUNT; ++i) {
        if (upper == FAMILY_NAMES[i]) {
            return static_cast<HueFamily>(i);
        }
    }
    throw ParseException("unknown hue family '" + code + "'");
}

HueFamily HueFamilyFromIndex(int index) {
    int i = index % MUNSELL_FAMILY_COUNT;
    if (i < 0) i += MUNSELL_FAMILY_COUNT;
    return static_cast<HueFamily>(i);
}

// =============================================================================
// MunsellColor
// =============================================================================

MunsellColor::MunsellColor(HueFamily family, double hueNumber, double value, double chroma) {
    MUNSELLSPACE_REQUIRE_RANGE(hueNumber, 0.0, 10.0);
    MUNSELLSPACE_REQUIRE_RANGE(value, MUNSELL_VALUE_MIN, MUNSELL_VALUE_MAX);
    MUNSELLSPACE_REQUIRE_FINITE(chroma);
    MUNSELLSPACE_REQUIRE_NON_NEGATIVE(chroma);

    value_ = value;
    if (chroma == 0.0) {
        return;
    }

    chroma_ = chroma;
    if (hueNumber >= 10.0) {
        family_ = HueFamilyFromIndex(static_cast<int>(family) + 1);
        hueNumber_ = 0.0;
    } else {
        family_ = family;
        hueNumber_ = hueNumber;
    }
}

MunsellColor MunsellColor::Neutral(double value) {
    return MunsellColor(HueFamily::R, 0.0, value, 0.0);
}

MunsellColor MunsellColor::FromHuePosition(double position, double value, double chroma) {
    MUNSELLSPACE_REQUIRE_FINITE(position);
    double p = PositiveMod(position, MUNSELL_HUE_CIRCLE);
    int index = static_cast<int>(std::floor(p / 10.0));
    double hue = p - 10.0 * index;
    if (hue >= 10.0 - HUE_SNAP_TOLERANCE) {
        ++index;
        hue = 0.0;
    }
    return MunsellColor(HueFamilyFromIndex(index), std::max(0.0, hue), value, chroma);
}

double MunsellColor::HuePosition() const {
    return static_cast<int>(family_) * 10.0 + hueNumber_;
}

std::string MunsellColor::ToString(int precision) const {
    if (precision < 0) precision = 0;
    if (IsNeutral()) {
        return "N " + FormatFixed(value_, precision);
    }

    // Rounding may carry the hue number into the next family
    double hue = RoundTo(hueNumber_, precision);
    HueFamily family = family_;
    if (hue >= 10.0) {
        hue = 0.0;
        family = HueFamilyFromIndex(static_cast<int>(family_) + 1);
    }
    return FormatFixed(hue, precision) + HueFamilyName(family) + " " +
           FormatFixed(value_, precision) + "/" + FormatFixed(chroma_, precision);
}

// =============================================================================
// Parsing
// =============================================================================

namespace {

std::string ReadNumber(const std::string& s, size_t& pos) {
    size_t start = pos;
    while (pos < s.size() && (std::isdigit(static_cast<unsigned char>(s[pos])) || s[pos] == '.')) {
        ++pos;
    }
    return s.substr(start, pos - start);
}

void SkipSpaces(const std::string& s, size_t& pos) {
    while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) ++pos;
}

double RequireNumber(const std::string& token, const char* field, const std::string& notation) {
    double v = 0.0;
    if (!Platform::ParseDouble(token, v)) {
        throw ParseException("invalid " + std::string(field) + " in '" + notation + "'");
    }
    return v;
}

MunsellColor ParseNeutral(const std::string& s, size_t pos, const std::string& notation) {
    SkipSpaces(s, pos);
    double value = RequireNumber(ReadNumber(s, pos), "value", notation);
    SkipSpaces(s, pos);
    if (pos < s.size()) {
        if (s[pos] != '/') {
            throw ParseException("unexpected text in '" + notation + "'");
        }
        ++pos;
        SkipSpaces(s, pos);
        if (pos < s.size()) {
            double chroma = RequireNumber(ReadNumber(s, pos), "chroma", notation);
            SkipSpaces(s, pos);
            if (pos < s.size() || chroma != 0.0) {
                throw ParseException("neutral color must have chroma 0 in '" + notation + "'");
            }
        }
    }
    if (value < MUNSELL_VALUE_MIN || value > MUNSELL_VALUE_MAX) {
        throw ParseException("value out of range in '" + notation + "'");
    }
    return MunsellColor::Neutral(value);
}

} // anonymous namespace

MunsellColor ParseMunsell(const std::string& notation) {
    std::string s = Platform::TrimString(notation);
    if (s.empty()) {
        throw ParseException("empty Munsell notation");
    }

    size_t pos = 0;
    if (s[0] == 'N' || s[0] == 'n') {
        return ParseNeutral(s, 1, notation);
    }

    double hue = RequireNumber(ReadNumber(s, pos), "hue", notation);
    SkipSpaces(s, pos);

    size_t familyStart = pos;
    while (pos < s.size() && std::isalpha(static_cast<unsigned char>(s[pos]))) ++pos;
    if (pos == familyStart) {
        throw ParseException("missing hue family in '" + notation + "'");
    }
    HueFamily family = ParseHueFamily(s.substr(familyStart, pos - familyStart));
    SkipSpaces(s, pos);

    double value = RequireNumber(ReadNumber(s, pos), "value", notation);
    SkipSpaces(s, pos);
    if (pos >= s.size() || s[pos] != '/') {
        throw ParseException("expected '/' in '" + notation + "'");
    }
    ++pos;
    SkipSpaces(s, pos);
    double chroma = RequireNumber(ReadNumber(s, pos), "chroma", notation);
    SkipSpaces(s, pos);
    if (pos != s.size()) {
        throw ParseException("unexpected text in '" + notation + "'");
    }

    if (hue < 0.0 || hue > 10.0) {
        throw ParseException("hue number out of range in '" + notation + "'");
    }
    if (value < MUNSELL_VALUE_MIN || value > MUNSELL_VALUE_MAX) {
        throw ParseException("value out of range in '" + notation + "'");
    }
    return MunsellColor(family, hue, value, chroma);
}

} // namespace MunsellSpace
