/**
 * @file IsccNbsClassifier.cpp
 * @brief ISCC-NBS wedge / polygon lookup and table loading
 */

#include <MunsellSpace/Classify/IsccNbsClassifier.h>
#include <MunsellSpace/Core/Constants.h>
#include <MunsellSpace/Core/Exception.h>
#include <MunsellSpace/Internal/GeomRelation.h>
#include <MunsellSpace/MunsellSpaceConfig.h>
#include <MunsellSpace/Platform/FileIO.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <set>
#include <utility>

namespace MunsellSpace::Classify {

namespace {

// Tolerance for "this edge is horizontal / vertical"
constexpr double AXIS_EDGE_TOLERANCE = 1e-10;

double RoundCoordinate(double v) {
    const double scale = std::pow(10.0, ISCC_NBS_COORDINATE_DECIMALS);
    return std::round(v * scale) / scale;
}

struct AxisRange {
    bool valid = false;
    double lo = 0.0;
    double hi = 0.0;

    void Add(double v) {
        if (!valid) {
            lo = hi = v;
            valid = true;
        } else {
            lo = std::min(lo, v);
            hi = std::max(hi, v);
        }
    }

    // (lo, hi], or [0, hi] when lo is 0
    bool Accepts(double v) const {
        if (!valid) return false;
        if (lo == 0.0) return v >= 0.0 && v <= hi;
        return v > lo && v <= hi;
    }
};

/**
 * Polygon containment with the half-open boundary rule. Interior points are
 * inside; a boundary point is inside when it passes the rule on both the
 * chroma extent of the polygon at its value and the value extent at its
 * chroma.
 */
bool RegionContains(const std::vector<Point2d>& polygon, const Point2d& point) {
    auto relation = Internal::PointInPolygon(point, polygon);
    if (relation == Internal::PointPolygonRelation::Inside) return true;
    if (relation == Internal::PointPolygonRelation::Outside) return false;

    const double chroma = point.x;
    const double value = point.y;
    AxisRange chromaRange;
    AxisRange valueRange;

    size_t n = polygon.size();
    for (size_t i = 0; i < n; ++i) {
        const Point2d& p1 = polygon[i];
        const Point2d& p2 = polygon[(i + 1) % n];

        if (std::min(p1.y, p2.y) <= value && value <= std::max(p1.y, p2.y)) {
            if (std::abs(p2.y - p1.y) < AXIS_EDGE_TOLERANCE) {
                chromaRange.Add(p1.x);
                chromaRange.Add(p2.x);
            } else {
                chromaRange.Add(p1.x + (value - p1.y) * (p2.x - p1.x) / (p2.y - p1.y));
            }
        }
        if (std::min(p1.x, p2.x) <= chroma && chroma <= std::max(p1.x, p2.x)) {
            if (std::abs(p2.x - p1.x) < AXIS_EDGE_TOLERANCE) {
                valueRange.Add(p1.y);
                valueRange.Add(p2.y);
            } else {
                valueRange.Add(p1.y + (chroma - p1.x) * (p2.y - p1.y) / (p2.x - p1.x));
            }
        }
    }
    return chromaRange.Accepts(chroma) && valueRange.Accepts(value);
}

std::string LowerNoSpace(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (c == ' ' || c == '-' || c == '_') continue;
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

int ParseIntField(const std::string& field, const char* what, size_t lineNo) {
    int v = 0;
    if (!Platform::ParseInt(field, v)) {
        throw ParseException("ISCC-NBS line " + std::to_string(lineNo) + ": invalid " + what +
                             " '" + field + "'");
    }
    return v;
}

double ParseDoubleField(const std::string& field, const char* what, size_t lineNo) {
    double v = 0.0;
    if (!Platform::ParseDouble(field, v)) {
        throw ParseException("ISCC-NBS line " + std::to_string(lineNo) + ": invalid " + what +
                             " '" + field + "'");
    }
    return v;
}

// (name, -ish form); base names first, then overlay names
const std::pair<const char*, const char*> ISH_FORMS[] = {
    {"brown", "brownish"},   {"blue", "bluish"},        {"red", "reddish"},
    {"green", "greenish"},   {"yellow", "yellowish"},   {"purple", "purplish"},
    {"pink", "pinkish"},     {"orange", "orangish"},    {"gray", "grayish"},
    {"grey", "greyish"},     {"olive", "olive"},        {"white", "whitish"},
    {"black", "blackish"},
    {"gold", "goldish"},     {"peach", "peachy"},       {"rose", "rosy"},
    {"rust", "rusty"},       {"violet", "violetish"},   {"sand", "sandy"},
    {"tan", "tannish"},
};

void ReplaceAll(std::string& text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // anonymous namespace

// =============================================================================
// Enumerations and descriptors
// =============================================================================

std::string ToString(BoundaryPolicy policy) {
    switch (policy) {
        case BoundaryPolicy::Method1: return "Method1";
        case BoundaryPolicy::Method2: return "Method2";
    }
    return "unknown";
}

BoundaryPolicy ParseBoundaryPolicy(const std::string& name) {
    std::string lower = LowerNoSpace(name);
    if (lower == "method1" || lower == "1") return BoundaryPolicy::Method1;
    if (lower == "method2" || lower == "2") return BoundaryPolicy::Method2;
    throw InvalidArgumentException("Unknown boundary policy: " + name);
}

std::string IshForm(const std::string& name) {
    for (const auto& entry : ISH_FORMS) {
        if (name == entry.first) return entry.second;
    }
    return name;
}

std::string FormatDescriptor(const std::string& formatter, const std::string& name) {
    if (formatter.empty()) return name;
    std::string out = formatter;
    ReplaceAll(out, "{0}", name);
    ReplaceAll(out, "{1}", IshForm(name));
    return out;
}

std::string IsccNbsColorInfo::Descriptor() const {
    return FormatDescriptor(formatter, name);
}

std::string IsccNbsColorInfo::ExtendedDescriptor() const {
    return FormatDescriptor(formatter, extendedName);
}

// =============================================================================
// Hue ranges
// =============================================================================

double ParseRegionHue(const std::string& text) {
    std::string s = Platform::TrimString(text);
    size_t split = 0;
    while (split < s.size() &&
           (std::isdigit(static_cast<unsigned char>(s[split])) || s[split] == '.')) {
        ++split;
    }
    if (split == 0 || split == s.size()) {
        throw ParseException("invalid ISCC-NBS hue '" + text + "'");
    }

    double number = 0.0;
    if (!Platform::ParseDouble(s.substr(0, split), number) || number < 0.0 || number > 10.0) {
        throw ParseException("invalid ISCC-NBS hue number in '" + text + "'");
    }

    std::string code;
    for (size_t i = split; i < s.size(); ++i) {
        code += static_cast<char>(std::toupper(static_cast<unsigned char>(s[i])));
    }
    if (code == "PR") code = "RP";

    HueFamily family = ParseHueFamily(code);
    return PositiveMod(static_cast<int>(family) * 10.0 + number, MUNSELL_HUE_CIRCLE);
}

bool HueInRange(double huePosition, double start, double end, BoundaryPolicy policy) {
    double span = PositiveMod(end - start, MUNSELL_HUE_CIRCLE);
    if (span == 0.0) return true;
    double offset = PositiveMod(huePosition - start, MUNSELL_HUE_CIRCLE);
    if (policy == BoundaryPolicy::Method1) {
        return offset < span;
    }
    return offset > 0.0 && offset <= span;
}

// =============================================================================
// Construction and loading
// =============================================================================

IsccNbsClassifier::IsccNbsClassifier(std::vector<IsccNbsRegion> regions,
                                     std::vector<IsccNbsColorInfo> colors)
    : regions_(std::move(regions)) {
    for (auto& info : colors) {
        if (info.number < ISCC_NBS_FIRST_COLOR || info.number > ISCC_NBS_LAST_COLOR) {
            throw InvalidArgumentException("ISCC-NBS color number out of range: " +
                                           std::to_string(info.number));
        }
        int number = info.number;
        if (!colors_.emplace(number, std::move(info)).second) {
            throw InvalidArgumentException("duplicate ISCC-NBS color " + std::to_string(number));
        }
    }
    for (const auto& region : regions_) {
        if (region.polygon.size() < 3) {
            throw InvalidArgumentException("ISCC-NBS region " + std::to_string(region.colorNumber) +
                                           "/" + std::to_string(region.polygonGroup) +
                                           " has fewer than 3 points");
        }
        if (colors_.count(region.colorNumber) == 0) {
            throw InvalidArgumentException("ISCC-NBS region refers to color " +
                                           std::to_string(region.colorNumber) +
                                           " without metadata");
        }
    }
}

IsccNbsClassifier IsccNbsClassifier::Parse(const std::vector<std::string>& definitionLines,
                                           const std::vector<std::string>& colorLines) {
    // ---- Regions, grouped by (color, group) in order of first appearance ----
    std::vector<IsccNbsRegion> regions;
    std::vector<std::vector<std::pair<int, Point2d>>> points;
    std::map<std::pair<int, int>, size_t> groupIndex;

    for (size_t i = 0; i < definitionLines.size(); ++i) {
        size_t lineNo = i + 1;
        std::string line = Platform::TrimString(definitionLines[i]);
        if (line.empty() || line[0] == '#') continue;

        auto fields = Platform::SplitString(line, ',');
        if (fields[0] == "color_number") continue;
        if (fields.size() != 7) {
            throw ParseException("ISCC-NBS line " + std::to_string(lineNo) +
                                 ": expected 7 fields, got " + std::to_string(fields.size()));
        }

        int number = ParseIntField(fields[0], "color number", lineNo);
        int group = ParseIntField(fields[1], "polygon group", lineNo);
        int pointIndex = ParseIntField(fields[2], "point index", lineNo);
        double hueStart = ParseRegionHue(fields[3]);
        double hueEnd = ParseRegionHue(fields[4]);
        double chroma = ParseDoubleField(fields[5], "chroma", lineNo);
        double value = ParseDoubleField(fields[6], "value", lineNo);

        auto key = std::make_pair(number, group);
        auto it = groupIndex.find(key);
        if (it == groupIndex.end()) {
            IsccNbsRegion region;
            region.colorNumber = number;
            region.polygonGroup = group;
            region.hueStart = hueStart;
            region.hueEnd = hueEnd;
            it = groupIndex.emplace(key, regions.size()).first;
            regions.push_back(region);
            points.emplace_back();
        } else {
            const IsccNbsRegion& region = regions[it->second];
            if (region.hueStart != hueStart || region.hueEnd != hueEnd) {
                throw ParseException("ISCC-NBS line " + std::to_string(lineNo) +
                                     ": hue range differs within polygon " +
                                     std::to_string(number) + "/" + std::to_string(group));
            }
        }
        points[it->second].emplace_back(pointIndex, Point2d(chroma, value));
    }

    for (size_t r = 0; r < regions.size(); ++r) {
        auto& pts = points[r];
        std::stable_sort(pts.begin(), pts.end(),
                         [](const std::pair<int, Point2d>& a, const std::pair<int, Point2d>& b) {
                             return a.first < b.first;
                         });
        for (const auto& p : pts) {
            regions[r].polygon.push_back(p.second);
        }
    }

    // ---- Color metadata ----
    std::vector<IsccNbsColorInfo> colors;
    for (size_t i = 0; i < colorLines.size(); ++i) {
        size_t lineNo = i + 1;
        std::string line = Platform::TrimString(colorLines[i]);
        if (line.empty() || line[0] == '#') continue;

        auto fields = Platform::SplitString(line, ',');
        if (fields[0] == "color_number") continue;
        if (fields.size() != 5) {
            throw ParseException("ISCC-NBS colors line " + std::to_string(lineNo) +
                                 ": expected 5 fields, got " + std::to_string(fields.size()));
        }

        IsccNbsColorInfo info;
        info.number = ParseIntField(fields[0], "color number", lineNo);
        info.name = fields[1];
        info.formatter = fields[2];
        info.extendedName = fields[3].empty() ? fields[1] : fields[3];
        info.shade = fields[4];
        colors.push_back(std::move(info));
    }

    try {
        return IsccNbsClassifier(std::move(regions), std::move(colors));
    } catch (const InvalidArgumentException& e) {
        throw ParseException(e.what());
    }
}

IsccNbsClassifier IsccNbsClassifier::LoadFromFiles(const std::string& definitionsPath,
                                                   const std::string& colorsPath) {
    std::vector<std::string> definitionLines;
    if (!Platform::ReadTextLines(definitionsPath, definitionLines)) {
        throw IOException("cannot read ISCC-NBS definitions '" + definitionsPath + "'");
    }
    std::vector<std::string> colorLines;
    if (!Platform::ReadTextLines(colorsPath, colorLines)) {
        throw IOException("cannot read ISCC-NBS colors '" + colorsPath + "'");
    }
    return Parse(definitionLines, colorLines);
}

std::string IsccNbsClassifier::DefaultDefinitionsPath() {
    return MUNSELLSPACE_ISCC_NBS_DEFINITIONS_FILE;
}

std::string IsccNbsClassifier::DefaultColorsPath() {
    return MUNSELLSPACE_ISCC_NBS_COLORS_FILE;
}

const IsccNbsClassifier& IsccNbsClassifier::Default() {
    static const IsccNbsClassifier classifier =
        LoadFromFiles(DefaultDefinitionsPath(), DefaultColorsPath());
    return classifier;
}

// =============================================================================
// Queries
// =============================================================================

int IsccNbsClassifier::NeutralColorNumber(double value) {
    if (value <= 2.5) return ISCC_NBS_BLACK;
    if (value <= 4.5) return ISCC_NBS_DARK_GRAY;
    if (value <= 6.5) return ISCC_NBS_MEDIUM_GRAY;
    if (value <= 8.5) return ISCC_NBS_LIGHT_GRAY;
    return ISCC_NBS_WHITE;
}

const IsccNbsColorInfo* IsccNbsClassifier::Info(int colorNumber) const {
    auto it = colors_.find(colorNumber);
    return (it == colors_.end()) ? nullptr : &it->second;
}

IsccNbsMatch IsccNbsClassifier::MakeMatch(int colorNumber, bool exact, double distance) const {
    const IsccNbsColorInfo* info = Info(colorNumber);
    if (info == nullptr) {
        throw InsufficientDataException("no metadata for ISCC-NBS color " +
                                        std::to_string(colorNumber));
    }
    IsccNbsMatch match;
    match.colorNumber = colorNumber;
    match.descriptor = info->Descriptor();
    match.name = info->name;
    match.extendedDescriptor = info->ExtendedDescriptor();
    match.shade = info->shade;
    match.exact = exact;
    match.distance = distance;
    return match;
}

IsccNbsMatch IsccNbsClassifier::Classify(const MunsellColor& color, BoundaryPolicy policy) const {
    if (color.IsNeutral()) {
        return MakeMatch(NeutralColorNumber(color.Value()), true, 0.0);
    }
    if (regions_.empty()) {
        throw InsufficientDataException("no ISCC-NBS regions loaded");
    }

    const double hue = color.HuePosition();
    const Point2d point(RoundCoordinate(color.Chroma()), RoundCoordinate(color.Value()));

    for (const auto& region : regions_) {
        if (HueInRange(hue, region.hueStart, region.hueEnd, policy) &&
            RegionContains(region.polygon, point)) {
            return MakeMatch(region.colorNumber, true, 0.0);
        }
    }

    // Nearest candidate; all regions when none covers the hue
    bool anyCovers = std::any_of(regions_.begin(), regions_.end(), [&](const IsccNbsRegion& r) {
        return HueInRange(hue, r.hueStart, r.hueEnd, policy);
    });

    const IsccNbsRegion* best = nullptr;
    double bestDist = std::numeric_limits<double>::infinity();
    for (const auto& region : regions_) {
        if (anyCovers && !HueInRange(hue, region.hueStart, region.hueEnd, policy)) continue;
        double d = Internal::PointToPolygonBoundaryDistance(point, region.polygon);
        if (d < bestDist) {
            bestDist = d;
            best = &region;
        }
    }
    return MakeMatch(best->colorNumber, false, bestDist);
}

std::vector<int> IsccNbsClassifier::FindAll(const MunsellColor& color, BoundaryPolicy policy) const {
    if (color.IsNeutral()) {
        return {NeutralColorNumber(color.Value())};
    }

    const double hue = color.HuePosition();
    const Point2d point(RoundCoordinate(color.Chroma()), RoundCoordinate(color.Value()));

    std::set<int> numbers;
    for (const auto& region : regions_) {
        if (HueInRange(hue, region.hueStart, region.hueEnd, policy) &&
            RegionContains(region.polygon, point)) {
            numbers.insert(region.colorNumber);
        }
    }
    return std::vector<int>(numbers.begin(), numbers.end());
}

} // namespace MunsellSpace::Classify
