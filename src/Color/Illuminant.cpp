/**
 * @file Illuminant.cpp
 * @brief Standard illuminant white points and names
 */

#include <MunsellSpace/Color/Illuminant.h>
#include <MunsellSpace/Core/Exception.h>

#include <cctype>

namespace MunsellSpace::Color {

namespace {

struct IlluminantEntry {
    Illuminant illuminant;
    const char* name;
    WhitePoint white;
};

// CIE 1931 2-degree observer, Y normalized to 1
const IlluminantEntry ILLUMINANTS[] = {
    {Illuminant::A,   "A",   {1.09850, 1.0, 0.35585}},
    {Illuminant::B,   "B",   {0.99072, 1.0, 0.85223}},
    {Illuminant::C,   "C",   {0.98074, 1.0, 1.18232}},
    {Illuminant::D50, "D50", {0.96422, 1.0, 0.82521}},
    {Illuminant::D55, "D55", {0.95682, 1.0, 0.92149}},
    {Illuminant::D65, "D65", {0.95047, 1.0, 1.08883}},
    {Illuminant::D75, "D75", {0.94972, 1.0, 1.22638}},
    {Illuminant::E,   "E",   {1.00000, 1.0, 1.00000}},
    {Illuminant::F2,  "F2",  {0.99186, 1.0, 0.67393}},
    {Illuminant::F7,  "F7",  {0.95041, 1.0, 1.08747}},
    {Illuminant::F11, "F11", {1.00962, 1.0, 0.64350}},
};

const IlluminantEntry& Lookup(Illuminant illuminant) {
    for (const auto& entry : ILLUMINANTS) {
        if (entry.illuminant == illuminant) return entry;
    }
    throw InvalidArgumentException("unknown illuminant enumerator");
}

} // anonymous namespace

const WhitePoint& GetWhitePoint(Illuminant illuminant) {
    return Lookup(illuminant).white;
}

Point2d IlluminantChromaticity(Illuminant illuminant) {
    return Lookup(illuminant).white.Chromaticity();
}

std::string ToString(Illuminant illuminant) {
    return Lookup(illuminant).name;
}

Illuminant ParseIlluminant(const std::string& name) {
    std::string upper;
    upper.reserve(name.size());
    for (char c : name) {
        upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    for (const auto& entry : ILLUMINANTS) {
        if (upper == entry.name) return entry.illuminant;
    }
    throw InvalidArgumentException("Unknown illuminant: " + name);
}

} // namespace MunsellSpace::Color
