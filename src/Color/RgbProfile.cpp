/**
 * @file RgbProfile.cpp
 * @brief RGB working space primaries, matrices and transfer functions
 */

#include <MunsellSpace/Color/RgbProfile.h>
#include <MunsellSpace/Core/Exception.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>

namespace MunsellSpace::Color {

namespace {

// sRGB curve
constexpr double SRGB_DECODE_THRESHOLD = 0.04045;
constexpr double SRGB_ENCODE_THRESHOLD = 0.0031308;
constexpr double SRGB_LINEAR_SLOPE = 12.92;
constexpr double SRGB_GAMMA = 2.4;
constexpr double SRGB_OFFSET = 0.055;
constexpr double SRGB_SCALE = 1.055;

// BT.2020 curve (12-bit constants)
constexpr double REC2020_ALPHA = 1.09929682680944;
constexpr double REC2020_BETA = 0.018053968510807;
constexpr double REC2020_LINEAR_SLOPE = 4.5;
constexpr double REC2020_EXPONENT = 0.45;

constexpr int PROFILE_COUNT = 6;

const RgbProfileInfo PROFILES[PROFILE_COUNT] = {
    {"sRGB",       {0.64, 0.33},     {0.30, 0.60},     {0.15, 0.06},
     Illuminant::D65, TransferFunction::SRgb, 2.4},
    {"Display P3", {0.68, 0.32},     {0.265, 0.69},    {0.15, 0.06},
     Illuminant::D65, TransferFunction::SRgb, 2.4},
    {"P3",         {0.68, 0.32},     {0.265, 0.69},    {0.15, 0.06},
     Illuminant::D65, TransferFunction::Gamma, 2.2},
    {"Adobe RGB",  {0.64, 0.33},     {0.21, 0.71},     {0.15, 0.06},
     Illuminant::D65, TransferFunction::Gamma, 563.0 / 256.0},
    {"ProPhoto RGB", {0.7347, 0.2653}, {0.1596, 0.8404}, {0.0366, 0.0001},
     Illuminant::D50, TransferFunction::Gamma, 1.8},
    {"Rec. 2020",  {0.708, 0.292},   {0.170, 0.797},   {0.131, 0.046},
     Illuminant::D65, TransferFunction::Rec2020, 1.0 / REC2020_EXPONENT},
};

struct ProfileMatrices {
    std::array<Internal::Mat33, PROFILE_COUNT> toXyz;
    std::array<Internal::Mat33, PROFILE_COUNT> fromXyz;
};

const ProfileMatrices& Matrices() {
    static const ProfileMatrices matrices = [] {
        ProfileMatrices m;
        for (int i = 0; i < PROFILE_COUNT; ++i) {
            const auto& info = PROFILES[i];
            m.toXyz[i] = ComputePrimaryMatrix(info.red, info.green, info.blue,
                                              GetWhitePoint(info.white));
            m.fromXyz[i] = m.toXyz[i].Inverse();
        }
        return m;
    }();
    return matrices;
}

int Index(RgbProfile profile) {
    int i = static_cast<int>(profile);
    if (i < 0 || i >= PROFILE_COUNT) {
        throw InvalidArgumentException("unknown RGB profile enumerator");
    }
    return i;
}

// Lowercase with separators removed ("Display-P3" -> "displayp3")
std::string NormalizeName(const std::string& name) {
    std::string out;
    for (char c : name) {
        if (c == ' ' || c == '-' || c == '_' || c == '.') continue;
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

} // anonymous namespace

// =============================================================================
// Profile Lookup
// =============================================================================

const RgbProfileInfo& GetProfileInfo(RgbProfile profile) {
    return PROFILES[Index(profile)];
}

Illuminant ProfileWhite(RgbProfile profile) {
    return GetProfileInfo(profile).white;
}

std::string ToString(RgbProfile profile) {
    return GetProfileInfo(profile).name;
}

RgbProfile ParseRgbProfile(const std::string& name) {
    std::string key = NormalizeName(name);
    if (key == "srgb") return RgbProfile::SRgb;
    if (key == "displayp3") return RgbProfile::DisplayP3;
    if (key == "p3" || key == "dcip3") return RgbProfile::P3;
    if (key == "adobergb" || key == "adobergb1998") return RgbProfile::AdobeRgb;
    if (key == "prophotorgb" || key == "prophoto" || key == "rommrgb") return RgbProfile::ProPhotoRgb;
    if (key == "rec2020" || key == "bt2020") return RgbProfile::Rec2020;

    throw InvalidArgumentException("Unknown RGB profile: " + name);
}

// =============================================================================
// Matrices
// =============================================================================

Internal::Mat33 ComputePrimaryMatrix(const Point2d& red, const Point2d& green,
                                     const Point2d& blue, const WhitePoint& white) {
    auto column = [](const Point2d& xy) {
        if (xy.y <= 0.0) {
            throw InvalidArgumentException("ComputePrimaryMatrix: primary y must be > 0");
        }
        return Internal::Vec3(xy.x / xy.y, 1.0, (1.0 - xy.x - xy.y) / xy.y);
    };

    Internal::Mat33 primaries = Internal::Mat33::FromColumns(column(red), column(green), column(blue));
    if (!primaries.IsInvertible()) {
        throw InvalidArgumentException("ComputePrimaryMatrix: primaries are collinear");
    }

    // Scale each primary so that RGB (1,1,1) reproduces the white
    Internal::Vec3 scale = primaries.Inverse() * Internal::Vec3(white.X, white.Y, white.Z);
    return primaries * Internal::Mat33::Diagonal(scale);
}

const Internal::Mat33& RgbToXyzMatrix(RgbProfile profile) {
    return Matrices().toXyz[Index(profile)];
}

const Internal::Mat33& XyzToRgbMatrix(RgbProfile profile) {
    return Matrices().fromXyz[Index(profile)];
}

// =============================================================================
// Transfer Functions
// =============================================================================

double LinearizeChannel(RgbProfile profile, double encoded) {
    const auto& info = GetProfileInfo(profile);
    double v = std::max(0.0, encoded);
    switch (info.transfer) {
        case TransferFunction::SRgb:
            return (v <= SRGB_DECODE_THRESHOLD)
                ? v / SRGB_LINEAR_SLOPE
                : std::pow((v + SRGB_OFFSET) / SRGB_SCALE, SRGB_GAMMA);
        case TransferFunction::Gamma:
            return std::pow(v, info.gamma);
        case TransferFunction::Rec2020:
            return (v < REC2020_LINEAR_SLOPE * REC2020_BETA)
                ? v / REC2020_LINEAR_SLOPE
                : std::pow((v + REC2020_ALPHA - 1.0) / REC2020_ALPHA, 1.0 / REC2020_EXPONENT);
    }
    return v;
}

double EncodeChannel(RgbProfile profile, double linear) {
    const auto& info = GetProfileInfo(profile);
    double v = std::max(0.0, linear);
    switch (info.transfer) {
        case TransferFunction::SRgb:
            return (v <= SRGB_ENCODE_THRESHOLD)
                ? v * SRGB_LINEAR_SLOPE
                : SRGB_SCALE * std::pow(v, 1.0 / SRGB_GAMMA) - SRGB_OFFSET;
        case TransferFunction::Gamma:
            return std::pow(v, 1.0 / info.gamma);
        case TransferFunction::Rec2020:
            return (v < REC2020_BETA)
                ? v * REC2020_LINEAR_SLOPE
                : REC2020_ALPHA * std::pow(v, REC2020_EXPONENT) - (REC2020_ALPHA - 1.0);
    }
    return v;
}

} // namespace MunsellSpace::Color
