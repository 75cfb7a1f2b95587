/**
 * @file ChromaticAdapter.cpp
 * @brief Von Kries style chromatic adaptation between illuminants
 */

#include <MunsellSpace/Color/ChromaticAdapter.h>
#include <MunsellSpace/Core/Exception.h>
#include <MunsellSpace/Core/Validate.h>

#include <cctype>

namespace MunsellSpace::Color {

namespace {

const Internal::Mat33 BRADFORD = {
     0.8951,  0.2664, -0.1614,
    -0.7502,  1.7135,  0.0367,
     0.0389, -0.0685,  1.0296
};

const Internal::Mat33 CAT02 = {
     0.7328,  0.4296, -0.1624,
    -0.7036,  1.6975,  0.0061,
     0.0030,  0.0136,  0.9834
};

// Hunt-Pointer-Estevez
const Internal::Mat33 VON_KRIES = {
     0.40024,  0.70760, -0.08081,
    -0.22630,  1.16532,  0.04570,
     0.0,      0.0,      0.91822
};

const Internal::Mat33 XYZ_SCALING = Internal::Mat33::Identity();

} // anonymous namespace

std::string ToString(AdaptationMethod method) {
    switch (method) {
        case AdaptationMethod::Bradford: return "Bradford";
        case AdaptationMethod::CAT02: return "CAT02";
        case AdaptationMethod::VonKries: return "VonKries";
        case AdaptationMethod::XYZScaling: return "XYZScaling";
    }
    return "unknown";
}

AdaptationMethod ParseAdaptationMethod(const std::string& name) {
    std::string lower;
    for (char c : name) {
        if (c == ' ' || c == '-' || c == '_') continue;
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (lower == "bradford") return AdaptationMethod::Bradford;
    if (lower == "cat02") return AdaptationMethod::CAT02;
    if (lower == "vonkries") return AdaptationMethod::VonKries;
    if (lower == "xyzscaling" || lower == "xyz") return AdaptationMethod::XYZScaling;

    throw InvalidArgumentException("Unknown adaptation method: " + name);
}

const Internal::Mat33& ConeResponseMatrix(AdaptationMethod method) {
    switch (method) {
        case AdaptationMethod::Bradford: return BRADFORD;
        case AdaptationMethod::CAT02: return CAT02;
        case AdaptationMethod::VonKries: return VON_KRIES;
        case AdaptationMethod::XYZScaling: return XYZ_SCALING;
    }
    throw InvalidArgumentException("unknown adaptation method enumerator");
}

// =============================================================================
// ChromaticAdapter
// =============================================================================

Internal::Mat33 ChromaticAdapter::Matrix(Illuminant from, Illuminant to) const {
    if (from == to) {
        return Internal::Mat33::Identity();
    }
    const Internal::Mat33& cone = ConeResponseMatrix(method_);
    const WhitePoint& src = GetWhitePoint(from);
    const WhitePoint& dst = GetWhitePoint(to);

    Internal::Vec3 rhoSrc = cone * Internal::Vec3(src.X, src.Y, src.Z);
    Internal::Vec3 rhoDst = cone * Internal::Vec3(dst.X, dst.Y, dst.Z);
    Internal::Vec3 gain(rhoDst[0] / rhoSrc[0], rhoDst[1] / rhoSrc[1], rhoDst[2] / rhoSrc[2]);

    return cone.Inverse() * Internal::Mat33::Diagonal(gain) * cone;
}

CieXyz ChromaticAdapter::Adapt(const CieXyz& xyz, Illuminant from, Illuminant to) const {
    Validate::RequireFiniteChannel(xyz.X, "X", "Adapt");
    Validate::RequireFiniteChannel(xyz.Y, "Y", "Adapt");
    Validate::RequireFiniteChannel(xyz.Z, "Z", "Adapt");

    if (from == to) {
        return CieXyz(xyz.X, xyz.Y, xyz.Z, to);
    }
    Internal::Vec3 out = Matrix(from, to) * Internal::Vec3(xyz.X, xyz.Y, xyz.Z);
    return CieXyz(out[0], out[1], out[2], to);
}

} // namespace MunsellSpace::Color
