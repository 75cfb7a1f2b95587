#pragma once

/**
 * @file MunsellSpace.h
 * @brief Main header file for MunsellSpace library
 *
 * MunsellSpace converts device RGB colors to and from the Munsell color
 * system and names Munsell colors with ISCC-NBS designations and non-basic
 * color-name polyhedra.
 */

// Configuration and export macros
#include <MunsellSpace/MunsellSpaceConfig.h>
#include <MunsellSpace/Core/Export.h>

// Core types and utilities
#include <MunsellSpace/Core/Types.h>
#include <MunsellSpace/Core/Constants.h>
#include <MunsellSpace/Core/Exception.h>
#include <MunsellSpace/Core/MunsellColor.h>

// Colorimetry
#include <MunsellSpace/Color/Illuminant.h>
#include <MunsellSpace/Color/RgbProfile.h>
#include <MunsellSpace/Color/ColorTypes.h>
#include <MunsellSpace/Color/ChromaticAdapter.h>
#include <MunsellSpace/Color/ColorSpaceConverter.h>

// Munsell renotation
#include <MunsellSpace/Renotation/MunsellMath.h>
#include <MunsellSpace/Renotation/RenotationTable.h>
#include <MunsellSpace/Renotation/RenotationInterpolator.h>
#include <MunsellSpace/Renotation/MunsellInverter.h>

// Geometry
#include <MunsellSpace/Geometry/CartesianMapper.h>
#include <MunsellSpace/Geometry/Polyhedron.h>
#include <MunsellSpace/Geometry/PolyhedronIndex.h>
#include <MunsellSpace/Geometry/PolyhedronIO.h>
#include <MunsellSpace/Geometry/ConvexHullBuilder.h>

// Classification
#include <MunsellSpace/Classify/IsccNbsClassifier.h>

// Pipeline
#include <MunsellSpace/Pipeline/ConverterConfig.h>
#include <MunsellSpace/Pipeline/MunsellConverter.h>
#include <MunsellSpace/Pipeline/ColorNamer.h>

namespace MunsellSpace {

/**
 * @brief Get library version string
 * @return Version string in format "major.minor.patch"
 */
inline const char* GetVersion() {
    return MUNSELLSPACE_VERSION_STRING;
}

/**
 * @brief Get library version as integers
 */
inline void GetVersion(int& major, int& minor, int& patch) {
    major = MUNSELLSPACE_VERSION_MAJOR;
    minor = MUNSELLSPACE_VERSION_MINOR;
    patch = MUNSELLSPACE_VERSION_PATCH;
}

} // namespace MunsellSpace
