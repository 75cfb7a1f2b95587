#pragma once

/**
 * @file Validate.h
 * @brief Unified parameter validation utilities for MunsellSpace
 *
 * All helpers throw with a consistent message format:
 *   "<function>: <param> must be <constraint>, got <value>"
 */

#include <MunsellSpace/Core/Export.h>
#include <MunsellSpace/Core/Exception.h>

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <string>

namespace MunsellSpace::Validate {

// =============================================================================
// Internal Formatting
// =============================================================================

namespace Detail {

// Format double with limited precision (avoid long tails)
inline std::string FormatValue(double val) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.6g", val);
    return buf;
}

inline std::string FormatValue(int val) {
    return std::to_string(val);
}

inline std::string FormatValue(int64_t val) {
    return std::to_string(val);
}

inline std::string FormatValue(size_t val) {
    return std::to_string(val);
}

} // namespace Detail

// =============================================================================
// Value Range Validation
// =============================================================================

/**
 * @brief Validate value is in range [min, max]
 */
template<typename T>
inline void RequireRange(T value, T minVal, T maxVal,
                         const char* paramName, const char* funcName) {
    if (!(value >= minVal && value <= maxVal)) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be in [" +
            Detail::FormatValue(minVal) + ", " + Detail::FormatValue(maxVal) +
            "], got " + Detail::FormatValue(value));
    }
}

/**
 * @brief Validate value is positive (> 0)
 */
template<typename T>
inline void RequirePositive(T value, const char* paramName, const char* funcName) {
    if (!(value > T(0))) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be > 0, got " +
            Detail::FormatValue(value));
    }
}

/**
 * @brief Validate value is non-negative (>= 0)
 */
template<typename T>
inline void RequireNonNegative(T value, const char* paramName, const char* funcName) {
    if (!(value >= T(0))) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be >= 0, got " +
            Detail::FormatValue(value));
    }
}

/**
 * @brief Validate value is at least minimum (>= min)
 */
template<typename T>
inline void RequireMin(T value, T minVal, const char* paramName, const char* funcName) {
    if (value < minVal) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be >= " +
            Detail::FormatValue(minVal) + ", got " + Detail::FormatValue(value));
    }
}

/**
 * @brief Validate value is finite (not NaN, not infinite)
 */
inline void RequireFinite(double value, const char* paramName, const char* funcName) {
    if (!std::isfinite(value)) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be finite, got " +
            Detail::FormatValue(value));
    }
}

// =============================================================================
// Color Channel Validation
// =============================================================================

/**
 * @brief Validate a color channel lies in [minVal, maxVal]
 * @throws InvalidChannelException if out of domain or non-finite
 */
inline void RequireChannel(double value, double minVal, double maxVal,
                           const char* channelName, const char* funcName) {
    if (!std::isfinite(value) || value < minVal || value > maxVal) {
        throw InvalidChannelException(
            std::string(funcName) + ": " + channelName + " must be in [" +
            Detail::FormatValue(minVal) + ", " + Detail::FormatValue(maxVal) +
            "], got " + Detail::FormatValue(value));
    }
}

/**
 * @brief Validate a color component is finite
 * @throws InvalidChannelException for NaN or infinity
 */
inline void RequireFiniteChannel(double value, const char* channelName, const char* funcName) {
    if (!std::isfinite(value)) {
        throw InvalidChannelException(
            std::string(funcName) + ": " + channelName + " must be finite, got " +
            Detail::FormatValue(value));
    }
}

// =============================================================================
// Convenience Macros
// =============================================================================

#define MUNSELLSPACE_REQUIRE_RANGE(val, min, max) \
    ::MunsellSpace::Validate::RequireRange(val, min, max, #val, __func__)

#define MUNSELLSPACE_REQUIRE_POSITIVE(val) \
    ::MunsellSpace::Validate::RequirePositive(val, #val, __func__)

#define MUNSELLSPACE_REQUIRE_NON_NEGATIVE(val) \
    ::MunsellSpace::Validate::RequireNonNegative(val, #val, __func__)

#define MUNSELLSPACE_REQUIRE_MIN(val, min) \
    ::MunsellSpace::Validate::RequireMin(val, min, #val, __func__)

#define MUNSELLSPACE_REQUIRE_FINITE(val) \
    ::MunsellSpace::Validate::RequireFinite(val, #val, __func__)

} // namespace MunsellSpace::Validate
