#pragma once

#include <MunsellSpace/Core/Export.h>

/**
 * @file Exception.h
 * @brief Exception classes for MunsellSpace
 */

#include <stdexcept>
#include <string>

namespace MunsellSpace {

/**
 * @brief Base exception class for MunsellSpace
 */
class MUNSELLSPACE_API Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& message)
        : std::runtime_error(message) {}

    explicit Exception(const char* message)
        : std::runtime_error(message) {}
};

/**
 * @brief Invalid argument exception
 */
class MUNSELLSPACE_API InvalidArgumentException : public Exception {
public:
    explicit InvalidArgumentException(const std::string& message)
        : Exception("Invalid argument: " + message) {}
};

/**
 * @brief Malformed textual input (Munsell notation, hex color, asset line)
 */
class MUNSELLSPACE_API ParseException : public Exception {
public:
    explicit ParseException(const std::string& message)
        : Exception("Parse error: " + message) {}
};

/**
 * @brief RGB or XYZ component outside the declared domain
 */
class MUNSELLSPACE_API InvalidChannelException : public Exception {
public:
    explicit InvalidChannelException(const std::string& message)
        : Exception("Invalid channel: " + message) {}
};

/**
 * @brief Requested color has no counterpart inside the reference gamut
 *
 * Raised by the forward renotation when the chroma exceeds the tabulated
 * MacAdam-limit chroma of the hue/value cell.
 */
class MUNSELLSPACE_API OutOfGamutException : public Exception {
public:
    explicit OutOfGamutException(const std::string& message)
        : Exception("Out of gamut: " + message) {}
};

/**
 * @brief Insufficient data for algorithm (e.g., not enough points for a hull)
 */
class MUNSELLSPACE_API InsufficientDataException : public Exception {
public:
    explicit InsufficientDataException(const std::string& message)
        : Exception("Insufficient data: " + message) {}
};

/**
 * @brief Algorithm failed to converge
 */
class MUNSELLSPACE_API ConvergenceException : public Exception {
public:
    explicit ConvergenceException(const std::string& message)
        : Exception("Convergence failed: " + message) {}
};

/**
 * @brief File I/O exception
 */
class MUNSELLSPACE_API IOException : public Exception {
public:
    explicit IOException(const std::string& message)
        : Exception("I/O error: " + message) {}
};

} // namespace MunsellSpace
