#pragma once

/**
 * @file FileIO.h
 * @brief Text asset I/O and tokenizing helpers
 *
 * Reference tables (renotation data, ISCC-NBS CSVs, polyhedra) are plain
 * UTF-8 text. Functions here report failure by return value; loaders above
 * them turn failures into IOException / ParseException.
 */

#include <MunsellSpace/Core/Export.h>

#include <string>
#include <vector>

namespace MunsellSpace::Platform {

// ============================================================================
// Path Utilities
// ============================================================================

/**
 * @brief Check if file exists
 */
MUNSELLSPACE_API bool FileExists(const std::string& path);

/**
 * @brief Join directory and file name with the platform separator
 */
MUNSELLSPACE_API std::string JoinPath(const std::string& dir, const std::string& name);

// ============================================================================
// Text File I/O (UTF-8)
// ============================================================================

/**
 * @brief Read text file lines into vector
 * @param path File path
 * @param lines Output vector of lines
 * @param trimLines If true, trim whitespace from each line
 * @return true on success
 */
MUNSELLSPACE_API bool ReadTextLines(const std::string& path, std::vector<std::string>& lines,
                                    bool trimLines = true);

/**
 * @brief Write lines to text file
 * @param path File path
 * @param lines Lines to write
 * @param lineEnding Line ending to use ("\n" or "\r\n")
 * @return true on success
 */
MUNSELLSPACE_API bool WriteTextLines(const std::string& path, const std::vector<std::string>& lines,
                                     const std::string& lineEnding = "\n");

// ============================================================================
// Tokenizing
// ============================================================================

/// Strip leading/trailing whitespace (including a trailing '\r')
MUNSELLSPACE_API std::string TrimString(const std::string& str);

/// Split on a single delimiter; fields are trimmed, empty fields kept
MUNSELLSPACE_API std::vector<std::string> SplitString(const std::string& str, char delimiter);

/// Split on runs of whitespace
MUNSELLSPACE_API std::vector<std::string> SplitWhitespace(const std::string& str);

/**
 * @brief Parse a complete string as a finite double
 * @return false if the string is empty, has trailing garbage, or is not finite
 */
MUNSELLSPACE_API bool ParseDouble(const std::string& str, double& value);

/**
 * @brief Parse a complete string as a base-10 integer
 */
MUNSELLSPACE_API bool ParseInt(const std::string& str, int& value);

} // namespace MunsellSpace::Platform
