#pragma once

/**
 * @file PolyhedronIO.h
 * @brief Line-oriented text format for polyhedron sets
 *
 * Format:
 * @code
 * # comment
 * polyhedron <name> [samples <n>]
 * v <x> <y> <z>            # Cartesian vertex, or
 * m <munsell notation>     # vertex in Munsell notation
 * f <i> <j> <k>            # zero-based vertex indices
 * end
 * @endcode
 *
 * Names are single tokens. Text after '#' is ignored on every line.
 */

#include <MunsellSpace/Core/Export.h>
#include <MunsellSpace/Geometry/Polyhedron.h>

#include <string>
#include <vector>

namespace MunsellSpace::Geometry {

/**
 * @brief Parse polyhedra from text lines
 * @throws ParseException on malformed lines, unterminated blocks or
 *         invalid polyhedra
 */
MUNSELLSPACE_API std::vector<Polyhedron> ParsePolyhedra(const std::vector<std::string>& lines);

/**
 * @brief Load polyhedra from a file
 * @throws IOException if the file cannot be read
 * @throws ParseException on malformed content
 */
MUNSELLSPACE_API std::vector<Polyhedron> LoadPolyhedra(const std::string& path);

/// Format polyhedra as text lines (Cartesian vertices, full precision)
MUNSELLSPACE_API std::vector<std::string> FormatPolyhedra(const std::vector<Polyhedron>& polyhedra);

/**
 * @brief Save polyhedra to a file
 * @throws IOException if the file cannot be written
 */
MUNSELLSPACE_API void SavePolyhedra(const std::string& path, const std::vector<Polyhedron>& polyhedra);

} // namespace MunsellSpace::Geometry
