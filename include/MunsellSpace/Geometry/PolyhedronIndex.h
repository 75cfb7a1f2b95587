#pragma once

/**
 * @file PolyhedronIndex.h
 * @brief Named polyhedra for non-basic color name overlays
 *
 * Overlays may overlap, so a point can match any number of names. All
 * queries are const; the index is immutable after construction.
 */

#include <MunsellSpace/Core/Export.h>
#include <MunsellSpace/Core/MunsellColor.h>
#include <MunsellSpace/Core/Types.h>
#include <MunsellSpace/Geometry/Polyhedron.h>

#include <map>
#include <string>
#include <vector>

namespace MunsellSpace::Geometry {

/**
 * @brief Point containment in a single polyhedron (boundary counts as inside)
 */
MUNSELLSPACE_API bool Contains(const Point3d& point, const Polyhedron& polyhedron);

class MUNSELLSPACE_API PolyhedronIndex {
public:
    PolyhedronIndex() = default;

    /**
     * @throws InvalidArgumentException on duplicate or empty names
     */
    explicit PolyhedronIndex(std::vector<Polyhedron> polyhedra);

    /**
     * @brief Load from the polyhedron text format
     * @throws IOException / ParseException
     */
    static PolyhedronIndex LoadFromFile(const std::string& path);

    /// Path of the installed polyhedra asset
    static std::string DefaultPath();

    /**
     * @brief Process-wide index loaded from DefaultPath()
     * @throws IOException if the asset is missing
     */
    static const PolyhedronIndex& Default();

    size_t Size() const { return polyhedra_.size(); }
    bool Empty() const { return polyhedra_.empty(); }

    const std::vector<Polyhedron>& Polyhedra() const { return polyhedra_; }

    /// All names, sorted
    std::vector<std::string> Names() const;

    /// Polyhedron by name, nullptr if absent
    const Polyhedron* Find(const std::string& name) const;

    /**
     * @brief Containment in a named polyhedron
     * @throws InvalidArgumentException if the name is unknown
     */
    bool Contains(const Point3d& point, const std::string& name) const;

    /// Names of every polyhedron containing the point, sorted
    std::vector<std::string> MatchingOverlays(const Point3d& point) const;

    /// As above, mapping the color through ToCartesian()
    std::vector<std::string> MatchingOverlays(const MunsellColor& color) const;

    /// Polyhedron whose solid centroid is nearest the point, nullptr if empty
    const Polyhedron* ClosestOverlay(const Point3d& point) const;

private:
    std::vector<Polyhedron> polyhedra_;
    std::map<std::string, size_t> byName_;
};

} // namespace MunsellSpace::Geometry
