/**
 * @file PolyhedronIndex.cpp
 * @brief Overlay membership queries
 */

#include <MunsellSpace/Geometry/PolyhedronIndex.h>
#include <MunsellSpace/Geometry/CartesianMapper.h>
#include <MunsellSpace/Geometry/PolyhedronIO.h>
#include <MunsellSpace/Core/Exception.h>
#include <MunsellSpace/MunsellSpaceConfig.h>

#include <algorithm>
#include <limits>
#include <utility>

namespace MunsellSpace::Geometry {

bool Contains(const Point3d& point, const Polyhedron& polyhedron) {
    return polyhedron.Contains(point);
}

PolyhedronIndex::PolyhedronIndex(std::vector<Polyhedron> polyhedra)
    : polyhedra_(std::move(polyhedra)) {
    for (size_t i = 0; i < polyhedra_.size(); ++i) {
        const std::string& name = polyhedra_[i].Name();
        if (name.empty()) {
            throw InvalidArgumentException("PolyhedronIndex: polyhedron " + std::to_string(i) +
                                           " has no name");
        }
        if (!byName_.emplace(name, i).second) {
            throw InvalidArgumentException("PolyhedronIndex: duplicate polyhedron '" + name + "'");
        }
    }
}

PolyhedronIndex PolyhedronIndex::LoadFromFile(const std::string& path) {
    return PolyhedronIndex(LoadPolyhedra(path));
}

std::string PolyhedronIndex::DefaultPath() {
    return MUNSELLSPACE_POLYHEDRA_FILE;
}

const PolyhedronIndex& PolyhedronIndex::Default() {
    static const PolyhedronIndex index = LoadFromFile(DefaultPath());
    return index;
}

std::vector<std::string> PolyhedronIndex::Names() const {
    std::vector<std::string> names;
    names.reserve(byName_.size());
    for (const auto& entry : byName_) {
        names.push_back(entry.first);
    }
    return names;
}

const Polyhedron* PolyhedronIndex::Find(const std::string& name) const {
    auto it = byName_.find(name);
    return (it == byName_.end()) ? nullptr : &polyhedra_[it->second];
}

bool PolyhedronIndex::Contains(const Point3d& point, const std::string& name) const {
    const Polyhedron* poly = Find(name);
    if (poly == nullptr) {
        throw InvalidArgumentException("PolyhedronIndex: unknown polyhedron '" + name + "'");
    }
    return poly->Contains(point);
}

std::vector<std::string> PolyhedronIndex::MatchingOverlays(const Point3d& point) const {
    std::vector<std::string> names;
    for (const auto& poly : polyhedra_) {
        if (poly.Contains(point)) {
            names.push_back(poly.Name());
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<std::string> PolyhedronIndex::MatchingOverlays(const MunsellColor& color) const {
    return MatchingOverlays(ToCartesian(color));
}

const Polyhedron* PolyhedronIndex::ClosestOverlay(const Point3d& point) const {
    const Polyhedron* best = nullptr;
    double bestDist = std::numeric_limits<double>::infinity();
    for (const auto& poly : polyhedra_) {
        double d = poly.Centroid().DistanceTo(point);
        if (d < bestDist) {
            bestDist = d;
            best = &poly;
        }
    }
    return best;
}

} // namespace MunsellSpace::Geometry
