/**
 * @file ConvexHullBuilder.cpp
 * @brief Outer / inner hull polyhedra
 */

#include <MunsellSpace/Geometry/ConvexHullBuilder.h>
#include <MunsellSpace/Geometry/CartesianMapper.h>
#include <MunsellSpace/Internal/ConvexHull3d.h>
#include <MunsellSpace/Core/Exception.h>

#include <algorithm>
#include <map>
#include <string>
#include <utility>

namespace MunsellSpace::Geometry {

namespace {

Polyhedron BuildPolyhedron(const std::vector<Point3d>& points, const std::string& name,
                           size_t sampleCount) {
    std::vector<Internal::HullFace3d> hull = Internal::ConvexHull3d(points);

    // Compact to the used vertices, keeping input order
    std::map<size_t, size_t> remap;
    for (const auto& f : hull) {
        remap.emplace(f.a, 0);
        remap.emplace(f.b, 0);
        remap.emplace(f.c, 0);
    }
    std::vector<Point3d> vertices;
    vertices.reserve(remap.size());
    for (auto& entry : remap) {
        entry.second = vertices.size();
        vertices.push_back(points[entry.first]);
    }

    std::vector<TriangleFace> faces;
    faces.reserve(hull.size());
    for (const auto& f : hull) {
        faces.emplace_back(remap[f.a], remap[f.b], remap[f.c]);
    }
    return Polyhedron(name, std::move(vertices), std::move(faces), sampleCount);
}

} // anonymous namespace

Polyhedron OuterHull(const std::vector<Point3d>& points, const std::string& name) {
    return BuildPolyhedron(points, name, points.size());
}

std::vector<size_t> OuterHullVertices(const std::vector<Point3d>& points) {
    return Internal::ConvexHull3dIndices(points);
}

Polyhedron InnerHull(const std::vector<Point3d>& points, const std::string& name) {
    std::vector<size_t> outer = Internal::ConvexHull3dIndices(points);

    std::vector<Point3d> outerPoints;
    outerPoints.reserve(outer.size());
    for (size_t i : outer) {
        outerPoints.push_back(points[i]);
    }

    std::vector<Point3d> remaining;
    remaining.reserve(points.size());
    for (const auto& p : points) {
        if (std::find(outerPoints.begin(), outerPoints.end(), p) == outerPoints.end()) {
            remaining.push_back(p);
        }
    }
    if (remaining.size() < 4) {
        throw InsufficientDataException("inner hull of '" + name + "': only " +
                                        std::to_string(remaining.size()) +
                                        " points remain after removing the outer hull");
    }
    return BuildPolyhedron(remaining, name, points.size());
}

Polyhedron BuildFromMunsell(const std::vector<MunsellColor>& samples, const std::string& name) {
    std::vector<Point3d> points;
    points.reserve(samples.size());
    for (const auto& color : samples) {
        points.push_back(ToCartesian(color));
    }
    return InnerHull(points, name);
}

} // namespace MunsellSpace::Geometry
