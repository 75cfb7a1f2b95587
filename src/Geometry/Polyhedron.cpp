/**
 * @file Polyhedron.cpp
 * @brief Convex polyhedron planes, volume and containment
 */

#include <MunsellSpace/Geometry/Polyhedron.h>
#include <MunsellSpace/Core/Exception.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace MunsellSpace::Geometry {

namespace {

// Faces with |cross| below this (relative to size^2) have no usable plane
constexpr double DEGENERATE_FACE_TOLERANCE = 1e-14;

} // anonymous namespace

Polyhedron::Polyhedron(std::string name, std::vector<Point3d> vertices,
                       std::vector<TriangleFace> faces, size_t sampleCount)
    : name_(std::move(name)), vertices_(std::move(vertices)),
      faces_(std::move(faces)), sampleCount_(sampleCount) {
    if (vertices_.size() < 4) {
        throw InvalidArgumentException("Polyhedron '" + name_ + "': needs at least 4 vertices, got " +
                                       std::to_string(vertices_.size()));
    }
    if (faces_.size() < 4) {
        throw InvalidArgumentException("Polyhedron '" + name_ + "': needs at least 4 faces, got " +
                                       std::to_string(faces_.size()));
    }
    for (const auto& v : vertices_) {
        if (!v.IsValid()) {
            throw InvalidArgumentException("Polyhedron '" + name_ + "': vertex is not finite");
        }
    }
    for (const auto& f : faces_) {
        if (f.v0 >= vertices_.size() || f.v1 >= vertices_.size() || f.v2 >= vertices_.size()) {
            throw InvalidArgumentException("Polyhedron '" + name_ + "': face index out of range");
        }
    }
    Build();
}

void Polyhedron::Build() {
    // Bounding box and vertex mean
    Point3d lo = vertices_[0];
    Point3d hi = vertices_[0];
    Point3d mean;
    for (const auto& v : vertices_) {
        lo = {std::min(lo.x, v.x), std::min(lo.y, v.y), std::min(lo.z, v.z)};
        hi = {std::max(hi.x, v.x), std::max(hi.y, v.y), std::max(hi.z, v.z)};
        mean = mean + v;
    }
    mean = mean * (1.0 / static_cast<double>(vertices_.size()));
    size_ = lo.DistanceTo(hi);

    double areaTol = DEGENERATE_FACE_TOLERANCE * std::max(1.0, size_ * size_);

    planes_.clear();
    planes_.reserve(faces_.size());
    double volume6 = 0.0;
    Point3d weighted;

    for (auto& f : faces_) {
        const Point3d& a = vertices_[f.v0];
        Point3d n = (vertices_[f.v1] - a).Cross(vertices_[f.v2] - a);
        double len = n.Norm();
        if (len < areaTol) {
            continue;
        }
        n = n * (1.0 / len);
        if (n.Dot(mean - a) > 0.0) {
            std::swap(f.v1, f.v2);
            n = n * -1.0;
        }
        planes_.push_back({n, n.Dot(a)});

        // Tetrahedron (mean, a, b, c)
        const Point3d& b = vertices_[f.v1];
        const Point3d& c = vertices_[f.v2];
        double v6 = (a - mean).Dot((b - mean).Cross(c - mean));
        volume6 += v6;
        weighted = weighted + (mean + a + b + c) * (v6 * 0.25);
    }

    volume_ = volume6 / 6.0;
    centroid_ = (volume6 > 0.0) ? weighted * (1.0 / volume6) : mean;
}

size_t Polyhedron::EdgeCount() const {
    if (vertices_.empty()) return 0;
    return vertices_.size() + faces_.size() - 2;
}

double Polyhedron::SignedDistance(const Point3d& point) const {
    double worst = -std::numeric_limits<double>::infinity();
    for (const auto& plane : planes_) {
        worst = std::max(worst, plane.normal.Dot(point) - plane.offset);
    }
    return worst;
}

bool Polyhedron::Contains(const Point3d& point, double epsilon) const {
    if (planes_.empty() || !point.IsValid()) {
        return false;
    }
    double tol = epsilon * std::max(1.0, size_);
    for (const auto& plane : planes_) {
        if (plane.normal.Dot(point) - plane.offset > tol) {
            return false;
        }
    }
    return true;
}

} // namespace MunsellSpace::Geometry
