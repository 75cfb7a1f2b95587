/**
 * @file ConvexHull3d.cpp
 * @brief Incremental 3D convex hull with horizon-edge stitching
 */

#include <MunsellSpace/Internal/ConvexHull3d.h>
#include <MunsellSpace/Core/Exception.h>

#include <algorithm>
#include <cmath>
#include <set>
#include <string>
#include <utility>

namespace MunsellSpace::Internal {

namespace {

struct Face {
    size_t v[3];
    Point3d normal;     // Unit, outward
    double offset;
    bool alive;
};

class HullBuilder {
public:
    HullBuilder(const std::vector<Point3d>& points, double eps)
        : points_(points), eps_(eps) {}

    void Seed(size_t i0, size_t i1, size_t i2, size_t i3) {
        interior_ = (points_[i0] + points_[i1] + points_[i2] + points_[i3]) * 0.25;
        AddFace(i0, i1, i2);
        AddFace(i0, i1, i3);
        AddFace(i0, i2, i3);
        AddFace(i1, i2, i3);
    }

    void Insert(size_t p) {
        const Point3d& pt = points_[p];

        std::set<std::pair<size_t, size_t>> visibleEdges;
        std::vector<size_t> visible;
        for (size_t f = 0; f < faces_.size(); ++f) {
            Face& face = faces_[f];
            if (!face.alive) continue;
            if (face.normal.Dot(pt) - face.offset > eps_) {
                visible.push_back(f);
                for (int k = 0; k < 3; ++k) {
                    visibleEdges.emplace(face.v[k], face.v[(k + 1) % 3]);
                }
            }
        }
        if (visible.empty()) return;

        // Horizon: directed edges of visible faces whose twin is not visible
        std::vector<std::pair<size_t, size_t>> horizon;
        for (size_t f : visible) {
            const Face& face = faces_[f];
            for (int k = 0; k < 3; ++k) {
                size_t a = face.v[k];
                size_t b = face.v[(k + 1) % 3];
                if (visibleEdges.count({b, a}) == 0) {
                    horizon.emplace_back(a, b);
                }
            }
            faces_[f].alive = false;
        }

        for (const auto& edge : horizon) {
            AddFace(edge.first, edge.second, p);
        }
    }

    std::vector<HullFace3d> Faces() const {
        std::vector<HullFace3d> out;
        for (const auto& face : faces_) {
            if (face.alive) {
                out.push_back({face.v[0], face.v[1], face.v[2]});
            }
        }
        return out;
    }

private:
    void AddFace(size_t a, size_t b, size_t c) {
        Point3d n = (points_[b] - points_[a]).Cross(points_[c] - points_[a]);
        double len = n.Norm();
        if (len > 0.0) n = n * (1.0 / len);
        if (n.Dot(interior_ - points_[a]) > 0.0) {
            std::swap(b, c);
            n = n * -1.0;
        }
        faces_.push_back({{a, b, c}, n, n.Dot(points_[a]), true});
    }

    const std::vector<Point3d>& points_;
    double eps_;
    Point3d interior_;
    std::vector<Face> faces_;
};

double DistanceToLine(const Point3d& p, const Point3d& a, const Point3d& b) {
    Point3d d = b - a;
    return (p - a).Cross(d).Norm() / d.Norm();
}

} // anonymous namespace

std::vector<HullFace3d> ConvexHull3d(const std::vector<Point3d>& points) {
    size_t n = points.size();
    if (n < 4) {
        throw InsufficientDataException("convex hull needs at least 4 points, got " +
                                        std::to_string(n));
    }
    for (const auto& p : points) {
        if (!p.IsValid()) {
            throw InvalidArgumentException("convex hull: point is not finite");
        }
    }

    Point3d lo = points[0];
    Point3d hi = points[0];
    for (const auto& p : points) {
        lo = {std::min(lo.x, p.x), std::min(lo.y, p.y), std::min(lo.z, p.z)};
        hi = {std::max(hi.x, p.x), std::max(hi.y, p.y), std::max(hi.z, p.z)};
    }
    double eps = HULL_RELATIVE_TOLERANCE * std::max(1.0, lo.DistanceTo(hi));

    // Maximal initial tetrahedron; ties resolve to the lowest index
    size_t i0 = 0;
    for (size_t i = 1; i < n; ++i) {
        if (points[i].x < points[i0].x) i0 = i;
    }

    size_t i1 = i0;
    double best = 0.0;
    for (size_t i = 0; i < n; ++i) {
        double d = points[i].DistanceTo(points[i0]);
        if (d > best) { best = d; i1 = i; }
    }
    if (best <= eps) {
        throw InsufficientDataException("convex hull: points are coincident");
    }

    size_t i2 = i0;
    best = 0.0;
    for (size_t i = 0; i < n; ++i) {
        double d = DistanceToLine(points[i], points[i0], points[i1]);
        if (d > best) { best = d; i2 = i; }
    }
    if (best <= eps) {
        throw InsufficientDataException("convex hull: points are collinear");
    }

    Point3d normal = (points[i1] - points[i0]).Cross(points[i2] - points[i0]);
    normal = normal * (1.0 / normal.Norm());
    size_t i3 = i0;
    best = 0.0;
    for (size_t i = 0; i < n; ++i) {
        double d = std::abs(normal.Dot(points[i] - points[i0]));
        if (d > best) { best = d; i3 = i; }
    }
    if (best <= eps) {
        throw InsufficientDataException("convex hull: points are coplanar");
    }

    HullBuilder builder(points, eps);
    builder.Seed(i0, i1, i2, i3);
    for (size_t i = 0; i < n; ++i) {
        if (i == i0 || i == i1 || i == i2 || i == i3) continue;
        builder.Insert(i);
    }
    return builder.Faces();
}

std::vector<size_t> ConvexHull3dIndices(const std::vector<Point3d>& points) {
    std::vector<size_t> indices;
    for (const auto& face : ConvexHull3d(points)) {
        indices.push_back(face.a);
        indices.push_back(face.b);
        indices.push_back(face.c);
    }
    std::sort(indices.begin(), indices.end());
    indices.erase(std::unique(indices.begin(), indices.end()), indices.end());
    return indices;
}

} // namespace MunsellSpace::Internal
