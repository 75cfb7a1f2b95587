#pragma once

/**
 * @file Polyhedron.h
 * @brief Closed convex polyhedron in Munsell Cartesian space
 *
 * Faces are triangles of vertex indices. On construction every face is
 * oriented outward (relative to the vertex mean) and its plane is cached, so
 * point containment is a sequence of signed plane distances.
 */

#include <MunsellSpace/Core/Export.h>
#include <MunsellSpace/Core/Types.h>

#include <cstddef>
#include <string>
#include <vector>

namespace MunsellSpace::Geometry {

/// Relative tolerance of containment tests (scaled by the polyhedron size)
constexpr double DEFAULT_CONTAINMENT_EPSILON = 1e-9;

/**
 * @brief Triangular face (zero-based vertex indices)
 */
struct TriangleFace {
    size_t v0 = 0;
    size_t v1 = 0;
    size_t v2 = 0;

    TriangleFace() = default;
    TriangleFace(size_t a, size_t b, size_t c) : v0(a), v1(b), v2(c) {}

    bool operator==(const TriangleFace& other) const {
        return v0 == other.v0 && v1 == other.v1 && v2 == other.v2;
    }
};

/**
 * @brief Convex, closed triangle mesh
 */
class MUNSELLSPACE_API Polyhedron {
public:
    Polyhedron() = default;

    /**
     * @brief Build from vertices and faces
     *
     * Faces are reoriented so their normals point outward. Degenerate faces
     * (zero area) are kept in Faces() but contribute no plane.
     *
     * @param sampleCount Number of samples the polyhedron was built from
     * @throws InvalidArgumentException if there are fewer than 4 vertices or
     *         4 faces, a face index is out of range, or a vertex is not finite
     */
    Polyhedron(std::string name, std::vector<Point3d> vertices,
               std::vector<TriangleFace> faces, size_t sampleCount = 0);

    const std::string& Name() const { return name_; }
    const std::vector<Point3d>& Vertices() const { return vertices_; }
    const std::vector<TriangleFace>& Faces() const { return faces_; }
    size_t SampleCount() const { return sampleCount_; }

    size_t VertexCount() const { return vertices_.size(); }
    size_t FaceCount() const { return faces_.size(); }

    /// Edge count from Euler's formula (V - E + F = 2)
    size_t EdgeCount() const;

    bool Empty() const { return vertices_.empty(); }

    /**
     * @brief Point-in-polyhedron test
     *
     * Inside iff the signed distance to every outward face plane is at most
     * epsilon * max(1, Size()). Boundary points count as inside.
     */
    bool Contains(const Point3d& point, double epsilon = DEFAULT_CONTAINMENT_EPSILON) const;

    /**
     * @brief Largest signed distance to a face plane
     *
     * Negative inside, zero on the boundary, positive outside.
     */
    double SignedDistance(const Point3d& point) const;

    /// Enclosed volume
    double Volume() const { return volume_; }

    /// Centroid of the filled solid
    Point3d Centroid() const { return centroid_; }

    /// Bounding-box diagonal
    double Size() const { return size_; }

private:
    struct Plane {
        Point3d normal;     // Unit, outward
        double offset;      // normal . p for p on the plane
    };

    void Build();

    std::string name_;
    std::vector<Point3d> vertices_;
    std::vector<TriangleFace> faces_;
    size_t sampleCount_ = 0;

    std::vector<Plane> planes_;
    double volume_ = 0.0;
    Point3d centroid_;
    double size_ = 0.0;
};

} // namespace MunsellSpace::Geometry
