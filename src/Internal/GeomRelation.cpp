/**
 * @file GeomRelation.cpp
 * @brief Implementation of point-polygon relationship functions
 */

#include <MunsellSpace/Internal/GeomRelation.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace MunsellSpace::Internal {

// =============================================================================
// Point-Segment
// =============================================================================

bool PointOnSegment(const Point2d& point, const Segment2d& segment, double tolerance) {
    double len = segment.Length();
    if (len < tolerance) {
        return point.DistanceTo(segment.p1) <= tolerance;
    }

    // Perpendicular distance to the supporting line
    Point2d d = segment.Direction();
    double lineDist = std::abs(d.Cross(point - segment.p1)) / len;
    if (lineDist > tolerance) {
        return false;
    }

    double t = segment.ProjectPoint(point);
    double tTol = tolerance / len;
    return t >= -tTol && t <= 1.0 + tTol;
}

// =============================================================================
// Point-Polygon
// =============================================================================

PointPolygonRelation PointInPolygon(const Point2d& point, const std::vector<Point2d>& polygon,
                                     double tolerance) {
    if (polygon.size() < 3) return PointPolygonRelation::Outside;

    if (PointOnPolygonBoundary(point, polygon, tolerance)) {
        return PointPolygonRelation::OnBoundary;
    }

    // Ray casting towards +x
    int n = static_cast<int>(polygon.size());
    int crossings = 0;

    for (int i = 0; i < n; ++i) {
        const Point2d& p1 = polygon[i];
        const Point2d& p2 = polygon[(i + 1) % n];

        if ((p1.y <= point.y && p2.y > point.y) || (p2.y <= point.y && p1.y > point.y)) {
            double t = (point.y - p1.y) / (p2.y - p1.y);
            double xIntersect = p1.x + t * (p2.x - p1.x);

            if (point.x < xIntersect) {
                crossings++;
            }
        }
    }

    return (crossings % 2 == 1) ? PointPolygonRelation::Inside : PointPolygonRelation::Outside;
}

bool PointOnPolygonBoundary(const Point2d& point, const std::vector<Point2d>& polygon,
                            double tolerance) {
    return !EdgesThroughPoint(point, polygon, tolerance).empty();
}

double PointToPolygonBoundaryDistance(const Point2d& point, const std::vector<Point2d>& polygon) {
    double best = std::numeric_limits<double>::infinity();
    int n = static_cast<int>(polygon.size());
    if (n == 1) {
        return point.DistanceTo(polygon[0]);
    }
    for (int i = 0; i < n; ++i) {
        Segment2d edge(polygon[i], polygon[(i + 1) % n]);
        best = std::min(best, edge.DistanceToPoint(point));
    }
    return best;
}

std::vector<int> EdgesThroughPoint(const Point2d& point, const std::vector<Point2d>& polygon,
                                   double tolerance) {
    std::vector<int> edges;
    int n = static_cast<int>(polygon.size());
    if (n < 2) return edges;
    for (int i = 0; i < n; ++i) {
        Segment2d edge(polygon[i], polygon[(i + 1) % n]);
        if (PointOnSegment(point, edge, tolerance)) {
            edges.push_back(i);
        }
    }
    return edges;
}

} // namespace MunsellSpace::Internal
