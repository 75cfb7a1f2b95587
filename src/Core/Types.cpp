#include <MunsellSpace/Core/Types.h>
#include <MunsellSpace/Core/Constants.h>
#include <algorithm>

namespace MunsellSpace {

// =============================================================================
// Segment2d Implementation
// =============================================================================

double Segment2d::DistanceToPoint(const Point2d& p) const {
    double t = std::clamp(ProjectPoint(p), 0.0, 1.0);
    return p.DistanceTo(PointAt(t));
}

double Segment2d::ProjectPoint(const Point2d& p) const {
    Point2d d = Direction();
    double lenSq = d.Dot(d);
    if (lenSq < EPSILON * EPSILON) {
        return 0.0;
    }
    return (p - p1).Dot(d) / lenSq;
}

} // namespace MunsellSpace
