#pragma once

#include <isobox/geometry.h>
#include <isobox/path.h>

namespace isobox {

//=============================================================================
// CornerFillet - circular arc replacing one corner of a polygon
//
// The arc is tangent to the incoming edge at tangentIn and to the outgoing
// edge at tangentOut. sweepAngle carries the turning direction of the
// traversal, so the arc always rounds the corner off (never notches it).
// A zero radius, a zero-length edge or a straight corner collapses the
// fillet onto the corner point with zero sweep.
//=============================================================================
struct CornerFillet {
    Point2D corner;
    Point2D tangentIn;
    Point2D tangentOut;
    Point2D center;
    float radius = 0.0f;
    float startAngle = 0.0f;
    float sweepAngle = 0.0f;
};

CornerFillet computeCornerFillet(Point2D prev, Point2D corner, Point2D next,
                                 float radius);

// Largest radius for which no corner's tangent distance exceeds half of its
// shorter adjacent edge. 0 for degenerate quads.
float maxCornerRadius(const Quad& quad);

// Closed straight-edged quad p[0] -> p[1] -> p[2] -> p[3] -> close.
Path buildQuadPath(const Quad& quad);

// Closed quad p1 -> p2 -> p3 -> p4 with every corner rounded by cornerRadius.
// Starts on the p1 -> p2 edge just past p1 and holds four lines and four
// arcs. The radius is not clamped; use maxCornerRadius() first when the
// input is untrusted.
Path buildRoundedPath(Point2D p1, Point2D p2, Point2D p3, Point2D p4,
                      float cornerRadius);

inline Path buildRoundedPath(const Quad& quad, float cornerRadius) {
    return buildRoundedPath(quad[0], quad[1], quad[2], quad[3], cornerRadius);
}

} // namespace isobox
