#pragma once

#include <isobox/geometry.h>

namespace isobox {

//=============================================================================
// Oblique projection of scene space onto the screen plane
//
//   isoX = (x - y) * cos(angle)
//   isoY = (x + y) * sin(angle) - z
//
// Height (z) only lifts a point upward on screen; x and y both feed isoX
// and isoY. Total over all finite inputs.
//=============================================================================
Point2D project(float x, float y, float z, float angleDegrees);

inline Point2D project(const Point3D& p, float angleDegrees) {
    return project(p.x, p.y, p.z, angleDegrees);
}

} // namespace isobox
