#pragma once

#include <isobox/geometry.h>
#include <cmath>

namespace isobox::testing {

constexpr float EPS = 1e-3f;

inline bool near(float a, float b, float eps = EPS) {
    return std::abs(a - b) <= eps;
}

inline bool near(const Point2D& a, const Point2D& b, float eps = EPS) {
    return near(a.x, b.x, eps) && near(a.y, b.y, eps);
}

} // namespace isobox::testing
