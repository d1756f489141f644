#pragma once

#include <array>
#include <cmath>

namespace isobox {

constexpr float PI = 3.14159265358979323846f;

//=============================================================================
// Point2D - viewport space (pixels, y grows downward)
//=============================================================================
struct Point2D {
    float x = 0.0f;
    float y = 0.0f;

    Point2D operator+(const Point2D& o) const { return {x + o.x, y + o.y}; }
    Point2D operator-(const Point2D& o) const { return {x - o.x, y - o.y}; }
    Point2D operator*(float s) const { return {x * s, y * s}; }
    bool operator==(const Point2D& o) const { return x == o.x && y == o.y; }
    bool operator!=(const Point2D& o) const { return !(*this == o); }
};

//=============================================================================
// Point3D - scene space
//=============================================================================
struct Point3D {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    bool operator==(const Point3D& o) const { return x == o.x && y == o.y && z == o.z; }
    bool operator!=(const Point3D& o) const { return !(*this == o); }
};

struct Rect {
    float minX = 0.0f, minY = 0.0f;
    float maxX = 0.0f, maxY = 0.0f;

    float width() const { return maxX - minX; }
    float height() const { return maxY - minY; }
};

// Four corners in traversal order
using Quad = std::array<Point2D, 4>;

inline float dot(const Point2D& a, const Point2D& b) { return a.x * b.x + a.y * b.y; }

// z component of the 3D cross product
inline float cross(const Point2D& a, const Point2D& b) { return a.x * b.y - a.y * b.x; }

inline float length(const Point2D& v) { return std::sqrt(dot(v, v)); }

inline float distance(const Point2D& a, const Point2D& b) { return length(b - a); }

inline float degToRad(float deg) { return deg * (PI / 180.0f); }

} // namespace isobox
