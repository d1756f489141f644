#include <isobox/rounded-path.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>

namespace isobox {
namespace {

constexpr float EPSILON = 1e-6f;

//=============================================================================
// Edge directions and interior angle at one corner
//=============================================================================
struct CornerFrame {
    Point2D toPrev;   // unit vector along the incoming edge, pointing back
    Point2D toNext;   // unit vector along the outgoing edge
    float lenPrev = 0.0f;
    float lenNext = 0.0f;
    float interior = 0.0f;  // radians, in [0, PI]
};

bool cornerFrame(Point2D prev, Point2D corner, Point2D next, CornerFrame& out) {
    Point2D a = prev - corner;
    Point2D b = next - corner;
    out.lenPrev = length(a);
    out.lenNext = length(b);
    if (out.lenPrev < EPSILON || out.lenNext < EPSILON) return false;

    out.toPrev = a * (1.0f / out.lenPrev);
    out.toNext = b * (1.0f / out.lenNext);
    float c = std::clamp(dot(out.toPrev, out.toNext), -1.0f, 1.0f);
    out.interior = std::acos(c);
    return true;
}

bool isStraight(const CornerFrame& f) { return PI - f.interior < EPSILON; }
bool isFolded(const CornerFrame& f) { return f.interior < EPSILON; }

} // namespace

CornerFillet computeCornerFillet(Point2D prev, Point2D corner, Point2D next,
                                 float radius) {
    CornerFillet f;
    f.corner = corner;
    f.tangentIn = corner;
    f.tangentOut = corner;
    f.center = corner;

    CornerFrame frame;
    if (radius <= 0.0f || !cornerFrame(prev, corner, next, frame)) return f;
    if (isStraight(frame) || isFolded(frame)) return f;

    float half = frame.interior * 0.5f;
    float tangentDist = radius / std::tan(half);
    float centerDist = radius / std::sin(half);

    Point2D bisector = frame.toPrev + frame.toNext;
    bisector = bisector * (1.0f / length(bisector));

    f.tangentIn = corner + frame.toPrev * tangentDist;
    f.tangentOut = corner + frame.toNext * tangentDist;
    f.center = corner + bisector * centerDist;
    f.radius = radius;

    Point2D startDir = f.tangentIn - f.center;
    f.startAngle = std::atan2(startDir.y, startDir.x);

    // The radius vector turns with the direction of travel
    float turn = cross(corner - prev, next - corner);
    f.sweepAngle = (turn >= 0.0f ? 1.0f : -1.0f) * (PI - frame.interior);
    return f;
}

float maxCornerRadius(const Quad& quad) {
    float limit = std::numeric_limits<float>::max();
    for (size_t i = 0; i < 4; ++i) {
        const Point2D& prev = quad[(i + 3) % 4];
        const Point2D& next = quad[(i + 1) % 4];

        CornerFrame frame;
        if (!cornerFrame(prev, quad[i], next, frame)) return 0.0f;
        if (isFolded(frame)) return 0.0f;
        if (isStraight(frame)) continue;

        float shorter = std::min(frame.lenPrev, frame.lenNext);
        limit = std::min(limit, shorter * 0.5f * std::tan(frame.interior * 0.5f));
    }
    return limit == std::numeric_limits<float>::max() ? 0.0f : limit;
}

Path buildQuadPath(const Quad& quad) {
    Path path;
    path.moveTo(quad[0]);
    path.lineTo(quad[1]);
    path.lineTo(quad[2]);
    path.lineTo(quad[3]);
    path.close();
    return path;
}

Path buildRoundedPath(Point2D p1, Point2D p2, Point2D p3, Point2D p4,
                      float cornerRadius) {
    const std::array<Point2D, 4> pts = {p1, p2, p3, p4};
    std::array<CornerFillet, 4> fillets;
    for (size_t i = 0; i < 4; ++i) {
        fillets[i] = computeCornerFillet(pts[(i + 3) % 4], pts[i], pts[(i + 1) % 4],
                                         cornerRadius);
    }

    Path path;
    path.moveTo(fillets[0].tangentOut);
    // Corners p2, p3, p4, then back around to p1
    for (size_t k = 1; k <= 4; ++k) {
        const CornerFillet& f = fillets[k % 4];
        path.lineTo(f.tangentIn);
        path.arcTo(f.center, f.radius, f.startAngle, f.sweepAngle);
    }
    path.close();
    return path;
}

} // namespace isobox
