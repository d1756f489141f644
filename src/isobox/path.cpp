#include <isobox/path.h>

#include <algorithm>
#include <cmath>

namespace isobox {

static Point2D pointOnCircle(Point2D center, float radius, float angle) {
    return {center.x + radius * std::cos(angle), center.y + radius * std::sin(angle)};
}

Point2D PathCommand::arcStart() const {
    return pointOnCircle(center, radius, startAngle);
}

void Path::moveTo(Point2D p) {
    _commands.push_back({PathVerb::MoveTo, p});
    _start = p;
    _current = p;
}

void Path::lineTo(Point2D p) {
    if (_commands.empty()) {
        moveTo(p);
        return;
    }
    _commands.push_back({PathVerb::LineTo, p});
    _current = p;
}

void Path::arcTo(Point2D center, float radius, float startAngle, float sweepAngle) {
    PathCommand cmd;
    cmd.verb = PathVerb::ArcTo;
    cmd.center = center;
    cmd.radius = radius;
    cmd.startAngle = startAngle;
    cmd.sweepAngle = sweepAngle;
    cmd.point = pointOnCircle(center, radius, startAngle + sweepAngle);

    if (_commands.empty()) {
        _start = cmd.arcStart();
    }
    _commands.push_back(cmd);
    _current = cmd.point;
}

void Path::close() {
    if (_commands.empty()) return;
    _commands.push_back({PathVerb::Close, _start});
    _current = _start;
}

size_t Path::count(PathVerb verb) const {
    return static_cast<size_t>(std::count_if(
        _commands.begin(), _commands.end(),
        [verb](const PathCommand& c) { return c.verb == verb; }));
}

std::vector<Point2D> Path::flatten(uint32_t segmentsPerArc) const {
    std::vector<Point2D> out;
    if (segmentsPerArc == 0) segmentsPerArc = 1;

    for (const auto& cmd : _commands) {
        switch (cmd.verb) {
            case PathVerb::MoveTo:
            case PathVerb::LineTo:
                out.push_back(cmd.point);
                break;
            case PathVerb::ArcTo:
                for (uint32_t i = 0; i <= segmentsPerArc; ++i) {
                    float t = static_cast<float>(i) / static_cast<float>(segmentsPerArc);
                    out.push_back(pointOnCircle(cmd.center, cmd.radius,
                                                cmd.startAngle + cmd.sweepAngle * t));
                }
                break;
            case PathVerb::Close:
                break;
        }
    }
    return out;
}

Rect Path::bounds() const {
    auto pts = flatten();
    if (pts.empty()) return {};

    Rect r{pts[0].x, pts[0].y, pts[0].x, pts[0].y};
    for (const auto& p : pts) {
        r.minX = std::min(r.minX, p.x);
        r.minY = std::min(r.minY, p.y);
        r.maxX = std::max(r.maxX, p.x);
        r.maxY = std::max(r.maxY, p.y);
    }
    return r;
}

} // namespace isobox
