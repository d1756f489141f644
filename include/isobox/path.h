#pragma once

#include <isobox/geometry.h>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace isobox {

enum class PathVerb : uint8_t {
    MoveTo,
    LineTo,
    ArcTo,
    Close,
};

//=============================================================================
// PathCommand
//
//   MoveTo/LineTo: point = target
//   ArcTo:         center, radius, startAngle, sweepAngle (radians, measured
//                  in screen space so positive sweep turns +x toward +y);
//                  point = arc end
//   Close:         point = start of the current subpath
//=============================================================================
struct PathCommand {
    PathVerb verb = PathVerb::MoveTo;
    Point2D point;
    Point2D center;
    float radius = 0.0f;
    float startAngle = 0.0f;
    float sweepAngle = 0.0f;

    Point2D arcStart() const;
};

//=============================================================================
// Path - ordered drawing commands for one closed or open outline
//
// arcTo() connects to the arc start with an implicit straight line when the
// current point differs from it (an empty path starts at the arc start).
//=============================================================================
class Path {
public:
    void moveTo(Point2D p);
    void lineTo(Point2D p);
    void arcTo(Point2D center, float radius, float startAngle, float sweepAngle);
    void close();

    const std::vector<PathCommand>& commands() const { return _commands; }
    bool empty() const { return _commands.empty(); }
    size_t count(PathVerb verb) const;

    bool isClosed() const {
        return !_commands.empty() && _commands.back().verb == PathVerb::Close;
    }

    Point2D startPoint() const { return _start; }
    Point2D currentPoint() const { return _current; }

    // Polyline approximation; arcs are split into segmentsPerArc chords.
    // Closing back to the start point is not repeated.
    std::vector<Point2D> flatten(uint32_t segmentsPerArc = 8) const;

    Rect bounds() const;

private:
    std::vector<PathCommand> _commands;
    Point2D _start;
    Point2D _current;
};

} // namespace isobox
