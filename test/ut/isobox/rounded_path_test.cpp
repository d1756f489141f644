//=============================================================================
// Path + Rounded-Quad Path Builder Unit Tests
//
// Covers path bookkeeping (start/current point, verb counts, flattening),
// per-corner fillet geometry, radius limits and closure of rounded quads
// for both windings and for the projected top-face rhombus.
//=============================================================================

#include <boost/ut.hpp>

#include <isobox/path.h>
#include <isobox/projector.h>
#include <isobox/rounded-path.h>
#include "test_helpers.h"

#include <algorithm>
#include <cmath>
#include <vector>

using namespace boost::ut;
using namespace isobox;
using isobox::testing::near;

//=============================================================================
// Helpers
//=============================================================================

static const Quad SQUARE_CW = {Point2D{0, 0}, Point2D{10, 0}, Point2D{10, 10}, Point2D{0, 10}};
static const Quad SQUARE_CCW = {Point2D{0, 0}, Point2D{0, 10}, Point2D{10, 10}, Point2D{10, 0}};

// Top face of the default box at 30 degrees, scale 40, centered at (100, 100)
static Quad topRhombus() {
    auto at = [](float x, float y) { return Point2D{100, 100} + project(x, y, 2.0f, 30.0f) * 40.0f; };
    return {at(0, 0), at(3, 0), at(3, 3), at(0, 3)};
}

static std::vector<const PathCommand*> arcsOf(const Path& path) {
    std::vector<const PathCommand*> out;
    for (const auto& c : path.commands()) {
        if (c.verb == PathVerb::ArcTo) out.push_back(&c);
    }
    return out;
}

//=============================================================================
// Path
//=============================================================================

suite path_tests = [] {

    "empty path"_test = [] {
        Path p;
        expect(p.empty());
        expect(!p.isClosed());
        expect(p.flatten().empty());
    };

    "lines track start and current point"_test = [] {
        Path p;
        p.moveTo({1, 2});
        p.lineTo({5, 2});
        p.lineTo({5, 7});
        expect(near(p.startPoint(), {1, 2}));
        expect(near(p.currentPoint(), {5, 7}));
        p.close();
        expect(p.isClosed());
        expect(near(p.currentPoint(), {1, 2}));
        expect(p.count(PathVerb::LineTo) == 2u);
        expect(p.count(PathVerb::Close) == 1u);
    };

    "lineTo on empty path starts a subpath"_test = [] {
        Path p;
        p.lineTo({3, 4});
        expect(p.count(PathVerb::MoveTo) == 1u);
        expect(p.count(PathVerb::LineTo) == 0u);
    };

    "arcTo on empty path starts at the arc start"_test = [] {
        Path p;
        p.arcTo({0, 0}, 5.0f, 0.0f, PI / 2.0f);
        expect(near(p.startPoint(), {5, 0}));
        expect(near(p.currentPoint(), {0, 5}));
        expect(near(p.commands().front().arcStart(), {5, 0}));
    };

    "flatten and bounds of a half circle"_test = [] {
        Path p;
        p.arcTo({0, 0}, 2.0f, 0.0f, PI);
        auto pts = p.flatten(4);
        expect(pts.size() == 5u);
        auto b = p.bounds();
        expect(near(b.minX, -2.0f));
        expect(near(b.maxX, 2.0f));
        expect(near(b.minY, 0.0f));
        expect(near(b.maxY, 2.0f));
    };

    "close on empty path is ignored"_test = [] {
        Path p;
        p.close();
        expect(p.empty());
    };
};

//=============================================================================
// Corner fillets
//=============================================================================

suite fillet_tests = [] {

    "right angle corner"_test = [] {
        auto f = computeCornerFillet({0, 0}, {10, 0}, {10, 10}, 2.0f);
        expect(near(f.tangentIn, {8, 0}));
        expect(near(f.tangentOut, {10, 2}));
        expect(near(f.center, {8, 2}));
        expect(near(f.radius, 2.0f));
        expect(near(f.sweepAngle, PI / 2.0f));
        expect(near(f.startAngle, -PI / 2.0f));
    };

    "sweep follows the turning direction"_test = [] {
        auto f = computeCornerFillet({10, 10}, {10, 0}, {0, 0}, 2.0f);
        expect(near(f.sweepAngle, -PI / 2.0f));
        expect(near(f.tangentIn, {10, 2}));
        expect(near(f.tangentOut, {8, 0}));
    };

    "arc ends on the outgoing tangent point"_test = [] {
        Quad q = topRhombus();
        for (size_t i = 0; i < 4; ++i) {
            auto f = computeCornerFillet(q[(i + 3) % 4], q[i], q[(i + 1) % 4], 6.0f);
            Point2D end = f.center + Point2D{std::cos(f.startAngle + f.sweepAngle),
                                             std::sin(f.startAngle + f.sweepAngle)} * f.radius;
            expect(near(end, f.tangentOut, 0.01f)) << "corner" << i;
            expect(near(distance(f.center, f.tangentIn), 6.0f, 0.01f)) << "corner" << i;
        }
    };

    "zero radius collapses onto the corner"_test = [] {
        auto f = computeCornerFillet({0, 0}, {10, 0}, {10, 10}, 0.0f);
        expect(near(f.tangentIn, {10, 0}));
        expect(near(f.tangentOut, {10, 0}));
        expect(f.radius == 0.0f);
        expect(f.sweepAngle == 0.0f);
    };

    "zero-length edge collapses onto the corner"_test = [] {
        auto f = computeCornerFillet({10, 0}, {10, 0}, {10, 10}, 3.0f);
        expect(near(f.tangentIn, {10, 0}));
        expect(f.sweepAngle == 0.0f);
    };

    "straight corner has no fillet"_test = [] {
        auto f = computeCornerFillet({0, 0}, {5, 0}, {10, 0}, 3.0f);
        expect(f.sweepAngle == 0.0f);
        expect(near(f.center, {5, 0}));
    };
};

//=============================================================================
// Radius limits
//=============================================================================

suite max_radius_tests = [] {

    "square allows half the side"_test = [] {
        expect(near(maxCornerRadius(SQUARE_CW), 5.0f));
        expect(near(maxCornerRadius(SQUARE_CCW), 5.0f));
    };

    "rhombus is limited by its acute corners"_test = [] {
        // Edges are 120px; acute corners are 60 degrees
        float expected = 60.0f * std::tan(PI / 6.0f);
        expect(near(maxCornerRadius(topRhombus()), expected, 0.01f));
    };

    "degenerate quad allows nothing"_test = [] {
        Quad q = {Point2D{1, 1}, Point2D{1, 1}, Point2D{5, 1}, Point2D{5, 4}};
        expect(maxCornerRadius(q) == 0.0f);
    };
};

//=============================================================================
// Quad paths
//=============================================================================

suite quad_path_tests = [] {

    "straight quad"_test = [] {
        Path p = buildQuadPath(SQUARE_CW);
        expect(p.count(PathVerb::MoveTo) == 1u);
        expect(p.count(PathVerb::LineTo) == 3u);
        expect(p.isClosed());
        auto pts = p.flatten();
        expect(pts.size() == 4u);
        for (size_t i = 0; i < 4; ++i) expect(near(pts[i], SQUARE_CW[i]));
    };

    "rounded square is closed with four arcs and four lines"_test = [] {
        Path p = buildRoundedPath(SQUARE_CW, 2.0f);
        expect(p.isClosed());
        expect(p.count(PathVerb::ArcTo) == 4u);
        expect(p.count(PathVerb::LineTo) == 4u);
        expect(p.count(PathVerb::MoveTo) == 1u);
        expect(near(p.startPoint(), {2, 0}));

        // The last arc ends where the path started
        const PathCommand* last = arcsOf(p).back();
        expect(near(last->point, p.startPoint()));
    };

    "rounded square stays inside and rounds off the corners"_test = [] {
        Path p = buildRoundedPath(SQUARE_CW, 2.0f);
        auto b = p.bounds();
        expect(near(b.minX, 0.0f) && near(b.minY, 0.0f));
        expect(near(b.maxX, 10.0f) && near(b.maxY, 10.0f));

        // Arc midpoint sits r * (sqrt(2) - 1) away from its corner
        for (const PathCommand* arc : arcsOf(p)) {
            float mid = arc->startAngle + arc->sweepAngle * 0.5f;
            Point2D m = arc->center + Point2D{std::cos(mid), std::sin(mid)} * arc->radius;
            float best = 1e9f;
            for (const auto& c : SQUARE_CW) best = std::min(best, distance(m, c));
            expect(near(best, 2.0f * (std::sqrt(2.0f) - 1.0f)));
        }
    };

    "counter-clockwise winding rounds the same way"_test = [] {
        Path p = buildRoundedPath(SQUARE_CCW, 2.0f);
        expect(p.isClosed());
        for (const PathCommand* arc : arcsOf(p)) {
            expect(near(arc->sweepAngle, -PI / 2.0f));
        }
        auto b = p.bounds();
        expect(near(b.minX, 0.0f) && near(b.maxX, 10.0f));
        expect(near(arcsOf(p).back()->point, p.startPoint()));
    };

    "rhombus arcs turn a full circle in total"_test = [] {
        Path p = buildRoundedPath(topRhombus(), 6.0f);
        float total = 0.0f;
        for (const PathCommand* arc : arcsOf(p)) {
            expect(arc->sweepAngle > 0.0f);
            total += arc->sweepAngle;
        }
        expect(near(total, 2.0f * PI));
        expect(near(arcsOf(p).back()->point, p.startPoint(), 0.01f));
    };

    "zero radius matches the straight quad"_test = [] {
        Quad q = topRhombus();
        Path p = buildRoundedPath(q, 0.0f);
        expect(p.count(PathVerb::ArcTo) == 4u);
        for (const PathCommand* arc : arcsOf(p)) {
            expect(arc->radius == 0.0f);
            expect(arc->sweepAngle == 0.0f);
        }
        // Every flattened point is one of the corners, and all corners appear
        auto pts = p.flatten();
        for (const auto& pt : pts) {
            bool isCorner = false;
            for (const auto& c : q) isCorner = isCorner || near(pt, c);
            expect(isCorner);
        }
        for (const auto& c : q) {
            bool seen = false;
            for (const auto& pt : pts) seen = seen || near(pt, c);
            expect(seen);
        }
        auto b = p.bounds();
        auto s = buildQuadPath(q).bounds();
        expect(near(b.minX, s.minX) && near(b.maxX, s.maxX));
        expect(near(b.minY, s.minY) && near(b.maxY, s.maxY));
    };
};
