//=============================================================================
// Projector Unit Tests
//=============================================================================

#include <boost/ut.hpp>

#include <isobox/projector.h>
#include "test_helpers.h"

using namespace boost::ut;
using namespace isobox;
using isobox::testing::near;

suite projector_tests = [] {

    "angle 0 reduces to (x - y, -z)"_test = [] {
        auto p = project(1.0f, 2.0f, 3.0f, 0.0f);
        expect(p.x == -1.0f);
        expect(p.y == -3.0f);
    };

    "angle 90 collapses x and keeps x + y - z"_test = [] {
        auto p = project(1.0f, 2.0f, 3.0f, 90.0f);
        expect(near(p.x, 0.0f));
        expect(near(p.y, 0.0f));

        auto q = project(4.0f, 1.0f, 2.0f, 90.0f);
        expect(near(q.x, 0.0f));
        expect(near(q.y, 3.0f));
    };

    "angle 30 along the x axis"_test = [] {
        auto p = project(3.0f, 0.0f, 0.0f, 30.0f);
        expect(near(p.x, 3.0f * std::sqrt(3.0f) / 2.0f));
        expect(near(p.y, 1.5f));
    };

    "height only lifts the point"_test = [] {
        auto lo = project(1.5f, -2.0f, 0.0f, 30.0f);
        auto hi = project(1.5f, -2.0f, 1.0f, 30.0f);
        expect(near(hi.x, lo.x));
        expect(near(hi.y, lo.y - 1.0f));
    };

    "x and y mirror across the vertical axis"_test = [] {
        auto a = project(2.0f, 0.0f, 0.0f, 30.0f);
        auto b = project(0.0f, 2.0f, 0.0f, 30.0f);
        expect(near(a.x, -b.x));
        expect(near(a.y, b.y));
    };

    "Point3D overload matches scalar form"_test = [] {
        Point3D p{0.5f, 1.25f, -3.0f};
        expect(near(project(p, 42.0f), project(0.5f, 1.25f, -3.0f, 42.0f)));
    };
};
