#include "loop/core/geometry.hpp"
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

using namespace loop;
using Catch::Matchers::WithinAbs;

TEST_CASE("Intersection of overlapping and disjoint rects", "[geometry]")
{
    Rect a{ 0, 0, 100, 100 };
    Rect b{ 50, 25, 100, 100 };

    REQUIRE(geometry::intersection(a, b) == Rect{ 50, 25, 50, 75 });
    REQUIRE(geometry::intersects(a, b));

    SECTION("Touching edges do not intersect")
    {
        Rect c{ 100, 0, 50, 50 };
        REQUIRE_FALSE(geometry::intersects(a, c));
        REQUIRE(geometry::intersection(a, c) == Rect{});
    }
}

TEST_CASE("Point containment is half-open", "[geometry]")
{
    Rect rect{ 10, 10, 100, 50 };

    REQUIRE(geometry::contains(rect, Point{ 10, 10 }));
    REQUIRE(geometry::contains(rect, Point{ 109.5, 59.5 }));
    REQUIRE_FALSE(geometry::contains(rect, Point{ 110, 30 }));
    REQUIRE_FALSE(geometry::contains(rect, Point{ 50, 60 }));
}

TEST_CASE("Rect containment includes shared edges", "[geometry]")
{
    Rect outer{ 0, 0, 100, 100 };

    REQUIRE(geometry::contains(outer, outer));
    REQUIRE(geometry::contains(outer, Rect{ 10, 10, 90, 90 }));
    REQUIRE_FALSE(geometry::contains(outer, Rect{ 10, 10, 91, 90 }));
}

TEST_CASE("push_inside moves without resizing", "[geometry]")
{
    Rect bounds{ 0, 0, 1000, 800 };

    REQUIRE(geometry::push_inside({ 900, 700, 200, 200 }, bounds) == Rect{ 800, 600, 200, 200 });
    REQUIRE(geometry::push_inside({ -50, -20, 200, 200 }, bounds) == Rect{ 0, 0, 200, 200 });
    REQUIRE(geometry::push_inside({ 100, 100, 200, 200 }, bounds) == Rect{ 100, 100, 200, 200 });

    SECTION("Oversized rects align to the top-left")
    {
        REQUIRE(geometry::push_inside({ 300, 300, 1200, 900 }, bounds) == Rect{ 0, 0, 1200, 900 });
    }
}

TEST_CASE("Edge insets", "[geometry]")
{
    Rect rect{ 100, 100, 200, 200 };

    REQUIRE(geometry::inset_edges(rect, edge::Top, 10) == Rect{ 100, 110, 200, 190 });
    REQUIRE(geometry::inset_edges(rect, edge::Left | edge::Right, 10) == Rect{ 110, 100, 180, 200 });
    REQUIRE(geometry::inset_edges(rect, edge::All, -5) == Rect{ 95, 95, 210, 210 });
    REQUIRE(geometry::inset_edges(rect, edge::Empty, 10) == rect);

    REQUIRE(geometry::inset_by(rect, 10, 20) == Rect{ 110, 120, 180, 160 });
}

TEST_CASE("Uniform inset keeps a minimum size around the centre", "[geometry]")
{
    Rect rect{ 100, 100, 200, 200 };

    REQUIRE(geometry::inset_all(rect, 20, { 50, 50 }) == Rect{ 120, 120, 160, 160 });
    REQUIRE(geometry::inset_all(rect, 90, { 50, 50 }) == Rect{ 175, 175, 50, 50 });
    REQUIRE(geometry::inset_all(rect, -10, { 50, 50 }) == Rect{ 90, 90, 220, 220 });
}

TEST_CASE("Edges touching bounds within one unit", "[geometry]")
{
    Rect bounds{ 0, 0, 1000, 800 };

    REQUIRE(geometry::edges_touching({ 0, 0, 500, 800 }, bounds) == (edge::Left | edge::Top | edge::Bottom));
    REQUIRE(geometry::edges_touching({ 1, 0.5, 998.5, 799 }, bounds) == edge::All);
    REQUIRE(geometry::edges_touching({ 2, 2, 996, 796 }, bounds) == edge::Empty);
}

TEST_CASE("Rounding and tolerance helpers", "[geometry]")
{
    REQUIRE(geometry::integral({ 0.4, 0.6, 99.5, 100.49 }) == Rect{ 0, 1, 100, 100 });

    REQUIRE(geometry::approx_equal(Rect{ 0, 0, 100, 100 }, Rect{ 2, -2, 98, 102 }, 2));
    REQUIRE_FALSE(geometry::approx_equal(Rect{ 0, 0, 100, 100 }, Rect{ 0, 0, 103, 100 }, 2));

    REQUIRE(geometry::area({ 0, 0, 10, 20 }) == 200);
    REQUIRE(geometry::area({ 0, 0, -10, 20 }) == 0);
}

TEST_CASE("Angles use screen orientation", "[geometry]")
{
    Point origin{ 100, 100 };

    REQUIRE_THAT(geometry::angle_degrees(origin, { 200, 100 }), WithinAbs(0, 1e-9));
    REQUIRE_THAT(geometry::angle_degrees(origin, { 100, 200 }), WithinAbs(90, 1e-9));
    REQUIRE_THAT(geometry::angle_degrees(origin, { 0, 100 }), WithinAbs(180, 1e-9));
    REQUIRE_THAT(geometry::angle_degrees(origin, { 100, 0 }), WithinAbs(270, 1e-9));
    REQUIRE_THAT(geometry::angle_degrees(origin, { 200, 0 }), WithinAbs(315, 1e-9));

    REQUIRE_THAT(geometry::distance(origin, { 103, 104 }), WithinAbs(5, 1e-9));
}
