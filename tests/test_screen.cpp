#include "loop/core/screen.hpp"
#include <catch2/catch_test_macros.hpp>
#include <vector>

using namespace loop;

namespace {

Screen make_screen(uint32_t id, double x, double y, double width, double height)
{
    Screen screen;
    screen.id = id;
    screen.name = "screen-" + std::to_string(id);
    screen.frame = { x, y, width, height };
    screen.visible_frame = screen.frame;
    return screen;
}

std::vector<Screen> make_dual_screens()
{
    return { make_screen(1, 0, 0, 1920, 1080), make_screen(2, 1920, 0, 1920, 1080) };
}

std::vector<Screen> make_triple_screens_horizontal()
{
    return {
        make_screen(1, 0, 0, 1920, 1080),
        make_screen(2, 1920, 0, 1920, 1080),
        make_screen(3, 3840, 0, 1920, 1080),
    };
}

std::vector<Screen> make_stacked_screens()
{
    return {
        make_screen(1, 0, 0, 1920, 1080),    // Top
        make_screen(2, 0, 1080, 1920, 1080), // Bottom
    };
}

} // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Lookup
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Screen containing a window frame", "[screen]")
{
    auto screens = make_dual_screens();

    SECTION("Fully inside one screen")
    {
        REQUIRE(screens::screen_containing(screens, { 2000, 100, 400, 300 })->id == 2);
    }

    SECTION("Straddling screens picks the larger intersection")
    {
        REQUIRE(screens::screen_containing(screens, { 1800, 100, 500, 300 })->id == 2);
        REQUIRE(screens::screen_containing(screens, { 1500, 100, 500, 300 })->id == 1);
    }

    SECTION("Off every screen falls back to the first")
    {
        REQUIRE(screens::screen_containing(screens, { 5000, 5000, 10, 10 })->id == 1);
    }

    SECTION("Single screen and empty list")
    {
        std::vector<Screen> single{ make_screen(7, 0, 0, 100, 100) };
        REQUIRE(screens::screen_containing(single, { 5000, 5000, 10, 10 })->id == 7);
        REQUIRE(screens::screen_containing({}, { 0, 0, 10, 10 }) == nullptr);
    }
}

TEST_CASE("Screen under a point", "[screen]")
{
    auto screens = make_dual_screens();

    REQUIRE(screens::screen_at(screens, { 1919, 10 })->id == 1);
    REQUIRE(screens::screen_at(screens, { 1920, 10 })->id == 2);
    REQUIRE(screens::screen_at(screens, { 100, 1080 }) == nullptr);
}

// ─────────────────────────────────────────────────────────────────────────────
// Ordering
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Screens are ordered top to bottom then left to right", "[screen]")
{
    std::vector<Screen> screens{
        make_screen(1, 1920, 1080, 1920, 1080),
        make_screen(2, 1920, 0, 1920, 1080),
        make_screen(3, 0, 1080, 1920, 1080),
        make_screen(4, 0, 0, 1920, 1080),
    };

    auto ordered = screens::ordered(screens);
    REQUIRE(ordered.size() == 4);
    REQUIRE(ordered[0].id == 4);
    REQUIRE(ordered[1].id == 2);
    REQUIRE(ordered[2].id == 3);
    REQUIRE(ordered[3].id == 1);
}

TEST_CASE("Next and previous screens wrap around", "[screen]")
{
    auto screens = make_triple_screens_horizontal();

    REQUIRE(screens::next_screen(screens, screens[0])->id == 2);
    REQUIRE(screens::next_screen(screens, screens[2])->id == 1);
    REQUIRE(screens::previous_screen(screens, screens[0])->id == 3);
    REQUIRE(screens::previous_screen(screens, screens[1])->id == 1);

    SECTION("Results point into the caller's list")
    {
        REQUIRE(screens::next_screen(screens, screens[0]) == &screens[1]);
    }

    SECTION("Single screen cycles to itself")
    {
        std::vector<Screen> single{ make_screen(9, 0, 0, 100, 100) };
        REQUIRE(screens::next_screen(single, single[0])->id == 9);
        REQUIRE(screens::previous_screen(single, single[0])->id == 9);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Directional switching
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Directional neighbour on a horizontal row", "[screen][directional]")
{
    auto screens = make_triple_screens_horizontal();

    REQUIRE(screens::directional_screen(screens, screens[0], edge::Right)->id == 2);
    REQUIRE(screens::directional_screen(screens, screens[1], edge::Right)->id == 3);
    REQUIRE(screens::directional_screen(screens, screens[1], edge::Left)->id == 1);

    SECTION("Wraps to the far end of the row")
    {
        REQUIRE(screens::directional_screen(screens, screens[2], edge::Right)->id == 1);
        REQUIRE(screens::directional_screen(screens, screens[0], edge::Left)->id == 3);
    }
}

TEST_CASE("Directional neighbour on a stacked column", "[screen][directional]")
{
    auto screens = make_stacked_screens();

    REQUIRE(screens::directional_screen(screens, screens[0], edge::Bottom)->id == 2);
    REQUIRE(screens::directional_screen(screens, screens[1], edge::Top)->id == 1);

    SECTION("Top and bottom wrap as well")
    {
        REQUIRE(screens::directional_screen(screens, screens[0], edge::Top)->id == 2);
        REQUIRE(screens::directional_screen(screens, screens[1], edge::Bottom)->id == 1);
    }
}

TEST_CASE("Neighbours need enough perpendicular overlap", "[screen][directional]")
{
    std::vector<Screen> screens{
        make_screen(1, 0, 0, 1920, 1080),
        make_screen(2, 1920, 1075, 1920, 1080), // Overlaps the first by 5 rows only
        make_screen(3, 1920, -500, 1280, 1024),
    };

    REQUIRE(screens::directional_screen(screens, screens[0], edge::Right)->id == 3);
}

TEST_CASE("Closest neighbour wins", "[screen][directional]")
{
    std::vector<Screen> screens{
        make_screen(1, 0, 0, 1920, 1080),
        make_screen(2, 4000, 0, 1920, 1080),
        make_screen(3, 1920, 0, 1920, 1080),
    };

    REQUIRE(screens::directional_screen(screens, screens[0], edge::Right)->id == 3);
}

TEST_CASE("Row extremes", "[screen]")
{
    auto screens = make_triple_screens_horizontal();

    REQUIRE(screens::leftmost_in_row(screens, screens[2], 10).id == 1);
    REQUIRE(screens::rightmost_in_row(screens, screens[0], 10).id == 3);

    SECTION("The edge screen is its own extreme")
    {
        REQUIRE(screens::leftmost_in_row(screens, screens[0], 10).id == 1);
        REQUIRE(screens::rightmost_in_row(screens, screens[2], 10).id == 3);
    }

    SECTION("Screens in another row are ignored")
    {
        auto stacked = make_stacked_screens();
        REQUIRE(screens::leftmost_in_row(stacked, stacked[1], 10).id == 2);
    }
}
