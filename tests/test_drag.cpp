#include "fake_window_system.hpp"
#include "loop/drag/drag_observer.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace loop;
using namespace loop::test;

namespace {

constexpr uint16_t LEFT_HELD = 1;

struct DragFixture
{
    DragFixture()
    {
        h.config.stash.animate = false;
        window = h.windows.add_window(1, { 100, 100, 400, 300 });
        apply(make_action(Direction::TopHalf));
        observer.start();
    }

    void apply(Action const& action)
    {
        FrameState state;
        h.engine.apply(window, action, h.windows.screen_list.front(), state);
    }

    /// Starts a drag at from and moves past the threshold.
    void begin_drag(Point from)
    {
        h.move_pointer(from, LEFT_HELD);
        h.move_pointer({ from.x + 10, from.y }, LEFT_HELD);
    }

    Harness h;
    FakeWindowPtr window;
    DragObserver observer{ h.config, h.windows, h.engine, h.history, h.stash, h.pointer_events };
};

} // namespace

TEST_CASE("Moving a window drops its history", "[drag]")
{
    DragFixture f;
    REQUIRE(f.observer.running());
    REQUIRE(f.window->frame() == Rect{ 0, 0, 1000, 400 });

    f.begin_drag({ 500, 200 });
    f.window->set_frame({ 50, 50, 1000, 400 });
    f.h.move_pointer({ 560, 250 }, LEFT_HELD);

    REQUIRE_FALSE(f.h.history.has_been_recorded(1));
    REQUIRE(f.window->frame() == Rect{ 50, 50, 1000, 400 });
}

TEST_CASE("Small or partial changes are not a move", "[drag]")
{
    DragFixture f;
    f.begin_drag({ 500, 200 });

    SECTION("Within the corner tolerance")
    {
        f.window->set_frame({ 5, 5, 1000, 400 });
    }

    SECTION("Edge resize keeps a corner in place")
    {
        f.window->set_frame({ 0, 0, 1100, 450 });
    }

    f.h.move_pointer({ 560, 250 }, LEFT_HELD);
    REQUIRE(f.h.history.has_been_recorded(1));
}

TEST_CASE("Pointer travel below the threshold is not a drag", "[drag]")
{
    DragFixture f;

    f.h.move_pointer({ 500, 200 }, LEFT_HELD);
    f.h.move_pointer({ 503, 200 }, LEFT_HELD);

    // The window moves, but no drag was detected to notice it
    f.window->set_frame({ 50, 50, 1000, 400 });
    f.h.move_pointer({ 504, 200 }, LEFT_HELD);
    REQUIRE(f.h.history.has_been_recorded(1));

    SECTION("Crossing it later starts the drag")
    {
        f.h.move_pointer({ 520, 200 }, LEFT_HELD);
        f.window->set_frame({ 100, 100, 1000, 400 });
        f.h.move_pointer({ 560, 250 }, LEFT_HELD);
        REQUIRE_FALSE(f.h.history.has_been_recorded(1));
    }
}

TEST_CASE("Releasing the button ends the drag", "[drag]")
{
    DragFixture f;

    // Starts over empty space, so nothing is watched
    f.begin_drag({ 500, 600 });

    SECTION("Button up")
    {
        f.h.release_button(1);
    }

    SECTION("Move without the button")
    {
        f.h.move_pointer({ 500, 620 });
    }

    f.begin_drag({ 500, 200 });
    f.window->set_frame({ 50, 50, 1000, 400 });
    f.h.move_pointer({ 560, 250 }, LEFT_HELD);
    REQUIRE_FALSE(f.h.history.has_been_recorded(1));
}

TEST_CASE("Dragging can restore the initial size", "[drag]")
{
    DragFixture f;
    f.h.config.behavior.restore_window_frame_on_drag = true;

    f.begin_drag({ 500, 200 });
    f.window->set_frame({ 50, 50, 1000, 400 });
    f.h.move_pointer({ 560, 250 }, LEFT_HELD);

    // Initial 400x300, moved under the cursor
    REQUIRE(f.window->frame() == Rect{ 360, 50, 400, 300 });
    REQUIRE_FALSE(f.h.history.has_been_recorded(1));

    SECTION("Only once per drag")
    {
        int calls = f.window->set_frame_calls;
        f.h.move_pointer({ 600, 260 }, LEFT_HELD);
        REQUIRE(f.window->set_frame_calls == calls);
    }
}

TEST_CASE("Dragging a stashed window releases it", "[drag][stash]")
{
    DragFixture f;
    CustomFrame frame;
    frame.anchor = CustomAnchor::Left;
    frame.width = 40;
    frame.height = 100;
    f.apply(make_custom_action(Direction::Stash, frame));
    REQUIRE(f.h.stash.managed(1));

    f.begin_drag({ 5, 400 });
    f.window->set_frame({ 200, 100, 400, 800 });
    f.h.move_pointer({ 300, 500 }, LEFT_HELD);

    REQUIRE_FALSE(f.h.stash.managed(1));
    REQUIRE_FALSE(f.h.history.has_been_recorded(1));
}

TEST_CASE("Excluded applications are never watched", "[drag]")
{
    DragFixture f;
    f.h.config.behavior.excluded_apps = { "App" };

    f.begin_drag({ 500, 200 });
    f.window->set_frame({ 50, 50, 1000, 400 });
    f.h.move_pointer({ 560, 250 }, LEFT_HELD);

    REQUIRE(f.h.history.has_been_recorded(1));
}

TEST_CASE("Stopped observers ignore the pointer", "[drag]")
{
    DragFixture f;
    f.observer.stop();
    REQUIRE_FALSE(f.observer.running());

    f.begin_drag({ 500, 200 });
    f.window->set_frame({ 50, 50, 1000, 400 });
    f.h.move_pointer({ 560, 250 }, LEFT_HELD);

    REQUIRE(f.h.history.has_been_recorded(1));
}

// ─────────────────────────────────────────────────────────────────────────────
// Snapping
// ─────────────────────────────────────────────────────────────────────────────

namespace {

/// Drags the window off its frame and brings the cursor to to.
void drag_window_to(DragFixture& f, Point to)
{
    f.begin_drag({ 500, 200 });
    f.window->set_frame({ 50, 50, 1000, 400 });
    f.h.move_pointer(to, LEFT_HELD);
}

} // namespace

TEST_CASE("Dropping a window on a screen edge snaps it", "[drag][snap]")
{
    DragFixture f;
    f.h.config.behavior.window_snapping = true;

    SECTION("Left edge")
    {
        drag_window_to(f, { 0, 400 });
        REQUIRE(f.window->frame() == Rect{ 50, 50, 1000, 400 });

        f.h.release_button(1);
        REQUIRE(f.window->frame() == Rect{ 0, 0, 500, 800 });
        REQUIRE(f.h.history.has_been_recorded(1));
    }

    SECTION("Corner")
    {
        drag_window_to(f, { 999, 20 });
        f.h.release_button(1);
        REQUIRE(f.window->frame() == Rect{ 500, 0, 500, 400 });
    }

    SECTION("Release noticed on the next move")
    {
        drag_window_to(f, { 0, 400 });
        f.h.move_pointer({ 0, 400 });
        REQUIRE(f.window->frame() == Rect{ 0, 0, 500, 800 });
    }

    SECTION("Leaving the edge before release")
    {
        drag_window_to(f, { 0, 400 });
        f.h.move_pointer({ 400, 400 }, LEFT_HELD);
        f.h.release_button(1);
        REQUIRE(f.window->frame() == Rect{ 50, 50, 1000, 400 });
    }

    SECTION("On the screen under the cursor")
    {
        f.h.windows.screen_list.push_back(make_screen(2, "right", { 1000, 0, 1000, 800 }));
        drag_window_to(f, { 1999, 400 });
        // The window follows the cursor onto the other screen
        f.window->set_frame({ 1400, 100, 1000, 400 });
        f.h.release_button(1);
        REQUIRE(f.window->frame() == Rect{ 1500, 0, 500, 800 });
    }
}

TEST_CASE("Only moved windows snap", "[drag][snap]")
{
    DragFixture f;
    f.h.config.behavior.window_snapping = true;

    f.begin_drag({ 500, 200 });
    f.h.move_pointer({ 0, 400 }, LEFT_HELD);
    f.h.release_button(1);

    REQUIRE(f.window->frame() == Rect{ 0, 0, 1000, 400 });
}

TEST_CASE("Snapping is off by default", "[drag][snap]")
{
    DragFixture f;
    REQUIRE_FALSE(f.h.config.behavior.window_snapping);

    drag_window_to(f, { 0, 400 });
    f.h.release_button(1);

    REQUIRE(f.window->frame() == Rect{ 50, 50, 1000, 400 });
    REQUIRE_FALSE(f.h.history.has_been_recorded(1));
}
