#include "fake_window_system.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace loop;
using namespace loop::test;
using namespace std::chrono_literals;

namespace {

struct EngineFixture
{
    EngineFixture() { window = h.windows.add_window(1, { 100, 100, 400, 300 }); }

    void apply(Direction direction) { apply(make_action(direction)); }

    void apply(Action const& action, std::optional<Screen> screen = std::nullopt)
    {
        FrameState state;
        state.last_target_frame = window->frame();
        h.engine.apply(window, action, screen.value_or(h.windows.screen_list.front()), state);
    }

    Harness h;
    FakeWindowPtr window;
};

} // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Non-geometric directions
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Window state directions toggle", "[engine]")
{
    EngineFixture f;

    f.apply(Direction::Minimize);
    REQUIRE(f.window->is_minimized);
    f.apply(Direction::Minimize);
    REQUIRE_FALSE(f.window->is_minimized);

    f.apply(Direction::Hide);
    REQUIRE(f.window->is_application_hidden);

    f.apply(Direction::Fullscreen);
    REQUIRE(f.window->is_fullscreen);
    f.apply(Direction::Fullscreen);
    REQUIRE_FALSE(f.window->is_fullscreen);

    REQUIRE(f.window->set_frame_calls == 0);
    REQUIRE(f.window->activations == 0);
}

TEST_CASE("Minimize others leaves only the target", "[engine]")
{
    EngineFixture f;
    auto second = f.h.windows.add_window(2, { 0, 0, 200, 200 });
    auto third = f.h.windows.add_window(3, { 300, 300, 200, 200 });
    third->is_application_hidden = true;

    f.apply(Direction::MinimizeOthers);

    REQUIRE_FALSE(f.window->is_minimized);
    REQUIRE(second->is_minimized);
    REQUIRE_FALSE(third->is_minimized);
}

TEST_CASE("No action touches nothing", "[engine]")
{
    EngineFixture f;

    f.apply(Direction::NoAction);
    REQUIRE(f.window->set_frame_calls == 0);
    REQUIRE_FALSE(f.h.history.has_been_recorded(1));
}

// ─────────────────────────────────────────────────────────────────────────────
// Resizing
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Applying an action resizes, focuses and records", "[engine]")
{
    EngineFixture f;

    f.apply(Direction::TopHalf);

    REQUIRE(f.window->frame() == Rect{ 0, 0, 1000, 400 });
    REQUIRE(f.window->activations == 1);
    REQUIRE(f.h.history.current_action(1)->direction == Direction::TopHalf);
    REQUIRE(f.h.history.initial_frame(1) == Rect{ 100, 100, 400, 300 });

    SECTION("Focusing can be turned off")
    {
        f.h.config.behavior.focus_window_on_resize = false;
        f.apply(Direction::BottomHalf);
        REQUIRE(f.window->activations == 1);
    }
}

TEST_CASE("Resizing leaves fullscreen", "[engine]")
{
    EngineFixture f;
    f.window->is_fullscreen = true;

    f.apply(Direction::Maximize);
    REQUIRE_FALSE(f.window->is_fullscreen);
    REQUIRE(f.window->frame() == Rect{ 0, 0, 1000, 800 });
}

TEST_CASE("Windows refusing to shrink are pushed back on screen", "[engine]")
{
    EngineFixture f;
    f.window->min_size = Size{ 600, 500 };

    f.apply(Direction::RightHalf);

    REQUIRE(f.window->frame() == Rect{ 400, 0, 600, 800 });
    REQUIRE(f.window->set_position_calls == 1);
}

TEST_CASE("Moves may leave the screen", "[engine]")
{
    EngineFixture f;
    f.h.config.geometry.preview_visibility = false;
    f.h.config.geometry.size_increment = 150;

    f.apply(Direction::MoveLeft);
    REQUIRE(f.window->frame() == Rect{ -50, 100, 400, 300 });
    REQUIRE(f.window->set_position_calls == 0);
}

TEST_CASE("Enhanced UI is paused during a resize", "[engine]")
{
    EngineFixture f;
    f.window->enhanced_ui = true;

    f.apply(Direction::LeftHalf);

    REQUIRE(f.window->enhanced_ui_changes == std::vector<bool>{ false, true });
    REQUIRE(f.window->frame() == Rect{ 0, 0, 500, 800 });

    SECTION("Windows without it are left alone")
    {
        f.window->enhanced_ui.reset();
        f.apply(Direction::RightHalf);
        REQUIRE(f.window->enhanced_ui_changes.size() == 2);
    }
}

TEST_CASE("The cursor can follow the window", "[engine]")
{
    EngineFixture f;

    f.apply(Direction::TopHalf);
    REQUIRE(f.h.windows.warps.empty());

    f.h.config.behavior.move_cursor_with_window = true;
    f.apply(Direction::BottomHalf);
    REQUIRE(f.h.windows.warps == std::vector<Point>{ { 500, 600 } });
}

TEST_CASE("Undo walks back through history", "[engine][undo]")
{
    EngineFixture f;

    f.apply(Direction::TopHalf);
    f.apply(Direction::LeftHalf);
    REQUIRE(f.window->frame() == Rect{ 0, 0, 500, 800 });

    f.apply(Direction::Undo);
    REQUIRE(f.window->frame() == Rect{ 0, 0, 1000, 400 });
    REQUIRE(f.h.history.current_action(1)->direction == Direction::TopHalf);

    f.apply(Direction::Undo);
    REQUIRE(f.window->frame() == Rect{ 100, 100, 400, 300 });
    REQUIRE_FALSE(f.h.history.current_action(1));

    SECTION("Nothing left to undo keeps the frame")
    {
        f.apply(Direction::Undo);
        REQUIRE(f.window->frame() == Rect{ 100, 100, 400, 300 });
    }
}

TEST_CASE("Initial frame returns to the first recorded frame", "[engine]")
{
    EngineFixture f;

    f.apply(Direction::Maximize);
    f.apply(Direction::BottomRightQuarter);
    f.apply(Direction::InitialFrame);

    REQUIRE(f.window->frame() == Rect{ 100, 100, 400, 300 });
}

// ─────────────────────────────────────────────────────────────────────────────
// Window manager delegation
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Native window manager handles what it can", "[engine][native]")
{
    EngineFixture f;
    f.h.config.behavior.use_system_window_manager = true;
    f.window->supports_native = true;

    f.apply(Direction::Maximize);
    REQUIRE(f.window->native_requests == std::vector<Direction>{ Direction::Maximize });
    REQUIRE(f.window->set_frame_calls == 0);
    REQUIRE(f.window->activations == 1);

    SECTION("Unsupported requests fall back to resizing")
    {
        f.window->supports_native = false;
        f.apply(Direction::LeftHalf);
        REQUIRE(f.window->frame() == Rect{ 0, 0, 500, 800 });
    }

    SECTION("Screen changes are always resized here")
    {
        f.h.windows.screen_list.push_back(make_screen(2, "right", { 1000, 0, 1000, 800 }));
        f.apply(make_action(Direction::Maximize), f.h.windows.screen_list.back());
        REQUIRE(f.window->native_requests.size() == 1);
        REQUIRE(f.window->frame() == Rect{ 1100, 100, 400, 300 });
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Screens
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Fractional actions keep proportions across screens", "[engine][screens]")
{
    EngineFixture f;
    f.h.windows.screen_list.push_back(make_screen(2, "right", { 1000, 0, 1000, 800 }));
    Screen right = f.h.windows.screen_list.back();

    SECTION("A half stays a half")
    {
        f.apply(Direction::LeftHalf);
        f.apply(make_action(Direction::LeftHalf), right);
        REQUIRE(f.window->frame() == Rect{ 1000, 0, 500, 800 });
    }

    SECTION("A free-floating window keeps its relative place")
    {
        f.apply(make_action(Direction::LeftHalf), right);
        REQUIRE(f.window->frame() == Rect{ 1100, 100, 400, 300 });
    }

    SECTION("Other actions resolve on the new screen")
    {
        f.apply(make_action(Direction::Center), right);
        REQUIRE(f.window->frame() == Rect{ 1300, 250, 400, 300 });
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Animation
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Resizes animate when enabled", "[engine][animation]")
{
    EngineFixture f;
    f.h.config.behavior.animate_window_resizes = true;

    f.apply(Direction::TopHalf);
    REQUIRE(f.h.animator.animating(1));
    REQUIRE_FALSE(f.window->frame() == Rect{ 0, 0, 1000, 400 });

    f.h.advance(200ms);
    REQUIRE_FALSE(f.h.animator.animating(1));
    REQUIRE(f.window->frame() == Rect{ 0, 0, 1000, 400 });

    SECTION("A new animation replaces the running one")
    {
        f.apply(Direction::BottomHalf);
        f.h.advance(50ms);
        f.apply(Direction::LeftHalf);
        f.h.advance(200ms);
        REQUIRE(f.window->frame() == Rect{ 0, 0, 500, 800 });
    }
}

TEST_CASE("Low power mode and enhanced UI skip animation", "[engine][animation]")
{
    EngineFixture f;
    f.h.config.behavior.animate_window_resizes = true;
    f.h.windows.low_power = true;

    f.apply(Direction::TopHalf);
    REQUIRE_FALSE(f.h.animator.animating(1));
    REQUIRE(f.window->frame() == Rect{ 0, 0, 1000, 400 });

    SECTION("Unless low power is ignored")
    {
        f.h.config.behavior.ignore_low_power_mode = true;
        f.apply(Direction::BottomHalf);
        REQUIRE(f.h.animator.animating(1));
    }

    SECTION("Enhanced UI windows never animate")
    {
        f.h.config.behavior.ignore_low_power_mode = true;
        f.window->enhanced_ui = true;
        f.apply(Direction::BottomHalf);
        REQUIRE_FALSE(f.h.animator.animating(1));
        REQUIRE(f.window->frame() == Rect{ 0, 400, 1000, 400 });
    }
}
