#include "fake_window_system.hpp"
#include "loop/trigger/keybind_observer.hpp"
#include "loop/trigger/middle_click_observer.hpp"
#include <X11/keysym.h>
#include <catch2/catch_test_macros.hpp>
#include <vector>

using namespace loop;
using namespace std::chrono_literals;

namespace {

/// Records trigger callbacks and tracks whether a session is open.
struct SessionSpy
{
    TriggerCallbacks callbacks()
    {
        return TriggerCallbacks{
            .open =
                [this](std::optional<Action> action)
                {
                    open = true;
                    opened.push_back(action ? action->direction : Direction::NoAction);
                },
            .close =
                [this](bool force)
                {
                    open = false;
                    closes.push_back(force);
                },
            .is_open = [this]() { return open; },
            .shift_changed = [this](bool pressed) { shift = pressed; },
        };
    }

    bool open = false;
    bool shift = false;
    std::vector<Direction> opened;
    std::vector<bool> closes;
};

struct KeyboardFixture
{
    KeyboardFixture()
    {
        config.actions = {
            make_action(Direction::TopHalf, { XK_Up }),
            make_action(Direction::Larger, { XK_equal }),
            make_action(Direction::Maximize, { XK_Control_L, XK_m }),
        };
        config.trigger.passthrough_keys = { XK_Tab };
        config.trigger.system_shortcuts = { KeySet{ XK_Super_L, XK_l } };
        cache.rebuild(config.actions, true);
    }

    KeyEvent flags(KeySet held)
    {
        now += 10ms;
        return KeyEvent{ .type = KeyEventType::FlagsChanged, .key = XK_Super_L, .flags = std::move(held), .time = now };
    }

    KeyEvent down(Key key, KeySet held = { XK_Super_L }, bool repeat = false)
    {
        now += 10ms;
        return KeyEvent{ .type = KeyEventType::KeyDown, .key = key, .flags = std::move(held), .is_repeat = repeat, .time = now };
    }

    KeyEvent up(Key key, KeySet held = { XK_Super_L })
    {
        now += 10ms;
        return KeyEvent{ .type = KeyEventType::KeyUp, .key = key, .flags = std::move(held), .time = now };
    }

    Config config = default_config();
    ActionCache cache;
    SessionSpy spy;
    KeybindObserver observer{ config, cache, spy.callbacks() };
    std::chrono::steady_clock::time_point now = std::chrono::steady_clock::time_point{} + 1h;
};

} // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Keyboard trigger
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Holding the trigger opens and releasing it closes", "[trigger][keyboard]")
{
    KeyboardFixture f;

    f.observer.handle(f.flags({ XK_Super_L }));
    REQUIRE(f.spy.open);
    REQUIRE(f.spy.opened == std::vector<Direction>{ Direction::NoAction });

    f.observer.handle(f.flags({}));
    REQUIRE_FALSE(f.spy.open);
    REQUIRE(f.spy.closes == std::vector<bool>{ false });
}

TEST_CASE("Trigger plus a bound key selects its action", "[trigger][keyboard]")
{
    KeyboardFixture f;

    f.observer.handle(f.flags({ XK_Super_L }));
    REQUIRE(f.observer.handle(f.down(XK_Up)) == EventHandling::Consume);
    REQUIRE(f.spy.opened.back() == Direction::TopHalf);
    REQUIRE(f.observer.pressed_keys() == KeySet{ XK_Up });

    REQUIRE(f.observer.handle(f.up(XK_Up)) == EventHandling::Consume);
    REQUIRE(f.spy.open);
    REQUIRE(f.observer.pressed_keys().empty());

    SECTION("Uppercase keysyms match lowercase bindings")
    {
        f.observer.handle(f.down(XK_M, { XK_Super_L, XK_Control_R }));
        REQUIRE(f.spy.opened.back() == Direction::Maximize);
    }
}

TEST_CASE("Unbound keys are forwarded while the session stays open", "[trigger][keyboard]")
{
    KeyboardFixture f;

    f.observer.handle(f.flags({ XK_Super_L }));
    REQUIRE(f.observer.handle(f.down(XK_q)) == EventHandling::Forward);
    REQUIRE(f.spy.open);
}

TEST_CASE("Escape cancels the session", "[trigger][keyboard]")
{
    KeyboardFixture f;

    f.observer.handle(f.flags({ XK_Super_L }));
    REQUIRE(f.observer.handle(f.down(XK_Escape)) == EventHandling::Consume);
    REQUIRE_FALSE(f.spy.open);
    REQUIRE(f.spy.closes == std::vector<bool>{ true });
    REQUIRE(f.observer.pressed_keys().empty());
}

TEST_CASE("Modifier changes right after a key-up do not close", "[trigger][keyboard]")
{
    KeyboardFixture f;

    f.observer.handle(f.flags({ XK_Super_L }));
    f.observer.handle(f.down(XK_Up));
    f.observer.handle(f.up(XK_Up));

    f.observer.handle(f.flags({ XK_Super_L, XK_Shift_L }));
    REQUIRE(f.spy.open);
    REQUIRE(f.spy.closes.empty());

    SECTION("Releasing the trigger still closes")
    {
        f.observer.handle(f.flags({}));
        REQUIRE_FALSE(f.spy.open);
    }
}

TEST_CASE("A new modifier right after a key-up is still a keybind", "[trigger][keyboard]")
{
    KeyboardFixture f;
    f.config.actions.push_back(make_action(Direction::Center, { XK_Shift_L }));
    f.cache.rebuild(f.config.actions, true);

    f.observer.handle(f.flags({ XK_Super_L }));
    f.observer.handle(f.down(XK_Up));
    f.observer.handle(f.up(XK_Up));
    size_t opens = f.spy.opened.size();

    SECTION("Shift pressed")
    {
        REQUIRE(f.observer.handle(f.flags({ XK_Super_L, XK_Shift_L })) == EventHandling::Consume);
        REQUIRE(f.spy.opened.size() == opens + 1);
        REQUIRE(f.spy.opened.back() == Direction::Center);
    }

    SECTION("The released modifiers reported again are ignored")
    {
        REQUIRE(f.observer.handle(f.flags({ XK_Super_L })) == EventHandling::Consume);
        REQUIRE(f.spy.opened.size() == opens);
        REQUIRE(f.spy.open);
    }
}

TEST_CASE("Key repeat only re-applies relative actions", "[trigger][keyboard]")
{
    KeyboardFixture f;

    f.observer.handle(f.flags({ XK_Super_L }));
    f.observer.handle(f.down(XK_equal));
    REQUIRE(f.observer.handle(f.down(XK_equal, { XK_Super_L }, true)) == EventHandling::Consume);
    REQUIRE(f.spy.opened.back() == Direction::Larger);
    auto opens = f.spy.opened.size();

    f.observer.handle(f.up(XK_equal));
    f.observer.handle(f.down(XK_Up));
    auto handling = f.observer.handle(f.down(XK_Up, { XK_Super_L }, true));
    REQUIRE(handling == EventHandling::Forward);
    REQUIRE(f.spy.opened.size() == opens + 2);
    REQUIRE(f.spy.opened.back() == Direction::NoAction);
}

TEST_CASE("Shift state is reported on every event", "[trigger][keyboard]")
{
    KeyboardFixture f;

    f.observer.handle(f.flags({ XK_Super_L, XK_Shift_L }));
    REQUIRE(f.spy.shift);
    f.observer.handle(f.flags({ XK_Super_L }));
    REQUIRE_FALSE(f.spy.shift);
}

TEST_CASE("Pass-through keys are forwarded until the pointer moves", "[trigger][keyboard]")
{
    KeyboardFixture f;

    f.observer.handle(f.flags({ XK_Super_L }));
    REQUIRE(f.observer.handle(f.down(XK_Tab)) == EventHandling::Forward);

    f.observer.set_passthrough_allowed(false);
    REQUIRE(f.observer.handle(f.down(XK_Tab)) == EventHandling::Consume);

    f.observer.reset();
    REQUIRE(f.observer.handle(f.down(XK_Tab)) == EventHandling::Forward);
}

TEST_CASE("System shortcuts close the session and reach the system", "[trigger][keyboard]")
{
    KeyboardFixture f;

    f.observer.handle(f.flags({ XK_Super_L }));
    REQUIRE(f.observer.handle(f.down(XK_l)) == EventHandling::Forward);
    REQUIRE_FALSE(f.spy.open);
    REQUIRE(f.spy.closes == std::vector<bool>{ true });
}

TEST_CASE("Keys without the trigger do nothing", "[trigger][keyboard]")
{
    KeyboardFixture f;

    REQUIRE(f.observer.handle(f.down(XK_Up, {})) == EventHandling::Forward);
    REQUIRE(f.spy.opened.empty());
    REQUIRE(f.spy.closes.empty());
}

// ─────────────────────────────────────────────────────────────────────────────
// Middle-click trigger
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Middle click opens while held", "[trigger][middle_click]")
{
    test::Harness h;
    h.config.trigger.middle_click = true;

    int opens = 0;
    std::vector<bool> closes;
    MiddleClickObserver observer(
        h.config, h.scheduler, h.pointer_events, [&]() { ++opens; }, [&](bool force) { closes.push_back(force); }
    );
    observer.start();
    REQUIRE(observer.running());

    h.press_button(2);
    REQUIRE(opens == 1);
    h.release_button(2);
    REQUIRE(closes == std::vector<bool>{ false });

    SECTION("Left and right buttons are ignored")
    {
        h.press_button(1);
        h.release_button(1);
        h.press_button(3);
        h.release_button(3);
        REQUIRE(opens == 1);
        REQUIRE(closes.size() == 1);
    }

    SECTION("Other buttons close")
    {
        h.press_button(2);
        h.release_button(8);
        REQUIRE(closes.size() == 2);
    }

    SECTION("Stopping unsubscribes")
    {
        observer.stop();
        REQUIRE_FALSE(observer.running());
        h.press_button(2);
        REQUIRE(opens == 1);
    }
}

TEST_CASE("Middle click honours the trigger delay", "[trigger][middle_click]")
{
    test::Harness h;
    h.config.trigger.middle_click = true;
    h.config.trigger.delay_on_middle_click = true;
    h.config.trigger.delay = 0.3;

    int opens = 0;
    int closes = 0;
    MiddleClickObserver observer(
        h.config, h.scheduler, h.pointer_events, [&]() { ++opens; }, [&](bool) { ++closes; }
    );
    observer.start();

    h.press_button(2);
    h.advance(200ms);
    REQUIRE(opens == 0);
    h.advance(150ms);
    REQUIRE(opens == 1);

    SECTION("Releasing early cancels the open")
    {
        h.release_button(2);
        h.press_button(2);
        h.advance(100ms);
        h.release_button(2);
        h.advance(500ms);
        REQUIRE(opens == 1);
        REQUIRE(closes == 2);
    }

    SECTION("Short delays open immediately")
    {
        h.config.trigger.delay = 0.05;
        h.press_button(2);
        REQUIRE(opens == 2);
    }
}

TEST_CASE("Middle click is inert when disabled", "[trigger][middle_click]")
{
    test::Harness h;
    h.config.trigger.middle_click = false;

    int opens = 0;
    MiddleClickObserver observer(h.config, h.scheduler, h.pointer_events, [&]() { ++opens; }, [](bool) {});
    observer.start();

    h.press_button(2);
    REQUIRE(opens == 0);
}
