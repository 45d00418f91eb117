#include "fake_window_system.hpp"
#include "loop/core/history.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace loop;
using loop::test::FakeWindow;

TEST_CASE("First action captures the initial frame", "[history]")
{
    WindowHistory history;
    REQUIRE_FALSE(history.has_been_recorded(1));
    REQUIRE_FALSE(history.initial_frame(1));

    history.record(1, { 10, 20, 300, 200 }, make_action(Direction::LeftHalf));
    REQUIRE(history.has_been_recorded(1));
    REQUIRE(history.initial_frame(1) == Rect{ 10, 20, 300, 200 });

    history.record(1, { 0, 0, 500, 800 }, make_action(Direction::RightHalf));
    REQUIRE(history.initial_frame(1) == Rect{ 10, 20, 300, 200 });

    SECTION("record_first does not overwrite")
    {
        history.record_first(1, { 1, 1, 1, 1 });
        REQUIRE(history.initial_frame(1) == Rect{ 10, 20, 300, 200 });
    }
}

TEST_CASE("Last action is the one before the current", "[history]")
{
    WindowHistory history;
    REQUIRE_FALSE(history.last_action(1));
    REQUIRE_FALSE(history.current_action(1));

    history.record(1, {}, make_action(Direction::LeftHalf));
    REQUIRE(history.current_action(1)->direction == Direction::LeftHalf);
    REQUIRE(history.last_action(1)->direction == Direction::InitialFrame);

    history.record(1, {}, make_action(Direction::Maximize));
    REQUIRE(history.current_action(1)->direction == Direction::Maximize);
    REQUIRE(history.last_action(1)->direction == Direction::LeftHalf);

    history.remove_last_action(1);
    REQUIRE(history.current_action(1)->direction == Direction::LeftHalf);
}

TEST_CASE("Undo, no-op and screen switches are not recorded", "[history]")
{
    WindowHistory history;

    history.record(1, {}, make_action(Direction::NoAction));
    history.record(1, {}, make_action(Direction::Undo));
    history.record(1, {}, make_action(Direction::NextScreen));
    history.record(1, {}, make_action(Direction::LeftScreen));
    REQUIRE_FALSE(history.has_been_recorded(1));

    history.record(1, {}, make_action(Direction::Center));
    history.record(1, {}, make_action(Direction::Undo));
    REQUIRE(history.current_action(1)->direction == Direction::Center);
}

TEST_CASE("Histories are per window and erasable", "[history]")
{
    WindowHistory history;
    history.record(1, { 0, 0, 10, 10 }, make_action(Direction::LeftHalf));
    history.record(2, { 5, 5, 10, 10 }, make_action(Direction::RightHalf));

    history.erase(1);
    REQUIRE_FALSE(history.has_been_recorded(1));
    REQUIRE(history.current_action(2)->direction == Direction::RightHalf);
}

TEST_CASE("Snapshot combines live window state with history", "[history]")
{
    WindowHistory history;
    FakeWindow window(7, { 100, 100, 400, 300 });
    window.is_resizable = false;

    auto snapshot = history.snapshot(window);
    REQUIRE(snapshot.frame == Rect{ 100, 100, 400, 300 });
    REQUIRE_FALSE(snapshot.resizable);
    REQUIRE_FALSE(snapshot.initial_frame);
    REQUIRE_FALSE(snapshot.last_action);

    history.record(7, window.frame(), make_action(Direction::TopHalf));
    history.record(7, window.frame(), make_action(Direction::BottomHalf));
    snapshot = history.snapshot(window);
    REQUIRE(snapshot.initial_frame == Rect{ 100, 100, 400, 300 });
    REQUIRE(snapshot.last_action->direction == Direction::TopHalf);
}
