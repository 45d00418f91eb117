#include "loop/x11/connection.hpp"
#include "loop/x11/ewmh.hpp"
#include "loop/x11/x11_window.hpp"
#include "loop/x11/x11_window_system.hpp"
#include "x11_test_harness.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <thread>
#include <xcb/xcb_icccm.h>

using namespace loop;
using namespace loop::test;

namespace {

constexpr auto kTimeout = std::chrono::seconds(2);

/// A client connection publishing windows and properties, and the X11 layer under test on its own connection.
struct TestEnvironment
{
    std::unique_ptr<Connection> client;
    std::unique_ptr<Connection> conn;
    std::unique_ptr<Ewmh> ewmh;
    std::unique_ptr<X11WindowSystem> system;

    static std::optional<TestEnvironment> create()
    {
        auto const& display = TestDisplay::get();
        if (!display.available())
        {
            WARN("Xvfb not available; set LOOP_TEST_ALLOW_EXISTING_DISPLAY=1 to use an existing DISPLAY.");
            return std::nullopt;
        }

        TestEnvironment env;
        try
        {
            env.client = std::make_unique<Connection>(display.name().c_str());
            env.conn = std::make_unique<Connection>(display.name().c_str());
            env.ewmh = std::make_unique<Ewmh>(*env.conn);
        }
        catch (std::exception const& e)
        {
            WARN("Failed to connect to X server: " << e.what());
            return std::nullopt;
        }
        env.system = std::make_unique<X11WindowSystem>(*env.conn, *env.ewmh);
        return env;
    }

    Rect root_frame() const
    {
        return { 0, 0, static_cast<double>(client->screen()->width_in_pixels),
                 static_cast<double>(client->screen()->height_in_pixels) };
    }
};

bool wait_for_frame(Window const& window, Rect const& expected)
{
    return wait_for_condition([&]() { return window.frame() == expected; }, kTimeout);
}

} // namespace

TEST_CASE("Integration: screens cover the root window", "[integration][x11]")
{
    auto test_env = TestEnvironment::create();
    if (!test_env)
        return;

    auto screens = test_env->system->screens();
    REQUIRE_FALSE(screens.empty());
    REQUIRE(screens.front().frame == test_env->root_frame());
    REQUIRE(screens.front().visible_frame == screens.front().frame);

    SECTION("Work area trims the visible frame")
    {
        Rect root = test_env->root_frame();
        set_cardinals(
            *test_env->client,
            test_env->client->root(),
            "_NET_WORKAREA",
            { 0, 30, static_cast<uint32_t>(root.width), static_cast<uint32_t>(root.height) - 30 }
        );

        // Cached until invalidated
        REQUIRE(test_env->system->screens().front().visible_frame == root);

        test_env->system->invalidate_screens();
        REQUIRE(test_env->system->screens().front().visible_frame == Rect{ 0, 30, root.width, root.height - 30 });

        delete_property(*test_env->client, test_env->client->root(), "_NET_WORKAREA");
    }
}

TEST_CASE("Integration: frames are applied directly without a window manager", "[integration][x11]")
{
    auto test_env = TestEnvironment::create();
    if (!test_env)
        return;

    auto& client = *test_env->client;
    xcb_window_t id = create_client(client, { 10, 10, 200, 150 });
    show_client(client, id);

    X11Window window(*test_env->conn, *test_env->ewmh, id);
    REQUIRE(wait_for_frame(window, { 10, 10, 200, 150 }));

    window.set_frame({ 100, 80, 300, 200 });
    REQUIRE(wait_for_frame(window, { 100, 80, 300, 200 }));

    window.set_position({ 150, 90 });
    REQUIRE(wait_for_frame(window, { 150, 90, 300, 200 }));

    REQUIRE(window.resizable());
    REQUIRE_FALSE(window.minimized());
    REQUIRE_FALSE(window.hidden());

    destroy_client(client, id);
}

TEST_CASE("Integration: fixed size hints make a window non-resizable", "[integration][x11]")
{
    auto test_env = TestEnvironment::create();
    if (!test_env)
        return;

    auto& client = *test_env->client;
    xcb_window_t id = create_client(client, { 10, 10, 200, 150 });

    xcb_size_hints_t hints{};
    xcb_icccm_size_hints_set_min_size(&hints, 200, 150);
    xcb_icccm_size_hints_set_max_size(&hints, 200, 150);
    xcb_icccm_set_wm_normal_hints(client.get(), id, &hints);
    client.flush();

    X11Window window(*test_env->conn, *test_env->ewmh, id);
    REQUIRE(wait_for_condition([&]() { return !window.resizable(); }, kTimeout));

    destroy_client(client, id);
}

TEST_CASE("Integration: frames include published frame extents", "[integration][x11]")
{
    auto test_env = TestEnvironment::create();
    if (!test_env)
        return;

    auto& client = *test_env->client;
    xcb_window_t id = create_client(client, { 50, 60, 200, 100 });
    show_client(client, id);
    set_cardinals(client, id, "_NET_FRAME_EXTENTS", { 2, 2, 20, 2 });

    X11Window window(*test_env->conn, *test_env->ewmh, id);
    REQUIRE(wait_for_frame(window, { 48, 40, 204, 122 }));

    destroy_client(client, id);
}

TEST_CASE("Integration: windows follow the published stacking order", "[integration][x11]")
{
    auto test_env = TestEnvironment::create();
    if (!test_env)
        return;

    auto& client = *test_env->client;
    auto& system = *test_env->system;

    xcb_window_t bottom = create_client(client, { 10, 10, 200, 150 });
    xcb_window_t top = create_client(client, { 100, 100, 200, 150 });
    set_wm_class(client, top, "loop-test", "LoopTest");
    show_client(client, bottom);
    show_client(client, top);
    set_windows(client, client.root(), "_NET_CLIENT_LIST_STACKING", { bottom, top });
    set_windows(client, client.root(), "_NET_ACTIVE_WINDOW", { bottom });

    REQUIRE(wait_for_condition([&]() { return system.window_list().size() == 2; }, kTimeout));

    auto windows = system.window_list();
    REQUIRE(windows.front()->id() == top);
    REQUIRE(windows.front()->app_class() == "LoopTest");

    REQUIRE(system.window_at({ 120, 120 })->id() == top);
    REQUIRE(system.window_at({ 20, 20 })->id() == bottom);
    REQUIRE_FALSE(system.window_at({ 900, 600 }));

    REQUIRE(system.frontmost_window()->id() == bottom);

    SECTION("Minimized windows drop out of the list")
    {
        set_atoms(client, bottom, "_NET_WM_STATE", { "_NET_WM_STATE_HIDDEN" });
        REQUIRE(wait_for_condition([&]() { return system.window_list().size() == 1; }, kTimeout));

        X11Window window(*test_env->conn, *test_env->ewmh, bottom);
        REQUIRE(window.minimized());
        REQUIRE(window.hidden());
        REQUIRE(window.application_hidden());
    }

    SECTION("Docks are never targets")
    {
        set_atoms(client, top, "_NET_WM_WINDOW_TYPE", { "_NET_WM_WINDOW_TYPE_DOCK" });
        set_windows(client, client.root(), "_NET_ACTIVE_WINDOW", { top });
        REQUIRE(wait_for_condition([&]() { return system.window_list().size() == 1; }, kTimeout));
        REQUIRE_FALSE(system.frontmost_window());
    }

    delete_property(client, client.root(), "_NET_CLIENT_LIST_STACKING");
    delete_property(client, client.root(), "_NET_ACTIVE_WINDOW");
    destroy_client(client, top);
    destroy_client(client, bottom);
}

TEST_CASE("Integration: the cursor can be warped", "[integration][x11]")
{
    auto test_env = TestEnvironment::create();
    if (!test_env)
        return;

    auto& system = *test_env->system;
    system.warp_cursor({ 200, 150 });
    REQUIRE(wait_for_condition([&]() { return system.cursor_position() == Point{ 200, 150 }; }, kTimeout));
}

TEST_CASE("Integration: low power follows the platform profile", "[integration][x11]")
{
    auto test_env = TestEnvironment::create();
    if (!test_env)
        return;

    auto dir = make_temp_dir();
    REQUIRE_FALSE(dir.empty());
    auto profile = dir / "platform_profile";

    auto& system = *test_env->system;
    system.set_platform_profile_path(profile);
    REQUIRE_FALSE(system.low_power_mode());

    std::ofstream(profile) << "low-power\n";
    REQUIRE(system.low_power_mode());

    std::ofstream(profile) << "balanced\n";
    REQUIRE_FALSE(system.low_power_mode());

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

TEST_CASE("Integration: the daemon runs on a bare display and stops on SIGTERM", "[integration][daemon]")
{
    auto const& display = TestDisplay::get();
    if (!display.available())
    {
        WARN("Xvfb not available; set LOOP_TEST_ALLOW_EXISTING_DISPLAY=1 to use an existing DISPLAY.");
        return;
    }

    LoopProcess loop_process(display.name());
    if (!loop_process.running())
    {
        WARN("Failed to start loop.");
        return;
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    REQUIRE(loop_process.running());
    REQUIRE(loop_process.stop() == 0);
}
