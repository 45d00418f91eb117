#pragma once

#include "loop/config/config.hpp"
#include "loop/config/state_file.hpp"
#include "loop/core/history.hpp"
#include "loop/core/pointer_events.hpp"
#include "loop/core/scheduler.hpp"
#include "loop/drag/drag_observer.hpp"
#include "loop/engine/frame_animator.hpp"
#include "loop/engine/window_engine.hpp"
#include "loop/keybind/keybind.hpp"
#include "loop/session/session_controller.hpp"
#include "loop/stash/stash_manager.hpp"
#include "loop/stash/stash_store.hpp"
#include "loop/trigger/keybind_observer.hpp"
#include "loop/trigger/middle_click_observer.hpp"
#include "loop/x11/connection.hpp"
#include "loop/x11/ewmh.hpp"
#include "loop/x11/key_grabber.hpp"
#include "loop/x11/pointer_poller.hpp"
#include "loop/x11/x11_window_system.hpp"
#include <optional>
#include <string>

namespace loop {

/**
 * @brief Owns every component and runs the event loop
 *
 * Single-threaded apart from the pointer poller, which only posts to the
 * scheduler. SIGTERM/SIGINT stop the loop, SIGHUP reloads the config file.
 */
class Daemon
{
public:
    Daemon(Config config, std::string config_path, std::optional<std::filesystem::path> state_path);
    ~Daemon();

    Daemon(Daemon const&) = delete;
    Daemon& operator=(Daemon const&) = delete;

    void run();

private:
    void handle_event(xcb_generic_event_t const& event);
    void handle_property_notify(xcb_property_notify_event_t const& event);
    void handle_signals();
    void reload_config();
    void on_screens_changed();

    Config config_;
    std::string config_path_;

    Connection conn_;
    Ewmh ewmh_;
    X11WindowSystem windows_;
    Scheduler scheduler_;
    PointerPoller poller_;
    PointerEvents pointer_events_;

    StateFile state_;
    WindowHistory history_;
    ActionCache cache_;
    FrameAnimator animator_;
    StashStore stash_store_;
    StashManager stash_;
    WindowEngine engine_;
    SessionController session_;

    KeybindObserver keybinds_;
    MiddleClickObserver middle_click_;
    DragObserver drag_;
    KeyGrabber grabber_;

    bool running_ = true;
};

} // namespace loop
