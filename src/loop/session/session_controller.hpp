#pragma once

#include "loop/config/config.hpp"
#include "loop/config/state_file.hpp"
#include "loop/core/action.hpp"
#include "loop/core/history.hpp"
#include "loop/core/pointer_events.hpp"
#include "loop/core/resolver.hpp"
#include "loop/core/window.hpp"
#include <functional>
#include <optional>

namespace loop {

class StashManager;
class WindowEngine;

/**
 * @brief One open/close cycle of the action chooser
 *
 * While active, the session holds the target window, the screen to resize on
 * and the chosen action. Keybinds, pointer direction and left clicks change the
 * action; closing applies it. With preview on, the prospective frame is kept up
 * to date and the window only moves on close; with preview off every change is
 * applied live and history is recorded on close.
 */
class SessionController
{
public:
    struct ChangeOptions
    {
        bool from_screen_change = false;
        bool can_advance_cycle = true;
    };

    struct Hooks
    {
        std::function<void()> pointer_moved;       ///< First pointer move of a session
        std::function<void(bool)> active_changed;  ///< Session opened or closed
    };

    SessionController(
        Config const& config,
        WindowSystem& windows,
        WindowEngine& engine,
        StashManager& stash,
        WindowHistory& history,
        PointerEvents& pointer_events,
        StateFile& state
    );

    void set_hooks(Hooks hooks) { hooks_ = std::move(hooks); }

    void open(std::optional<Action> const& starting);
    void close(bool force);
    bool active() const { return active_; }

    void set_shift_pressed(bool pressed) { shift_pressed_ = pressed; }

    void change_action(Action const& action, ChangeOptions options);
    void change_action(Action const& action) { change_action(action, ChangeOptions{}); }

    Action const& current_action() const { return current_; }
    std::optional<Action> const& parent_cycle() const { return parent_cycle_; }
    std::optional<Screen> const& screen() const { return screen_; }
    WindowPtr const& target_window() const { return target_; }
    std::optional<Rect> const& preview_frame() const { return preview_frame_; }
    FrameState const& frame_state() const { return frame_state_; }

private:
    WindowPtr choose_target_window();
    Screen choose_screen() const;
    Action next_cycle_action(Action const& cycle) const;
    Screen screen_for(Direction direction, Screen const& current) const;
    Action radial_action(double angle, double distance) const;
    void on_pointer(PointerEvent const& event);
    void update_preview();
    void reset();

    Config const& config_;
    WindowSystem& windows_;
    WindowEngine& engine_;
    StashManager& stash_;
    WindowHistory& history_;
    PointerEvents& pointer_events_;
    StateFile& state_;
    Hooks hooks_;

    bool active_ = false;
    bool shift_pressed_ = false;
    WindowPtr target_;
    std::optional<Screen> screen_;
    Action current_ = make_action(Direction::NoAction);
    std::optional<Action> parent_cycle_;
    FrameState frame_state_;
    std::optional<Rect> preview_frame_;

    Point initial_pointer_;
    double pointer_angle_ = 0;
    double pointer_distance_ = 0;
    PointerEvents::Subscription pointer_subscription_;
};

} // namespace loop
