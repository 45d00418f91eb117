#pragma once

#include "loop/config/config.hpp"
#include "loop/core/action.hpp"
#include "loop/core/history.hpp"
#include "loop/core/resolver.hpp"
#include "loop/core/window.hpp"
#include "loop/engine/frame_animator.hpp"

namespace loop {

class StashManager;

/**
 * @brief Applies resolved actions to real windows
 *
 * Handles the non-geometric directions (hide, minimize, fullscreen, minimize
 * others), delegates to the window manager when configured, records history
 * for undo, and notifies the stash manager after every resize.
 */
class WindowEngine
{
public:
    static constexpr double FRAME_TOLERANCE = 2.0;

    WindowEngine(
        Config const& config,
        WindowSystem& windows,
        WindowHistory& history,
        FrameAnimator& animator,
        StashManager& stash
    );

    /// should_record is false only for live (no preview) sessions, which record on close.
    void apply(
        WindowPtr const& window,
        Action const& action,
        Screen const& screen,
        FrameState& frame_state,
        bool should_record = true
    );

    /// Frame the action would give window on screen, resolved in preview mode.
    Rect preview_frame(Window const& window, Action const& action, Screen const& screen, FrameState& frame_state) const;

private:
    void minimize_others(Window const& except);
    void resize(WindowPtr const& window, Rect const& target, Screen const& screen, bool ignore_padding, bool animate);
    void push_inside_bounds(Window& window, Rect const& bounds);
    std::optional<Rect> proportional_source(Window const& window, Screen const& from, Action const& action) const;
    Rect reference_frame() const;

    Config const& config_;
    WindowSystem& windows_;
    WindowHistory& history_;
    FrameAnimator& animator_;
    StashManager& stash_;
};

} // namespace loop
