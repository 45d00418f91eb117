#pragma once

#include "loop/config/config.hpp"
#include "loop/core/action.hpp"
#include "loop/core/resolver.hpp"
#include "loop/core/types.hpp"
#include "loop/core/window.hpp"

namespace loop {

/**
 * @brief A window parked on a screen edge by a stash action
 *
 * The frames are recomputed from the action on every call, so a stashed window
 * follows config and work area changes.
 */
struct StashedWindow
{
    static constexpr double MAX_PEEK_FRACTION = 0.2;

    WindowPtr window;
    Screen screen;
    Action action;

    WindowId id() const { return window->id(); }

    /// Frame of the action on the screen's visible frame.
    Rect revealed_frame(resolver::WindowSnapshot const& snapshot, GeometryConfig const& config) const;

    /// Revealed frame slid off the stash edge so that only peek pixels stay visible.
    /// Peek is clamped to [1, MAX_PEEK_FRACTION * width].
    Rect stashed_frame(resolver::WindowSnapshot const& snapshot, GeometryConfig const& config, double peek) const;
};

} // namespace loop
