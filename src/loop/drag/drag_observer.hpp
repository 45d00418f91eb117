#pragma once

#include "loop/config/config.hpp"
#include "loop/core/direction.hpp"
#include "loop/core/history.hpp"
#include "loop/core/pointer_events.hpp"
#include "loop/core/window.hpp"
#include <optional>

namespace loop {

class StashManager;
class WindowEngine;

/**
 * @brief Notices windows dragged by the user
 *
 * A drag starts once the pointer travels DRAG_THRESHOLD with the left button
 * held. The window under the cursor at that point is watched; when it has
 * really moved, its history is dropped (and its initial size restored when
 * configured) and any stash on it is released. Button release ends the drag.
 *
 * With window snapping on, a moved window dropped with the cursor on a screen
 * edge gets the layout of that edge on the screen under the cursor.
 */
class DragObserver
{
public:
    static constexpr double DRAG_THRESHOLD = 5;
    static constexpr double CORNER_TOLERANCE = 10;

    DragObserver(
        Config const& config,
        WindowSystem& windows,
        WindowEngine& engine,
        WindowHistory& history,
        StashManager& stash,
        PointerEvents& pointer_events
    );

    void start();
    void stop();
    bool running() const { return subscription_.active(); }

private:
    void handle(PointerEvent const& event);
    void on_dragged(Point const& position);
    void restore_initial_size(Window& window, Point const& cursor);
    void update_snap(Point const& cursor);
    void release(Point const& cursor);
    void end_drag();

    Config const& config_;
    WindowSystem& windows_;
    WindowEngine& engine_;
    WindowHistory& history_;
    StashManager& stash_;
    PointerEvents& pointer_events_;
    PointerEvents::Subscription subscription_;

    std::optional<Point> drag_origin_;
    bool past_threshold_ = false;
    bool window_determined_ = false;
    bool handled_ = false;
    WindowPtr window_;
    Rect initial_frame_;
    Direction snap_direction_ = Direction::NoAction;
};

} // namespace loop
