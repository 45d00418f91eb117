#include "drag_observer.hpp"
#include "loop/core/geometry.hpp"
#include "loop/core/log.hpp"
#include "loop/core/policy.hpp"
#include "loop/core/screen.hpp"
#include "loop/engine/window_engine.hpp"
#include "loop/stash/stash_manager.hpp"
#include <algorithm>

namespace loop {

namespace {

constexpr uint8_t LEFT_BUTTON = 1;

// Every corner moved, so this is a move and not an edge resize
bool has_moved(Rect const& frame, Rect const& initial, double tolerance)
{
    auto corner_moved = [&](Point a, Point b) { return !geometry::approx_equal(a, b, tolerance); };
    return corner_moved({ initial.min_x(), initial.min_y() }, { frame.min_x(), frame.min_y() })
        && corner_moved({ initial.max_x(), initial.min_y() }, { frame.max_x(), frame.min_y() })
        && corner_moved({ initial.min_x(), initial.max_y() }, { frame.min_x(), frame.max_y() })
        && corner_moved({ initial.max_x(), initial.max_y() }, { frame.max_x(), frame.max_y() });
}

} // namespace

DragObserver::DragObserver(
    Config const& config,
    WindowSystem& windows,
    WindowEngine& engine,
    WindowHistory& history,
    StashManager& stash,
    PointerEvents& pointer_events
)
    : config_(config)
    , windows_(windows)
    , engine_(engine)
    , history_(history)
    , stash_(stash)
    , pointer_events_(pointer_events)
{
}

void DragObserver::start()
{
    if (subscription_.active())
        return;
    subscription_ = pointer_events_.subscribe([this](PointerEvent const& event) { handle(event); });
}

void DragObserver::stop()
{
    subscription_.reset();
    end_drag();
}

void DragObserver::handle(PointerEvent const& event)
{
    if (event.type == PointerEventType::ButtonUp && event.button == LEFT_BUTTON)
    {
        release(event.position);
        return;
    }
    if (event.type != PointerEventType::Moved)
        return;

    if (!event.left_held())
    {
        // Release happened between samples
        if (drag_origin_)
            release(event.position);
        return;
    }
    on_dragged(event.position);
}

void DragObserver::on_dragged(Point const& position)
{
    if (!drag_origin_)
    {
        drag_origin_ = position;
        return;
    }

    if (!past_threshold_)
    {
        past_threshold_ = geometry::distance(*drag_origin_, position) > DRAG_THRESHOLD;
        if (!past_threshold_)
            return;
    }

    if (!window_determined_)
    {
        window_determined_ = true;
        auto window = windows_.window_at(position);
        auto const& excluded = config_.behavior.excluded_apps;
        if (!window || std::find(excluded.begin(), excluded.end(), window->app_class()) != excluded.end())
            return;
        window_ = std::move(window);
        initial_frame_ = window_->frame();
        LOG_DEBUG("Dragging window {:#x}", window_->id());
    }

    if (!window_)
        return;

    if (!handled_)
    {
        if (!has_moved(window_->frame(), initial_frame_, CORNER_TOLERANCE))
            return;

        handled_ = true;
        if (config_.behavior.restore_window_frame_on_drag)
        {
            restore_initial_size(*window_, position);
        }
        else
        {
            stash_.on_window_dragged(window_->id());
            history_.erase(window_->id());
        }
    }

    if (config_.behavior.window_snapping)
        update_snap(position);
}

void DragObserver::restore_initial_size(Window& window, Point const& cursor)
{
    Rect start = window.frame();
    auto initial = history_.initial_frame(window.id());
    if (!initial)
        return;

    Rect frame{ start.x, start.y, initial->width, initial->height };
    auto screens = windows_.screens();
    if (auto const* screen = screens::screen_at(screens, cursor))
        frame = geometry::push_inside(frame, screen->frame);
    window.set_frame(frame);

    // Keep the window under the cursor that is dragging it
    if (!geometry::contains(window.frame(), cursor))
    {
        frame = window.frame();
        frame.x = start.max_x() - frame.width;
        if (!geometry::contains(frame, cursor))
            frame.x = cursor.x - frame.width / 2;
        window.set_frame(frame);
    }

    LOG_INFO("Restored initial size of dragged window {:#x}", window.id());
    history_.erase(window.id());
}

void DragObserver::update_snap(Point const& cursor)
{
    auto screens = windows_.screens();
    Screen const* screen = screens::screen_at(screens, cursor);
    Direction direction = screen ? snap_policy::snap_direction(cursor, *screen, config_.behavior.snap_threshold)
                                 : Direction::NoAction;
    if (direction != snap_direction_)
        LOG_DEBUG("Snap direction: {}", to_string(direction));
    snap_direction_ = direction;
}

void DragObserver::release(Point const& cursor)
{
    if (window_ && handled_ && config_.behavior.window_snapping)
    {
        update_snap(cursor);
        auto screens = windows_.screens();
        Screen const* screen = screens::screen_at(screens, cursor);
        if (screen && snap_direction_ != Direction::NoAction)
        {
            LOG_INFO("Snapping window {:#x} to {} on {}", window_->id(), to_string(snap_direction_), screen->name);
            FrameState frame_state;
            engine_.apply(window_, make_action(snap_direction_), *screen, frame_state);
        }
    }
    end_drag();
}

void DragObserver::end_drag()
{
    drag_origin_.reset();
    past_threshold_ = false;
    window_determined_ = false;
    handled_ = false;
    window_.reset();
    snap_direction_ = Direction::NoAction;
}

} // namespace loop
