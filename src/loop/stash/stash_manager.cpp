#include "stash_manager.hpp"
#include "loop/core/geometry.hpp"
#include "loop/core/log.hpp"
#include "loop/core/policy.hpp"
#include "loop/core/screen.hpp"
#include <vector>

namespace loop {

StashManager::StashManager(
    Config const& config,
    WindowSystem& windows,
    WindowHistory& history,
    FrameAnimator& animator,
    Scheduler& scheduler,
    PointerEvents& pointer_events,
    StashStore& store
)
    : config_(config)
    , windows_(windows)
    , history_(history)
    , animator_(animator)
    , scheduler_(scheduler)
    , pointer_events_(pointer_events)
    , store_(store)
    , debounce_(scheduler)
{
}

void StashManager::start()
{
    if (store_.restore(windows_.window_list(), windows_.screens()) > 0)
        start_listening();
}

void StashManager::on_desktop_changed()
{
    if (!store_.has_pending_restores())
        return;

    LOG_INFO("Desktop changed, retrying stashed window restore");
    if (store_.retry_restore(windows_.window_list(), windows_.screens()) > 0)
        start_listening();
}

// ─────────────────────────────────────────────────────────────────────────────
// Stash and unstash
// ─────────────────────────────────────────────────────────────────────────────

void StashManager::on_window_resized(Action const& action, WindowPtr const& window, Screen const& screen)
{
    WindowId id = window->id();

    if (auto edge = action.stash_edge())
    {
        // All screens form one row; stashes go to the outermost screen of it
        Screen target = screen_for_edge(screen, *edge);
        if (!(target == screen))
        {
            LOG_INFO("{} is not the outermost screen for this stash, redirecting to {}", screen.name, target.name);
            on_window_resized(action, window, target);
            return;
        }
        stash(StashedWindow{ window, screen, action });
        return;
    }

    Direction direction = action.direction;
    if (direction == Direction::Unstash)
    {
        // The engine already moved the window to its initial frame
        unstash(id, false, config_.stash.animate);
    }
    else if (direction == Direction::Undo)
    {
        auto current = history_.current_action(id);
        if (current && current->direction != Direction::Undo)
            on_window_resized(*current, window, screen);
    }
    else if (grows(direction) || shrinks(direction) || adjusts_size(direction))
    {
        // A resize pulls a hidden stash back on screen without revealing it
        if (managed(id) && geometry::contains(screen.visible_frame, window->frame()) && !store_.revealed(id))
            store_.mark_revealed(id);
    }
    else if (moves(direction))
    {
        // Stash frames are recomputed on the next reveal/hide, dropping the move
    }
    else
    {
        unmanage(id);
    }
}

void StashManager::stash(StashedWindow window)
{
    LOG_INFO("Stashing {:#x} ({})", window.id(), window.action.display_name());
    unstash_overlapping(window);
    store_.insert(window);
    hide(window, config_.stash.animate);
    start_listening();
}

void StashManager::unstash(WindowId id, bool reset_frame, bool animate)
{
    auto const* stashed = store_.find(id);
    if (!stashed)
    {
        unmanage(id);
        return;
    }

    LOG_INFO("Unstashing {:#x}", id);
    if (reset_frame)
    {
        FrameState scratch;
        resolver::Request request{
            .action = make_action(Direction::InitialFrame),
            .window = history_.snapshot(*stashed->window),
            .bounds = stashed->screen.visible_frame,
            .screen_diagonal = stashed->screen.diagonal_inches,
            .reference_screen_frame = stashed->screen.frame,
        };
        set_frame(stashed->window, resolver::resolve(request, config_.geometry, scratch), animate);
    }
    unmanage(id);
}

void StashManager::restore_all(bool animate)
{
    std::vector<WindowId> ids;
    for (auto const& [id, window] : store_.stashed())
        ids.push_back(id);

    for (WindowId id : ids)
        unstash(id, true, animate);
}

void StashManager::unstash_overlapping(StashedWindow const& incoming)
{
    Rect incoming_frame = revealed_frame(incoming);

    // unstash mutates the store
    std::vector<WindowId> displaced;
    for (auto const& [id, window] : store_.stashed())
    {
        if (id == incoming.id())
            continue;
        if (window.action.stash_edge() != incoming.action.stash_edge())
            continue;

        if (same_manipulation(window.action, incoming.action) && window.screen == incoming.screen)
        {
            LOG_INFO("Stash placement of {:#x} taken over by {:#x}", id, incoming.id());
            displaced.push_back(id);
            continue;
        }

        Rect current = stashed_frame(window);
        if (!stash_policy::ranges_non_overlapping_by(
                STACK_TOLERANCE,
                incoming_frame.min_y(),
                incoming_frame.max_y(),
                current.min_y(),
                current.max_y()
            ))
        {
            LOG_INFO("Stash of {:#x} overlaps {:#x}, replacing", incoming.id(), id);
            displaced.push_back(id);
        }
    }

    for (WindowId id : displaced)
        unstash(id, true, config_.stash.animate);
}

void StashManager::unmanage(WindowId id)
{
    store_.erase(id);
    store_.mark_revealed(id);
    last_reveal_.erase(id);
    if (store_.empty())
        stop_listening();
}

bool StashManager::handle_if_stashed(Action const& action, Screen const& screen)
{
    if (action.direction != Direction::Stash)
        return false;

    auto const* stashed = store_.find_by_placement(action, screen);
    if (!stashed || stashed->window->hidden() || stashed->window->application_hidden())
        return false;

    LOG_INFO("Stash action toggles stashed window {:#x}", stashed->id());
    StashedWindow window = *stashed;
    if (store_.revealed(window.id()))
        hide(window, true);
    else
        reveal(window, true);
    return true;
}

std::optional<Rect> StashManager::revealed_frame_for(WindowId id) const
{
    auto const* stashed = store_.find(id);
    if (!stashed)
        return std::nullopt;
    return revealed_frame(*stashed);
}

void StashManager::on_configuration_changed()
{
    store_.update_screens(windows_.screens());
    for (auto const& [id, window] : store_.stashed())
        set_frame(window.window, stashed_frame(window), config_.stash.animate);
}

// ─────────────────────────────────────────────────────────────────────────────
// Reveal and hide
// ─────────────────────────────────────────────────────────────────────────────

void StashManager::reveal(StashedWindow const& window, bool animate)
{
    if (store_.revealed(window.id()) || throttled(window.id()))
        return;

    // One revealed window at a time
    std::vector<StashedWindow> others;
    for (WindowId id : store_.revealed_ids())
    {
        if (auto const* other = store_.find(id))
            others.push_back(*other);
    }
    for (auto const& other : others)
        hide(other, animate);

    if (config_.stash.shift_focus)
        window.window->activate();

    store_.mark_revealed(window.id());
    set_frame(window.window, revealed_frame(window), animate);
    LOG_DEBUG("Revealed {:#x}", window.id());
}

void StashManager::hide(StashedWindow const& window, bool animate)
{
    if (throttled(window.id()))
        return;

    Rect frame = stashed_frame(window);
    unfocus(window.id());
    set_frame(window.window, frame, animate);
    store_.mark_hidden(window.id());
    LOG_DEBUG("Hid {:#x}", window.id());
}

bool StashManager::throttled(WindowId id)
{
    auto now = scheduler_.now();
    auto it = last_reveal_.find(id);
    if (it != last_reveal_.end() && now - it->second < THROTTLE)
        return true;
    last_reveal_[id] = now;
    return false;
}

void StashManager::unfocus(WindowId id)
{
    if (!config_.stash.shift_focus)
        return;

    auto const* stashed = store_.find(id);
    if (!stashed)
        return;

    auto screens = windows_.screens();
    if (screens.empty())
        return;

    auto screen_of = [&](Window const& window) {
        Screen const* screen = screens::screen_containing(screens, window.frame());
        return screen ? *screen : screens.front();
    };
    Screen screen = screen_of(*stashed->window);

    for (auto const& window : windows_.window_list())
    {
        if (window->id() == id || window->application_hidden() || window->hidden() || window->minimized())
            continue;
        if (!(screen_of(*window) == screen))
            continue;

        LOG_DEBUG("Focusing {:#x} in place of hidden stash", window->id());
        window->activate();
        return;
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Pointer tracking
// ─────────────────────────────────────────────────────────────────────────────

void StashManager::start_listening()
{
    if (subscription_.active())
        return;
    LOG_INFO("Listening for pointer moves over stashed windows");
    subscription_ = pointer_events_.subscribe([this](PointerEvent const& event) { on_pointer(event); });
}

void StashManager::stop_listening()
{
    if (!subscription_.active())
        return;
    LOG_INFO("Stopped listening for pointer moves");
    debounce_.cancel();
    subscription_.reset();
}

void StashManager::on_pointer(PointerEvent const& event)
{
    if (event.type != PointerEventType::Moved)
        return;

    last_pointer_ = event.position;
    debounce_.schedule(DEBOUNCE, [this] { process_pointer(last_pointer_); });
}

void StashManager::process_pointer(Point const& location)
{
    // Front to back, so only the topmost of overlapping stashes reacts
    std::vector<StashedWindow> ordered;
    for (auto const& window : windows_.window_list())
    {
        if (auto const* stashed = store_.find(window->id()))
            ordered.push_back(*stashed);
    }

    for (auto const& window : ordered)
    {
        Rect stashed = stashed_frame(window);
        if (store_.revealed(window.id()))
        {
            Rect revealed = geometry::inset_by(revealed_frame(window), -HIDE_TOLERANCE, -HIDE_TOLERANCE);
            if (geometry::contains(revealed, location) || geometry::contains(stashed, location))
                break;
            hide(window, config_.stash.animate);
        }
        else if (geometry::contains(stashed, location))
        {
            reveal(window, config_.stash.animate);
            break;
        }
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────────────────────────────────────

Rect StashManager::stashed_frame(StashedWindow const& window) const
{
    return window.stashed_frame(history_.snapshot(*window.window), config_.geometry, config_.stash.visible_padding);
}

Rect StashManager::revealed_frame(StashedWindow const& window) const
{
    return window.revealed_frame(history_.snapshot(*window.window), config_.geometry);
}

Screen StashManager::screen_for_edge(Screen const& current, StashEdge edge) const
{
    auto screens = windows_.screens();
    if (screens.empty())
        return current;
    if (edge == StashEdge::Left)
        return screens::leftmost_in_row(screens, current, ROW_THRESHOLD);
    return screens::rightmost_in_row(screens, current, ROW_THRESHOLD);
}

void StashManager::set_frame(WindowPtr const& window, Rect const& frame, bool animate)
{
    if (animate)
        animator_.animate(window, frame, Rect{});
    else
        animator_.set_frame(window, frame);
}

} // namespace loop
