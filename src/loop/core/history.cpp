#include "history.hpp"
#include "log.hpp"

namespace loop {

void WindowHistory::record_first(WindowId id, Rect const& frame)
{
    if (records_.contains(id))
        return;
    records_[id] = Record{ frame, {} };
    LOG_DEBUG("Recorded initial frame of {:#x}", id);
}

bool WindowHistory::has_been_recorded(WindowId id) const { return records_.contains(id); }

void WindowHistory::record(WindowId id, Rect const& current_frame, Action const& action)
{
    if (action.direction == Direction::NoAction || action.direction == Direction::Undo
        || changes_screen(action.direction))
        return;

    record_first(id, current_frame);
    records_[id].actions.push_back(action);
    LOG_TRACE("Recorded {} for {:#x}", action.display_name(), id);
}

std::optional<Action> WindowHistory::last_action(WindowId id) const
{
    auto it = records_.find(id);
    if (it == records_.end() || it->second.actions.empty())
        return std::nullopt;

    auto const& actions = it->second.actions;
    if (actions.size() == 1)
        return make_action(Direction::InitialFrame);
    return actions[actions.size() - 2];
}

std::optional<Action> WindowHistory::current_action(WindowId id) const
{
    auto it = records_.find(id);
    if (it == records_.end() || it->second.actions.empty())
        return std::nullopt;
    return it->second.actions.back();
}

std::optional<Rect> WindowHistory::initial_frame(WindowId id) const
{
    auto it = records_.find(id);
    if (it == records_.end())
        return std::nullopt;
    return it->second.initial_frame;
}

void WindowHistory::remove_last_action(WindowId id)
{
    auto it = records_.find(id);
    if (it != records_.end() && !it->second.actions.empty())
        it->second.actions.pop_back();
}

void WindowHistory::erase(WindowId id) { records_.erase(id); }

resolver::WindowSnapshot WindowHistory::snapshot(Window const& window) const
{
    return {
        .frame = window.frame(),
        .resizable = window.resizable(),
        .initial_frame = initial_frame(window.id()),
        .last_action = last_action(window.id()),
    };
}

} // namespace loop
