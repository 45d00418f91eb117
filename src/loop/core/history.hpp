#pragma once

#include "loop/core/action.hpp"
#include "loop/core/resolver.hpp"
#include "loop/core/types.hpp"
#include "loop/core/window.hpp"
#include <optional>
#include <unordered_map>
#include <vector>

namespace loop {

/**
 * @brief Per-window record of applied actions
 *
 * Keeps the frame a window had before its first action and the actions applied
 * since. NoAction, Undo and screen switches are never recorded.
 */
class WindowHistory
{
public:
    void record_first(WindowId id, Rect const& frame);
    bool has_been_recorded(WindowId id) const;

    /// Appends an action, capturing current_frame as the initial frame on first use.
    void record(WindowId id, Rect const& current_frame, Action const& action);

    /// Action applied before the current one; InitialFrame when only one is recorded.
    std::optional<Action> last_action(WindowId id) const;
    std::optional<Action> current_action(WindowId id) const;
    std::optional<Rect> initial_frame(WindowId id) const;

    void remove_last_action(WindowId id);
    void erase(WindowId id);

    resolver::WindowSnapshot snapshot(Window const& window) const;

private:
    struct Record
    {
        Rect initial_frame;
        std::vector<Action> actions;
    };

    std::unordered_map<WindowId, Record> records_;
};

} // namespace loop
