#pragma once

#include "loop/config/state_file.hpp"
#include "loop/stash/stashed_window.hpp"
#include <cstddef>
#include <map>
#include <set>
#include <vector>

namespace loop {

/**
 * @brief Stashed windows and the revealed set, mirrored to the state file
 *
 * Every mutation is persisted. Windows stashed by a previous run that are not in
 * the current window list (usually because they live on another desktop) stay
 * pending and are persisted with the rest until retry_restore finds them.
 */
class StashStore
{
public:
    explicit StashStore(StateFile& state);

    std::map<WindowId, StashedWindow> const& stashed() const { return stashed_; }
    StashedWindow const* find(WindowId id) const;
    bool empty() const { return stashed_.empty(); }

    void insert(StashedWindow window);
    void erase(WindowId id);

    bool revealed(WindowId id) const { return revealed_.contains(id); }
    std::set<WindowId> const& revealed_ids() const { return revealed_; }
    void mark_revealed(WindowId id);
    void mark_hidden(WindowId id);

    /// Stashed window whose action is the same manipulation on the same screen.
    StashedWindow const* find_by_placement(Action const& action, Screen const& screen) const;

    /// Reloads from the state file. Returns the number of windows re-attached.
    size_t restore(std::vector<WindowPtr> const& windows, std::vector<Screen> const& screens);

    /// Re-attaches pending windows now present in windows.
    size_t retry_restore(std::vector<WindowPtr> const& windows, std::vector<Screen> const& screens);

    bool has_pending_restores() const { return !pending_.empty(); }

    /// Replaces each stash's screen with the current copy of the same output.
    /// Stashes whose output is gone move to the screen holding most of the window.
    void update_screens(std::vector<Screen> const& screens);

private:
    void persist();

    StateFile& state_;
    std::map<WindowId, StashedWindow> stashed_;
    std::set<WindowId> revealed_;
    std::map<WindowId, Action> pending_;
};

} // namespace loop
