#pragma once

#include "loop/core/action.hpp"
#include "loop/core/types.hpp"
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <set>

namespace loop {

/**
 * @brief Small TOML state file kept across restarts
 *
 *   times_looped = 42
 *   [stash]
 *   revealed = [0x1a00004]
 *   [[stash.windows]]
 *   id = 0x1a00004
 *   action = { direction = "Stash", anchor = "left", ... }
 *
 * Without a path the state only lives in memory. Read and write failures are
 * logged and otherwise ignored.
 */
class StateFile
{
public:
    explicit StateFile(std::optional<std::filesystem::path> path = std::nullopt);

    uint64_t times_looped() const { return times_looped_; }
    void increment_times_looped();

    std::map<WindowId, Action> const& stashed() const { return stashed_; }
    std::set<WindowId> const& revealed() const { return revealed_; }
    void set_stash(std::map<WindowId, Action> stashed, std::set<WindowId> revealed);

private:
    void load();
    void save() const;

    std::optional<std::filesystem::path> path_;
    uint64_t times_looped_ = 0;
    std::map<WindowId, Action> stashed_;
    std::set<WindowId> revealed_;
};

/// $XDG_STATE_HOME/loop/state.toml, else ~/.local/state/loop/state.toml.
std::optional<std::filesystem::path> default_state_path();

} // namespace loop
