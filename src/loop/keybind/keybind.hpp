#pragma once

#include "loop/core/action.hpp"
#include "loop/core/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace loop {

/// Folds right-hand modifiers onto their left variants and letters onto lower case.
Key normalize_key(Key keysym);

/// Parses an X keysym name ("Up", "space", "Super_L") or a modifier alias ("super", "shift", "ctrl", "alt").
std::optional<Key> parse_key(std::string const& name);

std::string key_name(Key key);
std::string key_names(KeySet const& keys);

bool is_modifier_key(Key key);

/**
 * @brief Exact key-set lookup of configured actions
 *
 * The first action bound to a key set wins. With reverse cycling enabled, cycles
 * are also reachable with Shift added, unless that chord is already taken.
 */
class ActionCache
{
public:
    void rebuild(std::vector<Action> const& actions, bool cycle_backwards_on_shift);
    Action const* lookup(KeySet const& keys) const;
    size_t size() const { return actions_by_keys_.size(); }

private:
    std::map<KeySet, Action> actions_by_keys_;
};

} // namespace loop
