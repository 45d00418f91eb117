#include "keybind.hpp"
#include "loop/core/log.hpp"
#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <X11/keysym.h>
#include <algorithm>
#include <cctype>

namespace loop {

Key normalize_key(Key keysym)
{
    switch (keysym)
    {
        case XK_Shift_R:
            return XK_Shift_L;
        case XK_Control_R:
            return XK_Control_L;
        case XK_Alt_R:
            return XK_Alt_L;
        case XK_Super_R:
            return XK_Super_L;
        case XK_Meta_R:
            return XK_Meta_L;
        case XK_Hyper_R:
            return XK_Hyper_L;
        default:
            break;
    }
    if (keysym >= XK_A && keysym <= XK_Z)
        return keysym - XK_A + XK_a;
    return keysym;
}

std::optional<Key> parse_key(std::string const& name)
{
    if (name == "super")
        return XK_Super_L;
    if (name == "shift")
        return XK_Shift_L;
    if (name == "ctrl" || name == "control")
        return XK_Control_L;
    if (name == "alt")
        return XK_Alt_L;

    KeySym sym = XStringToKeysym(name.c_str());
    if (sym == NoSymbol)
    {
        std::string lower = name;
        std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return std::tolower(c); });
        sym = XStringToKeysym(lower.c_str());
    }
    if (sym == NoSymbol)
        return std::nullopt;
    return normalize_key(static_cast<Key>(sym));
}

std::string key_name(Key key)
{
    if (char const* name = XKeysymToString(key))
        return name;
    return fmt::format("{:#x}", key);
}

std::string key_names(KeySet const& keys)
{
    std::string result;
    for (Key key : keys)
    {
        if (!result.empty())
            result += '+';
        result += key_name(key);
    }
    return result;
}

bool is_modifier_key(Key key) { return IsModifierKey(key); }

void ActionCache::rebuild(std::vector<Action> const& actions, bool cycle_backwards_on_shift)
{
    actions_by_keys_.clear();

    for (auto const& action : actions)
    {
        if (action.keybind.empty())
            continue;
        if (!actions_by_keys_.emplace(action.keybind, action).second)
            LOG_WARN("Keybind {} is bound twice, keeping the first action", key_names(action.keybind));
    }

    if (cycle_backwards_on_shift)
    {
        for (auto const& action : actions)
        {
            if (action.keybind.empty() || action.direction != Direction::Cycle)
                continue;

            KeySet shifted = action.keybind;
            shifted.insert(XK_Shift_L);
            actions_by_keys_.emplace(std::move(shifted), action);
        }
    }

    LOG_DEBUG("Action cache holds {} keybinds", actions_by_keys_.size());
}

Action const* ActionCache::lookup(KeySet const& keys) const
{
    auto it = actions_by_keys_.find(keys);
    return it != actions_by_keys_.end() ? &it->second : nullptr;
}

} // namespace loop
