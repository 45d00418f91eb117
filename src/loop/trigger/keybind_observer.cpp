#include "keybind_observer.hpp"
#include "loop/core/log.hpp"
#include "loop/core/policy.hpp"
#include <X11/keysym.h>
#include <algorithm>
#include <iterator>

namespace loop {

KeybindObserver::KeybindObserver(Config const& config, ActionCache const& cache, TriggerCallbacks callbacks)
    : config_(config)
    , cache_(cache)
    , callbacks_(std::move(callbacks))
{
}

void KeybindObserver::reset()
{
    pressed_.clear();
    can_passthrough_ = true;
    last_release_.reset();
    release_flags_.clear();
}

bool KeybindObserver::is_passthrough_key(Key key) const
{
    return std::ranges::find(config_.trigger.passthrough_keys, key) != config_.trigger.passthrough_keys.end();
}

KeySet KeybindObserver::normalized_flags(KeyEvent const& event)
{
    KeySet flags;
    for (Key flag : event.flags)
        flags.insert(normalize_key(flag));
    return flags;
}

KeySet KeybindObserver::held_keys(KeyEvent const& event) const
{
    KeySet all = pressed_;
    all.merge(normalized_flags(event));
    return all;
}

bool KeybindObserver::matches_system_shortcut(KeyEvent const& event) const
{
    auto const& shortcuts = config_.trigger.system_shortcuts;
    return std::ranges::find(shortcuts, held_keys(event)) != shortcuts.end();
}

EventHandling KeybindObserver::handle(KeyEvent const& event)
{
    Key key = normalize_key(event.key);
    LOG_TRACE("Key event: type={} key={} flags={}", static_cast<int>(event.type), key_name(key), key_names(event.flags));

    if (callbacks_.shift_changed)
        callbacks_.shift_changed(event.flags.contains(XK_Shift_L));

    if (event.type == KeyEventType::KeyUp)
        pressed_.erase(key);
    else if (event.type == KeyEventType::KeyDown)
        pressed_.insert(key);

    if (is_passthrough_key(key))
        return can_passthrough_ ? EventHandling::Forward : EventHandling::Consume;

    if (perform_keybind(event))
        return EventHandling::Consume;

    if (matches_system_shortcut(event))
    {
        LOG_DEBUG("System shortcut {} pressed, closing session", key_names(held_keys(event)));
        callbacks_.close(true);
    }
    return EventHandling::Forward;
}

bool KeybindObserver::perform_keybind(KeyEvent const& event)
{
    auto const& trigger = config_.trigger.keys;

    KeySet all = held_keys(event);
    KeySet action_keys;
    std::ranges::set_difference(all, trigger, std::inserter(action_keys, action_keys.end()));
    bool contains_trigger = !trigger.empty() && std::ranges::includes(all, trigger);

    if (callbacks_.is_open())
    {
        if (pressed_.contains(XK_Escape))
        {
            LOG_DEBUG("Escape pressed, cancelling session");
            pressed_.clear();
            can_passthrough_ = true;
            callbacks_.close(true);
            return true;
        }

        if (event.type == KeyEventType::KeyUp)
        {
            last_release_ = event.time;
            release_flags_ = normalized_flags(event);
            return true;
        }

        // Repeats of the released modifiers right after a key-up are the tail of one release
        if (event.type == KeyEventType::FlagsChanged && contains_trigger
            && trigger_policy::within_release_burst(last_release_, event.time)
            && normalized_flags(event) == release_flags_)
        {
            LOG_TRACE("Ignoring modifier change inside release burst");
            return true;
        }

        if (event.type != KeyEventType::KeyDown && !contains_trigger)
        {
            callbacks_.close(false);
            return true;
        }
    }

    if (event.type != KeyEventType::KeyUp && contains_trigger)
    {
        Action const* action = cache_.lookup(action_keys);
        if (action && (!event.is_repeat || action->manipulates_existing_frame()))
        {
            callbacks_.open(*action);
            return true;
        }

        callbacks_.open(std::nullopt);
        return false;
    }

    return false;
}

} // namespace loop
