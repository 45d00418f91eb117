#pragma once

#include "loop/config/config.hpp"
#include "loop/core/action.hpp"
#include "loop/keybind/keybind.hpp"
#include <chrono>
#include <functional>
#include <optional>

namespace loop {

enum class KeyEventType
{
    KeyDown,
    KeyUp,
    FlagsChanged, ///< A modifier key was pressed or released
};

struct KeyEvent
{
    KeyEventType type = KeyEventType::KeyDown;
    Key key = 0;
    KeySet flags; ///< Modifier keys held after the event
    bool is_repeat = false;
    std::chrono::steady_clock::time_point time;
};

enum class EventHandling
{
    Forward,
    Consume,
};

/// Session hooks the trigger drives.
struct TriggerCallbacks
{
    std::function<void(std::optional<Action>)> open;
    std::function<void(bool force)> close;
    std::function<bool()> is_open;
    std::function<void(bool)> shift_changed;
};

/**
 * @brief Turns raw key events into session open/close/change requests
 *
 * Holding the trigger opens a session. Extra keys held with it select the
 * cached action for that chord. Releasing the trigger closes the session and
 * applies the action; Escape closes without applying.
 */
class KeybindObserver
{
public:
    KeybindObserver(Config const& config, ActionCache const& cache, TriggerCallbacks callbacks);

    EventHandling handle(KeyEvent const& event);

    /// Clears pressed keys, e.g. when the input layer loses its grab.
    void reset();

    /// Pass-through keys are forwarded only until the pointer moves in a session.
    void set_passthrough_allowed(bool allowed) { can_passthrough_ = allowed; }

    KeySet const& pressed_keys() const { return pressed_; }

private:
    bool perform_keybind(KeyEvent const& event);
    bool is_passthrough_key(Key key) const;
    bool matches_system_shortcut(KeyEvent const& event) const;

    /// Pressed keys plus the modifiers in the event flags.
    KeySet held_keys(KeyEvent const& event) const;
    static KeySet normalized_flags(KeyEvent const& event);

    Config const& config_;
    ActionCache const& cache_;
    TriggerCallbacks callbacks_;

    KeySet pressed_;
    bool can_passthrough_ = true;
    std::optional<std::chrono::steady_clock::time_point> last_release_;
    KeySet release_flags_; ///< Modifiers held at last_release_
};

} // namespace loop
