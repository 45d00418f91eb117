#pragma once

#include "connection.hpp"
#include "loop/config/config.hpp"
#include "loop/core/scheduler.hpp"
#include "loop/trigger/keybind_observer.hpp"
#include <chrono>
#include <cstdlib>
#include <functional>
#include <memory>
#include <optional>
#include <set>

namespace loop {

/**
 * @brief Global keyboard input for the trigger
 *
 * The trigger keys are grabbed passively in synchronous mode on the root
 * window, so every press either reaches the handler or is replayed to the
 * focused client. While a session is active the whole keyboard is grabbed and
 * keys the handler forwards are resent to the focused window.
 */
class KeyGrabber
{
public:
    using Handler = std::function<EventHandling(KeyEvent const&)>;
    using EventPtr = std::unique_ptr<xcb_generic_event_t, decltype(&free)>;

    static constexpr auto RETRY_INTERVAL = std::chrono::seconds(5);

    KeyGrabber(Connection& conn, Config const& config, Scheduler& scheduler, Handler handler);
    ~KeyGrabber();

    KeyGrabber(KeyGrabber const&) = delete;
    KeyGrabber& operator=(KeyGrabber const&) = delete;

    /// Grabs the trigger keys, retrying every RETRY_INTERVAL while refused.
    bool grab();
    void ungrab();

    /// Active keyboard grab, held for the duration of a session.
    void set_keyboard_grabbed(bool grabbed);
    bool keyboard_grabbed() const { return keyboard_grabbed_; }

    /// Handles KeyPress/KeyRelease. Returns false for any other event.
    bool handle_event(xcb_generic_event_t const& event);

    /// Event read ahead while checking for auto-repeat, to be handled next.
    EventPtr take_deferred() { return std::move(deferred_); }

private:
    struct Translated
    {
        KeyEvent event;
        xcb_keycode_t keycode = 0;
    };

    Translated translate(xcb_key_press_event_t const& event, bool press) const;
    bool is_repeat_release(xcb_key_release_event_t const& release);
    void forward(xcb_key_press_event_t const& event);
    static KeySet flags_from_state(uint16_t state);

    Connection& conn_;
    Config const& config_;
    Handler handler_;
    DelayedTask retry_;

    std::set<xcb_keycode_t> grabbed_codes_;
    std::set<xcb_keycode_t> held_codes_;
    std::optional<xcb_keycode_t> passive_key_; ///< Key whose press activated the passive grab
    bool keyboard_grabbed_ = false;
    EventPtr deferred_{ nullptr, free };
};

} // namespace loop
