#include "key_grabber.hpp"
#include "loop/core/log.hpp"
#include "loop/keybind/keybind.hpp"
#include <X11/keysym.h>

namespace loop {

KeyGrabber::KeyGrabber(Connection& conn, Config const& config, Scheduler& scheduler, Handler handler)
    : conn_(conn)
    , config_(config)
    , handler_(std::move(handler))
    , retry_(scheduler)
{
}

KeyGrabber::~KeyGrabber()
{
    if (conn_.has_error())
        return;
    set_keyboard_grabbed(false);
    ungrab();
}

bool KeyGrabber::grab()
{
    ungrab();

    xcb_setup_t const* setup = xcb_get_setup(conn_.get());
    bool ok = true;

    for (int code = setup->min_keycode; code <= setup->max_keycode; ++code)
    {
        auto keycode = static_cast<xcb_keycode_t>(code);
        xcb_keysym_t keysym = xcb_key_symbols_get_keysym(conn_.keysyms(), keycode, 0);
        if (keysym == XCB_NO_SYMBOL || !config_.trigger.keys.contains(normalize_key(keysym)))
            continue;

        auto cookie = xcb_grab_key_checked(
            conn_.get(),
            1,
            conn_.root(),
            XCB_MOD_MASK_ANY,
            keycode,
            XCB_GRAB_MODE_ASYNC,
            XCB_GRAB_MODE_SYNC
        );
        if (auto* error = xcb_request_check(conn_.get(), cookie))
        {
            LOG_WARN("Failed to grab keycode {} (error {})", code, error->error_code);
            free(error);
            ok = false;
            continue;
        }
        grabbed_codes_.insert(keycode);
    }

    if (grabbed_codes_.empty())
        ok = false;

    if (!ok)
    {
        LOG_WARN("Trigger key grab incomplete, retrying in {}s", RETRY_INTERVAL.count());
        retry_.schedule(RETRY_INTERVAL, [this]() { grab(); });
    }
    else
    {
        retry_.cancel();
        LOG_INFO("Grabbed trigger {}", key_names(config_.trigger.keys));
    }

    conn_.flush();
    return ok;
}

void KeyGrabber::ungrab()
{
    for (xcb_keycode_t keycode : grabbed_codes_)
        xcb_ungrab_key(conn_.get(), keycode, conn_.root(), XCB_MOD_MASK_ANY);
    grabbed_codes_.clear();
    conn_.flush();
}

void KeyGrabber::set_keyboard_grabbed(bool grabbed)
{
    if (grabbed == keyboard_grabbed_)
        return;

    if (grabbed)
    {
        auto cookie = xcb_grab_keyboard(
            conn_.get(),
            0,
            conn_.root(),
            XCB_CURRENT_TIME,
            XCB_GRAB_MODE_ASYNC,
            XCB_GRAB_MODE_ASYNC
        );
        auto* reply = xcb_grab_keyboard_reply(conn_.get(), cookie, nullptr);
        keyboard_grabbed_ = reply && reply->status == XCB_GRAB_STATUS_SUCCESS;
        if (!keyboard_grabbed_)
            LOG_WARN("Keyboard grab refused, keys outside the trigger stay with the focused window");
        free(reply);
    }
    else
    {
        xcb_ungrab_keyboard(conn_.get(), XCB_CURRENT_TIME);
        keyboard_grabbed_ = false;
        held_codes_.clear();
    }
    conn_.flush();
}

KeySet KeyGrabber::flags_from_state(uint16_t state)
{
    KeySet flags;
    if (state & XCB_MOD_MASK_SHIFT)
        flags.insert(XK_Shift_L);
    if (state & XCB_MOD_MASK_CONTROL)
        flags.insert(XK_Control_L);
    if (state & XCB_MOD_MASK_1)
        flags.insert(XK_Alt_L);
    if (state & XCB_MOD_MASK_4)
        flags.insert(XK_Super_L);
    return flags;
}

KeyGrabber::Translated KeyGrabber::translate(xcb_key_press_event_t const& event, bool press) const
{
    Translated result;
    result.keycode = event.detail;
    result.event.time = std::chrono::steady_clock::now();

    Key key = normalize_key(xcb_key_symbols_get_keysym(conn_.keysyms(), event.detail, 0));
    result.event.key = key;

    // The state field holds the modifiers from before this event
    result.event.flags = flags_from_state(event.state);
    if (is_modifier_key(key))
    {
        result.event.type = KeyEventType::FlagsChanged;
        if (press)
            result.event.flags.insert(key);
        else
            result.event.flags.erase(key);
    }
    else
    {
        result.event.type = press ? KeyEventType::KeyDown : KeyEventType::KeyUp;
    }
    return result;
}

// Core auto-repeat arrives as release/press pairs with the same timestamp.
bool KeyGrabber::is_repeat_release(xcb_key_release_event_t const& release)
{
    xcb_flush(conn_.get());
    xcb_generic_event_t* next = xcb_poll_for_queued_event(conn_.get());
    if (!next)
        return false;

    deferred_.reset(next);
    if ((next->response_type & ~0x80) != XCB_KEY_PRESS)
        return false;

    auto const* press = reinterpret_cast<xcb_key_press_event_t const*>(next);
    return press->detail == release.detail && press->time == release.time;
}

bool KeyGrabber::handle_event(xcb_generic_event_t const& event)
{
    uint8_t type = event.response_type & ~0x80;
    if (type != XCB_KEY_PRESS && type != XCB_KEY_RELEASE)
        return false;

    auto const& key_event = reinterpret_cast<xcb_key_press_event_t const&>(event);
    bool press = type == XCB_KEY_PRESS;

    if (!press && is_repeat_release(key_event))
    {
        // Swallow the release, the paired press is handled as a repeat
        EventPtr paired = take_deferred();
        auto const& repeat = reinterpret_cast<xcb_key_press_event_t const&>(*paired);
        Translated translated = translate(repeat, true);
        translated.event.is_repeat = true;
        EventHandling handling = handler_(translated.event);
        if (handling == EventHandling::Forward)
            forward(repeat);
        return true;
    }

    Translated translated = translate(key_event, press);
    if (press)
    {
        translated.event.is_repeat = held_codes_.contains(translated.keycode);
        held_codes_.insert(translated.keycode);
    }
    else
    {
        held_codes_.erase(translated.keycode);
    }

    bool activates_passive = press && !keyboard_grabbed_ && !passive_key_ && grabbed_codes_.contains(key_event.detail);
    if (activates_passive)
        passive_key_ = key_event.detail;

    EventHandling handling = handler_(translated.event);

    if (activates_passive)
    {
        // The keyboard is frozen until the passive grab is released one way or the other
        uint8_t mode = handling == EventHandling::Forward && !keyboard_grabbed_ ? XCB_ALLOW_REPLAY_KEYBOARD
                                                                                  : XCB_ALLOW_ASYNC_KEYBOARD;
        xcb_allow_events(conn_.get(), mode, key_event.time);
        if (mode == XCB_ALLOW_REPLAY_KEYBOARD)
            passive_key_.reset();
    }
    else if (handling == EventHandling::Forward)
    {
        forward(key_event);
    }

    if (!press && passive_key_ == key_event.detail)
        passive_key_.reset();

    conn_.flush();
    return true;
}

void KeyGrabber::forward(xcb_key_press_event_t const& event)
{
    auto* focus = xcb_get_input_focus_reply(conn_.get(), xcb_get_input_focus(conn_.get()), nullptr);
    if (!focus)
        return;

    xcb_window_t target = focus->focus;
    free(focus);
    if (target == XCB_NONE || target == XCB_INPUT_FOCUS_POINTER_ROOT)
        return;

    xcb_key_press_event_t copy = event;
    copy.event = target;
    copy.child = XCB_NONE;
    copy.same_screen = 1;

    uint32_t mask = (event.response_type & ~0x80) == XCB_KEY_PRESS ? XCB_EVENT_MASK_KEY_PRESS
                                                                    : XCB_EVENT_MASK_KEY_RELEASE;
    xcb_send_event(conn_.get(), 1, target, mask, reinterpret_cast<char const*>(&copy));
    LOG_TRACE("Forwarded keycode {} to {:#x}", event.detail, target);
}

} // namespace loop
