#include "ewmh.hpp"
#include "loop/core/log.hpp"
#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <xcb/xcb_icccm.h>

namespace loop {

Ewmh::Ewmh(Connection& conn)
    : conn_(conn)
{
    xcb_intern_atom_cookie_t* cookies = xcb_ewmh_init_atoms(conn_.get(), &ewmh_);
    if (!xcb_ewmh_init_atoms_replies(&ewmh_, cookies, nullptr))
    {
        throw std::runtime_error("Failed to initialize EWMH atoms");
    }

    char const* name = "WM_CHANGE_STATE";
    auto cookie = xcb_intern_atom(conn_.get(), 0, static_cast<uint16_t>(std::strlen(name)), name);
    if (auto* reply = xcb_intern_atom_reply(conn_.get(), cookie, nullptr))
    {
        wm_change_state_ = reply->atom;
        free(reply);
    }

    refresh_supported();
}

Ewmh::~Ewmh() { xcb_ewmh_connection_wipe(&ewmh_); }

void Ewmh::refresh_supported()
{
    supported_.clear();
    xcb_ewmh_get_atoms_reply_t atoms;
    if (!xcb_ewmh_get_supported_reply(&ewmh_, xcb_ewmh_get_supported(&ewmh_, 0), &atoms, nullptr))
    {
        LOG_WARN("No EWMH window manager found, falling back to direct configuration");
        return;
    }
    supported_.assign(atoms.atoms, atoms.atoms + atoms.atoms_len);
    xcb_ewmh_get_atoms_reply_wipe(&atoms);
}

bool Ewmh::supports(xcb_atom_t atom) const
{
    return std::find(supported_.begin(), supported_.end(), atom) != supported_.end();
}

xcb_window_t Ewmh::active_window() const
{
    xcb_window_t window = XCB_NONE;
    if (!xcb_ewmh_get_active_window_reply(&ewmh_, xcb_ewmh_get_active_window(&ewmh_, 0), &window, nullptr))
        return XCB_NONE;
    return window;
}

std::vector<xcb_window_t> Ewmh::client_list_stacking() const
{
    std::vector<xcb_window_t> result;
    xcb_ewmh_get_windows_reply_t windows;
    if (!xcb_ewmh_get_client_list_stacking_reply(&ewmh_, xcb_ewmh_get_client_list_stacking(&ewmh_, 0), &windows, nullptr))
    {
        // Not every window manager keeps a stacking list
        if (!xcb_ewmh_get_client_list_reply(&ewmh_, xcb_ewmh_get_client_list(&ewmh_, 0), &windows, nullptr))
            return result;
    }
    result.assign(windows.windows, windows.windows + windows.windows_len);
    xcb_ewmh_get_windows_reply_wipe(&windows);
    return result;
}

uint32_t Ewmh::current_desktop() const
{
    uint32_t desktop = 0;
    if (!xcb_ewmh_get_current_desktop_reply(&ewmh_, xcb_ewmh_get_current_desktop(&ewmh_, 0), &desktop, nullptr))
        return 0;
    return desktop;
}

std::optional<Rect> Ewmh::workarea() const
{
    xcb_ewmh_get_workarea_reply_t reply;
    if (!xcb_ewmh_get_workarea_reply(&ewmh_, xcb_ewmh_get_workarea(&ewmh_, 0), &reply, nullptr))
        return std::nullopt;

    std::optional<Rect> result;
    if (reply.workarea_len > 0)
    {
        uint32_t index = std::min(current_desktop(), reply.workarea_len - 1);
        auto const& area = reply.workarea[index];
        result = Rect{ static_cast<double>(area.x),
                       static_cast<double>(area.y),
                       static_cast<double>(area.width),
                       static_cast<double>(area.height) };
    }
    xcb_ewmh_get_workarea_reply_wipe(&reply);
    return result;
}

FrameExtents Ewmh::frame_extents(xcb_window_t window) const
{
    FrameExtents extents;
    xcb_ewmh_get_extents_reply_t reply;
    if (xcb_ewmh_get_frame_extents_reply(&ewmh_, xcb_ewmh_get_frame_extents(&ewmh_, window), &reply, nullptr))
    {
        extents.left = reply.left;
        extents.right = reply.right;
        extents.top = reply.top;
        extents.bottom = reply.bottom;
    }
    return extents;
}

std::optional<uint32_t> Ewmh::pid(xcb_window_t window) const
{
    uint32_t pid = 0;
    if (!xcb_ewmh_get_wm_pid_reply(&ewmh_, xcb_ewmh_get_wm_pid(&ewmh_, window), &pid, nullptr))
        return std::nullopt;
    return pid;
}

std::string Ewmh::name(xcb_window_t window) const
{
    xcb_ewmh_get_utf8_strings_reply_t utf8;
    if (xcb_ewmh_get_wm_name_reply(&ewmh_, xcb_ewmh_get_wm_name(&ewmh_, window), &utf8, nullptr))
    {
        std::string result(utf8.strings, utf8.strings_len);
        xcb_ewmh_get_utf8_strings_reply_wipe(&utf8);
        return result;
    }

    xcb_icccm_get_text_property_reply_t text;
    if (xcb_icccm_get_wm_name_reply(conn_.get(), xcb_icccm_get_wm_name(conn_.get(), window), &text, nullptr))
    {
        std::string result(text.name, text.name_len);
        xcb_icccm_get_text_property_reply_wipe(&text);
        return result;
    }
    return {};
}

bool Ewmh::has_window_state(xcb_window_t window, xcb_atom_t state) const
{
    xcb_ewmh_get_atoms_reply_t current_state;
    if (!xcb_ewmh_get_wm_state_reply(&ewmh_, xcb_ewmh_get_wm_state(&ewmh_, window), &current_state, nullptr))
        return false;

    bool found = std::find(current_state.atoms, current_state.atoms + current_state.atoms_len, state)
        != current_state.atoms + current_state.atoms_len;
    xcb_ewmh_get_atoms_reply_wipe(&current_state);
    return found;
}

bool Ewmh::is_desktop_or_dock(xcb_window_t window) const
{
    xcb_ewmh_get_atoms_reply_t types;
    if (!xcb_ewmh_get_wm_window_type_reply(&ewmh_, xcb_ewmh_get_wm_window_type(&ewmh_, window), &types, nullptr))
        return false;

    bool result = false;
    for (uint32_t i = 0; i < types.atoms_len; ++i)
    {
        if (types.atoms[i] == ewmh_._NET_WM_WINDOW_TYPE_DESKTOP || types.atoms[i] == ewmh_._NET_WM_WINDOW_TYPE_DOCK)
            result = true;
    }
    xcb_ewmh_get_atoms_reply_wipe(&types);
    return result;
}

void Ewmh::request_state(xcb_window_t window, xcb_atom_t first, xcb_atom_t second, bool enable)
{
    xcb_ewmh_request_change_wm_state(
        &ewmh_,
        0,
        window,
        enable ? XCB_EWMH_WM_STATE_ADD : XCB_EWMH_WM_STATE_REMOVE,
        first,
        second,
        XCB_EWMH_CLIENT_SOURCE_TYPE_OTHER
    );
}

void Ewmh::request_activate(xcb_window_t window)
{
    xcb_ewmh_request_change_active_window(
        &ewmh_,
        0,
        window,
        XCB_EWMH_CLIENT_SOURCE_TYPE_OTHER,
        XCB_CURRENT_TIME,
        active_window()
    );
}

void Ewmh::request_moveresize(xcb_window_t window, int32_t x, int32_t y, uint32_t width, uint32_t height)
{
    if (!supports(ewmh_._NET_MOVERESIZE_WINDOW))
    {
        uint32_t values[] = { static_cast<uint32_t>(x), static_cast<uint32_t>(y), width, height };
        xcb_configure_window(
            conn_.get(),
            window,
            XCB_CONFIG_WINDOW_X | XCB_CONFIG_WINDOW_Y | XCB_CONFIG_WINDOW_WIDTH | XCB_CONFIG_WINDOW_HEIGHT,
            values
        );
        return;
    }

    auto flags = static_cast<xcb_ewmh_moveresize_window_opt_flags_t>(
        XCB_EWMH_MOVERESIZE_WINDOW_X | XCB_EWMH_MOVERESIZE_WINDOW_Y | XCB_EWMH_MOVERESIZE_WINDOW_WIDTH
        | XCB_EWMH_MOVERESIZE_WINDOW_HEIGHT
    );
    xcb_ewmh_request_moveresize_window(
        &ewmh_,
        0,
        window,
        XCB_GRAVITY_NORTH_WEST,
        XCB_EWMH_CLIENT_SOURCE_TYPE_OTHER,
        flags,
        static_cast<uint32_t>(x),
        static_cast<uint32_t>(y),
        width,
        height
    );
}

void Ewmh::request_move(xcb_window_t window, int32_t x, int32_t y)
{
    if (!supports(ewmh_._NET_MOVERESIZE_WINDOW))
    {
        uint32_t values[] = { static_cast<uint32_t>(x), static_cast<uint32_t>(y) };
        xcb_configure_window(conn_.get(), window, XCB_CONFIG_WINDOW_X | XCB_CONFIG_WINDOW_Y, values);
        return;
    }

    auto flags =
        static_cast<xcb_ewmh_moveresize_window_opt_flags_t>(XCB_EWMH_MOVERESIZE_WINDOW_X | XCB_EWMH_MOVERESIZE_WINDOW_Y);
    xcb_ewmh_request_moveresize_window(
        &ewmh_,
        0,
        window,
        XCB_GRAVITY_NORTH_WEST,
        XCB_EWMH_CLIENT_SOURCE_TYPE_OTHER,
        flags,
        static_cast<uint32_t>(x),
        static_cast<uint32_t>(y),
        0,
        0
    );
}

void Ewmh::request_iconify(xcb_window_t window)
{
    if (wm_change_state_ == XCB_ATOM_NONE)
        return;

    xcb_client_message_event_t event = {};
    event.response_type = XCB_CLIENT_MESSAGE;
    event.format = 32;
    event.window = window;
    event.type = wm_change_state_;
    event.data.data32[0] = XCB_ICCCM_WM_STATE_ICONIC;

    xcb_send_event(
        conn_.get(),
        0,
        conn_.root(),
        XCB_EVENT_MASK_SUBSTRUCTURE_REDIRECT | XCB_EVENT_MASK_SUBSTRUCTURE_NOTIFY,
        reinterpret_cast<char const*>(&event)
    );
}

} // namespace loop
