#include "x11_window.hpp"
#include "loop/core/log.hpp"
#include <algorithm>
#include <cmath>
#include <xcb/xcb_icccm.h>

namespace loop {

X11Window::X11Window(Connection& conn, Ewmh& ewmh, xcb_window_t id)
    : conn_(conn)
    , ewmh_(ewmh)
    , id_(id)
{
}

std::string X11Window::title() const { return ewmh_.name(id_); }

std::string X11Window::app_class() const
{
    xcb_icccm_get_wm_class_reply_t reply;
    if (!xcb_icccm_get_wm_class_reply(conn_.get(), xcb_icccm_get_wm_class(conn_.get(), id_), &reply, nullptr))
        return {};

    std::string result = reply.class_name ? reply.class_name : "";
    xcb_icccm_get_wm_class_reply_wipe(&reply);
    return result;
}

Rect X11Window::frame() const
{
    auto geometry_cookie = xcb_get_geometry(conn_.get(), id_);
    auto translate_cookie = xcb_translate_coordinates(conn_.get(), id_, conn_.root(), 0, 0);

    auto* geometry = xcb_get_geometry_reply(conn_.get(), geometry_cookie, nullptr);
    auto* translated = xcb_translate_coordinates_reply(conn_.get(), translate_cookie, nullptr);
    if (!geometry || !translated)
    {
        free(geometry);
        free(translated);
        LOG_DEBUG("Window {:#x} vanished while reading its frame", id_);
        return {};
    }

    FrameExtents extents = ewmh_.frame_extents(id_);
    Rect result{
        static_cast<double>(translated->dst_x) - extents.left,
        static_cast<double>(translated->dst_y) - extents.top,
        static_cast<double>(geometry->width) + extents.left + extents.right,
        static_cast<double>(geometry->height) + extents.top + extents.bottom,
    };
    free(geometry);
    free(translated);
    return result;
}

void X11Window::set_frame(Rect const& frame)
{
    // Window managers ignore geometry requests for maximized windows
    auto* atoms = ewmh_.get();
    if (ewmh_.has_window_state(id_, atoms->_NET_WM_STATE_MAXIMIZED_VERT)
        || ewmh_.has_window_state(id_, atoms->_NET_WM_STATE_MAXIMIZED_HORZ))
        ewmh_.request_state(id_, atoms->_NET_WM_STATE_MAXIMIZED_VERT, atoms->_NET_WM_STATE_MAXIMIZED_HORZ, false);

    FrameExtents extents = ewmh_.frame_extents(id_);
    double width = frame.width - extents.left - extents.right;
    double height = frame.height - extents.top - extents.bottom;

    ewmh_.request_moveresize(
        id_,
        static_cast<int32_t>(std::lround(frame.x)),
        static_cast<int32_t>(std::lround(frame.y)),
        static_cast<uint32_t>(std::max(1L, std::lround(width))),
        static_cast<uint32_t>(std::max(1L, std::lround(height)))
    );
    conn_.flush();
}

void X11Window::set_position(Point const& origin)
{
    ewmh_.request_move(id_, static_cast<int32_t>(std::lround(origin.x)), static_cast<int32_t>(std::lround(origin.y)));
    conn_.flush();
}

bool X11Window::resizable() const
{
    xcb_size_hints_t hints;
    if (!xcb_icccm_get_wm_normal_hints_reply(conn_.get(), xcb_icccm_get_wm_normal_hints(conn_.get(), id_), &hints, nullptr))
        return true;

    bool has_min = hints.flags & XCB_ICCCM_SIZE_HINT_P_MIN_SIZE;
    bool has_max = hints.flags & XCB_ICCCM_SIZE_HINT_P_MAX_SIZE;
    return !(has_min && has_max && hints.min_width == hints.max_width && hints.min_height == hints.max_height);
}

bool X11Window::minimized() const { return ewmh_.has_window_state(id_, ewmh_.get()->_NET_WM_STATE_HIDDEN); }

void X11Window::set_minimized(bool minimized)
{
    if (minimized)
        ewmh_.request_iconify(id_);
    else
        ewmh_.request_activate(id_);
    conn_.flush();
}

bool X11Window::fullscreen() const { return ewmh_.has_window_state(id_, ewmh_.get()->_NET_WM_STATE_FULLSCREEN); }

void X11Window::set_fullscreen(bool fullscreen)
{
    if (fullscreen == this->fullscreen())
        return;
    ewmh_.request_state(id_, ewmh_.get()->_NET_WM_STATE_FULLSCREEN, XCB_ATOM_NONE, fullscreen);
    conn_.flush();
}

std::vector<xcb_window_t> X11Window::application_windows() const
{
    auto pid = ewmh_.pid(id_);
    if (!pid)
        return { id_ };

    std::vector<xcb_window_t> result;
    for (xcb_window_t window : ewmh_.client_list_stacking())
    {
        if (window == id_ || ewmh_.pid(window) == pid)
            result.push_back(window);
    }
    return result;
}

// X11 has no application-level hiding; an application is hidden when all of its
// windows are iconified.
bool X11Window::application_hidden() const
{
    for (xcb_window_t window : application_windows())
    {
        if (!ewmh_.has_window_state(window, ewmh_.get()->_NET_WM_STATE_HIDDEN))
            return false;
    }
    return true;
}

void X11Window::set_application_hidden(bool hidden)
{
    for (xcb_window_t window : application_windows())
    {
        if (hidden)
            ewmh_.request_iconify(window);
        else
            ewmh_.request_activate(window);
    }
    conn_.flush();
}

bool X11Window::hidden() const
{
    auto cookie = xcb_get_window_attributes(conn_.get(), id_);
    auto* attributes = xcb_get_window_attributes_reply(conn_.get(), cookie, nullptr);
    if (!attributes)
        return true;

    bool viewable = attributes->map_state == XCB_MAP_STATE_VIEWABLE;
    free(attributes);
    return !viewable || minimized();
}

void X11Window::activate()
{
    ewmh_.request_activate(id_);
    conn_.flush();
}

bool X11Window::perform_native(Direction direction)
{
    auto* ewmh = ewmh_.get();
    xcb_atom_t first = XCB_ATOM_NONE;
    xcb_atom_t second = XCB_ATOM_NONE;

    switch (direction)
    {
        case Direction::Maximize:
            first = ewmh->_NET_WM_STATE_MAXIMIZED_VERT;
            second = ewmh->_NET_WM_STATE_MAXIMIZED_HORZ;
            break;
        case Direction::MaximizeHeight:
            first = ewmh->_NET_WM_STATE_MAXIMIZED_VERT;
            break;
        case Direction::MaximizeWidth:
            first = ewmh->_NET_WM_STATE_MAXIMIZED_HORZ;
            break;
        default:
            return false;
    }

    if (!ewmh_.supports(first))
    {
        LOG_INFO("Window manager has no native {}", to_string(direction));
        return false;
    }

    ewmh_.request_state(id_, first, second, true);
    conn_.flush();
    return true;
}

} // namespace loop
