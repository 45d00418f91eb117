#pragma once

#include "connection.hpp"
#include "loop/core/types.hpp"
#include <optional>
#include <string>
#include <vector>
#include <xcb/xcb_ewmh.h>

namespace loop {

/// Decoration sizes from _NET_FRAME_EXTENTS.
struct FrameExtents
{
    uint32_t left = 0;
    uint32_t right = 0;
    uint32_t top = 0;
    uint32_t bottom = 0;
};

/**
 * @brief Client side of EWMH
 *
 * Reads the root window properties a window manager publishes and sends the
 * client messages that ask it to move, resize, focus or change the state of
 * windows. Requests go through the window manager so that it can keep its own
 * bookkeeping; only without one do we configure windows directly.
 */
class Ewmh
{
public:
    explicit Ewmh(Connection& conn);
    ~Ewmh();

    Ewmh(Ewmh const&) = delete;
    Ewmh& operator=(Ewmh const&) = delete;

    // Root window properties
    void refresh_supported();
    bool supports(xcb_atom_t atom) const;
    xcb_window_t active_window() const;
    std::vector<xcb_window_t> client_list_stacking() const; ///< Bottom to top
    uint32_t current_desktop() const;
    std::optional<Rect> workarea() const; ///< Of the current desktop

    // Per-window properties
    FrameExtents frame_extents(xcb_window_t window) const;
    std::optional<uint32_t> pid(xcb_window_t window) const;
    std::string name(xcb_window_t window) const;
    bool has_window_state(xcb_window_t window, xcb_atom_t state) const;
    bool is_desktop_or_dock(xcb_window_t window) const;

    // Requests to the window manager
    void request_state(xcb_window_t window, xcb_atom_t first, xcb_atom_t second, bool enable);
    void request_activate(xcb_window_t window);
    void request_moveresize(xcb_window_t window, int32_t x, int32_t y, uint32_t width, uint32_t height);
    void request_move(xcb_window_t window, int32_t x, int32_t y);
    void request_iconify(xcb_window_t window);

    xcb_ewmh_connection_t* get() { return &ewmh_; }
    xcb_ewmh_connection_t* get() const { return &ewmh_; }

private:
    Connection& conn_;
    mutable xcb_ewmh_connection_t ewmh_; // mutable: XCB EWMH API isn't const-correct
    xcb_atom_t wm_change_state_ = XCB_ATOM_NONE;
    std::vector<xcb_atom_t> supported_;
};

} // namespace loop
