#pragma once

#include "connection.hpp"
#include "ewmh.hpp"
#include "loop/core/window.hpp"

namespace loop {

/**
 * @brief Top-level client window managed by some other window manager
 *
 * Frames are outer frames: client geometry plus _NET_FRAME_EXTENTS. State
 * changes are requested from the window manager and take effect
 * asynchronously.
 */
class X11Window : public Window
{
public:
    X11Window(Connection& conn, Ewmh& ewmh, xcb_window_t id);

    WindowId id() const override { return id_; }
    std::string title() const override;
    std::string app_class() const override;

    Rect frame() const override;
    void set_frame(Rect const& frame) override;
    void set_position(Point const& origin) override;
    bool resizable() const override;

    bool minimized() const override;
    void set_minimized(bool minimized) override;
    bool fullscreen() const override;
    void set_fullscreen(bool fullscreen) override;
    bool application_hidden() const override;
    void set_application_hidden(bool hidden) override;
    bool hidden() const override;

    void activate() override;
    bool perform_native(Direction direction) override;

private:
    std::vector<xcb_window_t> application_windows() const;

    Connection& conn_;
    Ewmh& ewmh_;
    xcb_window_t id_;
};

} // namespace loop
