#pragma once

#include "loop/core/direction.hpp"
#include "loop/core/types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace loop {

/**
 * @brief Capability interface over one top-level window
 *
 * The X11 backend implements it with EWMH requests; tests use an in-memory fake.
 * Frames are outer frames (decorations included) in root coordinates.
 */
class Window
{
public:
    virtual ~Window() = default;

    virtual WindowId id() const = 0;
    virtual std::string title() const = 0;
    virtual std::string app_class() const = 0;

    virtual Rect frame() const = 0;
    virtual void set_frame(Rect const& frame) = 0;
    virtual void set_position(Point const& origin) = 0;
    virtual bool resizable() const = 0;

    virtual bool minimized() const = 0;
    virtual void set_minimized(bool minimized) = 0;
    virtual bool fullscreen() const = 0;
    virtual void set_fullscreen(bool fullscreen) = 0;

    /// Every window of the owning application is hidden.
    virtual bool application_hidden() const = 0;
    virtual void set_application_hidden(bool hidden) = 0;

    /// Not currently visible on screen (unmapped or minimized).
    virtual bool hidden() const = 0;

    /// Accessibility-style acceleration flag; absent on most platforms.
    virtual std::optional<bool> enhanced_user_interface() const { return std::nullopt; }
    virtual void set_enhanced_user_interface(bool) { }

    virtual void activate() = 0;

    /// Lets the window manager perform the action itself. False when unsupported.
    virtual bool perform_native(Direction) { return false; }
};

using WindowPtr = std::shared_ptr<Window>;

/**
 * @brief Desktop-wide queries
 *
 * screens() lists the primary screen first. window_list() returns on-screen
 * windows front to back.
 */
class WindowSystem
{
public:
    virtual ~WindowSystem() = default;

    virtual std::vector<Screen> screens() const = 0;
    virtual WindowPtr frontmost_window() = 0;
    virtual WindowPtr window_at(Point const& point) = 0;
    virtual std::vector<WindowPtr> window_list() = 0;
    virtual Point cursor_position() const = 0;
    virtual void warp_cursor(Point const& point) = 0;
    virtual bool low_power_mode() const = 0;
};

} // namespace loop
