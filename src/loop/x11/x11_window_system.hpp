#pragma once

#include "connection.hpp"
#include "ewmh.hpp"
#include "loop/core/window.hpp"
#include <filesystem>
#include <optional>

namespace loop {

/**
 * @brief WindowSystem over RandR outputs and the EWMH client lists
 *
 * Screens are cached until invalidate_screens() is called (RandR change or a
 * new _NET_WORKAREA). The primary output comes first.
 */
class X11WindowSystem : public WindowSystem
{
public:
    X11WindowSystem(Connection& conn, Ewmh& ewmh);

    std::vector<Screen> screens() const override;
    WindowPtr frontmost_window() override;
    WindowPtr window_at(Point const& point) override;
    std::vector<WindowPtr> window_list() override;
    Point cursor_position() const override;
    void warp_cursor(Point const& point) override;
    bool low_power_mode() const override;

    void invalidate_screens() { screens_.reset(); }

    /// Platform profile file read for low_power_mode, replaceable for tests.
    void set_platform_profile_path(std::filesystem::path path) { platform_profile_ = std::move(path); }

private:
    std::vector<Screen> detect_screens() const;
    Screen fallback_screen() const;
    WindowPtr make_window(xcb_window_t id);

    Connection& conn_;
    Ewmh& ewmh_;
    mutable std::optional<std::vector<Screen>> screens_;
    std::filesystem::path platform_profile_ = "/sys/firmware/acpi/platform_profile";
};

} // namespace loop
