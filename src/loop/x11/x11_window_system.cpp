#include "x11_window_system.hpp"
#include "loop/core/geometry.hpp"
#include "loop/core/log.hpp"
#include "x11_window.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>

namespace loop {

namespace {

constexpr double MM_PER_INCH = 25.4;

} // namespace

X11WindowSystem::X11WindowSystem(Connection& conn, Ewmh& ewmh)
    : conn_(conn)
    , ewmh_(ewmh)
{
}

std::vector<Screen> X11WindowSystem::screens() const
{
    if (!screens_)
        screens_ = detect_screens();
    return *screens_;
}

std::vector<Screen> X11WindowSystem::detect_screens() const
{
    std::vector<Screen> result;
    if (!conn_.has_randr())
    {
        result.push_back(fallback_screen());
        return result;
    }

    auto res_cookie = xcb_randr_get_screen_resources_current(conn_.get(), conn_.root());
    auto primary_cookie = xcb_randr_get_output_primary(conn_.get(), conn_.root());
    auto* res_reply = xcb_randr_get_screen_resources_current_reply(conn_.get(), res_cookie, nullptr);

    xcb_randr_output_t primary = XCB_NONE;
    if (auto* primary_reply = xcb_randr_get_output_primary_reply(conn_.get(), primary_cookie, nullptr))
    {
        primary = primary_reply->output;
        free(primary_reply);
    }

    if (!res_reply)
    {
        result.push_back(fallback_screen());
        return result;
    }

    auto workarea = ewmh_.workarea();

    int num_outputs = xcb_randr_get_screen_resources_current_outputs_length(res_reply);
    xcb_randr_output_t* outputs = xcb_randr_get_screen_resources_current_outputs(res_reply);

    for (int i = 0; i < num_outputs; ++i)
    {
        auto out_cookie = xcb_randr_get_output_info(conn_.get(), outputs[i], res_reply->config_timestamp);
        auto* out_reply = xcb_randr_get_output_info_reply(conn_.get(), out_cookie, nullptr);

        if (!out_reply)
            continue;
        if (out_reply->connection != XCB_RANDR_CONNECTION_CONNECTED || out_reply->crtc == XCB_NONE)
        {
            free(out_reply);
            continue;
        }

        int name_len = xcb_randr_get_output_info_name_length(out_reply);
        uint8_t* name_data = xcb_randr_get_output_info_name(out_reply);
        std::string output_name(reinterpret_cast<char*>(name_data), name_len);

        auto crtc_cookie = xcb_randr_get_crtc_info(conn_.get(), out_reply->crtc, res_reply->config_timestamp);
        auto* crtc_reply = xcb_randr_get_crtc_info_reply(conn_.get(), crtc_cookie, nullptr);

        if (crtc_reply && crtc_reply->width > 0 && crtc_reply->height > 0)
        {
            Screen screen;
            screen.id = outputs[i];
            screen.name = output_name;
            screen.frame = Rect{ static_cast<double>(crtc_reply->x),
                                 static_cast<double>(crtc_reply->y),
                                 static_cast<double>(crtc_reply->width),
                                 static_cast<double>(crtc_reply->height) };
            screen.visible_frame = screen.frame;
            if (workarea)
            {
                Rect visible = geometry::intersection(screen.frame, *workarea);
                if (visible.width > 0 && visible.height > 0)
                    screen.visible_frame = visible;
            }
            if (out_reply->mm_width > 0 && out_reply->mm_height > 0)
                screen.diagonal_inches = std::hypot(out_reply->mm_width, out_reply->mm_height) / MM_PER_INCH;
            result.push_back(std::move(screen));
        }

        free(crtc_reply);
        free(out_reply);
    }

    free(res_reply);

    if (result.empty())
    {
        result.push_back(fallback_screen());
        return result;
    }

    std::ranges::sort(result, [primary](Screen const& a, Screen const& b) {
        if ((a.id == primary) != (b.id == primary))
            return a.id == primary;
        return a.frame.x < b.frame.x;
    });

    for (auto const& screen : result)
        LOG_DEBUG("Screen {} ({:#x}) {}x{}+{}+{}", screen.name, screen.id, screen.frame.width, screen.frame.height, screen.frame.x, screen.frame.y);
    return result;
}

Screen X11WindowSystem::fallback_screen() const
{
    Screen screen;
    screen.name = "default";
    screen.frame = Rect{ 0, 0, static_cast<double>(conn_.screen()->width_in_pixels), static_cast<double>(conn_.screen()->height_in_pixels) };
    screen.visible_frame = screen.frame;
    if (auto workarea = ewmh_.workarea())
        screen.visible_frame = *workarea;
    if (conn_.screen()->width_in_millimeters > 0 && conn_.screen()->height_in_millimeters > 0)
    {
        screen.diagonal_inches =
            std::hypot(conn_.screen()->width_in_millimeters, conn_.screen()->height_in_millimeters) / MM_PER_INCH;
    }
    return screen;
}

WindowPtr X11WindowSystem::make_window(xcb_window_t id) { return std::make_shared<X11Window>(conn_, ewmh_, id); }

WindowPtr X11WindowSystem::frontmost_window()
{
    xcb_window_t active = ewmh_.active_window();
    if (active == XCB_NONE || active == conn_.root() || ewmh_.is_desktop_or_dock(active))
        return nullptr;
    return make_window(active);
}

WindowPtr X11WindowSystem::window_at(Point const& point)
{
    for (auto& window : window_list())
    {
        if (geometry::contains(window->frame(), point))
            return window;
    }
    return nullptr;
}

std::vector<WindowPtr> X11WindowSystem::window_list()
{
    auto stacking = ewmh_.client_list_stacking();
    std::vector<WindowPtr> result;
    result.reserve(stacking.size());

    for (auto it = stacking.rbegin(); it != stacking.rend(); ++it)
    {
        if (ewmh_.is_desktop_or_dock(*it))
            continue;
        auto window = make_window(*it);
        if (window->hidden())
            continue;
        result.push_back(std::move(window));
    }
    return result;
}

Point X11WindowSystem::cursor_position() const
{
    auto* reply = xcb_query_pointer_reply(conn_.get(), xcb_query_pointer(conn_.get(), conn_.root()), nullptr);
    if (!reply)
        return {};
    Point result{ static_cast<double>(reply->root_x), static_cast<double>(reply->root_y) };
    free(reply);
    return result;
}

void X11WindowSystem::warp_cursor(Point const& point)
{
    xcb_warp_pointer(
        conn_.get(),
        XCB_NONE,
        conn_.root(),
        0,
        0,
        0,
        0,
        static_cast<int16_t>(std::lround(point.x)),
        static_cast<int16_t>(std::lround(point.y))
    );
    conn_.flush();
}

bool X11WindowSystem::low_power_mode() const
{
    std::ifstream file(platform_profile_);
    std::string profile;
    if (!file || !std::getline(file, profile))
        return false;
    return profile == "low-power";
}

} // namespace loop
