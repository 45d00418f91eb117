#include "config.hpp"
#include "action_toml.hpp"
#include "loop/core/log.hpp"
#include "loop/keybind/keybind.hpp"
#include <X11/keysym.h>
#include <toml++/toml.hpp>

namespace loop {

namespace {

Action cycle_of(std::initializer_list<Direction> directions, KeySet keys = {}, std::optional<std::string> name = std::nullopt)
{
    std::vector<Action> members;
    for (Direction direction : directions)
        members.push_back(make_action(direction));
    return make_cycle_action(std::move(members), std::move(keys), std::move(name));
}

KeySet read_key_names(toml::array const& names)
{
    KeySet keys;
    for (auto const& item : names)
    {
        auto name = item.value<std::string>();
        if (!name)
            continue;
        if (auto key = parse_key(*name))
            keys.insert(*key);
        else
            LOG_WARN("Config: unknown key name '{}'", *name);
    }
    return keys;
}

template<typename T>
void read(toml::table const& table, char const* key, T& out)
{
    if (auto v = table[key].value<T>())
        out = *v;
}

void read_general(toml::table const& general, Config& cfg)
{
    if (auto trigger = general["trigger"].as_array())
    {
        auto keys = read_key_names(*trigger);
        if (!keys.empty())
            cfg.trigger.keys = std::move(keys);
    }
    read(general, "trigger_delay", cfg.trigger.delay);
    read(general, "middle_click_triggers_loop", cfg.trigger.middle_click);
    read(general, "enable_trigger_delay_on_middle_click", cfg.trigger.delay_on_middle_click);

    if (auto passthrough = general["passthrough_keys"].as_array())
    {
        auto keys = read_key_names(*passthrough);
        cfg.trigger.passthrough_keys.assign(keys.begin(), keys.end());
    }
    if (auto shortcuts = general["system_shortcuts"].as_array())
    {
        cfg.trigger.system_shortcuts.clear();
        for (auto const& item : *shortcuts)
        {
            if (auto names = item.as_array())
            {
                auto keys = read_key_names(*names);
                if (!keys.empty())
                    cfg.trigger.system_shortcuts.push_back(std::move(keys));
            }
        }
    }

    read(general, "size_increment", cfg.geometry.size_increment);
    read(general, "preview_visibility", cfg.geometry.preview_visibility);
    read(general, "preview_padding", cfg.geometry.preview_padding);

    auto& behavior = cfg.behavior;
    read(general, "radial_menu_thickness", behavior.radial_menu_thickness);
    read(general, "cycle_mode_restart", behavior.cycle_mode_restart);
    read(general, "cycle_backwards_on_shift", behavior.cycle_backwards_on_shift);
    read(general, "use_screen_with_cursor", behavior.use_screen_with_cursor);
    read(general, "resize_window_under_cursor", behavior.resize_window_under_cursor);
    read(general, "focus_window_on_resize", behavior.focus_window_on_resize);
    read(general, "move_cursor_with_window", behavior.move_cursor_with_window);
    read(general, "animate_window_resizes", behavior.animate_window_resizes);
    read(general, "ignore_low_power_mode", behavior.ignore_low_power_mode);
    read(general, "disable_cursor_interaction", behavior.disable_cursor_interaction);
    read(general, "ignore_fullscreen", behavior.ignore_fullscreen);
    read(general, "use_system_window_manager", behavior.use_system_window_manager);
    read(general, "restore_window_frame_on_drag", behavior.restore_window_frame_on_drag);
    read(general, "window_snapping", behavior.window_snapping);
    read(general, "snap_threshold", behavior.snap_threshold);

    if (auto excluded = general["excluded_apps"].as_array())
    {
        behavior.excluded_apps.clear();
        for (auto const& item : *excluded)
        {
            if (auto v = item.value<std::string>())
                behavior.excluded_apps.push_back(*v);
        }
    }
}

void read_padding(toml::table const& padding, PaddingConfig& out)
{
    read(padding, "enabled", out.enabled);
    read(padding, "window", out.window);
    read(padding, "external_bar", out.external_bar);
    read(padding, "top", out.top);
    read(padding, "bottom", out.bottom);
    read(padding, "left", out.left);
    read(padding, "right", out.right);
    read(padding, "minimum_screen_size", out.minimum_screen_size);
}

// Radial slots are single action tables; a bad one keeps the default.
void read_radial_slot(toml::table const& radial, char const* key, Action& slot)
{
    auto table = radial[key].as_table();
    if (!table)
        return;

    std::string error;
    if (auto action = action_from_toml(*table, error))
        slot = std::move(*action);
    else
        LOG_WARN("Config: radial.{}: {}", key, error);
}

} // namespace

Config default_config()
{
    Config cfg;

    cfg.trigger.keys = { XK_Super_L };

    cfg.actions = {
        make_action(Direction::Maximize, { XK_space }),
        make_action(Direction::Center, { XK_Return }),
        cycle_of({ Direction::TopHalf, Direction::TopThird, Direction::TopTwoThirds }, { XK_Up }, "Top Cycle"),
        cycle_of({ Direction::BottomHalf, Direction::BottomThird, Direction::BottomTwoThirds }, { XK_Down }, "Bottom Cycle"),
        cycle_of({ Direction::RightHalf, Direction::RightThird, Direction::RightTwoThirds }, { XK_Right }, "Right Cycle"),
        cycle_of({ Direction::LeftHalf, Direction::LeftThird, Direction::LeftTwoThirds }, { XK_Left }, "Left Cycle"),
        make_action(Direction::TopLeftQuarter, { XK_Up, XK_Left }),
        make_action(Direction::TopRightQuarter, { XK_Up, XK_Right }),
        make_action(Direction::BottomRightQuarter, { XK_Down, XK_Right }),
        make_action(Direction::BottomLeftQuarter, { XK_Down, XK_Left }),
    };

    cfg.radial.top = cycle_of({ Direction::TopHalf, Direction::TopThird, Direction::TopTwoThirds });
    cfg.radial.top_right = make_action(Direction::TopRightQuarter);
    cfg.radial.right = cycle_of({ Direction::RightHalf, Direction::RightThird, Direction::RightTwoThirds });
    cfg.radial.bottom_right = make_action(Direction::BottomRightQuarter);
    cfg.radial.bottom = cycle_of({ Direction::BottomHalf, Direction::BottomThird, Direction::BottomTwoThirds });
    cfg.radial.bottom_left = make_action(Direction::BottomLeftQuarter);
    cfg.radial.left = cycle_of({ Direction::LeftHalf, Direction::LeftThird, Direction::LeftTwoThirds });
    cfg.radial.top_left = make_action(Direction::TopLeftQuarter);
    cfg.radial.center = cycle_of({ Direction::Maximize, Direction::MacOSCenter });

    return cfg;
}

std::optional<Config> load_config(std::string const& path)
{
    try
    {
        auto tbl = toml::parse_file(path);
        Config cfg = default_config();

        if (auto general = tbl["general"].as_table())
            read_general(*general, cfg);

        if (auto padding = tbl["padding"].as_table())
            read_padding(*padding, cfg.geometry.padding);

        if (auto stash = tbl["stash"].as_table())
        {
            read(*stash, "visible_padding", cfg.stash.visible_padding);
            read(*stash, "animate", cfg.stash.animate);
            read(*stash, "shift_focus", cfg.stash.shift_focus);
        }

        // Actions replace the defaults as a whole
        if (auto actions = tbl["actions"].as_array())
        {
            cfg.actions.clear();
            for (auto const& item : *actions)
            {
                auto table = item.as_table();
                if (!table)
                    continue;

                std::string error;
                auto action = action_from_toml(*table, error);
                if (!action)
                {
                    LOG_ERROR("Config error in {}: {}", path, error);
                    return std::nullopt;
                }
                cfg.actions.push_back(std::move(*action));
            }
        }

        if (auto radial = tbl["radial"].as_table())
        {
            read_radial_slot(*radial, "top", cfg.radial.top);
            read_radial_slot(*radial, "top_right", cfg.radial.top_right);
            read_radial_slot(*radial, "right", cfg.radial.right);
            read_radial_slot(*radial, "bottom_right", cfg.radial.bottom_right);
            read_radial_slot(*radial, "bottom", cfg.radial.bottom);
            read_radial_slot(*radial, "bottom_left", cfg.radial.bottom_left);
            read_radial_slot(*radial, "left", cfg.radial.left);
            read_radial_slot(*radial, "top_left", cfg.radial.top_left);
            read_radial_slot(*radial, "center", cfg.radial.center);
        }

        return cfg;
    }
    catch (toml::parse_error const& err)
    {
        LOG_ERROR("Config parse error: {}", err.description());
        return std::nullopt;
    }
    catch (std::exception const& e)
    {
        LOG_ERROR("Config error: {}", e.what());
        return std::nullopt;
    }
}

} // namespace loop
