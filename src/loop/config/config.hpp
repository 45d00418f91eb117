#pragma once

#include "loop/core/action.hpp"
#include "loop/core/types.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace loop {

struct PaddingConfig
{
    bool enabled = false;
    double window = 0;       // Gap between adjacent windows (half applied per edge)
    double external_bar = 0; // Extra top inset for a status bar
    double top = 0;
    double bottom = 0;
    double left = 0;
    double right = 0;
    double minimum_screen_size = 0; // Diagonal in inches; 0 pads every screen

    double total_top() const { return top + external_bar; }
};

/// Settings the geometry resolver reads.
struct GeometryConfig
{
    double size_increment = 20;
    bool preview_visibility = true;
    double preview_padding = 10;
    PaddingConfig padding;
};

struct TriggerConfig
{
    KeySet keys;
    double delay = 0; // Seconds
    bool middle_click = false;
    bool delay_on_middle_click = false;
    std::vector<Key> passthrough_keys;
    std::vector<KeySet> system_shortcuts;
};

struct BehaviorConfig
{
    double radial_menu_thickness = 22;
    bool cycle_mode_restart = false;
    bool cycle_backwards_on_shift = true;
    bool use_screen_with_cursor = true;
    bool resize_window_under_cursor = false;
    bool focus_window_on_resize = true;
    bool move_cursor_with_window = false;
    bool animate_window_resizes = false;
    bool ignore_low_power_mode = false;
    bool disable_cursor_interaction = false;
    bool ignore_fullscreen = false;
    bool use_system_window_manager = false;
    bool restore_window_frame_on_drag = false;
    bool window_snapping = false;
    double snap_threshold = 2; // Pixels from the screen edge that trigger snapping
    std::vector<std::string> excluded_apps; // WM_CLASS class names
};

struct StashConfig
{
    double visible_padding = 20; // Pixels left on screen when hidden
    bool animate = true;
    bool shift_focus = true;
};

struct RadialConfig
{
    Action top;
    Action top_right;
    Action right;
    Action bottom_right;
    Action bottom;
    Action bottom_left;
    Action left;
    Action top_left;
    Action center;
};

struct Config
{
    TriggerConfig trigger;
    GeometryConfig geometry;
    BehaviorConfig behavior;
    StashConfig stash;
    RadialConfig radial;
    std::vector<Action> actions;
};

std::optional<Config> load_config(std::string const& path);
Config default_config();

} // namespace loop
