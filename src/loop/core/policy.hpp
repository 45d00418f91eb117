#pragma once

#include "loop/core/direction.hpp"
#include "loop/core/types.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <optional>

namespace loop::cycle_policy {

/// Index after current in a cycle of count members, wrapping both ways. Starts at 0 without a current index.
inline size_t next_index(std::optional<size_t> current, size_t count, bool backwards)
{
    if (!current || count == 0)
        return 0;
    if (backwards)
        return *current == 0 ? count - 1 : *current - 1;
    return (*current + 1) % count;
}

} // namespace loop::cycle_policy

namespace loop::radial_policy {

enum class Slot
{
    Idle,
    Center,
    Right,
    BottomRight,
    Bottom,
    BottomLeft,
    Left,
    TopLeft,
    Top,
    TopRight,
};

constexpr double RADIAL_RADIUS = 50.0;
constexpr double CENTER_DEAD_ZONE = 10.0;

/**
 * Sector chosen by a pointer offset from the session start point.
 * angle is in degrees with 0 pointing right and 90 pointing down.
 */
inline Slot select_slot(double angle, double distance, double thickness)
{
    if (distance > RADIAL_RADIUS - thickness)
    {
        double normalized = std::fmod(angle, 360.0);
        if (normalized < 0)
            normalized += 360.0;

        switch (static_cast<int>((normalized + 22.5) / 45.0))
        {
            case 1:
                return Slot::BottomRight;
            case 2:
                return Slot::Bottom;
            case 3:
                return Slot::BottomLeft;
            case 4:
                return Slot::Left;
            case 5:
                return Slot::TopLeft;
            case 6:
                return Slot::Top;
            case 7:
                return Slot::TopRight;
            default:
                return Slot::Right;
        }
    }
    if (distance > CENTER_DEAD_ZONE)
        return Slot::Center;
    return Slot::Idle;
}

} // namespace loop::radial_policy

namespace loop::stash_policy {

/**
 * Whether two vertical ranges leave at least tolerance uncovered.
 * Disjoint ranges always do. Otherwise the longer range is the reference and
 * the shorter one must stick out below or above it by tolerance.
 */
inline bool ranges_non_overlapping_by(double tolerance, double a_min, double a_max, double b_min, double b_max)
{
    if (a_max < b_min || b_max < a_min)
        return true;

    bool a_longer = (a_max - a_min) >= (b_max - b_min);
    double ref_min = a_longer ? a_min : b_min;
    double ref_max = a_longer ? a_max : b_max;
    double other_min = a_longer ? b_min : a_min;
    double other_max = a_longer ? b_max : a_max;

    double below = other_min < ref_min ? ref_min - other_min : 0;
    double above = other_max > ref_max ? other_max - ref_max : 0;
    return below >= tolerance || above >= tolerance;
}

} // namespace loop::stash_policy

namespace loop::animation_policy {

inline bool should_animate(bool enhanced_ui, bool animate_setting, bool low_power, bool ignore_low_power)
{
    if (enhanced_ui)
        return false;
    if (!animate_setting)
        return false;
    if (low_power && !ignore_low_power)
        return false;
    return true;
}

} // namespace loop::animation_policy

namespace loop::trigger_policy {

constexpr std::chrono::milliseconds RELEASE_BURST_WINDOW{ 100 };

/// A key-up within the burst window of the previous one belongs to the same release.
inline bool within_release_burst(
    std::optional<std::chrono::steady_clock::time_point> last_release,
    std::chrono::steady_clock::time_point now
)
{
    return last_release && now - *last_release < RELEASE_BURST_WINDOW;
}

} // namespace loop::trigger_policy

namespace loop::snap_policy {

/**
 * Part of the screen where a dragged window is left alone.
 * The frame is inset by threshold on every side; the top inset also covers
 * half of a panel reserved at the top of the screen.
 */
inline Rect ignored_frame(Screen const& screen, double threshold)
{
    Rect const& frame = screen.frame;
    double top = std::max((screen.visible_frame.min_y() - frame.min_y()) / 2, threshold);
    return { frame.x + threshold,
             frame.y + top,
             std::max(0.0, frame.width - 2 * threshold),
             std::max(0.0, frame.height - top - threshold) };
}

/**
 * Layout for a window dropped with the cursor at cursor.
 * Side edges give halves, or quarters in their top and bottom eighths. The top
 * edge maximizes, or gives quarters in its outer fifths. The bottom edge gives
 * thirds. Anywhere inside the ignored frame gives NoAction.
 */
inline Direction snap_direction(Point const& cursor, Screen const& screen, double threshold)
{
    Rect const& frame = screen.frame;
    Rect ignored = ignored_frame(screen, threshold);

    if (cursor.x < ignored.min_x() || cursor.x > ignored.max_x())
    {
        bool left = cursor.x < ignored.min_x();
        if (cursor.y < frame.min_y() + frame.height / 8)
            return left ? Direction::TopLeftQuarter : Direction::TopRightQuarter;
        if (cursor.y > frame.max_y() - frame.height / 8)
            return left ? Direction::BottomLeftQuarter : Direction::BottomRightQuarter;
        return left ? Direction::LeftHalf : Direction::RightHalf;
    }

    if (cursor.y < ignored.min_y())
    {
        if (cursor.x < frame.min_x() + frame.width / 5)
            return Direction::TopLeftQuarter;
        if (cursor.x > frame.max_x() - frame.width / 5)
            return Direction::TopRightQuarter;
        return Direction::Maximize;
    }

    if (cursor.y > ignored.max_y())
    {
        if (cursor.x < frame.min_x() + frame.width / 3)
            return Direction::LeftThird;
        if (cursor.x > frame.max_x() - frame.width / 3)
            return Direction::RightThird;
        return Direction::HorizontalCenterThird;
    }

    return Direction::NoAction;
}

} // namespace loop::snap_policy
