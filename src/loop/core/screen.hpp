#pragma once

#include "loop/core/types.hpp"
#include <span>
#include <vector>

namespace loop::screens {

/// Minimum shared extent for two screens to count as neighbours.
constexpr double OVERLAP_THRESHOLD = 10.0;

/**
 * @brief Screen a window belongs to
 *
 * A single screen is returned directly. Otherwise the first screen fully
 * containing the frame, else the one with the largest intersection, else the
 * first screen. Returns nullptr only for an empty list.
 */
Screen const* screen_containing(std::span<Screen const> screens, Rect const& frame);

/// Screen under a point, nullptr when the point is on no screen.
Screen const* screen_at(std::span<Screen const> screens, Point const& point);

/// Screens ordered top-to-bottom, then left-to-right.
std::vector<Screen> ordered(std::span<Screen const> screens);

/// Next / previous in the ordered list, wrapping around.
Screen const* next_screen(std::span<Screen const> screens, Screen const& current);
Screen const* previous_screen(std::span<Screen const> screens, Screen const& current);

/**
 * @brief Neighbouring screen in a direction
 *
 * @param direction one of edge::Left/Right/Top/Bottom
 *
 * Direct neighbours must overlap by OVERLAP_THRESHOLD on the perpendicular axis;
 * the closest wins. Without one the search wraps to the far end of the row or
 * column.
 */
Screen const* directional_screen(std::span<Screen const> screens, Screen const& current, EdgeSet direction);

/// Screen furthest to the left/right sharing a row with current, or current itself.
Screen const& leftmost_in_row(std::span<Screen const> screens, Screen const& current, double threshold);
Screen const& rightmost_in_row(std::span<Screen const> screens, Screen const& current, double threshold);

} // namespace loop::screens
