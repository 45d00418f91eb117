#pragma once

#include "loop/config/config.hpp"
#include "loop/core/action.hpp"
#include "loop/core/types.hpp"
#include <optional>

namespace loop {

/**
 * @brief Interaction-scoped geometry state
 *
 * Relative actions (grow, shrink, size adjust, move) chain off last_target_frame.
 * sides_to_adjust is chosen on the first relative step and kept until a
 * non-relative action resets it.
 */
struct FrameState
{
    std::optional<EdgeSet> sides_to_adjust;
    Rect last_target_frame;
};

} // namespace loop

namespace loop::resolver {

/// What the resolver needs to know about a real window.
struct WindowSnapshot
{
    Rect frame;
    bool resizable = true;
    std::optional<Rect> initial_frame;
    std::optional<Action> last_action; ///< Action preceding the current one (undo target)
};

struct Request
{
    Action action;
    std::optional<WindowSnapshot> window;
    Rect bounds;
    std::optional<double> screen_diagonal; ///< Inches; checked against the padding minimum
    bool disable_padding = false;
    bool is_preview = false;
    std::optional<Rect> proportional_frame; ///< 0..1 fractions carried across screens
    Rect reference_screen_frame;            ///< Primary screen, scales pixel sizes without a window
};

/// Target frame of an action. Updates state.last_target_frame unless padding is disabled.
Rect resolve(Request const& request, GeometryConfig const& config, FrameState& state);

/// Whether outer padding applies on a screen of the given diagonal.
bool padding_applies(GeometryConfig const& config, std::optional<double> screen_diagonal);

/// Bounds inset by the outer padding (top includes the external bar).
Rect padded_bounds(Rect const& bounds, PaddingConfig const& padding);

/// Frame expressed as fractions of source_bounds, nullopt when outside or implausible.
std::optional<Rect> proportional_frame(Rect const& frame, Rect const& source_bounds);

} // namespace loop::resolver
