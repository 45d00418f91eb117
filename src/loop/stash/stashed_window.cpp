#include "stashed_window.hpp"
#include "loop/core/log.hpp"
#include <algorithm>

namespace loop {

Rect StashedWindow::revealed_frame(resolver::WindowSnapshot const& snapshot, GeometryConfig const& config) const
{
    // Stash frames never feed back into a session, so they resolve on scratch state
    FrameState scratch;
    resolver::Request request{
        .action = action,
        .window = snapshot,
        .bounds = screen.visible_frame,
        .screen_diagonal = screen.diagonal_inches,
        .reference_screen_frame = screen.frame,
    };
    return resolver::resolve(request, config, scratch);
}

Rect StashedWindow::stashed_frame(resolver::WindowSnapshot const& snapshot, GeometryConfig const& config, double peek) const
{
    Rect const& bounds = screen.visible_frame;
    Rect frame = revealed_frame(snapshot, config);

    double clamped = std::max(1.0, std::min(peek, frame.width * MAX_PEEK_FRACTION));

    auto edge = action.stash_edge();
    if (!edge)
    {
        LOG_WARN("Stashed frame requested for non-stash action {}", action.display_name());
        return frame;
    }

    if (*edge == StashEdge::Left)
        frame.x = bounds.min_x() - frame.width + clamped;
    else
        frame.x = bounds.max_x() - clamped;
    return frame;
}

} // namespace loop
