#pragma once

#include "loop/config/config.hpp"
#include "loop/core/history.hpp"
#include "loop/core/pointer_events.hpp"
#include "loop/core/scheduler.hpp"
#include "loop/core/window.hpp"
#include "loop/engine/frame_animator.hpp"
#include "loop/stash/stash_store.hpp"
#include <chrono>
#include <optional>
#include <unordered_map>

namespace loop {

/**
 * @brief Parks windows on screen edges and slides them back on hover
 *
 * A stashed window keeps a few pixels visible on its edge. Hovering that strip
 * reveals it (one revealed window at a time); leaving both the revealed frame
 * and the strip hides it again. Pointer moves are debounced and each window's
 * reveal/hide is throttled. Stashes on the same edge that would cover each
 * other too much are unstashed in favour of the newcomer.
 */
class StashManager
{
public:
    static constexpr std::chrono::milliseconds DEBOUNCE{ 50 };
    static constexpr std::chrono::milliseconds THROTTLE{ 100 };
    static constexpr double STACK_TOLERANCE = 100; ///< Vertical pixels a neighbour must keep uncovered
    static constexpr double HIDE_TOLERANCE = 15;   ///< Margin around the revealed frame before hiding
    static constexpr double ROW_THRESHOLD = 100;   ///< Vertical overlap for screens in the same row

    StashManager(
        Config const& config,
        WindowSystem& windows,
        WindowHistory& history,
        FrameAnimator& animator,
        Scheduler& scheduler,
        PointerEvents& pointer_events,
        StashStore& store
    );

    /// Restores stashes persisted by a previous run.
    void start();

    /// Called after an action resized window on screen.
    void on_window_resized(Action const& action, WindowPtr const& window, Screen const& screen);

    /// Toggles a stashed window occupying the placement of a Stash action.
    /// Returns true when the action was handled here.
    bool handle_if_stashed(Action const& action, Screen const& screen);

    std::optional<Rect> revealed_frame_for(WindowId id) const;

    void on_window_dragged(WindowId id) { unmanage(id); }

    /// Picks up the current screens, then recomputes and re-applies every stashed frame.
    void on_configuration_changed();

    /// Retries stashes that could not be restored at start.
    void on_desktop_changed();

    /// Puts every stashed window back at its initial frame.
    void restore_all(bool animate);

    bool managed(WindowId id) const { return store_.find(id) != nullptr; }
    bool revealed(WindowId id) const { return store_.revealed(id); }
    bool listening() const { return subscription_.active(); }

private:
    void stash(StashedWindow window);
    void unstash(WindowId id, bool reset_frame, bool animate);
    void unstash_overlapping(StashedWindow const& incoming);
    void unmanage(WindowId id);

    void reveal(StashedWindow const& window, bool animate);
    void hide(StashedWindow const& window, bool animate);
    bool throttled(WindowId id);
    void unfocus(WindowId id);

    void start_listening();
    void stop_listening();
    void on_pointer(PointerEvent const& event);
    void process_pointer(Point const& location);

    Rect stashed_frame(StashedWindow const& window) const;
    Rect revealed_frame(StashedWindow const& window) const;
    Screen screen_for_edge(Screen const& current, StashEdge edge) const;
    void set_frame(WindowPtr const& window, Rect const& frame, bool animate);

    Config const& config_;
    WindowSystem& windows_;
    WindowHistory& history_;
    FrameAnimator& animator_;
    Scheduler& scheduler_;
    PointerEvents& pointer_events_;
    StashStore& store_;

    PointerEvents::Subscription subscription_;
    DelayedTask debounce_;
    Point last_pointer_;
    std::unordered_map<WindowId, Scheduler::TimePoint> last_reveal_;
};

} // namespace loop
