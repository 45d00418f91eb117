#pragma once

#include "loop/core/scheduler.hpp"
#include "loop/core/types.hpp"
#include "loop/core/window.hpp"
#include <chrono>
#include <functional>
#include <unordered_map>

namespace loop {

/**
 * @brief Interpolates window frames on the scheduler
 *
 * Ease-out over DURATION at roughly 60 Hz. A new animation for a window replaces
 * the running one; the completion of the replaced animation never fires.
 */
class FrameAnimator
{
public:
    static constexpr std::chrono::milliseconds DURATION{ 150 };
    static constexpr std::chrono::milliseconds FRAME_INTERVAL{ 16 };

    explicit FrameAnimator(Scheduler& scheduler);
    ~FrameAnimator();

    /// Animates to target; intermediate frames stay inside bounds unless bounds is empty.
    void animate(WindowPtr const& window, Rect const& target, Rect const& bounds, std::function<void()> on_done = {});

    /// Sets the frame immediately, cancelling any running animation.
    void set_frame(WindowPtr const& window, Rect const& frame);

    void cancel(WindowId id);
    bool animating(WindowId id) const { return animations_.contains(id); }

private:
    struct Animation
    {
        WindowPtr window;
        Rect from;
        Rect to;
        Rect bounds;
        Scheduler::TimePoint start;
        std::function<void()> on_done;
        Scheduler::TaskId task = 0;
    };

    void step(WindowId id);

    Scheduler& scheduler_;
    std::unordered_map<WindowId, Animation> animations_;
};

} // namespace loop
