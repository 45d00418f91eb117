#include "frame_animator.hpp"
#include "loop/core/geometry.hpp"
#include "loop/core/log.hpp"
#include <algorithm>

namespace loop {

namespace {

double ease_out(double t)
{
    double inverse = 1.0 - t;
    return 1.0 - inverse * inverse * inverse;
}

double lerp(double a, double b, double t) { return a + (b - a) * t; }

} // namespace

FrameAnimator::FrameAnimator(Scheduler& scheduler)
    : scheduler_(scheduler)
{
}

FrameAnimator::~FrameAnimator()
{
    for (auto const& [id, animation] : animations_)
        scheduler_.cancel(animation.task);
}

void FrameAnimator::animate(WindowPtr const& window, Rect const& target, Rect const& bounds, std::function<void()> on_done)
{
    WindowId id = window->id();
    cancel(id);

    Animation animation{
        .window = window,
        .from = window->frame(),
        .to = target,
        .bounds = bounds,
        .start = scheduler_.now(),
        .on_done = std::move(on_done),
    };
    animation.task = scheduler_.schedule_after(std::chrono::milliseconds(0), [this, id] { step(id); });
    animations_[id] = std::move(animation);
    LOG_TRACE("Animating {:#x}", id);
}

void FrameAnimator::set_frame(WindowPtr const& window, Rect const& frame)
{
    cancel(window->id());
    window->set_frame(frame);
}

void FrameAnimator::cancel(WindowId id)
{
    auto it = animations_.find(id);
    if (it == animations_.end())
        return;
    scheduler_.cancel(it->second.task);
    animations_.erase(it);
}

void FrameAnimator::step(WindowId id)
{
    auto it = animations_.find(id);
    if (it == animations_.end())
        return;

    auto& animation = it->second;
    double elapsed = std::chrono::duration<double>(scheduler_.now() - animation.start).count();
    double t = std::clamp(elapsed / std::chrono::duration<double>(DURATION).count(), 0.0, 1.0);

    if (t >= 1.0)
    {
        animation.window->set_frame(animation.to);
        auto on_done = std::move(animation.on_done);
        animations_.erase(it);
        if (on_done)
            on_done();
        return;
    }

    double eased = ease_out(t);
    Rect frame{
        lerp(animation.from.x, animation.to.x, eased),
        lerp(animation.from.y, animation.to.y, eased),
        lerp(animation.from.width, animation.to.width, eased),
        lerp(animation.from.height, animation.to.height, eased),
    };
    if (animation.bounds.width > 0 && animation.bounds.height > 0)
        frame = geometry::push_inside(frame, animation.bounds);

    animation.window->set_frame(geometry::integral(frame));
    animation.task = scheduler_.schedule_after(FRAME_INTERVAL, [this, id] { step(id); });
}

} // namespace loop
