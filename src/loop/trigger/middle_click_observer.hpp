#pragma once

#include "loop/config/config.hpp"
#include "loop/core/pointer_events.hpp"
#include "loop/core/scheduler.hpp"
#include <functional>

namespace loop {

/// Opens a session while the middle button is held, optionally after the trigger delay.
class MiddleClickObserver
{
public:
    MiddleClickObserver(
        Config const& config,
        Scheduler& scheduler,
        PointerEvents& pointer_events,
        std::function<void()> open,
        std::function<void(bool force)> close
    );

    void start();
    void stop();
    bool running() const { return subscription_.active(); }

private:
    void handle(PointerEvent const& event);

    Config const& config_;
    PointerEvents& pointer_events_;
    std::function<void()> open_;
    std::function<void(bool)> close_;
    DelayedTask delay_;
    PointerEvents::Subscription subscription_;
};

} // namespace loop
