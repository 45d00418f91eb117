#pragma once

#include "loop/core/pointer_events.hpp"
#include "loop/core/scheduler.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <thread>

namespace loop {

/**
 * @brief PointerSource that samples the pointer on its own connection
 *
 * X only reports pointer motion to the window under the pointer, so a
 * background thread queries it every POLL_INTERVAL and turns changes of
 * position and button mask into events. Events are posted to the scheduler;
 * moves are droppable when the queue backs up.
 */
class PointerPoller : public PointerSource
{
public:
    using Sink = std::function<void(PointerEvent const&)>;

    static constexpr auto POLL_INTERVAL = std::chrono::milliseconds(10);

    /// @param display X display for the polling connection, $DISPLAY when empty
    PointerPoller(Scheduler& scheduler, Sink sink, std::string display = {});
    ~PointerPoller() override;

    void start() override;
    void stop() override;
    bool running() const { return thread_.joinable(); }

private:
    void run(std::stop_token stop);

    Scheduler& scheduler_;
    Sink sink_;
    std::string display_;
    std::jthread thread_;
};

} // namespace loop
