#include "middle_click_observer.hpp"
#include "loop/core/log.hpp"
#include <chrono>

namespace loop {

namespace {

constexpr uint8_t LEFT_BUTTON = 1;
constexpr uint8_t MIDDLE_BUTTON = 2;
constexpr uint8_t RIGHT_BUTTON = 3;
constexpr double MIN_TRIGGER_DELAY = 0.1;

} // namespace

MiddleClickObserver::MiddleClickObserver(
    Config const& config,
    Scheduler& scheduler,
    PointerEvents& pointer_events,
    std::function<void()> open,
    std::function<void(bool force)> close
)
    : config_(config)
    , pointer_events_(pointer_events)
    , open_(std::move(open))
    , close_(std::move(close))
    , delay_(scheduler)
{
}

void MiddleClickObserver::start()
{
    if (subscription_.active())
        return;
    subscription_ = pointer_events_.subscribe([this](PointerEvent const& event) { handle(event); });
    LOG_DEBUG("Middle-click trigger listening");
}

void MiddleClickObserver::stop()
{
    delay_.cancel();
    subscription_.reset();
}

void MiddleClickObserver::handle(PointerEvent const& event)
{
    if (!config_.trigger.middle_click || event.type == PointerEventType::Moved)
        return;
    if (event.button == LEFT_BUTTON || event.button == RIGHT_BUTTON)
        return;

    if (event.type == PointerEventType::ButtonDown && event.button == MIDDLE_BUTTON)
    {
        double delay = config_.trigger.delay;
        if (config_.trigger.delay_on_middle_click && delay > MIN_TRIGGER_DELAY)
        {
            auto duration = std::chrono::duration_cast<Scheduler::Clock::duration>(std::chrono::duration<double>(delay));
            delay_.schedule(duration, [this] { open_(); });
            LOG_DEBUG("Middle click, opening in {}s", delay);
        }
        else
        {
            open_();
        }
        return;
    }

    delay_.cancel();
    close_(false);
}

} // namespace loop
