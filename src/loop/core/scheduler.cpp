#include "scheduler.hpp"
#include "log.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <sys/eventfd.h>
#include <unistd.h>
#include <vector>

namespace loop {

Scheduler::Scheduler(std::function<TimePoint()> clock)
    : clock_(std::move(clock))
{
    wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0)
        throw std::runtime_error(std::string("Failed to create eventfd: ") + std::strerror(errno));
}

Scheduler::~Scheduler()
{
    if (wake_fd_ >= 0)
        close(wake_fd_);
}

Scheduler::TaskId Scheduler::schedule_after(Clock::duration delay, Task task)
{
    TaskId id = next_id_++;
    timers_[id] = Timer{ now() + delay, std::move(task) };
    return id;
}

void Scheduler::cancel(TaskId id) { timers_.erase(id); }

bool Scheduler::post(Task task, bool droppable)
{
    {
        std::lock_guard lock(posted_mutex_);
        if (posted_.size() >= MAX_POSTED)
        {
            auto victim = std::ranges::find_if(posted_, [](Posted const& p) { return p.droppable; });
            if (victim == posted_.end())
            {
                LOG_WARN("Scheduler queue full, dropping task");
                return false;
            }
            posted_.erase(victim);
        }
        posted_.push_back(Posted{ std::move(task), droppable });
    }

    uint64_t one = 1;
    if (write(wake_fd_, &one, sizeof(one)) < 0 && errno != EAGAIN)
        LOG_WARN("Failed to wake scheduler: {}", std::strerror(errno));
    return true;
}

std::optional<Scheduler::TimePoint> Scheduler::next_deadline() const
{
    if (timers_.empty())
        return std::nullopt;

    auto it = std::ranges::min_element(timers_, {}, [](auto const& entry) { return entry.second.deadline; });
    return it->second.deadline;
}

int Scheduler::poll_timeout_ms() const
{
    auto deadline = next_deadline();
    if (!deadline)
        return -1;

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - now()).count();
    // Round up so poll() does not wake just before the deadline
    if (*deadline > now() + std::chrono::milliseconds(remaining))
        ++remaining;
    return static_cast<int>(std::max<int64_t>(0, remaining));
}

void Scheduler::drain_wake_fd()
{
    uint64_t value = 0;
    while (read(wake_fd_, &value, sizeof(value)) > 0)
    {
    }
}

void Scheduler::run_pending()
{
    drain_wake_fd();

    std::deque<Posted> posted;
    {
        std::lock_guard lock(posted_mutex_);
        posted.swap(posted_);
    }
    for (auto& entry : posted)
        entry.task();

    // Timers scheduled by the tasks below run on the next call
    TimePoint current = now();
    std::vector<std::pair<TimePoint, TaskId>> due;
    for (auto const& [id, timer] : timers_)
    {
        if (timer.deadline <= current)
            due.emplace_back(timer.deadline, id);
    }
    std::ranges::sort(due);

    for (auto const& [deadline, id] : due)
    {
        auto it = timers_.find(id);
        if (it == timers_.end())
            continue;
        Task task = std::move(it->second.task);
        timers_.erase(it);
        task();
    }
}

void DelayedTask::schedule(Scheduler::Clock::duration delay, Scheduler::Task task)
{
    cancel();
    id_ = scheduler_.schedule_after(delay, std::move(task));
}

void DelayedTask::cancel()
{
    if (id_)
    {
        scheduler_.cancel(*id_);
        id_.reset();
    }
}

} // namespace loop
