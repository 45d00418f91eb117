#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>

namespace loop {

/**
 * @brief Single-threaded cooperative executor
 *
 * Timers and posted tasks run on the thread calling run_pending(). post() is the
 * only member safe to call from other threads; it wakes the owner through an
 * eventfd that the daemon adds to its poll set.
 */
class Scheduler
{
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Task = std::function<void()>;
    using TaskId = uint64_t;

    static constexpr size_t MAX_POSTED = 1024;

    explicit Scheduler(std::function<TimePoint()> clock = &Clock::now);
    ~Scheduler();

    Scheduler(Scheduler const&) = delete;
    Scheduler& operator=(Scheduler const&) = delete;

    TimePoint now() const { return clock_(); }

    TaskId schedule_after(Clock::duration delay, Task task);
    void cancel(TaskId id);
    bool pending(TaskId id) const { return timers_.contains(id); }

    /**
     * Queue a task from any thread. When the queue is full the oldest droppable
     * task is evicted; a full queue of non-droppable tasks rejects the new one.
     */
    bool post(Task task, bool droppable = false);

    std::optional<TimePoint> next_deadline() const;

    /// Milliseconds until the next timer for poll(), -1 when there is none.
    int poll_timeout_ms() const;

    /// Runs posted tasks, then every timer due at the time of the call.
    void run_pending();

    int wake_fd() const { return wake_fd_; }

private:
    struct Timer
    {
        TimePoint deadline;
        Task task;
    };

    struct Posted
    {
        Task task;
        bool droppable = false;
    };

    void drain_wake_fd();

    std::function<TimePoint()> clock_;
    std::map<TaskId, Timer> timers_;
    TaskId next_id_ = 1;
    int wake_fd_ = -1;

    std::mutex posted_mutex_;
    std::deque<Posted> posted_;
};

/**
 * @brief One pending timer at a time
 *
 * schedule() replaces whatever was pending. The timer is cancelled on destruction.
 */
class DelayedTask
{
public:
    explicit DelayedTask(Scheduler& scheduler)
        : scheduler_(scheduler)
    {
    }
    ~DelayedTask() { cancel(); }

    DelayedTask(DelayedTask const&) = delete;
    DelayedTask& operator=(DelayedTask const&) = delete;

    void schedule(Scheduler::Clock::duration delay, Scheduler::Task task);
    void cancel();
    bool pending() const { return id_ && scheduler_.pending(*id_); }

private:
    Scheduler& scheduler_;
    std::optional<Scheduler::TaskId> id_;
};

} // namespace loop
