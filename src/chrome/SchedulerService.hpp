#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <queue>
#include <unordered_set>
#include <vector>

namespace fk::chrome
{

// Delayed one-shot work on the UI thread.
class Scheduler
{
  public:
    using Clock = std::chrono::steady_clock;
    using TaskId = std::size_t;
    using Callback = std::function<void()>;

    virtual ~Scheduler() = default;

    virtual TaskId schedule_once(std::chrono::milliseconds delay,
                                 Callback callback) = 0;
    // Returns false when the task already ran or was never scheduled.
    virtual bool cancel(TaskId id) = 0;
};

// Cooperative scheduler pumped by the owning message loop. The clock is
// injectable so tests can drive time.
class SchedulerService : public Scheduler
{
  public:
    using NowFunction = std::function<Clock::time_point()>;

    explicit SchedulerService(NowFunction now = &Clock::now);

    TaskId schedule_once(std::chrono::milliseconds delay,
                         Callback callback) override;
    bool cancel(TaskId id) override;

    // Run due tasks. Returns how many were executed.
    size_t tick(Clock::time_point now);
    size_t tick()
    {
        return tick(now_());
    }

    // Helper for the main loop: "How long can I sleep before work is due?"
    std::chrono::milliseconds time_until_next_task(Clock::time_point now);

    size_t pending() const noexcept
    {
        return tasks_.size() - cancelled_.size();
    }

  private:
    struct Task
    {
        TaskId id;
        Clock::time_point next_run;
        Callback callback;

        // Min-heap priority queue needs > operator for smallest-first; ties
        // run in scheduling order.
        bool operator>(Task const &other) const
        {
            if (next_run == other.next_run)
            {
                return id > other.id;
            }
            return next_run > other.next_run;
        }
    };

    void drop_cancelled_head();

    NowFunction now_;
    std::priority_queue<Task, std::vector<Task>, std::greater<Task>> tasks_;
    std::unordered_set<TaskId> queued_;
    std::unordered_set<TaskId> cancelled_;
    TaskId next_id_ = 1;
};

} // namespace fk::chrome
