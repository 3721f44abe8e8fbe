#include "chrome/SchedulerService.hpp"

#include <utility>

namespace fk::chrome
{

SchedulerService::SchedulerService(NowFunction now) : now_(std::move(now))
{
}

auto SchedulerService::schedule_once(std::chrono::milliseconds delay,
                                     Callback callback) -> TaskId
{
    TaskId id = next_id_++;
    tasks_.push({id, now_() + delay, std::move(callback)});
    queued_.insert(id);
    return id;
}

bool SchedulerService::cancel(TaskId id)
{
    if (queued_.find(id) == queued_.end())
    {
        return false;
    }
    return cancelled_.insert(id).second;
}

void SchedulerService::drop_cancelled_head()
{
    while (!tasks_.empty())
    {
        auto const id = tasks_.top().id;
        if (cancelled_.erase(id) == 0)
        {
            return;
        }
        queued_.erase(id);
        tasks_.pop();
    }
}

size_t SchedulerService::tick(Clock::time_point now)
{
    size_t executed = 0;

    drop_cancelled_head();
    while (!tasks_.empty() && tasks_.top().next_run <= now)
    {
        Task task = tasks_.top();
        tasks_.pop();
        queued_.erase(task.id);

        // A callback may schedule or cancel; the queue is consistent here.
        if (task.callback)
        {
            task.callback();
            executed++;
        }
        drop_cancelled_head();
    }
    return executed;
}

std::chrono::milliseconds
SchedulerService::time_until_next_task(Clock::time_point now)
{
    drop_cancelled_head();
    if (tasks_.empty())
    {
        return std::chrono::hours(24);
    }
    auto next = tasks_.top().next_run;
    if (now >= next)
    {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::ceil<std::chrono::milliseconds>(next - now);
}

} // namespace fk::chrome
