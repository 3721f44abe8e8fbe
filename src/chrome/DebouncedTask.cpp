#include "chrome/DebouncedTask.hpp"

#include <utility>

namespace fk::chrome
{

DebouncedTask::DebouncedTask(Scheduler &scheduler,
                             std::chrono::milliseconds interval,
                             std::function<void()> action)
  : scheduler_(scheduler),
    interval_(interval),
    action_(std::move(action))
{
}

DebouncedTask::~DebouncedTask()
{
    if (pending_)
    {
        scheduler_.cancel(*pending_);
    }
}

void DebouncedTask::request()
{
    if (pending_)
    {
        scheduler_.cancel(*pending_);
    }
    armed_ = true;
    pending_ = scheduler_.schedule_once(interval_, [this] { fire(); });
}

void DebouncedTask::fire()
{
    pending_.reset();
    if (!armed_)
    {
        return;
    }
    armed_ = false;
    if (!suppressed_ && action_)
    {
        action_();
    }
}

} // namespace fk::chrome
