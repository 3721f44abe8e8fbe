#pragma once

#include "chrome/SchedulerService.hpp"

#include <chrono>
#include <functional>
#include <optional>

namespace fk::chrome
{

// Runs `action` once the requests stop arriving for `interval`. Each request
// restarts the interval. A suppressed task still fires but drops the action;
// suppression only ends with resume(), never with a new request.
class DebouncedTask
{
  public:
    DebouncedTask(Scheduler &scheduler, std::chrono::milliseconds interval,
                  std::function<void()> action);
    ~DebouncedTask();

    DebouncedTask(DebouncedTask const &) = delete;
    DebouncedTask &operator=(DebouncedTask const &) = delete;

    void request();
    void suppress() noexcept
    {
        suppressed_ = true;
    }
    void resume() noexcept
    {
        suppressed_ = false;
    }

    bool is_armed() const noexcept
    {
        return armed_;
    }
    bool is_suppressed() const noexcept
    {
        return suppressed_;
    }
    std::chrono::milliseconds interval() const noexcept
    {
        return interval_;
    }

  private:
    void fire();

    Scheduler &scheduler_;
    std::chrono::milliseconds interval_;
    std::function<void()> action_;
    std::optional<Scheduler::TaskId> pending_;
    bool armed_ = false;
    bool suppressed_ = false;
};

} // namespace fk::chrome
