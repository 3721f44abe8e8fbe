#pragma once

#include <functional>

namespace fk::app
{

// Queues work onto the UI thread. try_enqueue() may be called from any
// thread; it returns false when the UI thread no longer accepts work.
class UiDispatcher
{
  public:
    virtual ~UiDispatcher() = default;

    virtual bool try_enqueue(std::function<void()> work) = 0;
};

} // namespace fk::app
