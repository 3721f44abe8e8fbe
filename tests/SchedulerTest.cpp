#include "FakePlatform.hpp"

#include "chrome/DebouncedTask.hpp"

#include <vector>

#include <doctest/doctest.h>

using namespace fk;
using namespace std::chrono_literals;

TEST_CASE("SchedulerService runs due tasks in order")
{
    test::ManualClock clock;
    chrome::SchedulerService scheduler([&clock] { return clock.now; });
    std::vector<int> order;

    scheduler.schedule_once(20ms, [&] { order.push_back(2); });
    scheduler.schedule_once(10ms, [&] { order.push_back(1); });
    scheduler.schedule_once(20ms, [&] { order.push_back(3); });
    CHECK(scheduler.pending() == 3);
    CHECK(scheduler.time_until_next_task(clock.now) == 10ms);

    clock.advance(9ms);
    CHECK(scheduler.tick(clock.now) == 0);
    clock.advance(11ms);
    CHECK(scheduler.tick(clock.now) == 3);
    CHECK(order == std::vector<int>{1, 2, 3});
    CHECK(scheduler.pending() == 0);
}

TEST_CASE("SchedulerService cancel")
{
    test::ManualClock clock;
    chrome::SchedulerService scheduler([&clock] { return clock.now; });
    int runs = 0;

    auto first = scheduler.schedule_once(5ms, [&] { ++runs; });
    scheduler.schedule_once(10ms, [&] { ++runs; });
    CHECK(scheduler.cancel(first));
    CHECK_FALSE(scheduler.cancel(first));
    CHECK(scheduler.pending() == 1);
    CHECK(scheduler.time_until_next_task(clock.now) == 10ms);

    clock.advance(10ms);
    CHECK(scheduler.tick(clock.now) == 1);
    CHECK(runs == 1);
    CHECK_FALSE(scheduler.cancel(first));
    CHECK_FALSE(scheduler.cancel(999));
}

TEST_CASE("DebouncedTask waits for requests to stop")
{
    test::ClockedScheduler time;
    int runs = 0;
    chrome::DebouncedTask task(time.scheduler, 125ms, [&] { ++runs; });

    task.request();
    time.run_for(100ms);
    task.request();
    time.run_for(124ms);
    CHECK(runs == 0);
    CHECK(task.is_armed());
    time.run_for(1ms);
    CHECK(runs == 1);
    CHECK_FALSE(task.is_armed());

    SUBCASE("suppressed firing drops the action")
    {
        task.suppress();
        task.request();
        time.run_for(200ms);
        CHECK(runs == 1);
        CHECK(task.is_suppressed());

        task.resume();
        task.request();
        time.run_for(125ms);
        CHECK(runs == 2);
    }
    SUBCASE("destruction cancels the pending run")
    {
        {
            chrome::DebouncedTask other(time.scheduler, 10ms, [&] { ++runs; });
            other.request();
        }
        time.run_for(50ms);
        CHECK(runs == 1);
    }
}
