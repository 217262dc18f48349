#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <queue>

namespace sfuctl {

using Task = std::function<void()>;
using Clock = std::chrono::steady_clock;
using TimerId = uint64_t;

class Loop {
public:
    void EnqueueTask(Task&& task);

    TimerId SchedulePeriodic(Clock::duration interval, Task task);
    void CancelTimer(TimerId id);
    bool HasTimer(TimerId id);

    void Run();
    void Stop();

    size_t RunOnce(Clock::time_point now);

private:
    struct Timer {
        Clock::time_point Due;
        Clock::duration Interval;
        Task Callback;
    };

    void Execute(const Task& task);

private:
    std::mutex Mutex_;
    std::condition_variable Cv_;
    std::queue<Task> TaskQueue_;
    std::map<TimerId, Timer> Timers_;
    TimerId NextTimerId_ = 1;
    bool TimersChanged_ = false;
    bool Stopped_ = false;
};

} // namespace sfuctl
