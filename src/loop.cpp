#include "loop.hpp"

#include <algorithm>
#include <iostream>
#include <utility>
#include <vector>

namespace sfuctl {

void Loop::Run() {
    while (true)
    {
        {
            std::unique_lock<std::mutex> lock(Mutex_);
            TimersChanged_ = false;

            auto ready = [this] {
                return Stopped_ || TimersChanged_ || !TaskQueue_.empty();
            };

            if (Timers_.empty()) {
                Cv_.wait(lock, ready);
            } else {
                auto next = Timers_.begin()->second.Due;
                for (auto& [id, timer] : Timers_) {
                    next = std::min(next, timer.Due);
                }
                Cv_.wait_until(lock, next, ready);
            }

            if (Stopped_) {
                return;
            }
        }
        RunOnce(Clock::now());
    }
}

void Loop::Stop() {
    {
        std::lock_guard<std::mutex> lock(Mutex_);
        Stopped_ = true;
    }

    Cv_.notify_all();
}

void Loop::EnqueueTask(Task&& task) {
    {
        std::lock_guard<std::mutex> lock(Mutex_);
        TaskQueue_.push(std::move(task));
    }

    Cv_.notify_one();
}

TimerId Loop::SchedulePeriodic(Clock::duration interval, Task task) {
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(Mutex_);
        id = NextTimerId_++;
        Timers_.emplace(id, Timer{Clock::now() + interval, interval, std::move(task)});
        TimersChanged_ = true;
    }

    Cv_.notify_one();
    return id;
}

void Loop::CancelTimer(TimerId id) {
    {
        std::lock_guard<std::mutex> lock(Mutex_);
        Timers_.erase(id);
        TimersChanged_ = true;
    }

    Cv_.notify_one();
}

bool Loop::HasTimer(TimerId id) {
    std::lock_guard<std::mutex> lock(Mutex_);
    return Timers_.count(id) != 0;
}

size_t Loop::RunOnce(Clock::time_point now) {
    std::queue<Task> tasks;
    {
        std::lock_guard<std::mutex> lock(Mutex_);
        std::swap(tasks, TaskQueue_);
    }

    size_t executed = 0;
    while (!tasks.empty()) {
        Execute(tasks.front());
        tasks.pop();
        ++executed;
    }

    std::vector<std::pair<TimerId, Task>> due;
    {
        std::lock_guard<std::mutex> lock(Mutex_);
        for (auto& [id, timer] : Timers_) {
            if (timer.Due > now) {
                continue;
            }
            timer.Due += timer.Interval;
            if (timer.Due <= now) {
                timer.Due = now + timer.Interval;
            }
            due.emplace_back(id, timer.Callback);
        }
    }

    for (auto& [id, task] : due) {
        // An earlier callback may have cancelled this timer.
        if (!HasTimer(id)) {
            continue;
        }
        Execute(task);
        ++executed;
    }

    return executed;
}

void Loop::Execute(const Task& task) {
    try {
        task();
    } catch (const std::exception& e) {
        std::cerr << "[Loop] Task failed: " << e.what() << std::endl;
    }
}

} //namespace sfuctl
