#pragma once

#include "fwd.hpp"
#include "loop.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>

namespace sfuctl {

inline constexpr std::chrono::milliseconds kDefaultAdaptationInterval{5000};

class AdaptationLoop {
public:
    AdaptationLoop(const std::shared_ptr<Loop>& loop, Clock::duration interval = kDefaultAdaptationInterval);
    ~AdaptationLoop();

    AdaptationLoop(const AdaptationLoop&) = delete;
    AdaptationLoop& operator=(const AdaptationLoop&) = delete;

    bool Start(const std::shared_ptr<Connection>& connection);
    void Stop(const std::shared_ptr<Connection>& connection);
    void StopAll();

    bool IsRunning(const std::shared_ptr<Connection>& connection) const;

    size_t RunningCount() const;

    static bool Tick(Connection& connection);

private:
    using ConnectionKey = std::weak_ptr<Connection>;

    void Forget(const ConnectionKey& connection);

private:
    std::shared_ptr<Loop> Loop_;
    Clock::duration Interval_;

    mutable std::mutex Mutex_;
    std::map<ConnectionKey, TimerId, std::owner_less<ConnectionKey>> Timers_;
};

} // namespace sfuctl
