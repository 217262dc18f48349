#include "adaptation_loop.hpp"

#include "bandwidth_estimator.hpp"
#include "layer_controller.hpp"
#include "transport.hpp"

#include <cmath>
#include <iostream>
#include <limits>

namespace sfuctl {

namespace {

uint64_t ToBitrate(double estimate) {
    constexpr auto kMax = std::numeric_limits<uint64_t>::max();
    if (estimate >= static_cast<double>(kMax)) {
        return kMax;
    }
    return static_cast<uint64_t>(std::round(estimate));
}

} // namespace

AdaptationLoop::AdaptationLoop(const std::shared_ptr<Loop>& loop, Clock::duration interval)
    : Loop_(loop)
    , Interval_(interval)
{ }

AdaptationLoop::~AdaptationLoop() {
    StopAll();
}

bool AdaptationLoop::Start(const std::shared_ptr<Connection>& connection) {
    std::lock_guard<std::mutex> lock(Mutex_);
    ConnectionKey key = connection;
    if (Timers_.count(key)) {
        return false;
    }

    auto id = Loop_->SchedulePeriodic(Interval_, [this, key] {
        auto connection = key.lock();
        if (!connection) {
            Forget(key);
            return;
        }
        Tick(*connection);
    });
    Timers_.emplace(key, id);

    std::cout << "[Adaptation] Monitoring connection " << connection.get() << std::endl;
    return true;
}

void AdaptationLoop::Stop(const std::shared_ptr<Connection>& connection) {
    Forget(connection);
}

void AdaptationLoop::Forget(const ConnectionKey& connection) {
    std::lock_guard<std::mutex> lock(Mutex_);
    auto it = Timers_.find(connection);
    if (it == Timers_.end()) {
        return;
    }

    Loop_->CancelTimer(it->second);
    Timers_.erase(it);
}

void AdaptationLoop::StopAll() {
    std::lock_guard<std::mutex> lock(Mutex_);
    for (auto& [connection, id] : Timers_) {
        Loop_->CancelTimer(id);
    }
    Timers_.clear();
}

bool AdaptationLoop::IsRunning(const std::shared_ptr<Connection>& connection) const {
    std::lock_guard<std::mutex> lock(Mutex_);
    return Timers_.count(connection) != 0;
}

size_t AdaptationLoop::RunningCount() const {
    std::lock_guard<std::mutex> lock(Mutex_);
    return Timers_.size();
}

bool AdaptationLoop::Tick(Connection& connection) {
    try {
        for (const auto& report : connection.GetStats()) {
            if (report.type != kOutboundRtpReportType || report.isRemote) {
                continue;
            }

            double estimate = EstimateBandwidth(report);
            if (std::isnan(estimate)) {
                continue;
            }
            AdjustBitrate(connection, ToBitrate(estimate));
        }
    } catch (const std::exception& e) {
        std::cerr << "[Adaptation] Skipping tick for connection " << &connection << ": " << e.what() << std::endl;
        return false;
    }
    return true;
}

} // namespace sfuctl
