#include "bandwidth_estimator.hpp"

namespace sfuctl {

double EstimateBandwidth(const StatsReport& report) {
    if (report.timestamp <= 0.0) {
        return 0.0;
    }

    double estimate = static_cast<double>(report.bytesSent) * 8.0 / report.timestamp;

    if (report.packetsSent > 0) {
        double lossRatio = static_cast<double>(report.packetsLost) / static_cast<double>(report.packetsSent);
        if (lossRatio > kLossThreshold) {
            estimate *= kLossPenalty;
        }
    }

    if (report.roundTripTime > kRttThresholdMs) {
        estimate *= kRttPenalty;
    }

    if (report.jitter > kJitterThresholdMs) {
        estimate *= kJitterPenalty;
    }

    return estimate;
}

} // namespace sfuctl
