#pragma once

#include <cstdint>
#include <string>

namespace sfuctl {

inline constexpr const char* kOutboundRtpReportType = "outbound-rtp";

// roundTripTime and jitter in ms, timestamp in s since the sender started.
struct StatsReport {
    std::string type;
    bool isRemote = false;

    uint64_t bytesSent = 0;
    uint64_t packetsSent = 0;
    uint64_t packetsLost = 0;

    double roundTripTime = 0.0;
    double jitter = 0.0;
    double timestamp = 0.0;
};

} // namespace sfuctl
