#pragma once

#include "stats.hpp"

namespace sfuctl {

inline constexpr double kLossThreshold = 0.05;
inline constexpr double kLossPenalty = 0.75;
inline constexpr double kRttThresholdMs = 300.0;
inline constexpr double kRttPenalty = 0.85;
inline constexpr double kJitterThresholdMs = 100.0;
inline constexpr double kJitterPenalty = 0.9;

double EstimateBandwidth(const StatsReport& report);

} // namespace sfuctl
