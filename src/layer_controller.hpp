#pragma once

#include "encoding.hpp"
#include "transport.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace sfuctl {

inline constexpr const char* kSvcScalabilityMode = "L3T3";

std::vector<EncodingLayer> DefaultSimulcastLayers();

std::shared_ptr<RtpSender> EnableSimulcast(Connection& connection, const std::shared_ptr<MediaTrack>& track);
std::shared_ptr<RtpSender> EnableSvc(Connection& connection, const std::shared_ptr<MediaTrack>& track);

// Caps never grow. Every sender is visited even if one fails; the first
// failure is rethrown afterwards.
void AdjustBitrate(Connection& connection, uint64_t availableBitrate);

} // namespace sfuctl
