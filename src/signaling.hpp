#pragma once

#include <string>

namespace sfuctl {

std::string SetPreferredCodec(const std::string& sdp, const std::string& codecName);

std::string GenerateRoomId();

bool IsSignalableCandidate(const std::string& candidate);

} // namespace sfuctl
