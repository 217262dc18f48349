#include "signaling.hpp"

#include <cstdint>
#include <cstdio>
#include <iostream>
#include <random>
#include <regex>
#include <sstream>
#include <vector>

namespace sfuctl {

namespace {

std::string EscapeRegex(const std::string& text) {
    static const std::regex special{R"([.^$|()\[\]{}*+?\\])"};
    return std::regex_replace(text, special, R"(\$&)");
}

} // namespace

std::string SetPreferredCodec(const std::string& sdp, const std::string& codecName) {
    std::regex rtpmap{"a=rtpmap:(\\d+) " + EscapeRegex(codecName) + "/", std::regex::icase};
    std::smatch codecMatch;
    if (!std::regex_search(sdp, codecMatch, rtpmap)) {
        std::cerr << "No " << codecName << " codec found in the SDP" << std::endl;
        return sdp;
    }
    const std::string payloadType = codecMatch[1];

    static const std::regex mediaLine{"m=video (\\d+) (\\S+)((?: \\d+)*)"};
    std::smatch lineMatch;
    if (!std::regex_search(sdp, lineMatch, mediaLine)) {
        std::cerr << "No video media section found in the SDP" << std::endl;
        return sdp;
    }

    std::istringstream formats(lineMatch[3].str());
    std::vector<std::string> ordered{payloadType};
    std::string format;
    while (formats >> format) {
        if (format != payloadType) {
            ordered.push_back(format);
        }
    }

    std::string line = "m=video " + lineMatch[1].str() + " " + lineMatch[2].str();
    for (const auto& pt : ordered) {
        line += " " + pt;
    }

    return lineMatch.prefix().str() + line + lineMatch.suffix().str();
}

std::string GenerateRoomId() {
    static thread_local std::mt19937_64 generator{std::random_device{}()};
    uint64_t high = generator();
    uint64_t low = generator();

    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buffer[37];
    std::snprintf(buffer, sizeof(buffer), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(high >> 32),
                  static_cast<unsigned>((high >> 16) & 0xFFFF),
                  static_cast<unsigned>(high & 0xFFFF),
                  static_cast<unsigned>(low >> 48),
                  static_cast<unsigned long long>(low & 0xFFFFFFFFFFFFULL));
    return buffer;
}

bool IsSignalableCandidate(const std::string& candidate) {
    if (candidate.empty()) {
        return false;
    }
    return candidate.find('.') != std::string::npos;
}

} // namespace sfuctl
