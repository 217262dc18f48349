#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sfuctl {

struct EncodingLayer {
    std::string rid;
    std::optional<uint64_t> maxBitrate;
    std::optional<double> scaleResolutionDownBy;
    std::optional<std::string> scalabilityMode;

    bool operator==(const EncodingLayer& other) const {
        return rid == other.rid
            && maxBitrate == other.maxBitrate
            && scaleResolutionDownBy == other.scaleResolutionDownBy
            && scalabilityMode == other.scalabilityMode;
    }

    bool operator!=(const EncodingLayer& other) const {
        return !(*this == other);
    }
};

struct Unconfigured { };

struct SingleLayer {
    EncodingLayer layer;
};

struct SimulcastLayers {
    std::vector<EncodingLayer> layers;
};

struct SvcLayer {
    EncodingLayer layer;
};

using LayerConfig = std::variant<Unconfigured, SingleLayer, SimulcastLayers, SvcLayer>;

struct SendParameters {
    LayerConfig encodings;
};

std::vector<EncodingLayer> ConfiguredLayers(const LayerConfig& config);

} // namespace sfuctl
