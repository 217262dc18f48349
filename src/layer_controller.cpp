#include "layer_controller.hpp"

#include <algorithm>
#include <exception>
#include <mutex>

namespace sfuctl {

namespace {

void ClampLayer(EncodingLayer& layer, uint64_t availableBitrate) {
    layer.maxBitrate = std::min(availableBitrate, layer.maxBitrate.value_or(availableBitrate));
}

// An unconfigured sender is clamped as one uncapped layer.
void ClampConfig(LayerConfig& config, uint64_t availableBitrate) {
    if (std::holds_alternative<Unconfigured>(config)) {
        config = SingleLayer{};
    }

    if (auto* single = std::get_if<SingleLayer>(&config)) {
        ClampLayer(single->layer, availableBitrate);
    } else if (auto* simulcast = std::get_if<SimulcastLayers>(&config)) {
        for (auto& layer : simulcast->layers) {
            ClampLayer(layer, availableBitrate);
        }
    } else if (auto* svc = std::get_if<SvcLayer>(&config)) {
        ClampLayer(svc->layer, availableBitrate);
    }
}

} // namespace

std::vector<EncodingLayer> DefaultSimulcastLayers() {
    std::vector<EncodingLayer> layers(3);

    layers[0].rid = "h";
    layers[0].maxBitrate = 500000;

    layers[1].rid = "m";
    layers[1].maxBitrate = 200000;
    layers[1].scaleResolutionDownBy = 2.0;

    layers[2].rid = "l";
    layers[2].maxBitrate = 100000;
    layers[2].scaleResolutionDownBy = 4.0;

    return layers;
}

std::shared_ptr<RtpSender> EnableSimulcast(Connection& connection, const std::shared_ptr<MediaTrack>& track) {
    auto sender = connection.AddTrack(track, {});

    std::lock_guard<std::mutex> lock(connection.ParametersMutex());
    auto parameters = sender->GetParameters();
    parameters.encodings = SimulcastLayers{DefaultSimulcastLayers()};
    sender->SetParameters(parameters);

    return sender;
}

std::shared_ptr<RtpSender> EnableSvc(Connection& connection, const std::shared_ptr<MediaTrack>& track) {
    auto sender = connection.AddTrack(track, {});

    std::lock_guard<std::mutex> lock(connection.ParametersMutex());
    auto parameters = sender->GetParameters();

    EncodingLayer layer;
    if (auto* svc = std::get_if<SvcLayer>(&parameters.encodings)) {
        layer = svc->layer;
    } else if (auto* single = std::get_if<SingleLayer>(&parameters.encodings)) {
        layer = single->layer;
    } else if (auto* simulcast = std::get_if<SimulcastLayers>(&parameters.encodings)) {
        if (!simulcast->layers.empty()) {
            layer = simulcast->layers.front();
            layer.scaleResolutionDownBy.reset();
        }
    }
    layer.scalabilityMode = kSvcScalabilityMode;

    parameters.encodings = SvcLayer{layer};
    sender->SetParameters(parameters);

    return sender;
}

void AdjustBitrate(Connection& connection, uint64_t availableBitrate) {
    std::lock_guard<std::mutex> lock(connection.ParametersMutex());

    std::exception_ptr failure;
    for (auto& sender : connection.GetSenders()) {
        try {
            auto parameters = sender->GetParameters();
            ClampConfig(parameters.encodings, availableBitrate);
            sender->SetParameters(parameters);
        } catch (const std::exception&) {
            if (!failure) {
                failure = std::current_exception();
            }
        }
    }

    if (failure) {
        std::rethrow_exception(failure);
    }
}

} // namespace sfuctl
