#include "encoding.hpp"

namespace sfuctl {

namespace {

template <class... Ts>
struct Overloaded : Ts... { using Ts::operator()...; };

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

std::vector<EncodingLayer> ConfiguredLayers(const LayerConfig& config) {
    return std::visit(Overloaded{
        [](const Unconfigured&) {
            return std::vector<EncodingLayer>{};
        },
        [](const SingleLayer& single) {
            return std::vector<EncodingLayer>{single.layer};
        },
        [](const SimulcastLayers& simulcast) {
            return simulcast.layers;
        },
        [](const SvcLayer& svc) {
            return std::vector<EncodingLayer>{svc.layer};
        },
    }, config);
}

} // namespace sfuctl
