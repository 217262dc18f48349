#include "transport.hpp"

#include <algorithm>

namespace sfuctl {

MediaStream::MediaStream(std::string id)
    : Id_(std::move(id))
{ }

bool MediaStream::AddTrack(const std::shared_ptr<MediaTrack>& track) {
    if (HasTrack(track->Id())) {
        return false;
    }
    Tracks_.push_back(track);
    return true;
}

bool MediaStream::HasTrack(const std::string& trackId) const {
    return std::any_of(Tracks_.begin(), Tracks_.end(), [&](const auto& track) {
        return track->Id() == trackId;
    });
}

} // namespace sfuctl
