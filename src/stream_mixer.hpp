#pragma once

#include "fwd.hpp"
#include "transport.hpp"

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

namespace sfuctl {

struct ForwardFailure {
    ParticipantId target;
    std::string trackId;
    std::string reason;
};

class StreamMixer {
public:
    using ForwardedCallback = std::function<void(const Participant& target, const StreamList& streams)>;
    using FailureCallback = std::function<void(const ForwardFailure& failure)>;

    explicit StreamMixer(const ParticipantRegistry& registry);

    std::shared_ptr<MediaStream> HandleTrack(const ParticipantId& participantId,
                                             const std::shared_ptr<MediaTrack>& track,
                                             const std::shared_ptr<MediaStream>& originStream);

    void BroadcastStream(const std::shared_ptr<MediaStream>& stream);

    std::shared_ptr<MediaStream> FindMixedStream(const std::string& originStreamId) const;

    size_t MixedStreamCount() const {
        return MixedStreams_.size();
    }

    void OnForwarded(ForwardedCallback callback) {
        OnForwarded_ = std::move(callback);
    }

    void OnForwardFailure(FailureCallback callback) {
        OnForwardFailure_ = std::move(callback);
    }

private:
    bool Forward(const Participant& target, const std::shared_ptr<MediaTrack>& track, const StreamList& streams);

private:
    const ParticipantRegistry& Registry_;
    std::unordered_map<std::string, std::shared_ptr<MediaStream>> MixedStreams_;

    ForwardedCallback OnForwarded_;
    FailureCallback OnForwardFailure_;
};

} // namespace sfuctl
