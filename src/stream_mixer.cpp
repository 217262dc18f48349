#include "stream_mixer.hpp"

#include "participant_registry.hpp"

#include <iostream>

namespace sfuctl {

StreamMixer::StreamMixer(const ParticipantRegistry& registry)
    : Registry_(registry)
{ }

std::shared_ptr<MediaStream> StreamMixer::HandleTrack(const ParticipantId& participantId,
                                                      const std::shared_ptr<MediaTrack>& track,
                                                      const std::shared_ptr<MediaStream>& originStream) {
    auto& mixed = MixedStreams_[originStream->Id()];
    if (!mixed) {
        std::cout << "[Mixer] New mixed stream " << originStream->Id() << " from participant " << participantId << std::endl;
        mixed = std::make_shared<MediaStream>(originStream->Id());
    }
    mixed->AddTrack(track);

    StreamList streams{mixed};
    for (auto& other : Registry_.Snapshot()) {
        if (other->GetId() == participantId) {
            continue;
        }

        std::cout << "Adding track " << track->Id() << " from participant " << participantId << " to participant " << other->GetId() << std::endl;
        Forward(*other, track, streams);
    }

    return mixed;
}

void StreamMixer::BroadcastStream(const std::shared_ptr<MediaStream>& stream) {
    StreamList streams{stream};
    for (auto& participant : Registry_.Snapshot()) {
        for (auto& track : stream->GetTracks()) {
            std::cout << "Broadcasting track " << track->Id() << " of stream " << stream->Id() << " to participant " << participant->GetId() << std::endl;
            Forward(*participant, track, streams);
        }
    }
}

std::shared_ptr<MediaStream> StreamMixer::FindMixedStream(const std::string& originStreamId) const {
    auto it = MixedStreams_.find(originStreamId);
    return it == MixedStreams_.end() ? nullptr : it->second;
}

bool StreamMixer::Forward(const Participant& target, const std::shared_ptr<MediaTrack>& track, const StreamList& streams) {
    try {
        target.GetConnection()->AddTrack(track, streams);
    } catch (const std::exception& e) {
        std::cerr << "[Participant " << target.GetId() << "] Failed to forward track " << track->Id() << ": " << e.what() << std::endl;
        if (OnForwardFailure_) {
            OnForwardFailure_(ForwardFailure{target.GetId(), track->Id(), e.what()});
        }
        return false;
    }

    if (OnForwarded_) {
        OnForwarded_(target, streams);
    }
    return true;
}

} // namespace sfuctl
