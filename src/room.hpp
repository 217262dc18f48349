#pragma once

#include "adaptation_loop.hpp"
#include "fwd.hpp"
#include "participant_registry.hpp"
#include "stream_mixer.hpp"
#include "transport.hpp"

#include <cstdint>
#include <memory>

namespace sfuctl {

class Room {
public:
    explicit Room(const std::shared_ptr<Loop>& loop, Clock::duration adaptationInterval = kDefaultAdaptationInterval);
    ~Room();

    Room(const Room&) = delete;
    Room& operator=(const Room&) = delete;

    void AddParticipant(const ParticipantId& participantId, const std::shared_ptr<Connection>& connection);
    void RemoveParticipant(const ParticipantId& participantId);

    bool HasParticipant(const ParticipantId& participantId) const {
        return Registry_.Contains(participantId);
    }

    size_t ParticipantCount() const {
        return Registry_.Size();
    }

    void HandleTrack(const ParticipantId& participantId,
                     const std::shared_ptr<MediaTrack>& track,
                     const std::shared_ptr<MediaStream>& originStream);

    void BroadcastStream(const std::shared_ptr<MediaStream>& stream);

    std::shared_ptr<RtpSender> EnableSimulcast(const std::shared_ptr<Connection>& connection, const std::shared_ptr<MediaTrack>& track);
    std::shared_ptr<RtpSender> EnableSvc(const std::shared_ptr<Connection>& connection, const std::shared_ptr<MediaTrack>& track);
    void AdjustBitrate(const std::shared_ptr<Connection>& connection, uint64_t availableBitrate);
    void MonitorNetworkConditions(const std::shared_ptr<Connection>& connection);

    void OnForwardFailure(StreamMixer::FailureCallback callback) {
        Mixer_.OnForwardFailure(std::move(callback));
    }

    const StreamMixer& GetMixer() const {
        return Mixer_;
    }

    const AdaptationLoop& GetAdaptationLoop() const {
        return Adaptation_;
    }

private:
    std::shared_ptr<Loop> Loop_;
    ParticipantRegistry Registry_;
    StreamMixer Mixer_;
    AdaptationLoop Adaptation_;

    // Guards callbacks already queued on the loop against a destroyed room.
    std::shared_ptr<bool> Alive_;
};

} // namespace sfuctl
