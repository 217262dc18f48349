#include "room.hpp"

#include "layer_controller.hpp"
#include "loop.hpp"

#include <iostream>

namespace sfuctl {

Room::Room(const std::shared_ptr<Loop>& loop, Clock::duration adaptationInterval)
    : Loop_(loop)
    , Mixer_(Registry_)
    , Adaptation_(loop, adaptationInterval)
    , Alive_(std::make_shared<bool>(true))
{
    Mixer_.OnForwarded([this](const Participant& target, const StreamList& streams) {
        if (!streams.empty()) {
            Adaptation_.Start(target.GetConnection());
        }
    });
}

Room::~Room() {
    Alive_.reset();
    Adaptation_.StopAll();
    for (auto& participant : Registry_.Snapshot()) {
        Registry_.Remove(participant->GetId());
    }
}

void Room::AddParticipant(const ParticipantId& participantId, const std::shared_ptr<Connection>& connection) {
    if (Registry_.Contains(participantId)) {
        std::cout << "[Participant " << participantId << "] Already registered, replacing connection" << std::endl;
        RemoveParticipant(participantId);
    }

    Registry_.Add(participantId, connection);

    std::weak_ptr<bool> alive = Alive_;
    connection->OnTrack([this, loop = Loop_, alive, participantId](std::shared_ptr<MediaTrack> track, StreamList streams) {
        loop->EnqueueTask([this, alive, participantId, track = std::move(track), streams = std::move(streams)] {
            if (alive.expired() || !Registry_.Contains(participantId)) {
                return;
            }

            // A track without a stream is mixed under its owner's id.
            auto origin = streams.empty() ? std::make_shared<MediaStream>(participantId) : streams.front();
            HandleTrack(participantId, track, origin);
        });
    });

    std::cout << "[Participant " << participantId << "] Joined, " << Registry_.Size() << " in room" << std::endl;
}

void Room::RemoveParticipant(const ParticipantId& participantId) {
    auto participant = Registry_.Find(participantId);
    if (!participant) {
        return;
    }

    std::cout << "Removing participant " << participantId << " from the room" << std::endl;

    Adaptation_.Stop(participant->GetConnection());
    Registry_.Remove(participantId);
}

void Room::HandleTrack(const ParticipantId& participantId,
                       const std::shared_ptr<MediaTrack>& track,
                       const std::shared_ptr<MediaStream>& originStream) {
    Mixer_.HandleTrack(participantId, track, originStream);
}

void Room::BroadcastStream(const std::shared_ptr<MediaStream>& stream) {
    Mixer_.BroadcastStream(stream);
}

std::shared_ptr<RtpSender> Room::EnableSimulcast(const std::shared_ptr<Connection>& connection, const std::shared_ptr<MediaTrack>& track) {
    return sfuctl::EnableSimulcast(*connection, track);
}

std::shared_ptr<RtpSender> Room::EnableSvc(const std::shared_ptr<Connection>& connection, const std::shared_ptr<MediaTrack>& track) {
    return sfuctl::EnableSvc(*connection, track);
}

void Room::AdjustBitrate(const std::shared_ptr<Connection>& connection, uint64_t availableBitrate) {
    sfuctl::AdjustBitrate(*connection, availableBitrate);
}

void Room::MonitorNetworkConditions(const std::shared_ptr<Connection>& connection) {
    Adaptation_.Start(connection);
}

} // namespace sfuctl
