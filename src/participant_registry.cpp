#include "participant_registry.hpp"

#include "errors.hpp"

#include <iostream>
#include <stdexcept>

namespace sfuctl {

std::shared_ptr<Participant> ParticipantRegistry::Add(const ParticipantId& id, const std::shared_ptr<Connection>& connection) {
    if (id.empty()) {
        throw std::invalid_argument("participant id must not be empty");
    }
    if (!connection) {
        throw std::invalid_argument("participant " + id + " has no connection");
    }
    if (Contains(id)) {
        throw RtcError(RtcErrorCode::InvalidState, "participant " + id + " is already registered");
    }

    auto participant = std::make_shared<Participant>(id, connection);
    Participants_.emplace(id, participant);
    return participant;
}

std::shared_ptr<Participant> ParticipantRegistry::Remove(const ParticipantId& id) {
    auto it = Participants_.find(id);
    if (it == Participants_.end()) {
        return nullptr;
    }

    auto participant = std::move(it->second);
    Participants_.erase(it);

    std::cout << "[Participant " << id << "] Removed, closing connection" << std::endl;
    participant->Close();
    return participant;
}

std::shared_ptr<Participant> ParticipantRegistry::Find(const ParticipantId& id) const {
    auto it = Participants_.find(id);
    return it == Participants_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<Participant>> ParticipantRegistry::Snapshot() const {
    std::vector<std::shared_ptr<Participant>> result;
    result.reserve(Participants_.size());
    for (auto& [id, participant] : Participants_) {
        result.push_back(participant);
    }
    return result;
}

} // namespace sfuctl
