#pragma once

#include "fwd.hpp"
#include "participant.hpp"

#include <memory>
#include <unordered_map>
#include <vector>

namespace sfuctl {

class ParticipantRegistry {
public:
    std::shared_ptr<Participant> Add(const ParticipantId& id, const std::shared_ptr<Connection>& connection);

    std::shared_ptr<Participant> Remove(const ParticipantId& id);

    std::shared_ptr<Participant> Find(const ParticipantId& id) const;

    bool Contains(const ParticipantId& id) const {
        return Participants_.count(id) != 0;
    }

    size_t Size() const {
        return Participants_.size();
    }

    std::vector<std::shared_ptr<Participant>> Snapshot() const;

private:
    std::unordered_map<ParticipantId, std::shared_ptr<Participant>> Participants_;
};

} // namespace sfuctl
