#include "participant.hpp"

#include <iostream>

namespace sfuctl {

Participant::Participant(ParticipantId id, const std::shared_ptr<Connection>& connection)
    : Id_(std::move(id))
    , Connection_(connection)
{ }

void Participant::Close() {
    if (Closed_) {
        return;
    }
    Closed_ = true;

    try {
        Connection_->OnTrack(nullptr);
        Connection_->Close();
    } catch (const std::exception& e) {
        std::cerr << "[Participant " << Id_ << "] Failed to close connection: " << e.what() << std::endl;
    }
}

} // namespace sfuctl
