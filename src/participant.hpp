#pragma once

#include "fwd.hpp"
#include "transport.hpp"

#include <memory>

namespace sfuctl {

class Participant {
public:
    Participant(ParticipantId id, const std::shared_ptr<Connection>& connection);

    const ParticipantId& GetId() const {
        return Id_;
    }

    std::shared_ptr<Connection> GetConnection() const {
        return Connection_;
    }

    bool IsClosed() const {
        return Closed_;
    }

    void Close();

private:
    ParticipantId Id_;
    std::shared_ptr<Connection> Connection_;
    bool Closed_ = false;
};

} // namespace sfuctl
