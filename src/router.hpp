#pragma once

#include "config.hpp"
#include "fwd.hpp"
#include "room.hpp"

#include <rtc/rtc.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <memory>
#include <unordered_map>

namespace sfuctl {

struct Client;

class Router {
public:
    explicit Router(Config config);
    void Run();

private:
    void WsOpenCallback(std::shared_ptr<rtc::WebSocket> ws);
    void WsClosedCallback(std::shared_ptr<rtc::WebSocket> ws);
    void WsOnMessageCallback(std::shared_ptr<rtc::WebSocket> ws, rtc::message_variant&& message);

    void HandleOffer(const ParticipantId& clientId, const std::shared_ptr<Client>& client, const nlohmann::json& j);
    void HandleCandidate(const ParticipantId& clientId, const std::shared_ptr<Client>& client, const nlohmann::json& j);
    void CreatePeerConnection(const ParticipantId& clientId, const std::shared_ptr<Client>& client);

    Room& GetOrCreateRoom(const RoomId& roomId);

private:
    Config Config_;

    std::atomic_uint64_t IdGenerator_{1};
    std::unordered_map<ParticipantId, std::shared_ptr<Client>> Clients_;

    std::unordered_map<RoomId, std::unique_ptr<Room>> Rooms_;
    std::shared_ptr<Loop> Loop_;
};

} // namespace sfuctl
