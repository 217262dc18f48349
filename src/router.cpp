#include "router.hpp"

#include "errors.hpp"
#include "loop.hpp"
#include "rtc_connection.hpp"
#include "signaling.hpp"

#include <rtc/description.hpp>
#include <rtc/rtc.hpp>

#include <iostream>
#include <memory>
#include <thread>

namespace sfuctl {

namespace {

using json = nlohmann::json;

void SendError(const std::shared_ptr<rtc::WebSocket>& ws, RtcErrorCode code, const std::string& message) {
    json error = {
        {"type", "error"},
        {"reason", ReasonName(code)},
        {"message", message}
    };
    ws->send(error.dump());
}

const char* StateName(rtc::PeerConnection::State state) {
    switch (state) {
        case rtc::PeerConnection::State::New: return "New";
        case rtc::PeerConnection::State::Connecting: return "Connecting";
        case rtc::PeerConnection::State::Connected: return "Connected";
        case rtc::PeerConnection::State::Disconnected: return "Disconnected";
        case rtc::PeerConnection::State::Failed: return "Failed";
        case rtc::PeerConnection::State::Closed: return "Closed";
    }
    return "Unknown";
}

} // namespace

struct Client {
    RoomId roomId;
    std::shared_ptr<rtc::WebSocket> ws;
    std::shared_ptr<rtc::PeerConnection> pc;
    std::shared_ptr<RtcConnection> connection;
};

Router::Router(Config config)
    : Config_(std::move(config))
    , Loop_(std::make_shared<Loop>())
{ }

void Router::WsOpenCallback(std::shared_ptr<rtc::WebSocket> ws) {
    Loop_->EnqueueTask([this, ws = std::move(ws)]
    {
        auto id = std::to_string(IdGenerator_++);
        auto client = std::make_shared<Client>();
        Clients_.emplace(id, client);
        client->ws = ws;

        std::cout << "[Client " << id << "] WebSocket connected" << std::endl;
    });
}

void Router::WsClosedCallback(std::shared_ptr<rtc::WebSocket> ws) {
    Loop_->EnqueueTask([this, ws = std::move(ws)]
    {
        std::shared_ptr<Client> clientToClose;
        ParticipantId idToClose;
        for (auto it = Clients_.begin(); it != Clients_.end(); ++it) {
            if (it->second->ws == ws) {
                clientToClose = it->second;
                idToClose = it->first;
                Clients_.erase(it);
                break;
            }
        }

        if (!clientToClose) {
            return;
        }

        std::cout << "[Client " << idToClose << "] WebSocket disconnected" << std::endl;

        auto roomIt = Rooms_.find(clientToClose->roomId);
        if (roomIt != Rooms_.end()) {
            roomIt->second->RemoveParticipant(idToClose);
            if (roomIt->second->ParticipantCount() == 0) {
                std::cout << "[Room " << roomIt->first << "] Empty, dropping" << std::endl;
                Rooms_.erase(roomIt);
            }
        } else if (clientToClose->connection) {
            clientToClose->connection->Close();
        }
    });
}

void Router::WsOnMessageCallback(std::shared_ptr<rtc::WebSocket> ws, rtc::message_variant&& message) {
    Loop_->EnqueueTask([this, ws = std::move(ws), message = std::move(message)]
    {
        auto pstr = std::get_if<std::string>(&message);
        if (!pstr) {
            SendError(ws, RtcErrorCode::InvalidConstraintsType, "signaling messages must be text");
            return;
        }

        json j;
        try {
            j = json::parse(*pstr);
        } catch (const json::parse_error& e) {
            std::cerr << "Invalid JSON signaling message: " << e.what() << std::endl;
            SendError(ws, RtcErrorCode::InvalidConstraintsType, "invalid JSON");
            return;
        }

        std::shared_ptr<Client> client;
        ParticipantId clientId;
        for (auto& [id, c] : Clients_) {
            if (c->ws == ws) {
                client = c;
                clientId = id;
                break;
            }
        }
        if (!client) {
            std::cerr << "Client not found for signaling message" << std::endl;
            return;
        }

        auto typeIt = j.find("type");
        if (typeIt == j.end() || !typeIt->is_string()) {
            std::cerr << "[Client " << clientId << "] Signaling message missing type" << std::endl;
            SendError(ws, RtcErrorCode::InvalidConstraintsType, "missing type");
            return;
        }

        const std::string type = *typeIt;
        std::cout << "[Client " << clientId << "] Received signaling: " << type << std::endl;

        try {
            if (type == "offer") {
                HandleOffer(clientId, client, j);
            }
            else if (type == "candidate") {
                HandleCandidate(clientId, client, j);
            }
            else if (type == "endOfCandidates") {
                std::cout << "[Client " << clientId << "] Client finished sending candidates" << std::endl;
            }
            else if (type == "ping") {
                ws->send(json({{"type", "pong"}}).dump());
            }
            else {
                std::cout << "[Client " << clientId << "] Unknown message type: " << type << std::endl;
            }
        } catch (const RtcError& e) {
            std::cerr << "[Client " << clientId << "] " << type << " rejected: " << e.what() << std::endl;
            SendError(ws, e.Code(), e.what());
        } catch (const std::exception& e) {
            std::cerr << "[Client " << clientId << "] " << type << " failed: " << e.what() << std::endl;
            SendError(ws, RtcErrorCode::InternalError, e.what());
        }
    });
}

void Router::HandleOffer(const ParticipantId& clientId, const std::shared_ptr<Client>& client, const json& j) {
    auto sdpIt = j.find("sdp");
    if (sdpIt == j.end() || !sdpIt->is_string()) {
        throw RtcError(RtcErrorCode::InvalidSessionDescription, "offer missing sdp");
    }

    if (!client->pc) {
        auto roomIdIt = j.find("room_id");
        if (roomIdIt != j.end() && !roomIdIt->is_string()) {
            throw RtcError(RtcErrorCode::InvalidConstraintsType, "room_id must be a string");
        }

        if (roomIdIt == j.end()) {
            client->roomId = GenerateRoomId();
            client->ws->send(json({{"type", "room"}, {"room_id", client->roomId}}).dump());
        } else {
            client->roomId = roomIdIt->get<std::string>();
        }

        CreatePeerConnection(clientId, client);
        GetOrCreateRoom(client->roomId).AddParticipant(clientId, client->connection);
    }

    std::string sdp = *sdpIt;
    std::cout << "[Client " << clientId << "] Processing offer..." << std::endl;

    client->pc->setRemoteDescription(rtc::Description(sdp, "offer"));
    client->pc->setLocalDescription();
}

void Router::HandleCandidate(const ParticipantId& clientId, const std::shared_ptr<Client>& client, const json& j) {
    auto candIt = j.find("candidate");
    if (candIt == j.end() || !candIt->is_string()) {
        throw RtcError(RtcErrorCode::InvalidCandidateType, "candidate message missing candidate field");
    }

    std::string candidate = *candIt;
    if (candidate.empty()) {
        std::cout << "[Client " << clientId << "] Skipping empty candidate" << std::endl;
        return;
    }
    if (!client->pc) {
        throw RtcError(RtcErrorCode::InvalidState, "candidate received before offer");
    }

    std::string sdpMid = j.value("sdpMid", "");
    client->pc->addRemoteCandidate(rtc::Candidate(candidate, sdpMid));
}

void Router::CreatePeerConnection(const ParticipantId& clientId, const std::shared_ptr<Client>& client) {
    rtc::Configuration config;
    config.disableAutoNegotiation = true;
    for (const auto& server : Config_.iceServers) {
        config.iceServers.emplace_back(server);
    }

    std::cout << "[Client " << clientId << "] Creating PeerConnection" << std::endl;
    client->pc = std::make_shared<rtc::PeerConnection>(config);
    client->connection = std::make_shared<RtcConnection>(client->pc);

    std::weak_ptr<rtc::WebSocket> weakWs = client->ws;
    auto preferredCodec = Config_.preferredVideoCodec;

    client->pc->onLocalDescription([weakWs, clientId, preferredCodec](const rtc::Description& desc) {
        auto ws = weakWs.lock();
        if (!ws || desc.type() != rtc::Description::Type::Answer) {
            return;
        }

        std::string sdp(desc);
        if (!preferredCodec.empty()) {
            sdp = SetPreferredCodec(sdp, preferredCodec);
        }

        json answer = {
            {"type", desc.typeString()},
            {"sdp", sdp}
        };
        std::cout << "[Client " << clientId << "] Sending answer" << std::endl;
        ws->send(answer.dump());
    });

    client->pc->onLocalCandidate([weakWs, clientId](const rtc::Candidate& cand) {
        auto ws = weakWs.lock();
        if (!ws) {
            return;
        }

        std::string candidate = cand.candidate();
        if (!IsSignalableCandidate(candidate)) {
            std::cerr << "[Client " << clientId << "] Skipping candidate " << candidate << std::endl;
            return;
        }

        json jcand = {
            {"type", "candidate"},
            {"candidate", candidate}
        };
        if (auto mid = cand.mid(); !mid.empty()) {
            jcand["sdpMid"] = mid;
        }
        ws->send(jcand.dump());
    });

    client->pc->onStateChange([clientId](rtc::PeerConnection::State state) {
        std::cout << "[Client " << clientId << "] PC State: " << StateName(state) << std::endl;
    });
}

Room& Router::GetOrCreateRoom(const RoomId& roomId) {
    auto& room = Rooms_[roomId];
    if (!room) {
        std::cout << "[Room " << roomId << "] Created" << std::endl;
        room = std::make_unique<Room>(Loop_, Config_.adaptationInterval);
        room->OnForwardFailure([roomId](const ForwardFailure& failure) {
            std::cerr << "[Room " << roomId << "] Track " << failure.trackId << " not forwarded to " << failure.target << ": " << failure.reason << std::endl;
        });
    }
    return *room;
}

void Router::Run() {
    rtc::WebSocketServer::Configuration wsCfg;
    wsCfg.port = Config_.port;
    wsCfg.enableTls = Config_.enableTls;

    std::thread t{&Loop::Run, Loop_};

    auto wsServer = std::make_shared<rtc::WebSocketServer>(wsCfg);
    wsServer->onClient([this](std::shared_ptr<rtc::WebSocket> ws) {
        ws->onOpen([this, ws]() {
            WsOpenCallback(ws);
        });

        ws->onClosed([this, ws]() {
            WsClosedCallback(ws);
        });

        ws->onMessage([this, ws](rtc::message_variant message) {
            WsOnMessageCallback(ws, std::move(message));
        });
    });

    std::cout << "Signaling server listening on port " << wsCfg.port << std::endl;
    t.join();
}

} // namespace sfuctl
