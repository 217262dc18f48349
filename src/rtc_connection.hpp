#pragma once

#include "loop.hpp"
#include "transport.hpp"

#include <rtc/rtc.hpp>

#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace sfuctl {

class RtcMediaTrack : public MediaTrack {
public:
    explicit RtcMediaTrack(const std::shared_ptr<rtc::Track>& track);
    ~RtcMediaTrack() override;

    std::string Id() const override;
    MediaKind Kind() const override;

    std::shared_ptr<rtc::Track> GetTrack() const {
        return Track_;
    }

    void AddTarget(const std::shared_ptr<rtc::Track>& target);

private:
    std::shared_ptr<rtc::Track> Track_;

    std::mutex TargetsMutex_;
    std::vector<std::weak_ptr<rtc::Track>> Targets_;
};

class RtcRtpSender : public RtpSender {
public:
    RtcRtpSender(const std::shared_ptr<MediaTrack>& source, const std::shared_ptr<rtc::Track>& outgoing);

    std::shared_ptr<MediaTrack> Track() const override {
        return Source_;
    }

    SendParameters GetParameters() const override;

    bool IsClosed() const {
        return Outgoing_->isClosed();
    }

    void SetParameters(const SendParameters& parameters) override;

private:
    std::shared_ptr<MediaTrack> Source_;
    std::shared_ptr<rtc::Track> Outgoing_;

    mutable std::mutex Mutex_;
    SendParameters Parameters_;
};

class RtcConnection : public Connection {
public:
    explicit RtcConnection(const std::shared_ptr<rtc::PeerConnection>& peerConnection);
    ~RtcConnection() override;

    std::shared_ptr<RtpSender> AddTrack(const std::shared_ptr<MediaTrack>& track, const StreamList& streams) override;
    std::vector<std::shared_ptr<RtpSender>> GetSenders() const override;
    std::vector<StatsReport> GetStats() override;
    void Close() override;
    void OnTrack(TrackCallback callback) override;

    std::shared_ptr<rtc::PeerConnection> GetPeerConnection() const {
        return PeerConnection_;
    }

private:
    void CheckOpen() const;
    std::shared_ptr<MediaStream> StreamFor(const std::shared_ptr<rtc::Track>& track);

private:
    std::shared_ptr<rtc::PeerConnection> PeerConnection_;
    Clock::time_point CreatedAt_;

    mutable std::mutex Mutex_;
    bool Closed_ = false;
    mutable std::vector<std::shared_ptr<RtcRtpSender>> Senders_;
    std::unordered_map<std::string, std::shared_ptr<MediaStream>> Streams_;
    TrackCallback TrackCallback_;
};

} // namespace sfuctl
