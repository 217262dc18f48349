#include "rtc_connection.hpp"

#include "errors.hpp"

#include <rtc/description.hpp>

#include <algorithm>
#include <iostream>
#include <limits>

namespace sfuctl {

RtcMediaTrack::RtcMediaTrack(const std::shared_ptr<rtc::Track>& track)
    : Track_(track)
{
    Track_->onMessage([this](rtc::binary message) {
        std::lock_guard<std::mutex> lock(TargetsMutex_);

        Targets_.erase(std::remove_if(Targets_.begin(), Targets_.end(), [](const auto& target) {
            return target.expired();
        }), Targets_.end());

        for (auto& weakTarget : Targets_) {
            auto target = weakTarget.lock();
            if (target && target->isOpen()) {
                target->send(message);
            }
        }
    }, nullptr);
}

RtcMediaTrack::~RtcMediaTrack() {
    Track_->onMessage(nullptr, nullptr);
}

std::string RtcMediaTrack::Id() const {
    return Track_->mid();
}

MediaKind RtcMediaTrack::Kind() const {
    return Track_->description().type() == "audio" ? MediaKind::Audio : MediaKind::Video;
}

void RtcMediaTrack::AddTarget(const std::shared_ptr<rtc::Track>& target) {
    std::lock_guard<std::mutex> lock(TargetsMutex_);
    Targets_.push_back(target);
}

RtcRtpSender::RtcRtpSender(const std::shared_ptr<MediaTrack>& source, const std::shared_ptr<rtc::Track>& outgoing)
    : Source_(source)
    , Outgoing_(outgoing)
{ }

SendParameters RtcRtpSender::GetParameters() const {
    std::lock_guard<std::mutex> lock(Mutex_);
    return Parameters_;
}

void RtcRtpSender::SetParameters(const SendParameters& parameters) {
    if (Outgoing_->isClosed()) {
        throw RtcError(RtcErrorCode::InvalidState, "track " + Outgoing_->mid() + " is closed");
    }

    constexpr auto kMaxTotal = std::numeric_limits<uint64_t>::max();
    constexpr auto kMaxKbps = static_cast<uint64_t>(std::numeric_limits<int>::max());

    uint64_t total = 0;
    bool capped = false;
    for (const auto& layer : ConfiguredLayers(parameters.encodings)) {
        if (layer.maxBitrate) {
            total = *layer.maxBitrate > kMaxTotal - total ? kMaxTotal : total + *layer.maxBitrate;
            capped = true;
        }
    }

    if (capped) {
        auto kbps = std::clamp<uint64_t>(total / 1000, 1, kMaxKbps);
        auto description = Outgoing_->description();
        description.setBitrate(static_cast<int>(kbps));
        Outgoing_->setDescription(std::move(description));
    }

    std::lock_guard<std::mutex> lock(Mutex_);
    Parameters_ = parameters;
}

RtcConnection::RtcConnection(const std::shared_ptr<rtc::PeerConnection>& peerConnection)
    : PeerConnection_(peerConnection)
    , CreatedAt_(Clock::now())
{
    PeerConnection_->onTrack([this](std::shared_ptr<rtc::Track> track) {
        TrackCallback callback;
        {
            std::lock_guard<std::mutex> lock(Mutex_);
            callback = TrackCallback_;
        }
        if (!callback) {
            return;
        }

        auto mediaTrack = std::make_shared<RtcMediaTrack>(track);
        auto stream = StreamFor(track);
        stream->AddTrack(mediaTrack);
        callback(mediaTrack, StreamList{stream});
    });
}

RtcConnection::~RtcConnection() {
    PeerConnection_->onTrack(nullptr);
}

std::shared_ptr<RtpSender> RtcConnection::AddTrack(const std::shared_ptr<MediaTrack>& track, const StreamList& streams) {
    CheckOpen();

    auto source = std::dynamic_pointer_cast<RtcMediaTrack>(track);
    if (!source) {
        throw RtcError(RtcErrorCode::InvalidState, "track " + track->Id() + " does not belong to this transport");
    }

    auto description = source->GetTrack()->description();
    description.setDirection(rtc::Description::Direction::SendOnly);
    if (!streams.empty()) {
        for (auto ssrc : description.getSSRCs()) {
            description.replaceSSRC(ssrc, ssrc, track->Id(), streams.front()->Id(), track->Id());
        }
    }

    auto outgoing = PeerConnection_->addTrack(std::move(description));
    source->AddTarget(outgoing);

    auto sender = std::make_shared<RtcRtpSender>(track, outgoing);
    std::lock_guard<std::mutex> lock(Mutex_);
    Senders_.push_back(sender);
    return sender;
}

std::vector<std::shared_ptr<RtpSender>> RtcConnection::GetSenders() const {
    std::lock_guard<std::mutex> lock(Mutex_);
    Senders_.erase(std::remove_if(Senders_.begin(), Senders_.end(), [](const auto& sender) {
        return sender->IsClosed();
    }), Senders_.end());
    return std::vector<std::shared_ptr<RtpSender>>(Senders_.begin(), Senders_.end());
}

std::vector<StatsReport> RtcConnection::GetStats() {
    CheckOpen();

    StatsReport report;
    report.type = kOutboundRtpReportType;
    report.bytesSent = PeerConnection_->bytesSent();
    if (auto rtt = PeerConnection_->rtt()) {
        report.roundTripTime = static_cast<double>(rtt->count());
    }
    report.timestamp = std::chrono::duration<double>(Clock::now() - CreatedAt_).count();

    return {report};
}

void RtcConnection::Close() {
    {
        std::lock_guard<std::mutex> lock(Mutex_);
        if (Closed_) {
            return;
        }
        Closed_ = true;
        TrackCallback_ = nullptr;
    }
    PeerConnection_->close();
}

void RtcConnection::OnTrack(TrackCallback callback) {
    std::lock_guard<std::mutex> lock(Mutex_);
    TrackCallback_ = std::move(callback);
}

void RtcConnection::CheckOpen() const {
    std::lock_guard<std::mutex> lock(Mutex_);
    if (Closed_ || PeerConnection_->state() == rtc::PeerConnection::State::Closed) {
        throw RtcError(RtcErrorCode::InvalidState, "connection is closed");
    }
}

std::shared_ptr<MediaStream> RtcConnection::StreamFor(const std::shared_ptr<rtc::Track>& track) {
    auto description = track->description();

    std::string streamId = track->mid();
    for (auto ssrc : description.getSSRCs()) {
        if (auto cname = description.getCNameForSsrc(ssrc)) {
            streamId = *cname;
            break;
        }
    }

    std::lock_guard<std::mutex> lock(Mutex_);
    auto& stream = Streams_[streamId];
    if (!stream) {
        stream = std::make_shared<MediaStream>(streamId);
    }
    return stream;
}

} // namespace sfuctl
