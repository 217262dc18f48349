#pragma once

#include "encoding.hpp"
#include "fwd.hpp"
#include "stats.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sfuctl {

enum class MediaKind {
    Audio,
    Video,
};

class MediaTrack {
public:
    virtual ~MediaTrack() = default;

    virtual std::string Id() const = 0;
    virtual MediaKind Kind() const = 0;
};

class MediaStream {
public:
    explicit MediaStream(std::string id);

    const std::string& Id() const {
        return Id_;
    }

    bool AddTrack(const std::shared_ptr<MediaTrack>& track);
    bool HasTrack(const std::string& trackId) const;

    const std::vector<std::shared_ptr<MediaTrack>>& GetTracks() const {
        return Tracks_;
    }

private:
    std::string Id_;
    std::vector<std::shared_ptr<MediaTrack>> Tracks_;
};

using StreamList = std::vector<std::shared_ptr<MediaStream>>;

class RtpSender {
public:
    virtual ~RtpSender() = default;

    virtual std::shared_ptr<MediaTrack> Track() const = 0;
    virtual SendParameters GetParameters() const = 0;
    virtual void SetParameters(const SendParameters& parameters) = 0;
};

using TrackCallback = std::function<void(std::shared_ptr<MediaTrack> track, StreamList streams)>;

class Connection {
public:
    virtual ~Connection() = default;

    virtual std::shared_ptr<RtpSender> AddTrack(const std::shared_ptr<MediaTrack>& track, const StreamList& streams) = 0;
    virtual std::vector<std::shared_ptr<RtpSender>> GetSenders() const = 0;
    virtual std::vector<StatsReport> GetStats() = 0;
    virtual void Close() = 0;

    // Passing an empty callback detaches the previous one.
    virtual void OnTrack(TrackCallback callback) = 0;

    std::mutex& ParametersMutex() {
        return ParametersMutex_;
    }

private:
    std::mutex ParametersMutex_;
};

} // namespace sfuctl
