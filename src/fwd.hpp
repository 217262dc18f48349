#pragma once

#include <cstdint>
#include <string>

namespace sfuctl {

using ParticipantId = std::string;
using RoomId = std::string;

class Loop;
class Room;
class Participant;
class ParticipantRegistry;
class StreamMixer;
class AdaptationLoop;

class Connection;
class MediaTrack;
class MediaStream;
class RtpSender;

} // namespace sfuctl
