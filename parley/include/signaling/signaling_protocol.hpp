#ifndef PARLEY_SIGNALING_PROTOCOL_HPP
#define PARLEY_SIGNALING_PROTOCOL_HPP

#include <chrono>
#include <string>
#include <vector>
#include "../rooms/room.hpp"
#include "../rooms/media_state_table.hpp"
#include "../rooms/connection_registry.hpp"
#include "peer_connection_tracker.hpp"

namespace parley {

/**
 * JSON builders for the outbound wire vocabulary and the admin HTTP surface.
 * Every function returns a complete JSON value as text.
 */
namespace SignalingProtocol {

    // "2024-05-01T12:30:00.000Z"
    std::string isoTimestamp(std::chrono::system_clock::time_point tp);
    std::string isoTimestampNow();

    std::string mediaStateJson(const MediaState& state);

    /**
     * {"userId","name","role","isAudioEnabled","isVideoEnabled",
     *  "isScreenSharing","isHandRaised","joinedAt"}
     */
    std::string participantJson(const Participant& participant, const MediaState& media);

    // Room snapshot; the room password is never included.
    std::string roomInfoJson(const Room& room, const MediaStateTable& media_states);

    // [{"urls":"stun:..."}, ...]
    std::string iceServersJson(const std::vector<IceServer>& servers);

    std::string errorFrame(const std::string& error_tag,
                           const std::string& context,
                           const std::string& message);

    std::string registryStatsJson(const RegistryStats& stats);
    std::string trackerStatsJson(const TrackerStats& stats);
    std::string peerRoomSnapshotJson(const PeerRoomSnapshot& snapshot);

} // namespace SignalingProtocol

} // namespace parley

#endif // PARLEY_SIGNALING_PROTOCOL_HPP
