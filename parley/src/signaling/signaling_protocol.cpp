#include "../../include/signaling/signaling_protocol.hpp"
#include "../../include/utils/json_parser.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace parley {

namespace SignalingProtocol {

namespace {

const char* boolText(bool value) {
    return value ? "true" : "false";
}

} // namespace

std::string isoTimestamp(std::chrono::system_clock::time_point tp) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;

    std::tm tm_buf{};
    gmtime_r(&seconds, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << (millis < 0 ? millis + 1000 : millis) << 'Z';
    return oss.str();
}

std::string isoTimestampNow() {
    return isoTimestamp(std::chrono::system_clock::now());
}

std::string mediaStateJson(const MediaState& state) {
    std::ostringstream oss;
    oss << "{\"audio\":" << boolText(state.audio)
        << ",\"video\":" << boolText(state.video)
        << ",\"screen\":" << boolText(state.screen) << "}";
    return oss.str();
}

std::string participantJson(const Participant& participant, const MediaState& media) {
    std::ostringstream oss;
    oss << "{"
        << "\"userId\":\"" << JsonParser::escapeJson(participant.id) << "\","
        << "\"name\":\"" << JsonParser::escapeJson(participant.name) << "\","
        << "\"role\":\"" << participantRoleName(participant.role) << "\","
        << "\"isAudioEnabled\":" << boolText(media.audio) << ","
        << "\"isVideoEnabled\":" << boolText(media.video) << ","
        << "\"isScreenSharing\":" << boolText(media.screen) << ","
        << "\"isHandRaised\":" << boolText(participant.hand_raised) << ","
        << "\"joinedAt\":\"" << isoTimestamp(participant.joined_at) << "\""
        << "}";
    return oss.str();
}

std::string roomInfoJson(const Room& room, const MediaStateTable& media_states) {
    const RoomSettings& settings = room.settings();

    std::ostringstream oss;
    oss << "{"
        << "\"roomId\":\"" << JsonParser::escapeJson(room.id()) << "\","
        << "\"userCount\":" << room.participantCount() << ","
        << "\"maxUsers\":" << room.capacity() << ","
        << "\"isActive\":" << boolText(room.isActive()) << ","
        << "\"createdAt\":\"" << isoTimestamp(room.createdAt()) << "\","
        << "\"createdBy\":";
    if (room.createdBy()) {
        oss << "\"" << JsonParser::escapeJson(*room.createdBy()) << "\"";
    } else {
        oss << "null";
    }
    oss << ",\"settings\":{"
        << "\"allowScreenShare\":" << boolText(settings.allow_screen_share) << ","
        << "\"allowChat\":" << boolText(settings.allow_chat) << ","
        << "\"requirePassword\":" << boolText(settings.require_password) << ","
        << "\"recordingEnabled\":" << boolText(settings.recording_enabled)
        << "},\"users\":[";

    const auto& participants = room.participants();
    for (size_t i = 0; i < participants.size(); i++) {
        if (i > 0) oss << ",";
        const Participant& participant = participants[i];
        oss << participantJson(participant, media_states.get(participant.id).value_or(MediaState{}));
    }
    oss << "]}";
    return oss.str();
}

std::string iceServersJson(const std::vector<IceServer>& servers) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < servers.size(); i++) {
        if (i > 0) oss << ",";
        oss << "{\"urls\":\"" << JsonParser::escapeJson(servers[i].urls) << "\"}";
    }
    oss << "]";
    return oss.str();
}

std::string errorFrame(const std::string& error_tag,
                       const std::string& context,
                       const std::string& message) {
    std::ostringstream oss;
    oss << "{\"type\":\"error\","
        << "\"error_type\":\"" << JsonParser::escapeJson(error_tag) << "\","
        << "\"context\":\"" << JsonParser::escapeJson(context) << "\","
        << "\"message\":\"" << JsonParser::escapeJson(message) << "\"}";
    return oss.str();
}

std::string registryStatsJson(const RegistryStats& stats) {
    std::ostringstream oss;
    oss << "{\"totalRooms\":" << stats.total_rooms
        << ",\"totalUsers\":" << stats.total_users
        << ",\"roomDetails\":[";
    for (size_t i = 0; i < stats.room_details.size(); i++) {
        const auto& detail = stats.room_details[i];
        if (i > 0) oss << ",";
        oss << "{"
            << "\"roomId\":\"" << JsonParser::escapeJson(detail.room_id) << "\","
            << "\"userCount\":" << detail.user_count << ","
            << "\"createdAt\":\"" << isoTimestamp(detail.created_at) << "\""
            << "}";
    }
    oss << "]}";
    return oss.str();
}

std::string trackerStatsJson(const TrackerStats& stats) {
    std::ostringstream oss;
    oss << "{\"totalRooms\":" << stats.total_rooms
        << ",\"totalUsers\":" << stats.total_users
        << ",\"totalConnections\":" << stats.total_connections
        << ",\"pendingOffers\":" << stats.pending_offers
        << ",\"rooms\":{";
    bool first = true;
    for (const auto& pair : stats.rooms) {
        if (!first) oss << ",";
        first = false;
        oss << "\"" << JsonParser::escapeJson(pair.first) << "\":{"
            << "\"userCount\":" << pair.second.user_count << ","
            << "\"connectionCount\":" << pair.second.connection_count
            << "}";
    }
    oss << "}}";
    return oss.str();
}

std::string peerRoomSnapshotJson(const PeerRoomSnapshot& snapshot) {
    std::ostringstream oss;
    oss << "{\"roomId\":\"" << JsonParser::escapeJson(snapshot.room_id) << "\""
        << ",\"userCount\":" << snapshot.user_count
        << ",\"totalConnections\":" << snapshot.total_connections
        << ",\"users\":{";
    bool first = true;
    for (const auto& pair : snapshot.users) {
        if (!first) oss << ",";
        first = false;
        const auto& info = pair.second;
        oss << "\"" << JsonParser::escapeJson(pair.first) << "\":{"
            << "\"socketId\":\"" << JsonParser::escapeJson(info.session_id) << "\","
            << "\"peerCount\":" << info.peer_count << ","
            << "\"mediaState\":" << mediaStateJson(info.media_state) << ","
            << "\"peers\":[";
        for (size_t i = 0; i < info.peers.size(); i++) {
            if (i > 0) oss << ",";
            oss << "\"" << JsonParser::escapeJson(info.peers[i]) << "\"";
        }
        oss << "]}";
    }
    oss << "}}";
    return oss.str();
}

} // namespace SignalingProtocol

} // namespace parley
