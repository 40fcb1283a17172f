#include "../../include/signaling/signaling_dispatcher.hpp"
#include "../../include/signaling/signaling_error.hpp"
#include "../../include/signaling/signaling_protocol.hpp"
#include "../../include/utils/id_generator.hpp"
#include "../../include/utils/json_parser.hpp"
#include "../../include/utils/logger.hpp"
#include <set>
#include <sstream>
#include <stdexcept>

namespace parley {

namespace {

using Fields = std::map<std::string, std::string>;

const std::set<std::string>& knownEventTypes() {
    static const std::set<std::string> types = {
        "join-room", "offer", "answer", "ice-candidate",
        "toggle-audio", "toggle-video", "toggle-screen-share",
        "start-screen-share", "stop-screen-share",
        "start-recording", "stop-recording",
        "mute-participant", "remove-participant", "raise-hand",
        "send-message", "share-file", "connection-quality", "leave-room"
    };
    return types;
}

std::string requireString(const Fields& fields, const std::string& name) {
    auto it = fields.find(name);
    if (it == fields.end() || !JsonParser::isStringValue(it->second)) {
        throw SignalingError(ErrorCode::InvalidMessage, "Missing required field: " + name);
    }
    return JsonParser::decodeString(it->second);
}

// Any JSON value except null; returned as raw JSON text for verbatim relay.
std::string requireValue(const Fields& fields, const std::string& name) {
    auto it = fields.find(name);
    if (it == fields.end() || it->second.empty() || it->second == "null") {
        throw SignalingError(ErrorCode::InvalidMessage, "Missing required field: " + name);
    }
    return it->second;
}

bool requireBool(const Fields& fields, const std::string& name) {
    auto it = fields.find(name);
    if (it != fields.end()) {
        if (it->second == "true") return true;
        if (it->second == "false") return false;
    }
    throw SignalingError(ErrorCode::InvalidMessage, "Field must be a boolean: " + name);
}

std::optional<std::string> optionalString(const Fields& fields, const std::string& name) {
    auto it = fields.find(name);
    if (it == fields.end() || !JsonParser::isStringValue(it->second)) {
        return std::nullopt;
    }
    return JsonParser::decodeString(it->second);
}

std::string optionalRaw(const Fields& fields, const std::string& name) {
    auto it = fields.find(name);
    if (it == fields.end() || it->second.empty()) {
        return "null";
    }
    return it->second;
}

std::string quoteOrNull(const std::optional<std::string>& value) {
    return value ? JsonParser::quote(*value) : "null";
}

const char* boolText(bool value) {
    return value ? "true" : "false";
}

} // namespace

SignalingDispatcher::SignalingDispatcher(ConnectionRegistry& registry,
                                         PeerConnectionTracker& tracker,
                                         RateLimiter& event_limiter)
    : registry_(registry), tracker_(tracker), event_limiter_(event_limiter) {}

void SignalingDispatcher::setSender(Sender sender) {
    std::lock_guard<std::mutex> lock(mutex_);
    sender_ = std::move(sender);
}

void SignalingDispatcher::setCloser(Closer closer) {
    std::lock_guard<std::mutex> lock(mutex_);
    closer_ = std::move(closer);
}

void SignalingDispatcher::handleConnect(const std::string& session_id, const std::string& remote_address) {
    std::lock_guard<std::mutex> lock(mutex_);
    SessionState state;
    state.remote_address = remote_address;
    sessions_[session_id] = state;
    Logger::getInstance().info("New client connected: " + session_id + " from " + remote_address);
}

void SignalingDispatcher::handleMessage(const std::string& session_id, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto session_it = sessions_.find(session_id);
    if (session_it == sessions_.end()) {
        Logger::getInstance().warning("Dropping message from unknown session " + session_id);
        return;
    }
    SessionState& session = session_it->second;

    std::string type = "unknown";
    try {
        Fields fields;
        try {
            fields = JsonParser::parseRaw(message);
        } catch (const std::invalid_argument& e) {
            throw SignalingError(ErrorCode::InvalidMessage, e.what());
        }

        auto type_it = fields.find("type");
        if (type_it == fields.end() || !JsonParser::isStringValue(type_it->second)) {
            throw SignalingError(ErrorCode::InvalidMessage, "Missing event type");
        }
        type = JsonParser::decodeString(type_it->second);
        if (!knownEventTypes().count(type)) {
            throw SignalingError(ErrorCode::InvalidMessage, "Unknown event type: " + type);
        }

        std::string ban_reason;
        if (!event_limiter_.allow(session.remote_address + "-" + type, ban_reason)) {
            throw SignalingError(ErrorCode::RateLimited, "Rate limit exceeded: " + ban_reason);
        }

        dispatch(session_id, session, type, fields);
    } catch (const SignalingError& e) {
        Logger::getInstance().warning("Signaling error for " + session_id + " on " + type + ": " +
                                      e.tag() + " (" + e.what() + ")");
        sendTo(session_id, SignalingProtocol::errorFrame(e.tag(), type, e.what()));
    } catch (const std::exception& e) {
        Logger::getInstance().error("Unhandled exception in " + type + " from " + session_id + ": " + e.what());
        sendTo(session_id, SignalingProtocol::errorFrame(errorCodeTag(ErrorCode::Internal), type,
                                                         "Internal server error"));
    }
}

void SignalingDispatcher::handleDisconnect(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto session_it = sessions_.find(session_id);
    if (session_it == sessions_.end()) {
        return;
    }

    try {
        teardownLocked(session_it->second);
    } catch (const std::exception& e) {
        Logger::getInstance().error("Cleanup failed for session " + session_id + ": " + e.what());
    }
    sessions_.erase(session_it);
    Logger::getInstance().info("Client disconnected: " + session_id);
}

size_t SignalingDispatcher::sweepEmptyRooms() {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.cleanupEmptyRooms();
}

size_t SignalingDispatcher::sweepExpiredOffers(std::chrono::milliseconds max_age) {
    std::lock_guard<std::mutex> lock(mutex_);
    return tracker_.sweepExpiredOffers(max_age);
}

size_t SignalingDispatcher::sessionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::optional<RoomId> SignalingDispatcher::boundRoom(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end() || !it->second.bound()) {
        return std::nullopt;
    }
    return it->second.room_id;
}

void SignalingDispatcher::dispatch(const std::string& session_id, SessionState& session,
                                   const std::string& type, const Fields& fields) {
    if (type == "join-room") {
        handleJoinRoom(session_id, session, fields);
        return;
    }

    if (!session.bound()) {
        throw SignalingError(ErrorCode::NotInRoom, "User not in room");
    }

    if (type == "offer") {
        handleOffer(session, fields);
    } else if (type == "answer") {
        handleAnswer(session, fields);
    } else if (type == "ice-candidate") {
        handleIceCandidate(session, fields);
    } else if (type == "toggle-audio") {
        handleMediaToggle(session, MediaKind::Audio, requireBool(fields, "enabled"));
    } else if (type == "toggle-video") {
        handleMediaToggle(session, MediaKind::Video, requireBool(fields, "enabled"));
    } else if (type == "toggle-screen-share") {
        handleMediaToggle(session, MediaKind::Screen, requireBool(fields, "enabled"));
    } else if (type == "start-screen-share") {
        handleScreenShare(session, true, fields);
    } else if (type == "stop-screen-share") {
        handleScreenShare(session, false, fields);
    } else if (type == "start-recording") {
        handleRecording(session, true);
    } else if (type == "stop-recording") {
        handleRecording(session, false);
    } else if (type == "mute-participant") {
        handleMuteParticipant(session, fields);
    } else if (type == "remove-participant") {
        handleRemoveParticipant(session, fields);
    } else if (type == "raise-hand") {
        handleRaiseHand(session, fields);
    } else if (type == "send-message") {
        handleSendMessage(session, fields);
    } else if (type == "share-file") {
        handleShareFile(session, fields);
    } else if (type == "connection-quality") {
        handleConnectionQuality(session, fields);
    } else if (type == "leave-room") {
        handleLeaveRoom(session_id, session);
    }
}

void SignalingDispatcher::handleJoinRoom(const std::string& session_id, SessionState& session,
                                         const Fields& fields) {
    const std::string room_id = requireString(fields, "roomId");
    const std::string user_name = requireString(fields, "userName");
    const std::optional<std::string> password = optionalString(fields, "password");
    if (room_id.empty()) {
        throw SignalingError(ErrorCode::InvalidMessage, "Missing required field: roomId");
    }

    const ParticipantId participant_id = session_id;
    const RoomId previous_room = session.room_id;
    std::optional<Participant> previous_self;
    if (session.bound()) {
        previous_self = registry_.getParticipant(participant_id);
    }

    JoinResult joined = registry_.joinRoom(room_id, participant_id,
                                           ParticipantInfo{user_name, session_id}, password);

    // The registry already dropped the old membership; bring the tracker and the old room in line.
    if (!previous_room.empty() && previous_room != room_id) {
        tracker_.removeParticipant(previous_room, participant_id);
        auto old_room = registry_.getRoom(previous_room);
        if (old_room && previous_self) {
            std::ostringstream oss;
            oss << "{\"type\":\"user-disconnected\","
                << "\"userId\":\"" << JsonParser::escapeJson(participant_id) << "\","
                << "\"user\":" << SignalingProtocol::participantJson(*previous_self, MediaState{}) << ","
                << "\"roomInfo\":" << SignalingProtocol::roomInfoJson(*old_room, registry_.mediaStates())
                << "}";
            broadcast(*old_room, oss.str(), participant_id);
        }
    }

    tracker_.addParticipant(room_id, participant_id, session_id);
    session.room_id = room_id;
    session.participant_id = participant_id;

    const MediaStateTable& media = registry_.mediaStates();
    const std::string room_info = SignalingProtocol::roomInfoJson(joined.room, media);
    const std::string user_json = SignalingProtocol::participantJson(
        joined.participant, media.get(participant_id).value_or(MediaState{}));

    std::ostringstream existing;
    existing << "[";
    bool first = true;
    for (const auto& participant : joined.room.participants()) {
        if (participant.id == participant_id) continue;
        if (!first) existing << ",";
        first = false;
        existing << "{"
                 << "\"userId\":\"" << JsonParser::escapeJson(participant.id) << "\","
                 << "\"name\":\"" << JsonParser::escapeJson(participant.name) << "\","
                 << "\"mediaState\":" << SignalingProtocol::mediaStateJson(
                        media.get(participant.id).value_or(MediaState{}))
                 << "}";
    }
    existing << "]";

    std::ostringstream joined_event;
    joined_event << "{\"type\":\"room-joined\","
                 << "\"roomId\":\"" << JsonParser::escapeJson(room_id) << "\","
                 << "\"userId\":\"" << JsonParser::escapeJson(participant_id) << "\","
                 << "\"user\":" << user_json << ","
                 << "\"roomInfo\":" << room_info << ","
                 << "\"existingUsers\":" << existing.str() << ","
                 << "\"iceServers\":" << SignalingProtocol::iceServersJson(tracker_.iceServers())
                 << "}";
    sendTo(session_id, joined_event.str());

    std::ostringstream connected_event;
    connected_event << "{\"type\":\"user-connected\","
                    << "\"userId\":\"" << JsonParser::escapeJson(participant_id) << "\","
                    << "\"user\":" << user_json << ","
                    << "\"roomInfo\":" << room_info
                    << "}";
    broadcast(joined.room, connected_event.str(), participant_id);

    Logger::getInstance().info("User " + participant_id + " successfully joined room " + room_id);
}

void SignalingDispatcher::handleOffer(SessionState& session, const Fields& fields) {
    const std::string target = requireString(fields, "target");
    const std::string offer = requireValue(fields, "offer");

    Room room = requireRoom(session);
    const Participant& target_participant = requireTarget(room, target);

    auto connection_id = tracker_.handleOffer(session.room_id, session.participant_id, target, offer);
    if (!connection_id) {
        throw SignalingError(ErrorCode::TargetNotFound, "Failed to process offer");
    }

    std::ostringstream oss;
    oss << "{\"type\":\"offer\","
        << "\"offer\":" << offer << ","
        << "\"sender\":\"" << JsonParser::escapeJson(session.participant_id) << "\","
        << "\"target\":\"" << JsonParser::escapeJson(target) << "\","
        << "\"connectionId\":\"" << JsonParser::escapeJson(*connection_id) << "\""
        << "}";
    sendTo(target_participant.session_id, oss.str());

    Logger::getInstance().info("Offer forwarded: " + session.participant_id + " -> " + target);
}

void SignalingDispatcher::handleAnswer(SessionState& session, const Fields& fields) {
    const std::string target = requireString(fields, "target");
    const std::string answer = requireValue(fields, "answer");

    Room room = requireRoom(session);
    const Participant& target_participant = requireTarget(room, target);

    if (!tracker_.handleAnswer(session.room_id, session.participant_id, target, answer)) {
        throw SignalingError(ErrorCode::NoMatchingOffer, "Failed to process answer");
    }

    std::ostringstream oss;
    oss << "{\"type\":\"answer\","
        << "\"answer\":" << answer << ","
        << "\"sender\":\"" << JsonParser::escapeJson(session.participant_id) << "\","
        << "\"target\":\"" << JsonParser::escapeJson(target) << "\""
        << "}";
    sendTo(target_participant.session_id, oss.str());

    Logger::getInstance().info("Answer forwarded: " + session.participant_id + " -> " + target);
}

void SignalingDispatcher::handleIceCandidate(SessionState& session, const Fields& fields) {
    const std::string target = requireString(fields, "target");
    const std::string candidate = requireValue(fields, "candidate");

    Room room = requireRoom(session);
    const Participant& target_participant = requireTarget(room, target);

    std::ostringstream oss;
    oss << "{\"type\":\"ice-candidate\","
        << "\"candidate\":" << candidate << ","
        << "\"sender\":\"" << JsonParser::escapeJson(session.participant_id) << "\","
        << "\"target\":\"" << JsonParser::escapeJson(target) << "\""
        << "}";
    sendTo(target_participant.session_id, oss.str());

    Logger::getInstance().debug("ICE candidate forwarded: " + session.participant_id + " -> " + target);
}

void SignalingDispatcher::handleMediaToggle(SessionState& session, MediaKind kind, bool enabled) {
    Room room = requireRoom(session);
    if (kind == MediaKind::Screen && enabled && !room.settings().allow_screen_share) {
        throw SignalingError(ErrorCode::PermissionDenied, "Screen sharing is disabled in this room");
    }

    auto participant = registry_.updateParticipantMedia(session.participant_id, kind, enabled);
    auto media_state = tracker_.updateMediaState(session.room_id, session.participant_id, kind, enabled);
    if (!participant || !media_state) {
        throw SignalingError(ErrorCode::NotInRoom, "User not in room");
    }

    std::ostringstream oss;
    oss << "{\"type\":\"user-media-changed\","
        << "\"userId\":\"" << JsonParser::escapeJson(session.participant_id) << "\","
        << "\"mediaType\":\"" << mediaKindName(kind) << "\","
        << "\"enabled\":" << boolText(enabled) << ","
        << "\"mediaState\":" << SignalingProtocol::mediaStateJson(*media_state) << ","
        << "\"user\":" << SignalingProtocol::participantJson(*participant, *media_state)
        << "}";
    broadcast(room, oss.str(), session.participant_id);
}

void SignalingDispatcher::handleScreenShare(SessionState& session, bool start, const Fields& fields) {
    Room room = requireRoom(session);
    if (start && !room.settings().allow_screen_share) {
        throw SignalingError(ErrorCode::PermissionDenied, "Screen sharing is disabled in this room");
    }

    auto participant = registry_.updateParticipantMedia(session.participant_id, MediaKind::Screen, start);
    auto media_state = tracker_.updateMediaState(session.room_id, session.participant_id, MediaKind::Screen, start);
    if (!participant || !media_state) {
        throw SignalingError(ErrorCode::NotInRoom, "User not in room");
    }

    std::ostringstream oss;
    oss << "{\"type\":\"" << (start ? "user-started-screen-share" : "user-stopped-screen-share") << "\","
        << "\"userId\":\"" << JsonParser::escapeJson(session.participant_id) << "\","
        << "\"userName\":\"" << JsonParser::escapeJson(participant->name) << "\",";
    if (start) {
        oss << "\"streamId\":" << quoteOrNull(optionalString(fields, "streamId")) << ",";
    }
    oss << "\"mediaState\":" << SignalingProtocol::mediaStateJson(*media_state) << ","
        << "\"user\":" << SignalingProtocol::participantJson(*participant, *media_state)
        << "}";
    broadcast(room, oss.str(), session.participant_id);

    Logger::getInstance().info(std::string("Screen sharing ") + (start ? "started" : "stopped") +
                               " by " + session.participant_id + " in room " + session.room_id);
}

void SignalingDispatcher::handleRecording(SessionState& session, bool start) {
    Room room = registry_.setRecording(session.participant_id, start);
    const Participant* host = room.findParticipant(session.participant_id);

    std::ostringstream oss;
    oss << "{\"type\":\"" << (start ? "recording-started" : "recording-stopped") << "\","
        << "\"" << (start ? "startedBy" : "stoppedBy") << "\":\""
        << JsonParser::escapeJson(session.participant_id) << "\","
        << "\"userName\":\"" << JsonParser::escapeJson(host ? host->name : "") << "\","
        << "\"timestamp\":\"" << SignalingProtocol::isoTimestampNow() << "\""
        << "}";
    broadcast(room, oss.str(), session.participant_id);

    Logger::getInstance().info(std::string("Recording ") + (start ? "started" : "stopped") +
                               " in room " + session.room_id + " by " + session.participant_id);
}

void SignalingDispatcher::handleMuteParticipant(SessionState& session, const Fields& fields) {
    const std::string target = requireString(fields, "target");

    Room room = requireRoom(session);
    if (!room.isHost(session.participant_id)) {
        throw SignalingError(ErrorCode::PermissionDenied, "Only host can mute participants");
    }
    const Participant target_participant = requireTarget(room, target);
    const Participant* host = room.findParticipant(session.participant_id);

    auto muted = registry_.updateParticipantMedia(target, MediaKind::Audio, false);
    auto media_state = tracker_.updateMediaState(session.room_id, target, MediaKind::Audio, false);
    if (!muted || !media_state) {
        throw SignalingError(ErrorCode::TargetNotFound, "Target is not connected");
    }

    std::ostringstream oss;
    oss << "{\"type\":\"participant-muted\","
        << "\"targetUserId\":\"" << JsonParser::escapeJson(target) << "\","
        << "\"targetUserName\":\"" << JsonParser::escapeJson(target_participant.name) << "\","
        << "\"mutedBy\":\"" << JsonParser::escapeJson(session.participant_id) << "\","
        << "\"mutedByName\":\"" << JsonParser::escapeJson(host->name) << "\""
        << "}";
    broadcast(room, oss.str());

    Logger::getInstance().info("User " + target + " muted by host " + session.participant_id +
                               " in room " + session.room_id);
}

void SignalingDispatcher::handleRemoveParticipant(SessionState& session, const Fields& fields) {
    const std::string target = requireString(fields, "target");

    Room room = requireRoom(session);
    if (!room.isHost(session.participant_id)) {
        throw SignalingError(ErrorCode::PermissionDenied, "Only host can remove participants");
    }
    const Participant target_participant = requireTarget(room, target);
    const Participant* host = room.findParticipant(session.participant_id);

    auto target_session = sessions_.find(target_participant.session_id);
    if (target_session == sessions_.end() || target_session->second.room_id != session.room_id) {
        throw SignalingError(ErrorCode::TargetNotFound, "Target is not connected");
    }

    std::ostringstream oss;
    oss << "{\"type\":\"removed-from-room\","
        << "\"removedBy\":\"" << JsonParser::escapeJson(session.participant_id) << "\","
        << "\"removedByName\":\"" << JsonParser::escapeJson(host->name) << "\","
        << "\"reason\":\"Removed by host\""
        << "}";
    sendTo(target_session->first, oss.str());

    const std::string host_id = session.participant_id;
    const std::string room_id = session.room_id;
    teardownLocked(target_session->second);
    if (closer_) {
        closer_(target_session->first);
    }

    Logger::getInstance().info("User " + target + " removed by host " + host_id + " from room " + room_id);
}

void SignalingDispatcher::handleRaiseHand(SessionState& session, const Fields& fields) {
    const bool raised = requireBool(fields, "raised");

    Room room = requireRoom(session);
    auto participant = registry_.setHandRaised(session.participant_id, raised);
    if (!participant) {
        throw SignalingError(ErrorCode::NotInRoom, "User not in room");
    }

    std::ostringstream oss;
    oss << "{\"type\":\"hand-raised\","
        << "\"userId\":\"" << JsonParser::escapeJson(session.participant_id) << "\","
        << "\"userName\":\"" << JsonParser::escapeJson(participant->name) << "\","
        << "\"raised\":" << boolText(raised) << ","
        << "\"timestamp\":\"" << SignalingProtocol::isoTimestampNow() << "\""
        << "}";
    broadcast(room, oss.str(), session.participant_id);

    Logger::getInstance().info(std::string("Hand ") + (raised ? "raised" : "lowered") + " by " +
                               session.participant_id + " in room " + session.room_id);
}

void SignalingDispatcher::handleSendMessage(SessionState& session, const Fields& fields) {
    const std::string text = requireString(fields, "message");
    const std::string message_type = optionalString(fields, "messageType").value_or("text");

    Room room = requireRoom(session);
    if (!room.settings().allow_chat) {
        throw SignalingError(ErrorCode::PermissionDenied, "Chat is disabled in this room");
    }
    const Participant* sender = room.findParticipant(session.participant_id);
    if (!sender) {
        throw SignalingError(ErrorCode::NotInRoom, "User not in room");
    }

    std::ostringstream oss;
    oss << "{\"type\":\"new-message\","
        << "\"id\":\"" << IdGenerator::generate() << "\","
        << "\"userId\":\"" << JsonParser::escapeJson(session.participant_id) << "\","
        << "\"userName\":\"" << JsonParser::escapeJson(sender->name) << "\","
        << "\"message\":\"" << JsonParser::escapeJson(text) << "\","
        << "\"messageType\":\"" << JsonParser::escapeJson(message_type) << "\","
        << "\"timestamp\":\"" << SignalingProtocol::isoTimestampNow() << "\""
        << "}";
    broadcast(room, oss.str());

    Logger::getInstance().info("Message sent in room " + session.room_id + " by " + session.participant_id);
}

void SignalingDispatcher::handleShareFile(SessionState& session, const Fields& fields) {
    const std::string file_name = requireString(fields, "fileName");

    Room room = requireRoom(session);
    if (!room.settings().allow_chat) {
        throw SignalingError(ErrorCode::PermissionDenied, "Chat is disabled in this room");
    }
    const Participant* sender = room.findParticipant(session.participant_id);
    if (!sender) {
        throw SignalingError(ErrorCode::NotInRoom, "User not in room");
    }

    std::ostringstream oss;
    oss << "{\"type\":\"new-file\","
        << "\"id\":\"" << IdGenerator::generate() << "\","
        << "\"userId\":\"" << JsonParser::escapeJson(session.participant_id) << "\","
        << "\"userName\":\"" << JsonParser::escapeJson(sender->name) << "\","
        << "\"fileName\":\"" << JsonParser::escapeJson(file_name) << "\","
        << "\"fileSize\":" << optionalRaw(fields, "fileSize") << ","
        << "\"fileType\":" << quoteOrNull(optionalString(fields, "fileType")) << ","
        << "\"fileUrl\":" << quoteOrNull(optionalString(fields, "fileUrl")) << ","
        << "\"messageType\":\"file\","
        << "\"timestamp\":\"" << SignalingProtocol::isoTimestampNow() << "\""
        << "}";
    broadcast(room, oss.str());

    Logger::getInstance().info("File shared in room " + session.room_id + " by " +
                               session.participant_id + ": " + file_name);
}

void SignalingDispatcher::handleConnectionQuality(SessionState& session, const Fields& fields) {
    const std::string quality = requireValue(fields, "quality");

    Room room = requireRoom(session);

    std::ostringstream oss;
    oss << "{\"type\":\"user-connection-quality\","
        << "\"userId\":\"" << JsonParser::escapeJson(session.participant_id) << "\","
        << "\"quality\":" << quality << ","
        << "\"stats\":" << optionalRaw(fields, "stats")
        << "}";
    broadcast(room, oss.str(), session.participant_id);
}

void SignalingDispatcher::handleLeaveRoom(const std::string& session_id, SessionState& session) {
    const RoomId room_id = session.room_id;
    teardownLocked(session);

    std::ostringstream oss;
    oss << "{\"type\":\"left-room\",\"roomId\":\"" << JsonParser::escapeJson(room_id) << "\"}";
    sendTo(session_id, oss.str());
}

void SignalingDispatcher::teardownLocked(SessionState& session) {
    if (!session.bound()) {
        return;
    }

    const RoomId room_id = session.room_id;
    const ParticipantId participant_id = session.participant_id;
    session.room_id.clear();
    session.participant_id.clear();

    auto result = registry_.leaveRoom(participant_id);
    tracker_.removeParticipant(room_id, participant_id);

    if (result && !result->room_deleted) {
        std::ostringstream oss;
        oss << "{\"type\":\"user-disconnected\","
            << "\"userId\":\"" << JsonParser::escapeJson(participant_id) << "\","
            << "\"user\":" << SignalingProtocol::participantJson(result->participant, MediaState{}) << ","
            << "\"roomInfo\":" << SignalingProtocol::roomInfoJson(result->room, registry_.mediaStates())
            << "}";
        broadcast(result->room, oss.str(), participant_id);
    }
}

Room SignalingDispatcher::requireRoom(const SessionState& session) const {
    auto room = registry_.getRoom(session.room_id);
    if (!room || !room->findParticipant(session.participant_id)) {
        throw SignalingError(ErrorCode::NotInRoom, "User not in room");
    }
    return *room;
}

const Participant& SignalingDispatcher::requireTarget(const Room& room, const std::string& target_id) const {
    const Participant* target = room.findParticipant(target_id);
    if (!target) {
        throw SignalingError(ErrorCode::TargetNotFound, "Target user not found in room");
    }
    return *target;
}

void SignalingDispatcher::sendTo(const std::string& session_id, const std::string& message) {
    if (sender_) {
        sender_(session_id, message);
    }
}

void SignalingDispatcher::broadcast(const Room& room, const std::string& message, const std::string& exclude_id) {
    for (const auto& participant : room.participants()) {
        if (participant.id == exclude_id) continue;
        sendTo(participant.session_id, message);
    }
}

} // namespace parley
