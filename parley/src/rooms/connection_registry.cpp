#include "../../include/rooms/connection_registry.hpp"
#include "../../include/security/room_password.hpp"
#include "../../include/signaling/signaling_error.hpp"
#include "../../include/utils/id_generator.hpp"
#include "../../include/utils/logger.hpp"

namespace parley {

ConnectionRegistry::ConnectionRegistry(MediaStateTable& media_states)
    : media_states_(media_states) {}

Room ConnectionRegistry::createRoom(const std::optional<std::string>& created_by, const RoomOptions& options) {
    Room room(IdGenerator::generate(), created_by);

    if (options.max_participants && *options.max_participants > 0) {
        room.setCapacity(*options.max_participants);
    }
    if (options.require_password) {
        room.settings().require_password = true;
        room.settings().password_hash = RoomPassword::hash(options.password);
    }
    if (options.allow_screen_share) {
        room.settings().allow_screen_share = *options.allow_screen_share;
    }
    if (options.allow_chat) {
        room.settings().allow_chat = *options.allow_chat;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    rooms_.emplace(room.id(), room);

    Logger::getInstance().info("Room created: " + room.id() + " by " + created_by.value_or("anonymous"));
    return room;
}

std::optional<Room> ConnectionRegistry::getRoom(const RoomId& room_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rooms_.find(room_id);
    if (it == rooms_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Room> ConnectionRegistry::allRooms() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Room> result;
    result.reserve(rooms_.size());
    for (const auto& pair : rooms_) {
        result.push_back(pair.second);
    }
    return result;
}

JoinResult ConnectionRegistry::joinRoom(const RoomId& room_id,
                                        const ParticipantId& participant_id,
                                        const ParticipantInfo& info,
                                        const std::optional<std::string>& password) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = rooms_.find(room_id);
    if (it == rooms_.end()) {
        throw SignalingError(ErrorCode::RoomNotFound, "Room not found");
    }
    if (!it->second.isActive()) {
        throw SignalingError(ErrorCode::RoomInactive, "Room is not active");
    }
    if (!it->second.validatePassword(password)) {
        throw SignalingError(ErrorCode::InvalidPassword, "Invalid room password");
    }

    // Re-joining the room one is already in must not tear the room down.
    auto current = participant_rooms_.find(participant_id);
    if (current != participant_rooms_.end() && current->second == room_id) {
        throw SignalingError(ErrorCode::DuplicateParticipant, "User already in room");
    }
    // Checked before the old membership goes away so a failed join leaves it intact.
    if (it->second.isFull()) {
        throw SignalingError(ErrorCode::RoomFull,
                             "Room is full. Maximum " + std::to_string(it->second.capacity()) + " users allowed.");
    }

    leaveRoomLocked(participant_id);

    // The previous room may have been erased; the target room is untouched.
    Room& room = rooms_.at(room_id);
    const Participant& participant = room.addParticipant(participant_id, info.name, info.session_id);
    participant_rooms_[participant_id] = room_id;
    media_states_.reset(participant_id);

    Logger::getInstance().info("User " + participant_id + " joined room " + room_id +
                               " as " + participantRoleName(participant.role));
    return JoinResult{room, participant};
}

std::optional<LeaveResult> ConnectionRegistry::leaveRoom(const ParticipantId& participant_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return leaveRoomLocked(participant_id);
}

std::optional<LeaveResult> ConnectionRegistry::leaveRoomLocked(const ParticipantId& participant_id) {
    auto index_it = participant_rooms_.find(participant_id);
    if (index_it == participant_rooms_.end()) {
        return std::nullopt;
    }

    const RoomId room_id = index_it->second;
    participant_rooms_.erase(index_it);
    media_states_.erase(participant_id);

    auto room_it = rooms_.find(room_id);
    if (room_it == rooms_.end()) {
        Logger::getInstance().warning("Participant " + participant_id + " indexed to missing room " + room_id);
        return std::nullopt;
    }

    auto removed = room_it->second.removeParticipant(participant_id);
    if (!removed) {
        return std::nullopt;
    }

    Logger::getInstance().info("User " + participant_id + " left room " + room_id);

    LeaveResult result{room_it->second, *removed, false};
    if (room_it->second.isEmpty()) {
        rooms_.erase(room_it);
        result.room_deleted = true;
        Logger::getInstance().info("Room " + room_id + " deleted (empty)");
    } else if (removed->role == ParticipantRole::Host) {
        auto host = result.room.hostId();
        Logger::getInstance().info("Host of room " + room_id + " passed to " + host.value_or("nobody"));
    }
    return result;
}

Room* ConnectionRegistry::findUserRoomLocked(const ParticipantId& participant_id) {
    auto index_it = participant_rooms_.find(participant_id);
    if (index_it == participant_rooms_.end()) {
        return nullptr;
    }
    auto room_it = rooms_.find(index_it->second);
    if (room_it == rooms_.end()) {
        return nullptr;
    }
    return &room_it->second;
}

std::optional<Participant> ConnectionRegistry::updateParticipantMedia(const ParticipantId& participant_id,
                                                                      MediaKind kind, bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    Room* room = findUserRoomLocked(participant_id);
    if (!room) {
        return std::nullopt;
    }
    Participant* participant = room->findParticipant(participant_id);
    if (!participant || !media_states_.set(participant_id, kind, enabled)) {
        return std::nullopt;
    }
    return *participant;
}

std::optional<Participant> ConnectionRegistry::setHandRaised(const ParticipantId& participant_id, bool raised) {
    std::lock_guard<std::mutex> lock(mutex_);
    Room* room = findUserRoomLocked(participant_id);
    if (!room) {
        return std::nullopt;
    }
    Participant* participant = room->findParticipant(participant_id);
    if (!participant) {
        return std::nullopt;
    }
    participant->hand_raised = raised;
    return *participant;
}

Room ConnectionRegistry::setRecording(const ParticipantId& participant_id, bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    Room* room = findUserRoomLocked(participant_id);
    if (!room) {
        throw SignalingError(ErrorCode::NotInRoom, "User not in room");
    }
    if (!room->isHost(participant_id)) {
        throw SignalingError(ErrorCode::PermissionDenied,
                             std::string("Only host can ") + (enabled ? "start" : "stop") + " recording");
    }
    room->settings().recording_enabled = enabled;
    return *room;
}

bool ConnectionRegistry::deactivateRoom(const RoomId& room_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rooms_.find(room_id);
    if (it == rooms_.end()) {
        return false;
    }
    it->second.setActive(false);
    Logger::getInstance().info("Room " + room_id + " deactivated");
    return true;
}

std::optional<Room> ConnectionRegistry::getUserRoom(const ParticipantId& participant_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto index_it = participant_rooms_.find(participant_id);
    if (index_it == participant_rooms_.end()) {
        return std::nullopt;
    }
    auto room_it = rooms_.find(index_it->second);
    if (room_it == rooms_.end()) {
        return std::nullopt;
    }
    return room_it->second;
}

std::optional<Participant> ConnectionRegistry::getParticipant(const ParticipantId& participant_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto index_it = participant_rooms_.find(participant_id);
    if (index_it == participant_rooms_.end()) {
        return std::nullopt;
    }
    auto room_it = rooms_.find(index_it->second);
    if (room_it == rooms_.end()) {
        return std::nullopt;
    }
    const Participant* participant = room_it->second.findParticipant(participant_id);
    if (!participant) {
        return std::nullopt;
    }
    return *participant;
}

size_t ConnectionRegistry::cleanupEmptyRooms() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;

    for (auto it = rooms_.begin(); it != rooms_.end();) {
        if (it->second.isEmpty()) {
            Logger::getInstance().info("Cleaned up empty room: " + it->first);
            it = rooms_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        Logger::getInstance().warning("Cleaned up " + std::to_string(removed) + " empty rooms");
    }
    return removed;
}

RegistryStats ConnectionRegistry::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    RegistryStats result;
    result.total_rooms = rooms_.size();
    result.total_users = participant_rooms_.size();
    result.room_details.reserve(rooms_.size());
    for (const auto& pair : rooms_) {
        result.room_details.push_back({pair.first, pair.second.participantCount(), pair.second.createdAt()});
    }
    return result;
}

} // namespace parley
