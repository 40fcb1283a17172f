#include "../../include/rooms/room.hpp"
#include "../../include/security/room_password.hpp"
#include "../../include/signaling/signaling_error.hpp"
#include <algorithm>

namespace parley {

const char* participantRoleName(ParticipantRole role) {
    return role == ParticipantRole::Host ? "host" : "participant";
}

Room::Room(RoomId id, std::optional<std::string> created_by)
    : id_(std::move(id)),
      created_by_(std::move(created_by)),
      created_at_(std::chrono::system_clock::now()) {}

void Room::setCapacity(size_t capacity) {
    capacity_ = std::max<size_t>(1, std::min(capacity, kMaxRoomCapacity));
}

const Participant& Room::addParticipant(const ParticipantId& participant_id,
                                        const std::string& name,
                                        const std::string& session_id) {
    if (isFull()) {
        throw SignalingError(ErrorCode::RoomFull,
                             "Room is full. Maximum " + std::to_string(capacity_) + " users allowed.");
    }
    if (findParticipant(participant_id)) {
        throw SignalingError(ErrorCode::DuplicateParticipant, "User already in room");
    }

    Participant participant;
    participant.id = participant_id;
    participant.name = name.empty() ? "User " + participant_id.substr(0, 8) : name;
    participant.session_id = session_id;
    participant.joined_at = std::chrono::system_clock::now();
    participant.role = participants_.empty() ? ParticipantRole::Host : ParticipantRole::Participant;

    participants_.push_back(std::move(participant));
    return participants_.back();
}

std::optional<Participant> Room::removeParticipant(const ParticipantId& participant_id) {
    auto it = std::find_if(participants_.begin(), participants_.end(),
                           [&](const Participant& p) { return p.id == participant_id; });
    if (it == participants_.end()) {
        return std::nullopt;
    }

    Participant removed = std::move(*it);
    participants_.erase(it);

    if (removed.role == ParticipantRole::Host && !participants_.empty()) {
        participants_.front().role = ParticipantRole::Host;
    }
    return removed;
}

Participant* Room::findParticipant(const ParticipantId& participant_id) {
    for (auto& participant : participants_) {
        if (participant.id == participant_id) {
            return &participant;
        }
    }
    return nullptr;
}

const Participant* Room::findParticipant(const ParticipantId& participant_id) const {
    for (const auto& participant : participants_) {
        if (participant.id == participant_id) {
            return &participant;
        }
    }
    return nullptr;
}

std::optional<ParticipantId> Room::hostId() const {
    for (const auto& participant : participants_) {
        if (participant.role == ParticipantRole::Host) {
            return participant.id;
        }
    }
    return std::nullopt;
}

bool Room::isHost(const ParticipantId& participant_id) const {
    const Participant* participant = findParticipant(participant_id);
    return participant && participant->role == ParticipantRole::Host;
}

bool Room::validatePassword(const std::optional<std::string>& password) const {
    if (!settings_.require_password) {
        return true;
    }
    if (!password) {
        return false;
    }
    return RoomPassword::verify(*password, settings_.password_hash);
}

} // namespace parley
