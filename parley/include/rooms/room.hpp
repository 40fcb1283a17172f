#ifndef PARLEY_ROOM_HPP
#define PARLEY_ROOM_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace parley {

using RoomId = std::string;
using ParticipantId = std::string;

constexpr size_t kDefaultRoomCapacity = 10;
constexpr size_t kMaxRoomCapacity = 50;

enum class ParticipantRole {
    Host,
    Participant
};

const char* participantRoleName(ParticipantRole role);

/**
 * Room member. Media flags are not stored here; they live in MediaStateTable.
 */
struct Participant {
    ParticipantId id;
    std::string name;
    std::string session_id;
    std::chrono::system_clock::time_point joined_at;
    bool hand_raised = false;
    ParticipantRole role = ParticipantRole::Participant;
};

struct RoomSettings {
    bool allow_screen_share = true;
    bool allow_chat = true;
    bool require_password = false;
    std::string password_hash;
    bool recording_enabled = false;
};

/**
 * Creation-time options as requested by the client; clamped by the registry.
 */
struct RoomOptions {
    std::optional<size_t> max_participants;
    bool require_password = false;
    std::string password;
    std::optional<bool> allow_screen_share;
    std::optional<bool> allow_chat;
};

class Room {
public:
    Room(RoomId id, std::optional<std::string> created_by);

    const RoomId& id() const { return id_; }
    const std::optional<std::string>& createdBy() const { return created_by_; }
    std::chrono::system_clock::time_point createdAt() const { return created_at_; }

    bool isActive() const { return active_; }
    void setActive(bool active) { active_ = active; }

    size_t capacity() const { return capacity_; }
    // Clamped to [1, kMaxRoomCapacity].
    void setCapacity(size_t capacity);

    const RoomSettings& settings() const { return settings_; }
    RoomSettings& settings() { return settings_; }

    /**
     * Adds a participant at the end of the join order. The first participant
     * of an empty room becomes host.
     * @throws SignalingError RoomFull or DuplicateParticipant
     */
    const Participant& addParticipant(const ParticipantId& participant_id,
                                      const std::string& name,
                                      const std::string& session_id);

    /**
     * Removes a participant. If it was host and others remain, the earliest
     * remaining joiner becomes host.
     */
    std::optional<Participant> removeParticipant(const ParticipantId& participant_id);

    Participant* findParticipant(const ParticipantId& participant_id);
    const Participant* findParticipant(const ParticipantId& participant_id) const;

    // Join order.
    const std::vector<Participant>& participants() const { return participants_; }
    size_t participantCount() const { return participants_.size(); }
    bool isEmpty() const { return participants_.empty(); }
    bool isFull() const { return participants_.size() >= capacity_; }

    std::optional<ParticipantId> hostId() const;
    bool isHost(const ParticipantId& participant_id) const;

    bool validatePassword(const std::optional<std::string>& password) const;

private:
    RoomId id_;
    std::optional<std::string> created_by_;
    std::chrono::system_clock::time_point created_at_;
    bool active_ = true;
    size_t capacity_ = kDefaultRoomCapacity;
    RoomSettings settings_;
    std::vector<Participant> participants_;
};

} // namespace parley

#endif // PARLEY_ROOM_HPP
