#ifndef PARLEY_CONNECTION_REGISTRY_HPP
#define PARLEY_CONNECTION_REGISTRY_HPP

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "room.hpp"
#include "media_state_table.hpp"

namespace parley {

struct ParticipantInfo {
    std::string name;
    std::string session_id;
};

struct JoinResult {
    Room room;
    Participant participant;
};

struct LeaveResult {
    Room room;               // state after the departure
    Participant participant; // the departed participant
    bool room_deleted = false;
};

struct RegistryStats {
    struct RoomDetail {
        RoomId room_id;
        size_t user_count = 0;
        std::chrono::system_clock::time_point created_at;
    };

    size_t total_rooms = 0;
    size_t total_users = 0;
    std::vector<RoomDetail> room_details;
};

/**
 * Room directory plus the participant -> room reverse index.
 *
 * A participant belongs to at most one room at a time. Every public call
 * takes the registry mutex; returned rooms and participants are copies.
 */
class ConnectionRegistry {
public:
    explicit ConnectionRegistry(MediaStateTable& media_states);

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    /**
     * Create a room with a fresh id. Capacity is min(requested, 50),
     * default 10. Never fails.
     */
    Room createRoom(const std::optional<std::string>& created_by, const RoomOptions& options = {});

    std::optional<Room> getRoom(const RoomId& room_id) const;
    std::vector<Room> allRooms() const;

    /**
     * Join a room. Any membership in another room is torn down first.
     * @throws SignalingError RoomNotFound, RoomInactive, InvalidPassword,
     *         RoomFull, DuplicateParticipant
     */
    JoinResult joinRoom(const RoomId& room_id,
                        const ParticipantId& participant_id,
                        const ParticipantInfo& info,
                        const std::optional<std::string>& password = std::nullopt);

    /**
     * Remove a participant from its room. The room is deleted as soon as it
     * becomes empty. Nothing is returned if the participant is in no room.
     */
    std::optional<LeaveResult> leaveRoom(const ParticipantId& participant_id);

    std::optional<Participant> updateParticipantMedia(const ParticipantId& participant_id,
                                                      MediaKind kind, bool enabled);
    std::optional<Participant> setHandRaised(const ParticipantId& participant_id, bool raised);

    /**
     * Toggle the room's recording flag. Host only.
     * @throws SignalingError NotInRoom, PermissionDenied
     */
    Room setRecording(const ParticipantId& participant_id, bool enabled);

    bool deactivateRoom(const RoomId& room_id);

    std::optional<Room> getUserRoom(const ParticipantId& participant_id) const;
    std::optional<Participant> getParticipant(const ParticipantId& participant_id) const;

    // Removes rooms left empty by a failed cleanup. Returns the number removed.
    size_t cleanupEmptyRooms();

    RegistryStats stats() const;

    const MediaStateTable& mediaStates() const { return media_states_; }

private:
    std::optional<LeaveResult> leaveRoomLocked(const ParticipantId& participant_id);
    Room* findUserRoomLocked(const ParticipantId& participant_id);

    MediaStateTable& media_states_;
    mutable std::mutex mutex_;
    std::unordered_map<RoomId, Room> rooms_;
    std::unordered_map<ParticipantId, RoomId> participant_rooms_;
};

} // namespace parley

#endif // PARLEY_CONNECTION_REGISTRY_HPP
