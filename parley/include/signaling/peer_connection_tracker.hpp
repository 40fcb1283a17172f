#ifndef PARLEY_PEER_CONNECTION_TRACKER_HPP
#define PARLEY_PEER_CONNECTION_TRACKER_HPP

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "../rooms/room.hpp"
#include "../rooms/media_state_table.hpp"

namespace parley {

enum class LinkStatus {
    Connecting,
    Connected
};

const char* linkStatusName(LinkStatus status);

/**
 * One signaling relationship between two participants of a room.
 * Stored once per unordered pair; connection_id keeps the direction of the
 * offer that created it ("<offerer>-<answerer>").
 */
struct PeerLink {
    std::string connection_id;
    ParticipantId offerer;
    ParticipantId answerer;
    LinkStatus status = LinkStatus::Connecting;
    std::chrono::steady_clock::time_point created_at;
};

struct PeerEntry {
    std::string session_id;
    bool is_initiator = false;
};

struct PendingOffer {
    RoomId room_id;
    ParticipantId from;
    ParticipantId to;
    std::string offer;
    std::chrono::steady_clock::time_point timestamp;
};

struct IceServer {
    std::string urls;
};

struct PeerRoomSnapshot {
    struct UserInfo {
        std::string session_id;
        size_t peer_count = 0;
        MediaState media_state;
        std::vector<ParticipantId> peers;
    };

    RoomId room_id;
    size_t user_count = 0;
    std::map<ParticipantId, UserInfo> users;
    size_t total_connections = 0;
};

struct TrackerStats {
    struct RoomCounts {
        size_t user_count = 0;
        size_t connection_count = 0;
    };

    size_t total_rooms = 0;
    size_t total_users = 0;
    size_t total_connections = 0;
    size_t pending_offers = 0;
    std::map<RoomId, RoomCounts> rooms;
};

/**
 * Signaling state per room: tracked participants, peer links, and offers
 * waiting for an answer. Participants are referenced by id only; keeping
 * this in step with ConnectionRegistry is the dispatcher's job.
 */
class PeerConnectionTracker {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Clock = std::function<TimePoint()>;

    static constexpr std::chrono::milliseconds kDefaultOfferMaxAge{30000};

    PeerConnectionTracker(MediaStateTable& media_states,
                          std::vector<IceServer> ice_servers,
                          Clock clock = Clock());

    PeerConnectionTracker(const PeerConnectionTracker&) = delete;
    PeerConnectionTracker& operator=(const PeerConnectionTracker&) = delete;

    // Idempotent.
    void addParticipant(const RoomId& room_id, const ParticipantId& participant_id,
                        const std::string& session_id);

    /**
     * Drops the participant, every link and pending offer that mentions it,
     * and the room bucket once it is empty.
     */
    bool removeParticipant(const RoomId& room_id, const ParticipantId& participant_id);

    /**
     * Create (or restart) the link between from and to in state connecting.
     * @return "<from>-<to>", or nothing if either side is not tracked
     */
    std::optional<std::string> createPeerLink(const RoomId& room_id,
                                              const ParticipantId& from_id,
                                              const ParticipantId& to_id);

    std::optional<std::string> handleOffer(const RoomId& room_id,
                                           const ParticipantId& from_id,
                                           const ParticipantId& to_id,
                                           const std::string& offer);

    /**
     * from_id answers the offer to_id sent earlier. Succeeds only if the
     * pair's link was offered by to_id to from_id.
     */
    bool handleAnswer(const RoomId& room_id,
                      const ParticipantId& from_id,
                      const ParticipantId& to_id,
                      const std::string& answer);

    std::optional<MediaState> updateMediaState(const RoomId& room_id,
                                               const ParticipantId& participant_id,
                                               MediaKind kind, bool enabled);

    bool isTracked(const RoomId& room_id, const ParticipantId& participant_id) const;
    std::optional<PeerLink> findLink(const RoomId& room_id,
                                     const ParticipantId& a,
                                     const ParticipantId& b) const;
    std::optional<PendingOffer> pendingOffer(const std::string& connection_id) const;

    std::optional<PeerRoomSnapshot> roomSnapshot(const RoomId& room_id) const;

    const std::vector<IceServer>& iceServers() const { return ice_servers_; }

    /**
     * Removes pending offers older than max_age. A link still connecting
     * when its offer expires is removed as well.
     * @return number of offers removed
     */
    size_t sweepExpiredOffers(std::chrono::milliseconds max_age = kDefaultOfferMaxAge);

    TrackerStats stats() const;

private:
    struct TrackedRoom {
        std::map<ParticipantId, PeerEntry> entries;
        std::map<std::string, PeerLink> links; // keyed by pairKey()
    };

    static std::string pairKey(const ParticipantId& a, const ParticipantId& b);
    // Caller holds mutex_.
    std::optional<std::string> createPeerLinkLocked(const RoomId& room_id,
                                                    const ParticipantId& from_id,
                                                    const ParticipantId& to_id);
    TimePoint now() const;

    MediaStateTable& media_states_;
    std::vector<IceServer> ice_servers_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::unordered_map<RoomId, TrackedRoom> rooms_;
    std::map<std::string, PendingOffer> pending_offers_; // keyed by connection id
};

} // namespace parley

#endif // PARLEY_PEER_CONNECTION_TRACKER_HPP
