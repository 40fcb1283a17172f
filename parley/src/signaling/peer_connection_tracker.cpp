#include "../../include/signaling/peer_connection_tracker.hpp"
#include "../../include/utils/logger.hpp"

namespace parley {

const char* linkStatusName(LinkStatus status) {
    return status == LinkStatus::Connected ? "connected" : "connecting";
}

PeerConnectionTracker::PeerConnectionTracker(MediaStateTable& media_states,
                                             std::vector<IceServer> ice_servers,
                                             Clock clock)
    : media_states_(media_states),
      ice_servers_(std::move(ice_servers)),
      clock_(std::move(clock)) {}

PeerConnectionTracker::TimePoint PeerConnectionTracker::now() const {
    return clock_ ? clock_() : std::chrono::steady_clock::now();
}

std::string PeerConnectionTracker::pairKey(const ParticipantId& a, const ParticipantId& b) {
    // Unit separator cannot appear in generated ids.
    return a < b ? a + '\x1f' + b : b + '\x1f' + a;
}

void PeerConnectionTracker::addParticipant(const RoomId& room_id, const ParticipantId& participant_id,
                                           const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto room_it = rooms_.find(room_id);
    if (room_it == rooms_.end()) {
        room_it = rooms_.emplace(room_id, TrackedRoom{}).first;
        Logger::getInstance().info("WebRTC connections initialized for room: " + room_id);
    }

    auto& entries = room_it->second.entries;
    if (entries.count(participant_id)) {
        return;
    }

    entries[participant_id] = PeerEntry{session_id, false};
    media_states_.ensure(participant_id);
    Logger::getInstance().info("User " + participant_id + " added to WebRTC room " + room_id);
}

bool PeerConnectionTracker::removeParticipant(const RoomId& room_id, const ParticipantId& participant_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto room_it = rooms_.find(room_id);
    if (room_it == rooms_.end() || room_it->second.entries.erase(participant_id) == 0) {
        return false;
    }

    auto& links = room_it->second.links;
    for (auto it = links.begin(); it != links.end();) {
        if (it->second.offerer == participant_id || it->second.answerer == participant_id) {
            it = links.erase(it);
        } else {
            ++it;
        }
    }

    for (auto it = pending_offers_.begin(); it != pending_offers_.end();) {
        const PendingOffer& offer = it->second;
        if (offer.room_id == room_id && (offer.from == participant_id || offer.to == participant_id)) {
            it = pending_offers_.erase(it);
        } else {
            ++it;
        }
    }

    media_states_.erase(participant_id);
    Logger::getInstance().info("User " + participant_id + " removed from WebRTC room " + room_id);

    if (room_it->second.entries.empty()) {
        rooms_.erase(room_it);
        Logger::getInstance().info("WebRTC room " + room_id + " cleaned up (empty)");
    }
    return true;
}

std::optional<std::string> PeerConnectionTracker::createPeerLink(const RoomId& room_id,
                                                                 const ParticipantId& from_id,
                                                                 const ParticipantId& to_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return createPeerLinkLocked(room_id, from_id, to_id);
}

std::optional<std::string> PeerConnectionTracker::createPeerLinkLocked(const RoomId& room_id,
                                                                       const ParticipantId& from_id,
                                                                       const ParticipantId& to_id) {
    auto room_it = rooms_.find(room_id);
    if (room_it == rooms_.end() || from_id == to_id) {
        return std::nullopt;
    }
    auto& room = room_it->second;
    auto from_it = room.entries.find(from_id);
    if (from_it == room.entries.end() || !room.entries.count(to_id)) {
        return std::nullopt;
    }

    const std::string key = pairKey(from_id, to_id);
    auto existing = room.links.find(key);
    if (existing != room.links.end()) {
        // Renegotiation replaces the previous link and its unanswered offer.
        pending_offers_.erase(existing->second.connection_id);
    }

    PeerLink link;
    link.connection_id = from_id + "-" + to_id;
    link.offerer = from_id;
    link.answerer = to_id;
    link.status = LinkStatus::Connecting;
    link.created_at = now();
    room.links[key] = link;
    from_it->second.is_initiator = true;

    Logger::getInstance().info("Peer connection created: " + link.connection_id + " in room " + room_id);
    return link.connection_id;
}

std::optional<std::string> PeerConnectionTracker::handleOffer(const RoomId& room_id,
                                                              const ParticipantId& from_id,
                                                              const ParticipantId& to_id,
                                                              const std::string& offer) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto connection_id = createPeerLinkLocked(room_id, from_id, to_id);
    if (!connection_id) {
        return std::nullopt;
    }

    pending_offers_[*connection_id] = PendingOffer{room_id, from_id, to_id, offer, now()};
    Logger::getInstance().debug("Offer stored for connection: " + *connection_id);
    return connection_id;
}

bool PeerConnectionTracker::handleAnswer(const RoomId& room_id,
                                         const ParticipantId& from_id,
                                         const ParticipantId& to_id,
                                         const std::string& answer) {
    (void)answer; // relayed by the dispatcher, never stored
    std::lock_guard<std::mutex> lock(mutex_);

    auto room_it = rooms_.find(room_id);
    if (room_it == rooms_.end()) {
        return false;
    }

    auto link_it = room_it->second.links.find(pairKey(from_id, to_id));
    if (link_it == room_it->second.links.end()) {
        return false;
    }

    PeerLink& link = link_it->second;
    if (link.offerer != to_id || link.answerer != from_id) {
        return false;
    }

    link.status = LinkStatus::Connected;
    pending_offers_.erase(link.connection_id);
    Logger::getInstance().info("Answer processed for connection: " + link.connection_id);
    return true;
}

std::optional<MediaState> PeerConnectionTracker::updateMediaState(const RoomId& room_id,
                                                                  const ParticipantId& participant_id,
                                                                  MediaKind kind, bool enabled) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto room_it = rooms_.find(room_id);
        if (room_it == rooms_.end() || !room_it->second.entries.count(participant_id)) {
            Logger::getInstance().error("Failed to update media state for " + participant_id +
                                        " in room " + room_id + ": User not found");
            return std::nullopt;
        }
    }

    auto state = media_states_.set(participant_id, kind, enabled);
    if (state) {
        Logger::getInstance().debug("Media state updated for " + participant_id + ": " +
                                    mediaKindName(kind) + " -> " + (enabled ? "on" : "off"));
    }
    return state;
}

bool PeerConnectionTracker::isTracked(const RoomId& room_id, const ParticipantId& participant_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto room_it = rooms_.find(room_id);
    return room_it != rooms_.end() && room_it->second.entries.count(participant_id) > 0;
}

std::optional<PeerLink> PeerConnectionTracker::findLink(const RoomId& room_id,
                                                        const ParticipantId& a,
                                                        const ParticipantId& b) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto room_it = rooms_.find(room_id);
    if (room_it == rooms_.end()) {
        return std::nullopt;
    }
    auto link_it = room_it->second.links.find(pairKey(a, b));
    if (link_it == room_it->second.links.end()) {
        return std::nullopt;
    }
    return link_it->second;
}

std::optional<PendingOffer> PeerConnectionTracker::pendingOffer(const std::string& connection_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_offers_.find(connection_id);
    if (it == pending_offers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<PeerRoomSnapshot> PeerConnectionTracker::roomSnapshot(const RoomId& room_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto room_it = rooms_.find(room_id);
    if (room_it == rooms_.end()) {
        return std::nullopt;
    }
    const TrackedRoom& room = room_it->second;

    PeerRoomSnapshot snapshot;
    snapshot.room_id = room_id;
    snapshot.user_count = room.entries.size();
    snapshot.total_connections = room.links.size();

    for (const auto& entry : room.entries) {
        PeerRoomSnapshot::UserInfo info;
        info.session_id = entry.second.session_id;
        info.media_state = media_states_.get(entry.first).value_or(MediaState{});
        snapshot.users[entry.first] = info;
    }
    for (const auto& pair : room.links) {
        const PeerLink& link = pair.second;
        auto offerer = snapshot.users.find(link.offerer);
        if (offerer != snapshot.users.end()) {
            offerer->second.peers.push_back(link.answerer);
            offerer->second.peer_count++;
        }
        auto answerer = snapshot.users.find(link.answerer);
        if (answerer != snapshot.users.end()) {
            answerer->second.peers.push_back(link.offerer);
            answerer->second.peer_count++;
        }
    }
    return snapshot;
}

size_t PeerConnectionTracker::sweepExpiredOffers(std::chrono::milliseconds max_age) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto current = now();
    size_t removed = 0;

    for (auto it = pending_offers_.begin(); it != pending_offers_.end();) {
        const PendingOffer& offer = it->second;
        if (current - offer.timestamp <= max_age) {
            ++it;
            continue;
        }

        auto room_it = rooms_.find(offer.room_id);
        if (room_it != rooms_.end()) {
            auto link_it = room_it->second.links.find(pairKey(offer.from, offer.to));
            if (link_it != room_it->second.links.end() &&
                link_it->second.connection_id == it->first &&
                link_it->second.status == LinkStatus::Connecting) {
                room_it->second.links.erase(link_it);
            }
        }

        Logger::getInstance().info("Expired offer cleaned up: " + it->first);
        it = pending_offers_.erase(it);
        removed++;
    }
    return removed;
}

TrackerStats PeerConnectionTracker::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    TrackerStats result;
    result.total_rooms = rooms_.size();
    result.pending_offers = pending_offers_.size();

    for (const auto& pair : rooms_) {
        TrackerStats::RoomCounts counts;
        counts.user_count = pair.second.entries.size();
        counts.connection_count = pair.second.links.size();
        result.total_users += counts.user_count;
        result.total_connections += counts.connection_count;
        result.rooms[pair.first] = counts;
    }
    return result;
}

} // namespace parley
