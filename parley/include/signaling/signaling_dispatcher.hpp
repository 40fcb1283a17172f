#ifndef PARLEY_SIGNALING_DISPATCHER_HPP
#define PARLEY_SIGNALING_DISPATCHER_HPP

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "../rooms/connection_registry.hpp"
#include "../security/rate_limiter.hpp"
#include "peer_connection_tracker.hpp"

namespace parley {

/**
 * Signaling protocol state machine.
 *
 * Each transport session is Unbound until a successful join-room binds it to
 * (room, participant). The participant id is the session id. Inbound frames
 * are validated here; SignalingError raised by the stores becomes an error
 * frame for the originating session only.
 *
 * All entry points, including the periodic sweeps, run under one mutex so a
 * join or leave that touches both stores is never observed half done.
 */
class SignalingDispatcher {
public:
    using Sender = std::function<void(const std::string& session_id, const std::string& message)>;
    using Closer = std::function<void(const std::string& session_id)>;

    SignalingDispatcher(ConnectionRegistry& registry,
                        PeerConnectionTracker& tracker,
                        RateLimiter& event_limiter);

    SignalingDispatcher(const SignalingDispatcher&) = delete;
    SignalingDispatcher& operator=(const SignalingDispatcher&) = delete;

    // Must not call back into the dispatcher synchronously.
    void setSender(Sender sender);
    void setCloser(Closer closer);

    void handleConnect(const std::string& session_id, const std::string& remote_address);
    void handleMessage(const std::string& session_id, const std::string& message);

    // Same cleanup as leave-room. Safe to call more than once.
    void handleDisconnect(const std::string& session_id);

    size_t sweepEmptyRooms();
    size_t sweepExpiredOffers(std::chrono::milliseconds max_age);

    size_t sessionCount() const;
    std::optional<RoomId> boundRoom(const std::string& session_id) const;

private:
    struct SessionState {
        std::string remote_address;
        RoomId room_id;
        ParticipantId participant_id;

        bool bound() const { return !room_id.empty(); }
    };

    using Fields = std::map<std::string, std::string>;

    void dispatch(const std::string& session_id, SessionState& session,
                  const std::string& type, const Fields& fields);

    void handleJoinRoom(const std::string& session_id, SessionState& session, const Fields& fields);
    void handleOffer(SessionState& session, const Fields& fields);
    void handleAnswer(SessionState& session, const Fields& fields);
    void handleIceCandidate(SessionState& session, const Fields& fields);
    void handleMediaToggle(SessionState& session, MediaKind kind, bool enabled);
    void handleScreenShare(SessionState& session, bool start, const Fields& fields);
    void handleRecording(SessionState& session, bool start);
    void handleMuteParticipant(SessionState& session, const Fields& fields);
    void handleRemoveParticipant(SessionState& session, const Fields& fields);
    void handleRaiseHand(SessionState& session, const Fields& fields);
    void handleSendMessage(SessionState& session, const Fields& fields);
    void handleShareFile(SessionState& session, const Fields& fields);
    void handleConnectionQuality(SessionState& session, const Fields& fields);
    void handleLeaveRoom(const std::string& session_id, SessionState& session);

    // Leave logic shared by leave-room, disconnect and removal.
    void teardownLocked(SessionState& session);

    Room requireRoom(const SessionState& session) const;
    const Participant& requireTarget(const Room& room, const std::string& target_id) const;

    void sendTo(const std::string& session_id, const std::string& message);
    void broadcast(const Room& room, const std::string& message, const std::string& exclude_id = "");

    ConnectionRegistry& registry_;
    PeerConnectionTracker& tracker_;
    RateLimiter& event_limiter_;
    Sender sender_;
    Closer closer_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, SessionState> sessions_;
};

} // namespace parley

#endif // PARLEY_SIGNALING_DISPATCHER_HPP
