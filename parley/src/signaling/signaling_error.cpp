#include "../../include/signaling/signaling_error.hpp"

namespace parley {

const char* errorCodeTag(ErrorCode code) {
    switch (code) {
        case ErrorCode::RoomNotFound: return "room-not-found";
        case ErrorCode::RoomInactive: return "room-inactive";
        case ErrorCode::RoomFull: return "room-full";
        case ErrorCode::InvalidPassword: return "invalid-password";
        case ErrorCode::DuplicateParticipant: return "duplicate-participant";
        case ErrorCode::NotInRoom: return "not-in-room";
        case ErrorCode::PermissionDenied: return "permission-denied";
        case ErrorCode::RateLimited: return "rate-limited";
        case ErrorCode::InvalidMessage: return "invalid-message";
        case ErrorCode::TargetNotFound: return "target-not-found";
        case ErrorCode::NoMatchingOffer: return "no-matching-offer";
        case ErrorCode::Internal: return "internal-error";
    }
    return "internal-error";
}

} // namespace parley
