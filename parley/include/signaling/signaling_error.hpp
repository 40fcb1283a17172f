#ifndef PARLEY_SIGNALING_ERROR_HPP
#define PARLEY_SIGNALING_ERROR_HPP

#include <stdexcept>
#include <string>

namespace parley {

enum class ErrorCode {
    RoomNotFound,
    RoomInactive,
    RoomFull,
    InvalidPassword,
    DuplicateParticipant,
    NotInRoom,
    PermissionDenied,
    RateLimited,
    InvalidMessage,
    TargetNotFound,
    NoMatchingOffer,
    Internal
};

/**
 * Stable wire tag for an error code ("room-full", "not-in-room", ...).
 */
const char* errorCodeTag(ErrorCode code);

/**
 * Recoverable failure of a room or signaling operation. The dispatcher turns
 * it into an error event for the originating session only.
 */
class SignalingError : public std::runtime_error {
public:
    SignalingError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }
    const char* tag() const { return errorCodeTag(code_); }

private:
    ErrorCode code_;
};

} // namespace parley

#endif // PARLEY_SIGNALING_ERROR_HPP
