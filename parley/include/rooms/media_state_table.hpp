#ifndef PARLEY_MEDIA_STATE_TABLE_HPP
#define PARLEY_MEDIA_STATE_TABLE_HPP

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace parley {

enum class MediaKind {
    Audio,
    Video,
    Screen
};

const char* mediaKindName(MediaKind kind);

struct MediaState {
    bool audio = true;
    bool video = true;
    bool screen = false;
};

/**
 * The one authoritative media state per participant. ConnectionRegistry and
 * PeerConnectionTracker both hold a reference to the same table.
 */
class MediaStateTable {
public:
    MediaStateTable() = default;
    MediaStateTable(const MediaStateTable&) = delete;
    MediaStateTable& operator=(const MediaStateTable&) = delete;

    // Creates a default entry unless one exists.
    void ensure(const std::string& participant_id);
    // Creates or overwrites the entry with defaults.
    void reset(const std::string& participant_id);
    void erase(const std::string& participant_id);

    std::optional<MediaState> get(const std::string& participant_id) const;
    // Returns the updated state, or nothing if the participant has no entry.
    std::optional<MediaState> set(const std::string& participant_id, MediaKind kind, bool enabled);

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, MediaState> states_;
};

} // namespace parley

#endif // PARLEY_MEDIA_STATE_TABLE_HPP
