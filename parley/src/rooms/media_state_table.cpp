#include "../../include/rooms/media_state_table.hpp"

namespace parley {

const char* mediaKindName(MediaKind kind) {
    switch (kind) {
        case MediaKind::Audio: return "audio";
        case MediaKind::Video: return "video";
        case MediaKind::Screen: return "screen";
    }
    return "audio";
}

void MediaStateTable::ensure(const std::string& participant_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    states_.emplace(participant_id, MediaState{});
}

void MediaStateTable::reset(const std::string& participant_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    states_[participant_id] = MediaState{};
}

void MediaStateTable::erase(const std::string& participant_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    states_.erase(participant_id);
}

std::optional<MediaState> MediaStateTable::get(const std::string& participant_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(participant_id);
    if (it == states_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<MediaState> MediaStateTable::set(const std::string& participant_id, MediaKind kind, bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(participant_id);
    if (it == states_.end()) {
        return std::nullopt;
    }

    switch (kind) {
        case MediaKind::Audio: it->second.audio = enabled; break;
        case MediaKind::Video: it->second.video = enabled; break;
        case MediaKind::Screen: it->second.screen = enabled; break;
    }
    return it->second;
}

size_t MediaStateTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return states_.size();
}

} // namespace parley
