#pragma once

#include <optional>
#include <string>

namespace playdeck::playback {

enum class PlaybackState { Idle, Loaded, Playing, Paused };

inline const char* playbackStateToString(PlaybackState state) {
    switch (state) {
    case PlaybackState::Loaded:
        return "loaded";
    case PlaybackState::Playing:
        return "playing";
    case PlaybackState::Paused:
        return "paused";
    case PlaybackState::Idle:
    default:
        return "idle";
    }
}

constexpr float kMinVolume = 0.0f;
constexpr float kMaxVolume = 1.0f;
constexpr float kMinSpeed = 0.5f;
constexpr float kMaxSpeed = 2.0f;

/**
 * @brief State of the single active track.
 *
 * Owned by PlaybackEngine and only touched under its mutex.
 * Invariant: 0 <= position <= duration.
 */
struct PlaybackSession {
    std::optional<std::string> track;  // locator of the last loaded track
    PlaybackState state = PlaybackState::Idle;
    double position = 0.0;  // seconds
    double duration = 0.0;  // seconds, best effort
    float volume = 0.7f;
    float speed = 1.0f;
};

// Copy handed out to readers
using PlaybackSnapshot = PlaybackSession;

}  // namespace playdeck::playback
