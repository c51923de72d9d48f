#pragma once

#include "catalog/media_formats.h"
#include "core/config_loader.h"
#include "core/error_codes.h"
#include "playback/event_dispatcher.h"
#include "playback/metadata_provider.h"
#include "playback/playback_backend.h"
#include "playback/playback_session.h"
#include "playback/position_tracker.h"

#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace playdeck::playback {

struct EngineConfig {
    catalog::MediaFormats formats;
    float volume = 0.7f;
    float speed = 1.0f;
    TrackerConfig tracker;
    // Tests turn this off and drive ticks with tickOnce()
    bool startTracker = true;
};

EngineConfig makeEngineConfig(const AppConfig& config);

/**
 * @brief State machine for the single active track.
 *
 * Idle -> Loaded -> Playing <-> Paused, and back to Idle on stop() or when the
 * backend runs dry. All session reads and writes, including those of the
 * position tracker, go through one mutex. Failing operations return an
 * OpResult and also publish PlaybackError; events are published after the
 * mutex is released.
 */
class PlaybackEngine {
   public:
    PlaybackEngine(std::unique_ptr<PlaybackBackend> backend, MetadataResolver metadata,
                   EngineConfig config = EngineConfig{});
    ~PlaybackEngine();

    PlaybackEngine(const PlaybackEngine&) = delete;
    PlaybackEngine& operator=(const PlaybackEngine&) = delete;

    /**
     * @brief Stop whatever plays and open a new track.
     *
     * PLAYBACK_NOT_FOUND if the file is missing, PLAYBACK_UNSUPPORTED_FORMAT for
     * an unknown extension, PLAYBACK_BACKEND_ERROR if the backend rejects it.
     * The engine is Idle after any failure.
     */
    OpResult load(const std::string& locator);

    // Resumes from Paused, (re)starts at the tracked position from Loaded/Playing
    OpResult play();
    OpResult pause();
    // Always succeeds; the track stays visible via currentTrack() but must be re-loaded
    OpResult stop();

    // Clamped to [0, 1]; NaN and infinities are VALIDATION_INVALID_ARGUMENT
    OpResult setVolume(float volume);
    // Clamped to [0.5, 2.0]; only a hint for backends that cannot change rate
    OpResult setSpeed(float speed);

    /**
     * @brief Move the playback position (clamped to [0, duration]).
     *
     * 0 restarts the stream for real; Paused and Loaded end up Loaded. Other
     * positions are a hard seek when the backend supports it and a stream is
     * running, otherwise only the tracked position changes. A non-finite
     * position is rejected with VALIDATION_INVALID_ARGUMENT and changes nothing.
     */
    OpResult seek(double position);

    PlaybackState state() const;
    double position() const;
    double duration() const;
    float volume() const;
    float speed() const;
    std::optional<std::string> currentTrack() const;
    PlaybackSnapshot snapshot() const;

    // Tracker tick: advances position or detects the end of the track
    TickOutcome advance(double elapsedSeconds);
    void tickOnce();

    EventDispatcher& events() {
        return events_;
    }

    const char* backendName() const;

    // Stops playback and the tracker, closes the backend. Idempotent.
    void shutdown();

   private:
    OpResult loadLocked(const std::string& locator);
    OpResult playLocked();
    OpResult pauseLocked();
    OpResult seekLocked(double position);
    void stopLocked();
    OpResult backendFailure(const std::string& what);
    OpResult report(OpResult result);

    std::unique_ptr<PlaybackBackend> backend_;
    MetadataResolver metadata_;
    EngineConfig config_;
    EventDispatcher events_;

    mutable std::mutex mutex_;
    PlaybackSession session_;
    bool shutdown_ = false;

    PositionTracker tracker_;
};

}  // namespace playdeck::playback
