#pragma once

#include <string>

namespace playdeck::playback {

/**
 * @brief Decode/output subsystem driven by PlaybackEngine.
 *
 * The engine owns the state machine; a backend only has to honor the calls in
 * the order the engine makes them: open -> start -> (pause/resume)* -> stop ->
 * close. start() on an active stream restarts it at the given offset.
 * Implementations must keep every call bounded; they are made while the
 * engine mutex is held.
 */
class PlaybackBackend {
   public:
    virtual ~PlaybackBackend() = default;

    virtual bool open(const std::string& path) = 0;
    virtual bool start(double offsetSeconds) = 0;
    virtual bool pause() = 0;
    virtual bool resume() = 0;
    virtual void stop() = 0;
    virtual void close() = 0;

    // Linear gain in [0, 1]
    virtual void setVolume(float volume) = 0;

    // Returns false if playback rate cannot be changed
    virtual bool setRate(float rate) {
        (void)rate;
        return false;
    }

    // True while the stream is producing output (paused counts as busy)
    virtual bool isBusy() const = 0;

    virtual bool canSeek() const {
        return false;
    }
    virtual bool seek(double seconds) {
        (void)seconds;
        return false;
    }

    // Error raised asynchronously since the last call (cleared on read)
    virtual std::string pollError() {
        return {};
    }

    // Reason for the most recent synchronous failure
    virtual std::string lastError() const {
        return {};
    }

    virtual const char* name() const = 0;
};

}  // namespace playdeck::playback
