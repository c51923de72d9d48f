#pragma once

#include "playback/metadata_provider.h"
#include "playback/playback_backend.h"

#include <chrono>
#include <mutex>
#include <string>

namespace playdeck::playback {

/**
 * @brief Silent backend that "plays" for the duration of the track.
 *
 * Used with output.device = "null" on machines without an audio device. The
 * duration comes from the metadata resolver, so the stream ends when a real
 * one would.
 */
class NullBackend : public PlaybackBackend {
   public:
    explicit NullBackend(MetadataResolver metadata);

    bool open(const std::string& path) override;
    bool start(double offsetSeconds) override;
    bool pause() override;
    bool resume() override;
    void stop() override;
    void close() override;

    void setVolume(float volume) override;
    bool setRate(float rate) override;
    bool isBusy() const override;
    bool canSeek() const override {
        return true;
    }
    bool seek(double seconds) override;
    std::string lastError() const override;

    const char* name() const override {
        return "null";
    }

   private:
    using Clock = std::chrono::steady_clock;

    double elapsedLocked() const;

    MetadataResolver metadata_;
    mutable std::mutex mutex_;
    bool opened_ = false;
    bool running_ = false;
    bool paused_ = false;
    double duration_ = 0.0;
    double offset_ = 0.0;  // stream position when startedAt_ was taken
    float rate_ = 1.0f;
    Clock::time_point startedAt_;
    std::string lastError_;
};

}  // namespace playdeck::playback
