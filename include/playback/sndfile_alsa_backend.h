#pragma once

#include "playback/playback_backend.h"

#include <alsa/asoundlib.h>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <sndfile.h>
#include <string>
#include <thread>
#include <vector>

namespace playdeck::playback {

/**
 * @brief libsndfile decoder feeding an ALSA PCM from a writer thread.
 *
 * Frames are read as interleaved S16, scaled by the volume gain and written
 * with snd_pcm_writei. The PCM is opened in start() so device errors surface
 * synchronously; pause drops the PCM buffer and resume prepares it again.
 */
class SndfileAlsaBackend : public PlaybackBackend {
   public:
    explicit SndfileAlsaBackend(std::string device, unsigned int periodFrames = 1024);
    ~SndfileAlsaBackend() override;

    bool open(const std::string& path) override;
    bool start(double offsetSeconds) override;
    bool pause() override;
    bool resume() override;
    void stop() override;
    void close() override;

    void setVolume(float volume) override;
    bool isBusy() const override;
    bool canSeek() const override;
    bool seek(double seconds) override;

    std::string pollError() override;
    std::string lastError() const override;

    const char* name() const override {
        return "alsa";
    }

    const std::string& device() const {
        return device_;
    }

   private:
    bool openPcm();
    void closePcm();
    bool recoverFromXrun(int err);
    void writerLoop();
    bool writeFrames(const int16_t* data, snd_pcm_uframes_t frames);
    void setAsyncError(const std::string& message);

    std::string device_;
    unsigned int periodFrames_;

    SNDFILE* file_ = nullptr;
    SF_INFO info_{};
    snd_pcm_t* pcm_ = nullptr;
    std::string lastError_;

    std::thread writer_;
    std::mutex controlMutex_;
    std::condition_variable controlCv_;
    bool running_ = false;
    bool paused_ = false;
    sf_count_t pendingSeekFrame_ = -1;

    std::atomic<bool> busy_{false};
    std::atomic<float> gain_{1.0f};

    mutable std::mutex errorMutex_;
    std::string asyncError_;
};

}  // namespace playdeck::playback
