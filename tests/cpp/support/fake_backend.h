#pragma once

#include "playback/playback_backend.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace playdeck::testing {

/**
 * @brief Scriptable backend for engine tests.
 *
 * The shared Control block stays with the test after the backend has been
 * moved into the engine. busy decides when the "stream" ends; the fail*
 * flags make the next matching call fail.
 */
class FakeBackend : public playback::PlaybackBackend {
   public:
    struct Control {
        std::mutex mutex;
        std::vector<std::string> calls;
        std::atomic<bool> busy{false};
        bool failOpen = false;
        bool failStart = false;
        bool failResume = false;
        bool seekable = false;
        bool rateSupported = false;
        float volume = -1.0f;
        float rate = 1.0f;
        double lastStartOffset = -1.0;
        double lastSeek = -1.0;
        std::string asyncError;

        void record(const std::string& call) {
            std::lock_guard<std::mutex> lock(mutex);
            calls.push_back(call);
        }

        std::vector<std::string> snapshot() {
            std::lock_guard<std::mutex> lock(mutex);
            return calls;
        }

        size_t count(const std::string& call) {
            std::lock_guard<std::mutex> lock(mutex);
            size_t n = 0;
            for (const auto& c : calls) {
                if (c == call) {
                    ++n;
                }
            }
            return n;
        }
    };

    explicit FakeBackend(std::shared_ptr<Control> control) : control_(std::move(control)) {}

    bool open(const std::string&) override {
        control_->record("open");
        return !control_->failOpen;
    }
    bool start(double offsetSeconds) override {
        control_->record("start");
        if (control_->failStart) {
            return false;
        }
        control_->lastStartOffset = offsetSeconds;
        control_->busy = true;
        return true;
    }
    bool pause() override {
        control_->record("pause");
        return true;
    }
    bool resume() override {
        control_->record("resume");
        return !control_->failResume;
    }
    void stop() override {
        control_->record("stop");
        control_->busy = false;
    }
    void close() override {
        control_->record("close");
    }
    void setVolume(float volume) override {
        control_->volume = volume;
    }
    bool setRate(float rate) override {
        control_->rate = rate;
        return control_->rateSupported;
    }
    bool isBusy() const override {
        return control_->busy.load();
    }
    bool canSeek() const override {
        return control_->seekable;
    }
    bool seek(double seconds) override {
        control_->record("seek");
        control_->lastSeek = seconds;
        return true;
    }
    std::string pollError() override {
        std::lock_guard<std::mutex> lock(control_->mutex);
        std::string error;
        error.swap(control_->asyncError);
        return error;
    }
    std::string lastError() const override {
        return control_->failOpen || control_->failStart ? "scripted failure" : "";
    }
    const char* name() const override {
        return "fake";
    }

   private:
    std::shared_ptr<Control> control_;
};

}  // namespace playdeck::testing
