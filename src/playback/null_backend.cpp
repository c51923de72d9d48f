#include "playback/null_backend.h"

#include "logging/logger.h"

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace playdeck::playback {

NullBackend::NullBackend(MetadataResolver metadata) : metadata_(std::move(metadata)) {}

bool NullBackend::open(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        std::lock_guard<std::mutex> lock(mutex_);
        lastError_ = "cannot open " + path;
        return false;
    }
    double duration = metadata_.resolve(path).durationSeconds;

    std::lock_guard<std::mutex> lock(mutex_);
    opened_ = true;
    running_ = false;
    paused_ = false;
    duration_ = duration;
    offset_ = 0.0;
    LOG_DEBUG("[NullBackend] opened {} ({:.1f}s)", path, duration_);
    return true;
}

double NullBackend::elapsedLocked() const {
    if (!running_ || paused_) {
        return offset_;
    }
    std::chrono::duration<double> wall = Clock::now() - startedAt_;
    return offset_ + wall.count() * rate_;
}

bool NullBackend::start(double offsetSeconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!opened_) {
        lastError_ = "no stream open";
        return false;
    }
    offset_ = std::clamp(offsetSeconds, 0.0, duration_);
    startedAt_ = Clock::now();
    running_ = true;
    paused_ = false;
    return true;
}

bool NullBackend::pause() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
        lastError_ = "not playing";
        return false;
    }
    if (!paused_) {
        offset_ = elapsedLocked();
        paused_ = true;
    }
    return true;
}

bool NullBackend::resume() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
        lastError_ = "not playing";
        return false;
    }
    if (paused_) {
        startedAt_ = Clock::now();
        paused_ = false;
    }
    return true;
}

void NullBackend::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
    paused_ = false;
    offset_ = 0.0;
}

void NullBackend::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    opened_ = false;
    running_ = false;
    paused_ = false;
    duration_ = 0.0;
    offset_ = 0.0;
}

void NullBackend::setVolume(float) {}

bool NullBackend::setRate(float rate) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_ && !paused_) {
        offset_ = elapsedLocked();
        startedAt_ = Clock::now();
    }
    rate_ = rate;
    return true;
}

bool NullBackend::isBusy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_ && elapsedLocked() < duration_;
}

bool NullBackend::seek(double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
        return false;
    }
    offset_ = std::clamp(seconds, 0.0, duration_);
    startedAt_ = Clock::now();
    return true;
}

std::string NullBackend::lastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}

}  // namespace playdeck::playback
