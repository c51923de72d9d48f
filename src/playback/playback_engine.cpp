#include "playback/playback_engine.h"

#include "logging/logger.h"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <system_error>

namespace playdeck::playback {

namespace fs = std::filesystem;

EngineConfig makeEngineConfig(const AppConfig& config) {
    EngineConfig engine;
    engine.formats = catalog::MediaFormats(config.extraExtensions);
    engine.volume = config.playback.volume;
    engine.speed = config.playback.speed;
    engine.tracker.intervalMs = config.tracker.intervalMs;
    engine.tracker.shutdownTimeoutMs = config.tracker.shutdownTimeoutMs;
    engine.tracker.errorIntervalMs = config.tracker.errorIntervalMs;
    return engine;
}

PlaybackEngine::PlaybackEngine(std::unique_ptr<PlaybackBackend> backend, MetadataResolver metadata,
                               EngineConfig config)
    : backend_(std::move(backend)),
      metadata_(std::move(metadata)),
      config_(std::move(config)),
      tracker_(config_.tracker, [this](double elapsed) { return advance(elapsed); }, events_) {
    session_.volume = std::clamp(config_.volume, kMinVolume, kMaxVolume);
    session_.speed = std::clamp(config_.speed, kMinSpeed, kMaxSpeed);
    if (config_.startTracker) {
        tracker_.start();
    }
    LOG_INFO("Playback engine ready (backend: {})", backendName());
}

PlaybackEngine::~PlaybackEngine() {
    shutdown();
}

const char* PlaybackEngine::backendName() const {
    return backend_ ? backend_->name() : "none";
}

OpResult PlaybackEngine::report(OpResult result) {
    if (!result.ok()) {
        LOG_WARN("Playback: {} ({})", result.message, errorCodeToString(result.code));
        events_.publish(PlaybackError{result.message});
    }
    return result;
}

OpResult PlaybackEngine::backendFailure(const std::string& what) {
    std::string detail = backend_ ? backend_->lastError() : std::string("no backend");
    stopLocked();
    std::string message = what;
    if (!detail.empty()) {
        message += ": " + detail;
    }
    return OpResult::failure(ErrorCode::PLAYBACK_BACKEND_ERROR, message);
}

// Caller holds mutex_
void PlaybackEngine::stopLocked() {
    if (backend_ && session_.state != PlaybackState::Idle) {
        backend_->stop();
        backend_->close();
    }
    session_.state = PlaybackState::Idle;
    session_.position = 0.0;
}

OpResult PlaybackEngine::loadLocked(const std::string& locator) {
    stopLocked();
    session_.track.reset();
    session_.duration = 0.0;

    if (shutdown_ || !backend_) {
        return OpResult::failure(ErrorCode::PLAYBACK_INVALID_STATE, "Engine is shut down");
    }

    fs::path path(locator);
    std::error_code ec;
    if (locator.empty() || !fs::is_regular_file(path, ec)) {
        return OpResult::failure(ErrorCode::PLAYBACK_NOT_FOUND, "File not found: " + locator);
    }
    if (!config_.formats.isSupported(path)) {
        return OpResult::failure(ErrorCode::PLAYBACK_UNSUPPORTED_FORMAT,
                                 "Unsupported format: " + path.filename().string());
    }
    if (!backend_->open(locator)) {
        std::string detail = backend_->lastError();
        backend_->close();
        return OpResult::failure(ErrorCode::PLAYBACK_BACKEND_ERROR,
                                 "Backend rejected " + path.filename().string() +
                                     (detail.empty() ? "" : ": " + detail));
    }

    ResolvedMetadata meta = metadata_.resolve(path);
    session_.track = locator;
    session_.duration = std::max(0.0, meta.durationSeconds);
    session_.position = 0.0;
    session_.state = PlaybackState::Loaded;
    backend_->setVolume(session_.volume);
    backend_->setRate(session_.speed);

    LOG_INFO("Loaded {} ({:.1f}s)", meta.title, session_.duration);
    return OpResult::success();
}

OpResult PlaybackEngine::load(const std::string& locator) {
    OpResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result = loadLocked(locator);
    }
    return report(std::move(result));
}

OpResult PlaybackEngine::playLocked() {
    switch (session_.state) {
    case PlaybackState::Idle:
        return OpResult::failure(ErrorCode::PLAYBACK_INVALID_STATE, "Nothing loaded");

    case PlaybackState::Paused:
        if (!backend_->resume()) {
            return backendFailure("Resume failed");
        }
        break;

    case PlaybackState::Loaded:
    case PlaybackState::Playing:
    default:
        if (!backend_->start(session_.position)) {
            return backendFailure("Start failed");
        }
        break;
    }

    backend_->setVolume(session_.volume);
    session_.state = PlaybackState::Playing;
    return OpResult::success();
}

OpResult PlaybackEngine::play() {
    OpResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result = playLocked();
    }
    return report(std::move(result));
}

OpResult PlaybackEngine::pauseLocked() {
    if (session_.state != PlaybackState::Playing) {
        return OpResult::failure(ErrorCode::PLAYBACK_INVALID_STATE,
                                 std::string("Cannot pause while ") +
                                     playbackStateToString(session_.state));
    }
    if (!backend_->pause()) {
        return backendFailure("Pause failed");
    }
    session_.state = PlaybackState::Paused;
    return OpResult::success();
}

OpResult PlaybackEngine::pause() {
    OpResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result = pauseLocked();
    }
    return report(std::move(result));
}

OpResult PlaybackEngine::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    stopLocked();
    return OpResult::success();
}

OpResult PlaybackEngine::setVolume(float volume) {
    if (!std::isfinite(volume)) {
        return report(OpResult::failure(ErrorCode::VALIDATION_INVALID_ARGUMENT,
                                        "Volume must be a finite number"));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    session_.volume = std::clamp(volume, kMinVolume, kMaxVolume);
    if (backend_ && session_.state != PlaybackState::Idle) {
        backend_->setVolume(session_.volume);
    }
    return OpResult::success();
}

OpResult PlaybackEngine::setSpeed(float speed) {
    if (!std::isfinite(speed)) {
        return report(OpResult::failure(ErrorCode::VALIDATION_INVALID_ARGUMENT,
                                        "Speed must be a finite number"));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    session_.speed = std::clamp(speed, kMinSpeed, kMaxSpeed);
    if (backend_ && session_.state != PlaybackState::Idle && !backend_->setRate(session_.speed)) {
        LOG_ONCE(INFO, "Backend {} cannot change rate; speed is recorded only", backend_->name());
    }
    return OpResult::success();
}

OpResult PlaybackEngine::seekLocked(double position) {
    if (!std::isfinite(position)) {
        return OpResult::failure(ErrorCode::VALIDATION_INVALID_ARGUMENT,
                                 "Seek position must be a finite number");
    }
    if (session_.state == PlaybackState::Idle) {
        return OpResult::failure(ErrorCode::PLAYBACK_INVALID_STATE, "Nothing loaded");
    }
    double target = std::clamp(position, 0.0, session_.duration);

    if (target == 0.0) {
        bool wasPlaying = session_.state == PlaybackState::Playing;
        backend_->stop();
        session_.position = 0.0;
        if (!wasPlaying) {
            session_.state = PlaybackState::Loaded;
            return OpResult::success();
        }
        if (!backend_->start(0.0)) {
            return backendFailure("Restart failed");
        }
        backend_->setVolume(session_.volume);
        return OpResult::success();
    }

    bool streamActive =
        session_.state == PlaybackState::Playing || session_.state == PlaybackState::Paused;
    if (streamActive && backend_->canSeek() && !backend_->seek(target)) {
        LOG_WARN("Backend seek to {:.1f}s failed, position is tracked only", target);
    }
    session_.position = target;
    return OpResult::success();
}

OpResult PlaybackEngine::seek(double position) {
    OpResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result = seekLocked(position);
    }
    return report(std::move(result));
}

PlaybackState PlaybackEngine::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.state;
}

double PlaybackEngine::position() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.position;
}

double PlaybackEngine::duration() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.duration;
}

float PlaybackEngine::volume() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.volume;
}

float PlaybackEngine::speed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.speed;
}

std::optional<std::string> PlaybackEngine::currentTrack() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.track;
}

PlaybackSnapshot PlaybackEngine::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

TickOutcome PlaybackEngine::advance(double elapsedSeconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    TickOutcome outcome;
    if (session_.state != PlaybackState::Playing || !backend_) {
        return outcome;
    }

    outcome.error = backend_->pollError();
    if (!backend_->isBusy()) {
        stopLocked();
        outcome.kind = TickOutcome::Kind::Ended;
        return outcome;
    }

    session_.position = std::clamp(session_.position + elapsedSeconds, 0.0, session_.duration);
    outcome.kind = TickOutcome::Kind::Position;
    outcome.position = session_.position;
    outcome.duration = session_.duration;
    return outcome;
}

void PlaybackEngine::tickOnce() {
    tracker_.tickOnce();
}

void PlaybackEngine::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            return;
        }
        shutdown_ = true;
    }

    tracker_.stop();

    std::lock_guard<std::mutex> lock(mutex_);
    stopLocked();
    if (backend_) {
        backend_->close();
    }
    LOG_DEBUG("Playback engine shut down");
}

}  // namespace playdeck::playback
