#include "player/player_controller.h"

#include "logging/logger.h"

#include <algorithm>

namespace playdeck::player {

using playback::PlaybackState;

PlayerController::PlayerController(catalog::Catalog& catalog, playback::PlaybackEngine& engine,
                                   QueueNavigator navigator)
    : catalog_(catalog), engine_(engine), navigator_(std::move(navigator)) {
    engine_.events().attach(*this);
}

PlayerController::~PlayerController() {
    engine_.events().clear();
}

void PlayerController::setObservers(Observers observers) {
    std::lock_guard<std::mutex> lock(observerMutex_);
    observers_ = std::move(observers);
}

PlayerController::Observers PlayerController::observers() const {
    std::lock_guard<std::mutex> lock(observerMutex_);
    return observers_;
}

// Caller holds mutex_
OpResult PlayerController::reloadTracksLocked() {
    if (collectionId_.empty()) {
        return OpResult::failure(ErrorCode::PLAYBACK_INVALID_STATE, "No collection open");
    }
    catalog::TrackListResult listed = catalog_.getTracks(collectionId_);
    if (!listed.ok()) {
        return listed.status;
    }
    tracks_ = std::move(listed.tracks);
    navigator_.setTrackCount(tracks_.size());
    return OpResult::success();
}

OpResult PlayerController::openCollection(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    catalog::TrackListResult listed = catalog_.getTracks(id);
    if (!listed.ok()) {
        return listed.status;
    }
    collectionId_ = id;
    tracks_ = std::move(listed.tracks);
    navigator_.reset(tracks_.size());
    finished_.store(false);
    LOG_INFO("Opened collection '{}' ({} tracks)", id, tracks_.size());
    return OpResult::success();
}

// Caller holds mutex_
OpResult PlayerController::playIndexLocked(size_t index) {
    if (!navigator_.select(index)) {
        return OpResult::failure(ErrorCode::VALIDATION_INVALID_ARGUMENT,
                                 "Track index " + std::to_string(index) + " out of range (" +
                                     std::to_string(tracks_.size()) + " tracks)");
    }
    const catalog::TrackView& track = tracks_[index];
    OpResult loaded = engine_.load(track.absolutePath.string());
    if (!loaded.ok()) {
        return loaded;
    }
    OpResult played = engine_.play();
    if (!played.ok()) {
        return played;
    }
    finished_.store(false);
    LOG_INFO("Playing [{}/{}] {}", index + 1, tracks_.size(), track.displayName);
    auto started = observers().onTrackStarted;
    if (started) {
        started(track);
    }
    return OpResult::success();
}

OpResult PlayerController::playIndex(size_t index) {
    std::lock_guard<std::mutex> lock(mutex_);
    OpResult reloaded = reloadTracksLocked();
    if (!reloaded.ok()) {
        return reloaded;
    }
    return playIndexLocked(index);
}

OpResult PlayerController::next() {
    std::lock_guard<std::mutex> lock(mutex_);
    OpResult reloaded = reloadTracksLocked();
    if (!reloaded.ok()) {
        return reloaded;
    }
    std::optional<size_t> index = navigator_.next();
    if (!index) {
        markFinished();
        return OpResult::success();
    }
    return playIndexLocked(*index);
}

OpResult PlayerController::previous() {
    std::lock_guard<std::mutex> lock(mutex_);
    OpResult reloaded = reloadTracksLocked();
    if (!reloaded.ok()) {
        return reloaded;
    }
    std::optional<size_t> index = navigator_.previous();
    if (!index) {
        return OpResult::success();
    }
    return playIndexLocked(*index);
}

OpResult PlayerController::togglePause() {
    switch (engine_.state()) {
    case PlaybackState::Playing:
        return engine_.pause();
    case PlaybackState::Paused:
    case PlaybackState::Loaded:
        return engine_.play();
    case PlaybackState::Idle:
    default: {
        std::lock_guard<std::mutex> lock(mutex_);
        OpResult reloaded = reloadTracksLocked();
        if (!reloaded.ok()) {
            return reloaded;
        }
        return playIndexLocked(navigator_.current());
    }
    }
}

OpResult PlayerController::rewind(double seconds) {
    double target = std::max(0.0, engine_.position() - std::max(0.0, seconds));
    return engine_.seek(target);
}

void PlayerController::setLoopMode(LoopMode mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    navigator_.setLoopMode(mode);
    LOG_INFO("Loop mode: {}", loopModeToString(mode));
}

void PlayerController::setShuffle(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    navigator_.setShuffle(enabled);
    LOG_INFO("Shuffle {}", enabled ? "on" : "off");
}

void PlayerController::seedShuffle(uint32_t seed) {
    std::lock_guard<std::mutex> lock(mutex_);
    navigator_.seed(seed);
}

std::optional<catalog::TrackView> PlayerController::currentTrack() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (navigator_.current() >= tracks_.size()) {
        return std::nullopt;
    }
    return tracks_[navigator_.current()];
}

size_t PlayerController::currentIndex() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return navigator_.current();
}

std::string PlayerController::lastError() const {
    std::lock_guard<std::mutex> lock(errorMutex_);
    return lastError_;
}

// Caller holds mutex_
void PlayerController::markFinished() {
    LOG_INFO("End of playlist '{}'", collectionId_);
    finished_.store(true);
    auto finishedHandler = observers().onFinished;
    if (finishedHandler) {
        finishedHandler();
    }
}

void PlayerController::onPositionUpdate(double position, double duration) {
    auto handler = observers().onPosition;
    if (handler) {
        handler(position, duration);
    }
}

void PlayerController::onTrackEnd() {
    std::lock_guard<std::mutex> lock(mutex_);
    OpResult reloaded = reloadTracksLocked();
    if (!reloaded.ok()) {
        LOG_WARN("Track ended but the list could not be read: {}", reloaded.message);
        markFinished();
        return;
    }
    std::optional<size_t> index = navigator_.onTrackEnded();
    if (!index) {
        markFinished();
        return;
    }
    OpResult played = playIndexLocked(*index);
    if (!played.ok()) {
        LOG_WARN("Could not continue with track {}: {}", *index + 1, played.message);
        markFinished();
    }
}

void PlayerController::onError(const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(errorMutex_);
        lastError_ = message;
    }
    auto handler = observers().onError;
    if (handler) {
        handler(message);
    }
}

}  // namespace playdeck::player
