#include "playback/position_tracker.h"

#include "logging/logger.h"

#include <exception>

namespace playdeck::playback {

PositionTracker::PositionTracker(TrackerConfig config, TickFunction tick, EventDispatcher& events)
    : config_(config),
      tick_(std::move(tick)),
      events_(events),
      state_(std::make_shared<LoopState>()) {
    if (config_.intervalMs <= 0) {
        config_.intervalMs = 1000;
    }
}

PositionTracker::~PositionTracker() {
    stop();
}

bool PositionTracker::start() {
    if (started_) {
        LOG_WARN("Position tracker already started");
        return false;
    }
    started_ = true;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->running = true;
    }
    thread_ = std::thread(&PositionTracker::run, this, state_);
    LOG_DEBUG("Position tracker started (interval {} ms)", config_.intervalMs);
    return true;
}

void PositionTracker::stop() {
    if (!thread_.joinable()) {
        return;
    }

    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->stopRequested = true;
    state_->wake.notify_all();

    if (std::this_thread::get_id() == thread_.get_id()) {
        // Called from an event handler on the tracker thread; the loop exits on return
        lock.unlock();
        thread_.detach();
        return;
    }

    bool exited = state_->exited.wait_for(lock, std::chrono::milliseconds(config_.shutdownTimeoutMs),
                                          [this] { return !state_->running; });
    lock.unlock();

    if (exited) {
        thread_.join();
        LOG_DEBUG("Position tracker stopped");
    } else {
        LOG_WARN("Position tracker did not stop within {} ms, detaching",
                 config_.shutdownTimeoutMs);
        thread_.detach();
    }
}

bool PositionTracker::isRunning() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->running;
}

void PositionTracker::run(std::shared_ptr<LoopState> state) {
    const auto interval = std::chrono::milliseconds(config_.intervalMs);

    std::unique_lock<std::mutex> lock(state->mutex);
    while (!state->stopRequested) {
        if (state->wake.wait_for(lock, interval, [&state] { return state->stopRequested; })) {
            break;
        }
        lock.unlock();
        tickOnce();
        lock.lock();
    }
    state->running = false;
    state->exited.notify_all();
}

void PositionTracker::tickOnce() {
    TickOutcome outcome;
    try {
        outcome = tick_(config_.intervalMs / 1000.0);
    } catch (const std::exception& e) {
        LOG_WARN("Position tracker tick failed: {}", e.what());
        reportError(std::string("Position tracking failed: ") + e.what());
        return;
    }

    if (!outcome.error.empty()) {
        reportError(outcome.error);
    }

    switch (outcome.kind) {
    case TickOutcome::Kind::Position:
        events_.publish(PositionUpdate{outcome.position, outcome.duration});
        break;
    case TickOutcome::Kind::Ended:
        LOG_DEBUG("Position tracker: track ended");
        events_.publish(TrackEnded{});
        break;
    case TickOutcome::Kind::None:
    default:
        break;
    }
}

void PositionTracker::reportError(const std::string& message) {
    auto now = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lock(errorMutex_);
        if (errorReported_ &&
            now - lastErrorTime_ < std::chrono::milliseconds(config_.errorIntervalMs)) {
            LOG_DEBUG("Position tracker: suppressed repeated error: {}", message);
            return;
        }
        errorReported_ = true;
        lastErrorTime_ = now;
    }
    events_.publish(PlaybackError{message});
}

}  // namespace playdeck::playback
