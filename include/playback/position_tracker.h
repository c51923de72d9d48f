#pragma once

#include "playback/event_dispatcher.h"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace playdeck::playback {

// Result of one tracker tick, computed under the engine lock
struct TickOutcome {
    enum class Kind {
        None,      // not playing, nothing to report
        Position,  // position advanced
        Ended      // backend drained, engine went Idle
    };

    Kind kind = Kind::None;
    double position = 0.0;
    double duration = 0.0;
    std::string error;  // asynchronous backend error, empty if none
};

struct TrackerConfig {
    int intervalMs = 1000;
    int shutdownTimeoutMs = 2000;
    int errorIntervalMs = 1000;  // minimum spacing of onError from the tracker
};

/**
 * @brief Background task that advances playback position once per interval.
 *
 * The tick callback does the state work (PlaybackEngine::advance); the tracker
 * publishes the resulting events after the callback returned, so no engine
 * lock is held while handlers run.
 */
class PositionTracker {
   public:
    using TickFunction = std::function<TickOutcome(double elapsedSeconds)>;

    PositionTracker(TrackerConfig config, TickFunction tick, EventDispatcher& events);
    ~PositionTracker();

    PositionTracker(const PositionTracker&) = delete;
    PositionTracker& operator=(const PositionTracker&) = delete;

    // Starts the background thread; false if it was already started once
    bool start();

    /**
     * @brief Signal the loop and wait up to shutdownTimeoutMs for it to exit.
     *
     * On timeout the thread is detached and a warning logged. Safe to call
     * from the tracker thread itself and more than once.
     */
    void stop();

    bool isRunning() const;

    // One tick on the calling thread
    void tickOnce();

    const TrackerConfig& config() const {
        return config_;
    }

   private:
    struct LoopState {
        std::mutex mutex;
        std::condition_variable wake;
        std::condition_variable exited;
        bool stopRequested = false;
        bool running = false;
    };

    void run(std::shared_ptr<LoopState> state);
    void reportError(const std::string& message);

    TrackerConfig config_;
    TickFunction tick_;
    EventDispatcher& events_;

    std::shared_ptr<LoopState> state_;
    std::thread thread_;
    bool started_ = false;

    std::mutex errorMutex_;
    bool errorReported_ = false;
    std::chrono::steady_clock::time_point lastErrorTime_;
};

}  // namespace playdeck::playback
