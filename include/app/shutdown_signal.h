#pragma once

#include <atomic>
#include <csignal>
#include <functional>

namespace playdeck::app {

// Flags written by the signal handler and polled by the play loop.
struct SignalState {
    volatile sig_atomic_t shutdown = 0;  // SIGTERM, SIGINT
    volatile sig_atomic_t received = 0;  // last signal number

    void reset() {
        shutdown = 0;
        received = 0;
    }
};

/**
 * @brief Turns pending signal flags into a stop of the CLI play loop.
 *
 * Works on any SignalState, so tests can set flags without raising signals.
 */
class ShutdownSignal {
   public:
    using StopCallback = std::function<void()>;
    using LogCallback = std::function<void(const char*)>;

    ShutdownSignal() = default;

    void setSignalState(SignalState* state) {
        signalState_ = state;
    }
    void setStopCallback(StopCallback cb) {
        stopCallback_ = std::move(cb);
    }
    void setLogCallback(LogCallback cb) {
        logCallback_ = std::move(cb);
    }

    // Returns true if a shutdown signal was consumed
    bool processPending();

    bool isRunning() const {
        return running_.load();
    }
    int lastSignal() const {
        return lastSignal_;
    }

   private:
    SignalState* signalState_ = nullptr;
    std::atomic<bool> running_{true};
    StopCallback stopCallback_;
    LogCallback logCallback_;
    int lastSignal_ = 0;
};

// Async-signal-safe handler that only sets flags in the global state
void signalHandler(int sig);

SignalState& getGlobalSignalState();

// SIGINT and SIGTERM -> signalHandler
void installSignalHandlers();

}  // namespace playdeck::app
