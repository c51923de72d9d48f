#include "app/shutdown_signal.h"

#include <cstdio>

namespace playdeck::app {

static SignalState g_signalState;

SignalState& getGlobalSignalState() {
    return g_signalState;
}

void signalHandler(int sig) {
    g_signalState.received = sig;
    g_signalState.shutdown = 1;
}

void installSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

bool ShutdownSignal::processPending() {
    if (!signalState_ || !signalState_->shutdown) {
        return false;
    }

    signalState_->shutdown = 0;
    lastSignal_ = signalState_->received;

    if (logCallback_) {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "Received signal %d, stopping playback", lastSignal_);
        logCallback_(buf);
    }
    if (stopCallback_) {
        stopCallback_();
    }
    running_ = false;
    return true;
}

}  // namespace playdeck::app
