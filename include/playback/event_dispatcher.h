#pragma once

#include "logging/logger.h"

#include <condition_variable>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace playdeck::playback {

struct PositionUpdate {
    double position = 0.0;
    double duration = 0.0;
};

struct TrackEnded {};

struct PlaybackError {
    std::string message;
};

/**
 * @brief Receiver of all three playback events.
 *
 * Implemented by the external controller (see player/player_controller.h).
 */
class PlaybackListener {
   public:
    virtual ~PlaybackListener() = default;

    virtual void onPositionUpdate(double position, double duration) = 0;
    virtual void onTrackEnd() = 0;
    virtual void onError(const std::string& message) = 0;
};

/**
 * @brief Delivers playback events to at most one subscriber per event kind.
 *
 * Subscribing again replaces the previous handler. Handlers run on the
 * publishing thread (tracker or caller), outside the dispatcher lock.
 * clear() returns only once no handler is running on another thread, so a
 * listener may be destroyed right after it. It must not be called while
 * holding a lock that a running handler waits for.
 */
class EventDispatcher {
   public:
    using PositionHandler = std::function<void(const PositionUpdate&)>;
    using TrackEndHandler = std::function<void(const TrackEnded&)>;
    using ErrorHandler = std::function<void(const PlaybackError&)>;

    void subscribe(const PositionHandler& handler);
    void subscribe(const TrackEndHandler& handler);
    void subscribe(const ErrorHandler& handler);

    // Routes all three kinds to the listener. The listener must outlive the subscription.
    void attach(PlaybackListener& listener);
    void clear();

    void publish(const PositionUpdate& event) const;
    void publish(const TrackEnded& event) const;
    void publish(const PlaybackError& event) const;

   private:
    // Unregisters the publishing thread however the handler exits
    struct ActiveScope {
        const EventDispatcher& dispatcher;
        std::thread::id thread;
        ~ActiveScope() {
            dispatcher.leave(thread);
        }
    };

    void leave(std::thread::id thread) const;

    template <typename Event, typename Handler>
    void publishImpl(const Event& event, const Handler& handler, const char* kind) const;

    mutable std::mutex mutex_;
    mutable std::condition_variable idle_;
    // Publishing threads and their nesting depth
    mutable std::map<std::thread::id, int> active_;
    PositionHandler positionHandler_;
    TrackEndHandler trackEndHandler_;
    ErrorHandler errorHandler_;
};

inline void EventDispatcher::subscribe(const PositionHandler& handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    positionHandler_ = handler;
}

inline void EventDispatcher::subscribe(const TrackEndHandler& handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    trackEndHandler_ = handler;
}

inline void EventDispatcher::subscribe(const ErrorHandler& handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    errorHandler_ = handler;
}

inline void EventDispatcher::attach(PlaybackListener& listener) {
    PlaybackListener* target = &listener;
    std::lock_guard<std::mutex> lock(mutex_);
    positionHandler_ = [target](const PositionUpdate& e) {
        target->onPositionUpdate(e.position, e.duration);
    };
    trackEndHandler_ = [target](const TrackEnded&) { target->onTrackEnd(); };
    errorHandler_ = [target](const PlaybackError& e) { target->onError(e.message); };
}

inline void EventDispatcher::clear() {
    const auto self = std::this_thread::get_id();
    std::unique_lock<std::mutex> lock(mutex_);
    positionHandler_ = nullptr;
    trackEndHandler_ = nullptr;
    errorHandler_ = nullptr;
    // A handler that clears its own dispatcher only waits for other threads
    idle_.wait(lock, [this, self] {
        return active_.empty() || (active_.size() == 1 && active_.count(self) == 1);
    });
}

inline void EventDispatcher::publish(const PositionUpdate& event) const {
    publishImpl(event, positionHandler_, "position");
}

inline void EventDispatcher::publish(const TrackEnded& event) const {
    publishImpl(event, trackEndHandler_, "track-end");
}

inline void EventDispatcher::publish(const PlaybackError& event) const {
    publishImpl(event, errorHandler_, "error");
}

template <typename Event, typename Handler>
void EventDispatcher::publishImpl(const Event& event, const Handler& handler,
                                  const char* kind) const {
    const auto self = std::this_thread::get_id();
    Handler copy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        copy = handler;
        if (!copy) {
            return;
        }
        ++active_[self];
    }
    ActiveScope scope{*this, self};
    try {
        copy(event);
    } catch (const std::exception& e) {
        LOG_WARN("EventDispatcher: {} handler threw: {}", kind, e.what());
    }
}

inline void EventDispatcher::leave(std::thread::id thread) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(thread);
        if (it != active_.end() && --it->second == 0) {
            active_.erase(it);
        }
    }
    idle_.notify_all();
}

}  // namespace playdeck::playback
