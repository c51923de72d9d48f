#pragma once

#include "catalog/catalog.h"
#include "core/error_codes.h"
#include "playback/event_dispatcher.h"
#include "playback/playback_engine.h"
#include "player/queue_navigator.h"

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace playdeck::player {

/**
 * @brief Drives the engine through a collection: next, previous, loop, shuffle.
 *
 * Registers itself as the engine's event listener. Track-end events arrive on
 * the tracker thread and pick the next track from a freshly read list. The
 * destructor detaches from the engine and waits for a handler already running
 * on the tracker thread to return.
 */
class PlayerController : public playback::PlaybackListener {
   public:
    struct Observers {
        std::function<void(const catalog::TrackView&)> onTrackStarted;
        std::function<void(double, double)> onPosition;
        std::function<void(const std::string&)> onError;
        std::function<void()> onFinished;
    };

    PlayerController(catalog::Catalog& catalog, playback::PlaybackEngine& engine,
                     QueueNavigator navigator = QueueNavigator());
    ~PlayerController() override;

    PlayerController(const PlayerController&) = delete;
    PlayerController& operator=(const PlayerController&) = delete;

    // Handlers may run on the tracker thread
    void setObservers(Observers observers);

    OpResult openCollection(const std::string& id);
    OpResult playIndex(size_t index);
    OpResult next();
    OpResult previous();
    OpResult togglePause();
    // Soft seek back, clamped at 0
    OpResult rewind(double seconds = 10.0);

    void setLoopMode(LoopMode mode);
    void setShuffle(bool enabled);
    void seedShuffle(uint32_t seed);

    std::optional<catalog::TrackView> currentTrack() const;
    size_t currentIndex() const;
    const std::string& collectionId() const {
        return collectionId_;
    }

    // Set once the end of a non-looping list was reached
    bool finished() const {
        return finished_.load();
    }
    std::string lastError() const;

    void onPositionUpdate(double position, double duration) override;
    void onTrackEnd() override;
    void onError(const std::string& message) override;

   private:
    OpResult reloadTracksLocked();
    OpResult playIndexLocked(size_t index);
    void markFinished();
    Observers observers() const;

    catalog::Catalog& catalog_;
    playback::PlaybackEngine& engine_;

    mutable std::mutex mutex_;
    QueueNavigator navigator_;
    std::string collectionId_;
    std::vector<catalog::TrackView> tracks_;

    mutable std::mutex observerMutex_;
    Observers observers_;
    std::atomic<bool> finished_{false};

    mutable std::mutex errorMutex_;
    std::string lastError_;
};

}  // namespace playdeck::player
