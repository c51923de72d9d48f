#pragma once

#include "core/config_loader.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>

namespace playdeck::player {

/**
 * @brief Cursor over an ordered track list with loop and shuffle modes.
 *
 * Holds no track data, only the list size and the current index; the caller
 * re-syncs the size whenever it re-reads the list.
 */
class QueueNavigator {
   public:
    explicit QueueNavigator(LoopMode loop = LoopMode::Off, bool shuffle = false);

    void reset(size_t trackCount, size_t index = 0);
    // Keeps the index if still valid, otherwise moves it to the last track
    void setTrackCount(size_t trackCount);

    bool select(size_t index);

    // Index to play next, nullopt at the end of a non-looping list
    std::optional<size_t> next();
    // Index to play before the current one, nullopt at the start of a non-looping list
    std::optional<size_t> previous();
    // Single loop repeats the current index, otherwise behaves like next()
    std::optional<size_t> onTrackEnded();

    size_t current() const {
        return index_;
    }
    size_t trackCount() const {
        return count_;
    }

    LoopMode loopMode() const {
        return loop_;
    }
    void setLoopMode(LoopMode mode) {
        loop_ = mode;
    }
    bool shuffle() const {
        return shuffle_;
    }
    void setShuffle(bool enabled) {
        shuffle_ = enabled;
    }

    void seed(uint32_t value) {
        rng_.seed(value);
    }

   private:
    size_t count_ = 0;
    size_t index_ = 0;
    LoopMode loop_;
    bool shuffle_;
    std::mt19937 rng_;
};

}  // namespace playdeck::player
