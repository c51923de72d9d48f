#include "player/queue_navigator.h"

namespace playdeck::player {

QueueNavigator::QueueNavigator(LoopMode loop, bool shuffle)
    : loop_(loop), shuffle_(shuffle), rng_(std::random_device{}()) {}

void QueueNavigator::reset(size_t trackCount, size_t index) {
    count_ = trackCount;
    index_ = (index < count_) ? index : 0;
}

void QueueNavigator::setTrackCount(size_t trackCount) {
    count_ = trackCount;
    if (count_ == 0) {
        index_ = 0;
    } else if (index_ >= count_) {
        index_ = count_ - 1;
    }
}

bool QueueNavigator::select(size_t index) {
    if (index >= count_) {
        return false;
    }
    index_ = index;
    return true;
}

std::optional<size_t> QueueNavigator::next() {
    if (count_ == 0) {
        return std::nullopt;
    }
    if (shuffle_) {
        std::uniform_int_distribution<size_t> dist(0, count_ - 1);
        index_ = dist(rng_);
        return index_;
    }
    if (index_ + 1 < count_) {
        return ++index_;
    }
    if (loop_ == LoopMode::Playlist) {
        index_ = 0;
        return index_;
    }
    return std::nullopt;
}

std::optional<size_t> QueueNavigator::previous() {
    if (count_ == 0) {
        return std::nullopt;
    }
    if (index_ > 0) {
        return --index_;
    }
    if (loop_ == LoopMode::Playlist) {
        index_ = count_ - 1;
        return index_;
    }
    return std::nullopt;
}

std::optional<size_t> QueueNavigator::onTrackEnded() {
    if (loop_ == LoopMode::Single && count_ > 0) {
        return index_;
    }
    return next();
}

}  // namespace playdeck::player
