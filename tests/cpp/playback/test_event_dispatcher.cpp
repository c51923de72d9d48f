#include "playback/event_dispatcher.h"

#include <atomic>
#include <chrono>
#include <future>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace playdeck::playback;

namespace {

class RecordingListener : public PlaybackListener {
   public:
    void onPositionUpdate(double position, double duration) override {
        positions.emplace_back(position, duration);
    }
    void onTrackEnd() override {
        ++trackEnds;
    }
    void onError(const std::string& message) override {
        errors.push_back(message);
    }

    std::vector<std::pair<double, double>> positions;
    int trackEnds = 0;
    std::vector<std::string> errors;
};

}  // namespace

TEST(EventDispatcher, PublishWithoutSubscriberIsNoop) {
    EventDispatcher events;
    EXPECT_NO_THROW(events.publish(PositionUpdate{1.0, 2.0}));
    EXPECT_NO_THROW(events.publish(TrackEnded{}));
    EXPECT_NO_THROW(events.publish(PlaybackError{"x"}));
}

TEST(EventDispatcher, AttachRoutesAllKinds) {
    EventDispatcher events;
    RecordingListener listener;
    events.attach(listener);

    events.publish(PositionUpdate{3.0, 10.0});
    events.publish(TrackEnded{});
    events.publish(PlaybackError{"device lost"});

    ASSERT_EQ(listener.positions.size(), 1u);
    EXPECT_DOUBLE_EQ(listener.positions[0].first, 3.0);
    EXPECT_DOUBLE_EQ(listener.positions[0].second, 10.0);
    EXPECT_EQ(listener.trackEnds, 1);
    EXPECT_EQ(listener.errors, std::vector<std::string>({"device lost"}));
}

TEST(EventDispatcher, SubscribeReplacesPreviousHandler) {
    EventDispatcher events;
    int first = 0;
    int second = 0;
    events.subscribe([&](const TrackEnded&) { ++first; });
    events.subscribe([&](const TrackEnded&) { ++second; });

    events.publish(TrackEnded{});

    EXPECT_EQ(first, 0);
    EXPECT_EQ(second, 1);
}

TEST(EventDispatcher, ClearDropsHandlers) {
    EventDispatcher events;
    RecordingListener listener;
    events.attach(listener);
    events.clear();

    events.publish(TrackEnded{});
    events.publish(PlaybackError{"x"});

    EXPECT_EQ(listener.trackEnds, 0);
    EXPECT_TRUE(listener.errors.empty());
}

TEST(EventDispatcher, ThrowingHandlerIsContained) {
    EventDispatcher events;
    events.subscribe([](const PlaybackError&) { throw std::runtime_error("observer bug"); });

    EXPECT_NO_THROW(events.publish(PlaybackError{"x"}));
}

TEST(EventDispatcher, ClearWaitsForHandlerOnAnotherThread) {
    EventDispatcher events;
    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> releaseSignal = release.get_future().share();
    std::atomic<bool> handlerDone{false};

    events.subscribe([&](const TrackEnded&) {
        entered.set_value();
        releaseSignal.wait();
        handlerDone = true;
    });

    std::thread publisher([&] { events.publish(TrackEnded{}); });
    entered.get_future().wait();

    std::atomic<bool> cleared{false};
    std::thread clearer([&] {
        events.clear();
        cleared = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(cleared.load());

    release.set_value();
    clearer.join();
    publisher.join();

    EXPECT_TRUE(cleared.load());
    EXPECT_TRUE(handlerDone.load());
}

TEST(EventDispatcher, ClearFromInsideHandlerReturns) {
    EventDispatcher events;
    int calls = 0;
    events.subscribe([&](const TrackEnded&) {
        ++calls;
        events.clear();
    });

    events.publish(TrackEnded{});
    events.publish(TrackEnded{});

    EXPECT_EQ(calls, 1);
}

TEST(EventDispatcher, ThrowingHandlerDoesNotBlockClear) {
    EventDispatcher events;
    events.subscribe([](const PlaybackError&) { throw 42; });

    EXPECT_THROW(events.publish(PlaybackError{"x"}), int);
    events.clear();
    SUCCEED();
}
