#include "player/queue_navigator.h"

#include <gtest/gtest.h>
#include <set>

using namespace playdeck;
using namespace playdeck::player;

TEST(QueueNavigator, EmptyListHasNoNeighbours) {
    QueueNavigator nav;
    EXPECT_FALSE(nav.next().has_value());
    EXPECT_FALSE(nav.previous().has_value());
    EXPECT_FALSE(nav.onTrackEnded().has_value());
    EXPECT_FALSE(nav.select(0));
}

TEST(QueueNavigator, LinearWithoutLoop) {
    QueueNavigator nav;
    nav.reset(3);

    EXPECT_EQ(nav.next(), 1u);
    EXPECT_EQ(nav.next(), 2u);
    EXPECT_FALSE(nav.next().has_value());
    EXPECT_EQ(nav.current(), 2u);

    EXPECT_EQ(nav.previous(), 1u);
    EXPECT_EQ(nav.previous(), 0u);
    EXPECT_FALSE(nav.previous().has_value());
    EXPECT_EQ(nav.current(), 0u);
}

TEST(QueueNavigator, PlaylistLoopWrapsBothWays) {
    QueueNavigator nav(LoopMode::Playlist);
    nav.reset(3, 2);

    EXPECT_EQ(nav.next(), 0u);
    EXPECT_EQ(nav.previous(), 2u);
    EXPECT_EQ(nav.onTrackEnded(), 0u);
}

TEST(QueueNavigator, SingleLoopRepeatsOnTrackEnd) {
    QueueNavigator nav(LoopMode::Single);
    nav.reset(3, 1);

    EXPECT_EQ(nav.onTrackEnded(), 1u);
    EXPECT_EQ(nav.onTrackEnded(), 1u);
    // Explicit navigation still moves
    EXPECT_EQ(nav.next(), 2u);
}

TEST(QueueNavigator, ResetClampsInvalidIndex) {
    QueueNavigator nav;
    nav.reset(2, 5);
    EXPECT_EQ(nav.current(), 0u);
}

TEST(QueueNavigator, ShrinkingListMovesIndexToLast) {
    QueueNavigator nav;
    nav.reset(5, 4);

    nav.setTrackCount(3);
    EXPECT_EQ(nav.current(), 2u);
    nav.setTrackCount(10);
    EXPECT_EQ(nav.current(), 2u);
    nav.setTrackCount(0);
    EXPECT_EQ(nav.current(), 0u);
}

TEST(QueueNavigator, ShuffleStaysInRangeAndIsSeedable) {
    QueueNavigator a(LoopMode::Off, true);
    QueueNavigator b(LoopMode::Off, true);
    a.reset(10);
    b.reset(10);
    a.seed(7);
    b.seed(7);

    std::set<size_t> seen;
    for (int i = 0; i < 200; ++i) {
        auto x = a.next();
        auto y = b.next();
        ASSERT_TRUE(x.has_value());
        ASSERT_LT(*x, 10u);
        EXPECT_EQ(x, y);
        seen.insert(*x);
    }
    EXPECT_GT(seen.size(), 5u);
}

TEST(QueueNavigator, ModeSetters) {
    QueueNavigator nav;
    nav.setLoopMode(LoopMode::Playlist);
    nav.setShuffle(true);
    EXPECT_EQ(nav.loopMode(), LoopMode::Playlist);
    EXPECT_TRUE(nav.shuffle());
}
