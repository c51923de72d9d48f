#include "playback/backend_factory.h"
#include "playback/null_backend.h"
#include "support/temp_dir.h"

#include <chrono>
#include <gtest/gtest.h>
#include <thread>

using namespace playdeck;
using namespace playdeck::playback;
using playdeck::testing::TempDir;
using playdeck::testing::writeFile;

namespace {

bool waitUntilIdle(const PlaybackBackend& backend, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!backend.isBusy()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return !backend.isBusy();
}

}  // namespace

class NullBackendTest : public ::testing::Test {
   protected:
    void SetUp() override {
        writeFile(dir_.path() / "short.wav", "x");
        path_ = (dir_.path() / "short.wav").string();
    }

    TempDir dir_;
    std::string path_;
};

TEST_F(NullBackendTest, OpenMissingFileFails) {
    NullBackend backend(MetadataResolver(0.1));
    EXPECT_FALSE(backend.open((dir_.path() / "missing.wav").string()));
    EXPECT_FALSE(backend.lastError().empty());
    EXPECT_FALSE(backend.start(0.0));
}

TEST_F(NullBackendTest, BusyForTrackDuration) {
    NullBackend backend(MetadataResolver(0.1));
    ASSERT_TRUE(backend.open(path_));
    EXPECT_FALSE(backend.isBusy());

    ASSERT_TRUE(backend.start(0.0));
    EXPECT_TRUE(backend.isBusy());
    EXPECT_TRUE(waitUntilIdle(backend, std::chrono::milliseconds(2000)));
}

TEST_F(NullBackendTest, PausedStreamStaysBusy) {
    NullBackend backend(MetadataResolver(0.05));
    ASSERT_TRUE(backend.open(path_));
    ASSERT_TRUE(backend.start(0.0));
    ASSERT_TRUE(backend.pause());

    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    EXPECT_TRUE(backend.isBusy());

    ASSERT_TRUE(backend.resume());
    EXPECT_TRUE(waitUntilIdle(backend, std::chrono::milliseconds(2000)));
}

TEST_F(NullBackendTest, StartAtEndIsImmediatelyDone) {
    NullBackend backend(MetadataResolver(10.0));
    ASSERT_TRUE(backend.open(path_));
    ASSERT_TRUE(backend.start(10.0));
    EXPECT_FALSE(backend.isBusy());
}

TEST_F(NullBackendTest, SeekAndStop) {
    NullBackend backend(MetadataResolver(10.0));
    ASSERT_TRUE(backend.open(path_));
    EXPECT_FALSE(backend.seek(2.0));

    ASSERT_TRUE(backend.start(0.0));
    EXPECT_TRUE(backend.canSeek());
    EXPECT_TRUE(backend.seek(10.0));
    EXPECT_FALSE(backend.isBusy());

    backend.stop();
    EXPECT_FALSE(backend.pause());
    EXPECT_TRUE(backend.setRate(1.5f));
    backend.close();
    EXPECT_FALSE(backend.start(0.0));
}

TEST(BackendFactory, NullDeviceSelectsNullBackend) {
    AppConfig config;
    config.output.device = "null";

    auto backend = createBackend(config);

    ASSERT_NE(backend, nullptr);
    EXPECT_STREQ(backend->name(), "null");
}

TEST(BackendFactory, OtherDevicesUseAlsa) {
    AppConfig config;
    config.output.device = "hw:0,0";

    auto backend = createBackend(config);

    ASSERT_NE(backend, nullptr);
    EXPECT_STREQ(backend->name(), "alsa");
    EXPECT_FALSE(backend->isBusy());
}
