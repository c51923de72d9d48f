/**
 * @file test_commands.cpp
 * @brief CLI command execution against a temporary library
 */

#include "app/commands.h"
#include "app/shutdown_signal.h"
#include "support/temp_dir.h"

#include <filesystem>
#include <gtest/gtest.h>
#include <sstream>

using namespace playdeck;
using namespace playdeck::app;
using playdeck::testing::TempDir;
using playdeck::testing::readFile;
using playdeck::testing::writeFile;

namespace fs = std::filesystem;

class CommandsTest : public ::testing::Test {
   protected:
    void SetUp() override {
        writeFile(root_.path() / "Rock" / "a.mp3", "audio-a");
        writeFile(root_.path() / "Rock" / "b.mp3", "audio-b");
        catalog_ = std::make_unique<catalog::Catalog>(root_.path());
        config_.libraryDir = root_.path().string();
        config_.output.device = "null";
        config_.tracker.intervalMs = 10;
    }

    int run(const std::string& command, std::vector<std::string> args) {
        CliOptions options;
        options.command = command;
        options.args = std::move(args);
        return run(options);
    }

    int run(const CliOptions& options) {
        out_.str("");
        err_.str("");
        return runCommand(options, config_, *catalog_, out_, err_);
    }

    TempDir root_;
    AppConfig config_;
    std::unique_ptr<catalog::Catalog> catalog_;
    std::ostringstream out_;
    std::ostringstream err_;
};

TEST_F(CommandsTest, ListCollections) {
    ASSERT_EQ(run("list", {}), kExitOk);
    EXPECT_EQ(out_.str(), "Rock\tRock\t2 tracks\n");
}

TEST_F(CommandsTest, TracksInOrder) {
    ASSERT_EQ(run("reorder", {"Rock", "b.mp3", "a.mp3"}), kExitOk);
    ASSERT_EQ(run("tracks", {"Rock"}), kExitOk);
    EXPECT_EQ(out_.str(), "  1. b  (b.mp3)\n  2. a  (a.mp3)\n");
}

TEST_F(CommandsTest, ErrorsGoToStderrWithCode) {
    EXPECT_EQ(run("tracks", {"Nope"}), kExitFailure);
    EXPECT_TRUE(out_.str().empty());
    EXPECT_NE(err_.str().find("(CATALOG_NOT_FOUND 0x2001)"), std::string::npos);
    EXPECT_EQ(err_.str().rfind("error: ", 0), 0u);
}

TEST_F(CommandsTest, CreateRenameDescribe) {
    CliOptions create;
    create.command = "create";
    create.args = {"Chill"};
    create.name = "Chill Out";
    ASSERT_EQ(run(create), kExitOk);
    EXPECT_EQ(catalog_->collectionDisplayName("Chill"), "Chill Out");

    ASSERT_EQ(run("rename", {"Chill", "Late Night"}), kExitOk);
    EXPECT_EQ(catalog_->collectionDisplayName("Chill"), "Late Night");

    ASSERT_EQ(run("describe", {"Chill", "Slow songs"}), kExitOk);
    EXPECT_NE(readFile(root_.path() / "Chill" / "playlist.json").find("Slow songs"),
              std::string::npos);

    EXPECT_EQ(run(create), kExitFailure);
    EXPECT_NE(err_.str().find("CATALOG_ALREADY_EXISTS"), std::string::npos);
}

TEST_F(CommandsTest, RenameTrack) {
    ASSERT_EQ(run("rename-track", {"Rock", "a.mp3", "Opener"}), kExitOk);
    EXPECT_EQ(catalog_->trackDisplayName("Rock", "a.mp3"), "Opener");
}

TEST_F(CommandsTest, RefreshPicksUpNewFiles) {
    ASSERT_EQ(run("list", {}), kExitOk);
    writeFile(root_.path() / "Rock" / "c.ogg", "audio-c");

    ASSERT_EQ(run("refresh", {"Rock"}), kExitOk);
    ASSERT_EQ(run("tracks", {"Rock"}), kExitOk);
    EXPECT_NE(out_.str().find("  3. c  (c.ogg)"), std::string::npos);
}

TEST_F(CommandsTest, ExportPrintsPath) {
    ASSERT_EQ(run("export", {"Rock", "m3u"}), kExitOk);

    fs::path expected = root_.path() / "Rock" / "Rock.m3u";
    EXPECT_EQ(out_.str(), expected.string() + "\n");
    EXPECT_EQ(readFile(expected).rfind("#EXTM3U\n", 0), 0u);

    EXPECT_EQ(run("export", {"Rock", "wpl"}), kExitFailure);
    EXPECT_NE(err_.str().find("CATALOG_UNSUPPORTED_EXPORT_FORMAT"), std::string::npos);
}

TEST_F(CommandsTest, Stats) {
    ASSERT_EQ(run("stats", {"Rock"}), kExitOk);
    std::string text = out_.str();
    EXPECT_NE(text.find("tracks:   2\n"), std::string::npos);
    EXPECT_NE(text.find("(14 bytes)"), std::string::npos);
    EXPECT_NE(text.find("formats:  .mp3\n"), std::string::npos);
    EXPECT_NE(text.find("modified: -\n"), std::string::npos);
}

TEST_F(CommandsTest, RemoveCollection) {
    ASSERT_EQ(run("remove", {"Rock"}), kExitOk);
    EXPECT_FALSE(fs::exists(root_.path() / "Rock"));
    EXPECT_EQ(run("remove", {"Rock"}), kExitFailure);
}

TEST_F(CommandsTest, PlayRunsThroughCollectionOnNullDevice) {
    getGlobalSignalState().reset();

    ASSERT_EQ(run("play", {"Rock"}), kExitOk);

    std::string text = out_.str();
    size_t first = text.find("> a");
    size_t second = text.find("> b");
    ASSERT_NE(first, std::string::npos);
    ASSERT_NE(second, std::string::npos);
    EXPECT_LT(first, second);
}

TEST_F(CommandsTest, PlayUnknownCollectionFails) {
    EXPECT_EQ(run("play", {"Nope"}), kExitFailure);
    EXPECT_NE(err_.str().find("CATALOG_NOT_FOUND"), std::string::npos);
}

TEST_F(CommandsTest, PlayIndexOutOfRangeFails) {
    CliOptions options;
    options.command = "play";
    options.args = {"Rock"};
    options.index = 7;
    EXPECT_EQ(run(options), kExitFailure);
    EXPECT_NE(err_.str().find("VALIDATION_INVALID_ARGUMENT"), std::string::npos);
}

// ============================================================
// formatClock
// ============================================================

TEST(FormatClock, MinutesAndHours) {
    EXPECT_EQ(formatClock(0.0), "0:00");
    EXPECT_EQ(formatClock(65.9), "1:05");
    EXPECT_EQ(formatClock(3725.0), "1:02:05");
    EXPECT_EQ(formatClock(-3.0), "0:00");
}
