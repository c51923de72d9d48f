#include "catalog/media_formats.h"
#include "support/temp_dir.h"

#include <gtest/gtest.h>

using namespace playdeck::catalog;
using playdeck::testing::TempDir;
using playdeck::testing::writeFile;

// ============================================================
// MediaFormats
// ============================================================

TEST(MediaFormats, DefaultsAreCaseInsensitive) {
    MediaFormats formats;
    EXPECT_TRUE(formats.isSupported("song.mp3"));
    EXPECT_TRUE(formats.isSupported("SONG.MP3"));
    EXPECT_TRUE(formats.isSupported("dir/take.Flac"));
    EXPECT_TRUE(formats.isSupported("x.aiff"));
    EXPECT_TRUE(formats.isSupported("x.wma"));
    EXPECT_FALSE(formats.isSupported("notes.txt"));
    EXPECT_FALSE(formats.isSupported("playlist.json"));
    EXPECT_FALSE(formats.isSupported("noext"));
}

TEST(MediaFormats, ExtrasAreNormalizedAndDeduplicated) {
    MediaFormats formats({"M4A", ".opus", ".mp3"});
    EXPECT_TRUE(formats.isSupported("a.m4a"));
    EXPECT_TRUE(formats.isSupported("a.OPUS"));

    size_t mp3Count = 0;
    for (const auto& ext : formats.extensions()) {
        if (ext == ".mp3") {
            ++mp3Count;
        }
    }
    EXPECT_EQ(mp3Count, 1u);
    EXPECT_EQ(formats.extensions().size(), MediaFormats::defaultExtensions().size() + 2);
}

TEST(MediaFormats, FileStem) {
    EXPECT_EQ(fileStem("a.mp3"), "a");
    EXPECT_EQ(fileStem("disc1/Intro.flac"), "Intro");
    EXPECT_EQ(fileStem("live.2001.wav"), "live.2001");
}

// ============================================================
// scanMediaFiles
// ============================================================

TEST(ScanMediaFiles, FindsSupportedFilesRecursively) {
    TempDir dir;
    writeFile(dir.path() / "b.mp3", "b");
    writeFile(dir.path() / "A.wav", "a");
    writeFile(dir.path() / "cover.jpg", "x");
    writeFile(dir.path() / "playlist.json", "{}");
    writeFile(dir.path() / "disc2" / "c.ogg", "c");

    auto files = scanMediaFiles(dir.path(), MediaFormats());

    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0], "A.wav");
    EXPECT_EQ(files[1], "b.mp3");
    EXPECT_EQ(files[2], "disc2/c.ogg");
}

TEST(ScanMediaFiles, SameNameOrderedByPath) {
    TempDir dir;
    writeFile(dir.path() / "z" / "track.mp3", "1");
    writeFile(dir.path() / "a" / "track.mp3", "2");

    auto files = scanMediaFiles(dir.path(), MediaFormats());

    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0], "a/track.mp3");
    EXPECT_EQ(files[1], "z/track.mp3");
}

TEST(ScanMediaFiles, MissingDirectoryYieldsEmpty) {
    TempDir dir;
    EXPECT_TRUE(scanMediaFiles(dir.path() / "nope", MediaFormats()).empty());
}
