#include "catalog/descriptor_store.h"
#include "support/temp_dir.h"

#include <filesystem>
#include <gtest/gtest.h>

using namespace playdeck;
using namespace playdeck::catalog;
using playdeck::testing::TempDir;
using playdeck::testing::readFile;
using playdeck::testing::writeFile;

namespace fs = std::filesystem;

class DescriptorStoreTest : public ::testing::Test {
   protected:
    TempDir dir_;
    DescriptorStore store_;

    Descriptor sample() const {
        Descriptor d;
        d.displayName = "Rock";
        d.description = "desc";
        d.created = "2024-01-01T00:00:00.000000";
        d.tracks.push_back({"a.mp3", "a", 1, "2024-01-01T00:00:00.000000", std::nullopt});
        return d;
    }
};

TEST_F(DescriptorStoreTest, MissingFile) {
    DescriptorLoadResult result = store_.load(dir_.path());
    EXPECT_EQ(result.status, DescriptorLoadStatus::Missing);
    EXPECT_FALSE(result.descriptor.has_value());
}

TEST_F(DescriptorStoreTest, SaveThenLoad) {
    ASSERT_TRUE(store_.save(dir_.path(), sample()).ok());
    EXPECT_TRUE(fs::exists(dir_.path() / "playlist.json"));
    EXPECT_FALSE(fs::exists(dir_.path() / "playlist.json.tmp"));

    DescriptorLoadResult result = store_.load(dir_.path());
    ASSERT_EQ(result.status, DescriptorLoadStatus::Loaded);
    EXPECT_EQ(result.descriptor->displayName, "Rock");
    ASSERT_EQ(result.descriptor->tracks.size(), 1u);
    EXPECT_EQ(result.descriptor->tracks[0].relativePath, "a.mp3");
}

TEST_F(DescriptorStoreTest, SaveIsByteStable) {
    ASSERT_TRUE(store_.save(dir_.path(), sample()).ok());
    std::string first = readFile(store_.descriptorPath(dir_.path()));
    ASSERT_TRUE(store_.save(dir_.path(), sample()).ok());
    EXPECT_EQ(readFile(store_.descriptorPath(dir_.path())), first);
}

TEST_F(DescriptorStoreTest, CorruptFileIsMovedToBackup) {
    writeFile(dir_.path() / "playlist.json", "{ not json");

    DescriptorLoadResult result = store_.load(dir_.path());

    EXPECT_EQ(result.status, DescriptorLoadStatus::Recovered);
    EXPECT_FALSE(fs::exists(dir_.path() / "playlist.json"));
    ASSERT_TRUE(fs::exists(store_.backupPath(dir_.path())));
    EXPECT_EQ(readFile(store_.backupPath(dir_.path())), "{ not json");
}

TEST_F(DescriptorStoreTest, WrongLayoutCountsAsCorrupt) {
    writeFile(dir_.path() / "playlist.json", R"({"tracks": ["a.mp3"]})");

    EXPECT_EQ(store_.load(dir_.path()).status, DescriptorLoadStatus::Recovered);
    EXPECT_TRUE(fs::exists(dir_.path() / "playlist.json.backup"));
}

TEST_F(DescriptorStoreTest, SaveIntoMissingDirectoryFails) {
    OpResult result = store_.save(dir_.path() / "gone", sample());
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.code, ErrorCode::CATALOG_PERSISTENCE_ERROR);
}

TEST_F(DescriptorStoreTest, CustomFileName) {
    DescriptorStore store("collection.json");
    ASSERT_TRUE(store.save(dir_.path(), sample()).ok());
    EXPECT_TRUE(fs::exists(dir_.path() / "collection.json"));
    EXPECT_EQ(store.load(dir_.path()).status, DescriptorLoadStatus::Loaded);
}

TEST_F(DescriptorStoreTest, RemoveDeletesDescriptorAndTemp) {
    ASSERT_TRUE(store_.save(dir_.path(), sample()).ok());
    writeFile(dir_.path() / "playlist.json.tmp", "partial");

    EXPECT_TRUE(store_.remove(dir_.path()).ok());
    EXPECT_FALSE(fs::exists(dir_.path() / "playlist.json"));
    EXPECT_FALSE(fs::exists(dir_.path() / "playlist.json.tmp"));
    EXPECT_TRUE(store_.remove(dir_.path()).ok());
}
