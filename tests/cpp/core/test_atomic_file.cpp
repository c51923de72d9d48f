#include "core/atomic_file.h"
#include "support/temp_dir.h"

#include <filesystem>
#include <gtest/gtest.h>

using namespace playdeck;
using playdeck::testing::TempDir;
using playdeck::testing::readFile;
using playdeck::testing::writeFile;

namespace fs = std::filesystem;

TEST(AtomicFile, WritesNewFile) {
    TempDir dir;
    fs::path target = dir.path() / "out.json";
    std::string error;

    ASSERT_TRUE(writeFileAtomically(target, "{}\n", error)) << error;
    EXPECT_EQ(readFile(target), "{}\n");
    EXPECT_FALSE(fs::exists(dir.path() / "out.json.tmp"));
}

TEST(AtomicFile, ReplacesExistingContent) {
    TempDir dir;
    fs::path target = dir.path() / "out.json";
    writeFile(target, "old content that is longer than the new one");
    std::string error;

    ASSERT_TRUE(writeFileAtomically(target, "new", error)) << error;
    EXPECT_EQ(readFile(target), "new");
}

TEST(AtomicFile, FailsWhenDirectoryIsMissing) {
    TempDir dir;
    fs::path target = dir.path() / "missing" / "out.json";
    std::string error;

    EXPECT_FALSE(writeFileAtomically(target, "data", error));
    EXPECT_FALSE(error.empty());
    EXPECT_FALSE(fs::exists(target));
}
