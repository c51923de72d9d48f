#include "catalog/descriptor.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace playdeck::catalog;
using json = nlohmann::ordered_json;

TEST(Descriptor, ParsesFullDocument) {
    json j = json::parse(R"({
        "display_name": "Rock",
        "description": "Loud",
        "created": "2024-01-01T10:00:00.000000",
        "modified": "2024-01-02T10:00:00.000000",
        "tracks": {
            "b.mp3": {"display_name": "Bee", "order": 2, "added": "t1"},
            "a.mp3": {"display_name": "Ay", "order": 1, "added": "t2", "modified": "t3"}
        }
    })");

    Descriptor d = descriptorFromJson(j);

    EXPECT_EQ(d.displayName, "Rock");
    EXPECT_EQ(d.description, "Loud");
    ASSERT_TRUE(d.modified.has_value());
    ASSERT_EQ(d.tracks.size(), 2u);
    // Insertion order of the document is kept
    EXPECT_EQ(d.tracks[0].relativePath, "b.mp3");
    EXPECT_EQ(d.tracks[0].order, 2);
    EXPECT_EQ(d.tracks[1].displayName, "Ay");
    EXPECT_EQ(d.tracks[1].modified.value_or(""), "t3");
    EXPECT_EQ(d.maxOrder(), 2);
}

TEST(Descriptor, MissingFieldsGetDefaults) {
    json j = json::parse(R"({"tracks": {"sub/Intro.flac": {}, "x.mp3": {"order": "first"}}})");

    Descriptor d = descriptorFromJson(j);

    EXPECT_EQ(d.displayName, "");
    EXPECT_FALSE(d.modified.has_value());
    ASSERT_EQ(d.tracks.size(), 2u);
    EXPECT_EQ(d.tracks[0].displayName, "Intro");
    EXPECT_EQ(d.tracks[0].order, kMissingOrder);
    EXPECT_EQ(d.tracks[1].order, kMissingOrder);
}

TEST(Descriptor, OutOfRangeOrdersReadAsMissing) {
    json j = json::parse(R"({"tracks": {
        "zero.mp3": {"order": 0},
        "negative.mp3": {"order": -4},
        "huge.mp3": {"order": 4294967297},
        "very_negative.mp3": {"order": -4294967297},
        "float.mp3": {"order": 2.5},
        "max.mp3": {"order": 2147483647},
        "one.mp3": {"order": 1}
    }})");

    Descriptor d = descriptorFromJson(j);

    ASSERT_EQ(d.tracks.size(), 7u);
    EXPECT_EQ(d.findTrack("zero.mp3")->order, kMissingOrder);
    EXPECT_EQ(d.findTrack("negative.mp3")->order, kMissingOrder);
    EXPECT_EQ(d.findTrack("huge.mp3")->order, kMissingOrder);
    EXPECT_EQ(d.findTrack("very_negative.mp3")->order, kMissingOrder);
    EXPECT_EQ(d.findTrack("float.mp3")->order, kMissingOrder);
    EXPECT_EQ(d.findTrack("max.mp3")->order, 2147483647);
    EXPECT_EQ(d.findTrack("one.mp3")->order, 1);
}

TEST(Descriptor, RejectsWrongShapes) {
    EXPECT_THROW(descriptorFromJson(json::parse("[]")), std::invalid_argument);
    EXPECT_THROW(descriptorFromJson(json::parse(R"({"tracks": []})")), std::invalid_argument);
    EXPECT_THROW(descriptorFromJson(json::parse(R"({"tracks": {"a.mp3": 3}})")),
                 std::invalid_argument);
}

TEST(Descriptor, SerializeUsesFixedKeyOrder) {
    Descriptor d;
    d.displayName = "Jazz";
    d.description = "";
    d.created = "c";
    d.tracks.push_back({"a.mp3", "A", 1, "t", std::nullopt});

    std::string text = serializeDescriptor(d);

    EXPECT_LT(text.find("\"display_name\""), text.find("\"description\""));
    EXPECT_LT(text.find("\"created\""), text.find("\"tracks\""));
    EXPECT_EQ(text.find("\"modified\""), std::string::npos);
    EXPECT_EQ(text.back(), '\n');
    EXPECT_NE(text.find("\n  \"tracks\""), std::string::npos);
}

TEST(Descriptor, FindTrack) {
    Descriptor d;
    d.tracks.push_back({"a.mp3", "A", 1, "t", std::nullopt});

    ASSERT_NE(d.findTrack("a.mp3"), nullptr);
    d.findTrack("a.mp3")->order = 5;
    EXPECT_EQ(d.maxOrder(), 5);
    EXPECT_EQ(d.findTrack("b.mp3"), nullptr);
    EXPECT_EQ(Descriptor{}.maxOrder(), 0);
}
