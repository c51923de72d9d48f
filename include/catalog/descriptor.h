#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace playdeck::catalog {

// One track reference inside a collection descriptor.
struct TrackEntry {
    std::string relativePath;  // key in the "tracks" object
    std::string displayName;
    int order = 1;
    std::string added;
    std::optional<std::string> modified;
};

/**
 * @brief Persisted metadata of one collection (the playlist.json content).
 *
 * Track entries keep the order in which they were inserted; this order breaks
 * ties between equal "order" values.
 */
struct Descriptor {
    std::string displayName;
    std::string description;
    std::string created;
    std::optional<std::string> modified;
    std::vector<TrackEntry> tracks;

    TrackEntry* findTrack(const std::string& relativePath);
    const TrackEntry* findTrack(const std::string& relativePath) const;

    // Largest order value in use, 0 when there are no tracks
    int maxOrder() const;
};

// Order assumed for entries that carry no usable "order" field
constexpr int kMissingOrder = 999;

nlohmann::ordered_json descriptorToJson(const Descriptor& descriptor);

/**
 * @brief Build a Descriptor from parsed JSON.
 *
 * Throws std::invalid_argument if the document is not an object or "tracks"
 * is present but not an object. Missing fields get defaults: display names
 * fall back to the file stem, orders to kMissingOrder.
 */
Descriptor descriptorFromJson(const nlohmann::ordered_json& j);

// Pretty-printed document as written to disk (2-space indent, trailing newline)
std::string serializeDescriptor(const Descriptor& descriptor);

}  // namespace playdeck::catalog
