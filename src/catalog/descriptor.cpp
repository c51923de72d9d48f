#include "catalog/descriptor.h"

#include "catalog/media_formats.h"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace playdeck::catalog {

TrackEntry* Descriptor::findTrack(const std::string& relativePath) {
    auto it = std::find_if(tracks.begin(), tracks.end(), [&](const TrackEntry& t) {
        return t.relativePath == relativePath;
    });
    return it == tracks.end() ? nullptr : &*it;
}

const TrackEntry* Descriptor::findTrack(const std::string& relativePath) const {
    auto it = std::find_if(tracks.begin(), tracks.end(), [&](const TrackEntry& t) {
        return t.relativePath == relativePath;
    });
    return it == tracks.end() ? nullptr : &*it;
}

int Descriptor::maxOrder() const {
    int maxValue = 0;
    for (const auto& t : tracks) {
        maxValue = std::max(maxValue, t.order);
    }
    return maxValue;
}

nlohmann::ordered_json descriptorToJson(const Descriptor& descriptor) {
    nlohmann::ordered_json j;
    j["display_name"] = descriptor.displayName;
    j["description"] = descriptor.description;
    j["created"] = descriptor.created;
    if (descriptor.modified) {
        j["modified"] = *descriptor.modified;
    }

    nlohmann::ordered_json tracks = nlohmann::ordered_json::object();
    for (const auto& t : descriptor.tracks) {
        nlohmann::ordered_json entry;
        entry["display_name"] = t.displayName;
        entry["order"] = t.order;
        entry["added"] = t.added;
        if (t.modified) {
            entry["modified"] = *t.modified;
        }
        tracks[t.relativePath] = std::move(entry);
    }
    j["tracks"] = std::move(tracks);
    return j;
}

static std::string stringField(const nlohmann::ordered_json& obj, const char* key,
                               const std::string& fallback) {
    auto it = obj.find(key);
    if (it != obj.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return fallback;
}

static std::optional<std::string> optionalStringField(const nlohmann::ordered_json& obj,
                                                      const char* key) {
    auto it = obj.find(key);
    if (it != obj.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return std::nullopt;
}

// Orders must be >= 1 and fit in an int; anything else reads as missing
static int orderField(const nlohmann::ordered_json& info) {
    auto it = info.find("order");
    if (it == info.end() || !it->is_number_integer()) {
        return kMissingOrder;
    }
    if (it->is_number_unsigned()) {
        auto value = it->get<uint64_t>();
        return value >= 1 && value <= static_cast<uint64_t>(std::numeric_limits<int>::max())
                   ? static_cast<int>(value)
                   : kMissingOrder;
    }
    auto value = it->get<int64_t>();
    return value >= 1 && value <= std::numeric_limits<int>::max() ? static_cast<int>(value)
                                                                   : kMissingOrder;
}

Descriptor descriptorFromJson(const nlohmann::ordered_json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("descriptor must be a JSON object");
    }

    Descriptor d;
    d.displayName = stringField(j, "display_name", "");
    d.description = stringField(j, "description", "");
    d.created = stringField(j, "created", "");
    d.modified = optionalStringField(j, "modified");

    auto tracksIt = j.find("tracks");
    if (tracksIt == j.end() || tracksIt->is_null()) {
        return d;
    }
    if (!tracksIt->is_object()) {
        throw std::invalid_argument("descriptor \"tracks\" must be an object");
    }

    for (auto it = tracksIt->begin(); it != tracksIt->end(); ++it) {
        TrackEntry entry;
        entry.relativePath = it.key();
        const auto& info = it.value();
        if (!info.is_object()) {
            throw std::invalid_argument("track entry for '" + it.key() + "' must be an object");
        }
        entry.displayName = stringField(info, "display_name", fileStem(entry.relativePath));
        entry.order = orderField(info);
        entry.added = stringField(info, "added", "");
        entry.modified = optionalStringField(info, "modified");
        d.tracks.push_back(std::move(entry));
    }
    return d;
}

std::string serializeDescriptor(const Descriptor& descriptor) {
    // ensure_ascii=false equivalent: nlohmann emits UTF-8 unchanged by default
    return descriptorToJson(descriptor).dump(2) + "\n";
}

}  // namespace playdeck::catalog
