#pragma once

#include "catalog/descriptor.h"
#include "catalog/descriptor_store.h"
#include "catalog/media_formats.h"
#include "core/error_codes.h"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace playdeck::catalog {

// A playable track of a collection, as handed to the playback engine
struct TrackView {
    std::string relativePath;
    std::filesystem::path absolutePath;
    std::string displayName;
    int order = 0;
};

struct CollectionInfo {
    std::string id;  // directory name
    Descriptor descriptor;
    size_t trackCount = 0;  // entries whose files exist
};

struct TrackListResult {
    OpResult status;
    std::vector<TrackView> tracks;

    bool ok() const {
        return status.ok();
    }
};

struct ExportResult {
    OpResult status;
    std::filesystem::path path;

    bool ok() const {
        return status.ok();
    }
};

struct CollectionStats {
    size_t trackCount = 0;
    std::uintmax_t totalBytes = 0;
    double totalMegabytes = 0.0;   // rounded to 2 decimals
    std::vector<std::string> formats;  // lowercase extensions, sorted
    std::string created;
    std::optional<std::string> modified;
};

struct StatsResult {
    OpResult status;
    CollectionStats stats;

    bool ok() const {
        return status.ok();
    }
};

// Fields accepted by updateMetadata; unset fields are left as they are
struct CollectionFields {
    std::optional<std::string> displayName;
    std::optional<std::string> description;
};

struct TrackFields {
    std::optional<std::string> displayName;
    std::optional<int> order;
};

/**
 * @brief File-backed catalog of collections below a library root.
 *
 * Each subdirectory of the root is a collection; its descriptor records track
 * names and order. Directories without a (valid) descriptor get one generated
 * from the media files found. All operations serialize on one mutex and report
 * failures through OpResult; none of them throws.
 */
class Catalog {
   public:
    explicit Catalog(std::filesystem::path rootDir,
                     std::string descriptorFileName = "playlist.json",
                     MediaFormats formats = MediaFormats());

    Catalog(const Catalog&) = delete;
    Catalog& operator=(const Catalog&) = delete;

    // Sorted by id. Missing or corrupt descriptors are regenerated on the way.
    std::vector<CollectionInfo> listCollections();

    /**
     * @brief Tracks ordered by "order", ties by descriptor insertion sequence.
     *
     * Entries whose files are gone are skipped without touching the descriptor.
     */
    TrackListResult getTracks(const std::string& id);

    /**
     * @brief Reconcile the descriptor with the files on disk.
     *
     * New files are appended after the current highest order (in scan order),
     * entries for vanished files are dropped. Nothing is written when the
     * descriptor already matches.
     */
    OpResult refresh(const std::string& id);

    /**
     * @brief Assign order = index + 1 to each listed path.
     *
     * Paths not in the descriptor are ignored; unlisted entries keep their
     * order value.
     */
    OpResult reorder(const std::string& id, const std::vector<std::string>& orderedPaths);

    OpResult createCollection(const std::string& id,
                              const std::optional<std::string>& displayName = std::nullopt,
                              const std::optional<std::string>& description = std::nullopt);

    OpResult updateMetadata(const std::string& id, const CollectionFields& fields);

    /**
     * @brief Rename or re-position a single track.
     *
     * A supported file that exists on disk but is not in the descriptor yet is
     * added first, at the end of the list.
     */
    OpResult updateTrack(const std::string& id, const std::string& relativePath,
                         const TrackFields& fields);

    // Writes <collection>/<id>.<format> ("m3u" or "pls")
    ExportResult exportCollection(const std::string& id, const std::string& format);

    StatsResult stats(const std::string& id);

    // Deletes the collection directory including its media files
    OpResult removeCollection(const std::string& id);

    // Falls back to the id
    std::string collectionDisplayName(const std::string& id);
    // Falls back to the file stem
    std::string trackDisplayName(const std::string& id, const std::string& relativePath);

    const std::filesystem::path& rootDir() const {
        return rootDir_;
    }
    const MediaFormats& formats() const {
        return formats_;
    }

    static bool isValidCollectionId(const std::string& id);

   private:
    std::filesystem::path collectionDir(const std::string& id) const;
    OpResult checkCollection(const std::string& id) const;
    Descriptor generateDescriptor(const std::filesystem::path& dir, const std::string& id) const;
    OpResult loadDescriptor(const std::string& id, Descriptor& out);
    std::vector<TrackView> existingTracks(const std::string& id, const Descriptor& d) const;

    std::filesystem::path rootDir_;
    DescriptorStore store_;
    MediaFormats formats_;
    std::mutex mutex_;
};

}  // namespace playdeck::catalog
