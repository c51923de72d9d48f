#include "catalog/catalog.h"

#include "catalog/playlist_export.h"
#include "core/atomic_file.h"
#include "core/timestamp.h"
#include "logging/logger.h"

#include <algorithm>
#include <cmath>
#include <set>
#include <system_error>
#include <unordered_set>

namespace playdeck::catalog {

namespace fs = std::filesystem;

Catalog::Catalog(fs::path rootDir, std::string descriptorFileName, MediaFormats formats)
    : rootDir_(std::move(rootDir)),
      store_(std::move(descriptorFileName)),
      formats_(std::move(formats)) {
    std::error_code ec;
    fs::create_directories(rootDir_, ec);
    if (ec) {
        LOG_WARN("Catalog: cannot create library root {}: {}", rootDir_.string(), ec.message());
    }
}

bool Catalog::isValidCollectionId(const std::string& id) {
    if (id.empty() || id == "." || id == "..") {
        return false;
    }
    return id.find_first_of(std::string("/\\\0", 3)) == std::string::npos;
}

fs::path Catalog::collectionDir(const std::string& id) const {
    return rootDir_ / id;
}

OpResult Catalog::checkCollection(const std::string& id) const {
    std::error_code ec;
    if (!isValidCollectionId(id) || !fs::is_directory(collectionDir(id), ec)) {
        return OpResult::failure(ErrorCode::CATALOG_NOT_FOUND, "Collection not found: " + id);
    }
    return OpResult::success();
}

Descriptor Catalog::generateDescriptor(const fs::path& dir, const std::string& id) const {
    Descriptor d;
    d.displayName = id;
    d.description = "Auto-generated playlist for " + id;
    d.created = nowIso8601();

    int order = 1;
    for (const auto& relative : scanMediaFiles(dir, formats_)) {
        TrackEntry entry;
        entry.relativePath = relative;
        entry.displayName = fileStem(relative);
        entry.order = order++;
        entry.added = nowIso8601();
        d.tracks.push_back(std::move(entry));
    }
    return d;
}

// Caller holds mutex_
OpResult Catalog::loadDescriptor(const std::string& id, Descriptor& out) {
    OpResult check = checkCollection(id);
    if (!check.ok()) {
        return check;
    }

    fs::path dir = collectionDir(id);
    DescriptorLoadResult loaded = store_.load(dir);
    switch (loaded.status) {
    case DescriptorLoadStatus::Loaded:
        out = std::move(*loaded.descriptor);
        return OpResult::success();

    case DescriptorLoadStatus::Unreadable:
        // Keep the file in place; work from a scan until a mutation overwrites it
        LOG_WARN("Catalog: descriptor of '{}' unreadable, using directory scan", id);
        out = generateDescriptor(dir, id);
        return OpResult::success();

    case DescriptorLoadStatus::Recovered:
    case DescriptorLoadStatus::Missing:
    default:
        break;
    }

    out = generateDescriptor(dir, id);
    OpResult saved = store_.save(dir, out);
    if (!saved.ok()) {
        LOG_WARN("Catalog: could not persist generated descriptor for '{}': {}", id,
                 saved.message);
    } else {
        LOG_INFO("Catalog: generated descriptor for '{}' ({} tracks)", id, out.tracks.size());
    }
    return OpResult::success();
}

std::vector<TrackView> Catalog::existingTracks(const std::string& id, const Descriptor& d) const {
    fs::path dir = collectionDir(id);
    std::vector<TrackView> views;
    views.reserve(d.tracks.size());
    for (const auto& entry : d.tracks) {
        fs::path absolute = dir / fs::path(entry.relativePath);
        std::error_code ec;
        if (!fs::exists(absolute, ec)) {
            continue;
        }
        views.push_back({entry.relativePath, absolute, entry.displayName, entry.order});
    }
    std::stable_sort(views.begin(), views.end(),
                     [](const TrackView& a, const TrackView& b) { return a.order < b.order; });
    return views;
}

std::vector<CollectionInfo> Catalog::listCollections() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> ids;
    std::error_code ec;
    for (fs::directory_iterator it(rootDir_, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code typeEc;
        if (it->is_directory(typeEc)) {
            ids.push_back(it->path().filename().string());
        }
    }
    if (ec) {
        LOG_WARN("Catalog: cannot list {}: {}", rootDir_.string(), ec.message());
    }
    std::sort(ids.begin(), ids.end());

    std::vector<CollectionInfo> result;
    result.reserve(ids.size());
    for (const auto& id : ids) {
        Descriptor d;
        if (!loadDescriptor(id, d).ok()) {
            continue;
        }
        size_t count = existingTracks(id, d).size();
        result.push_back({id, std::move(d), count});
    }
    return result;
}

TrackListResult Catalog::getTracks(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    TrackListResult result;
    Descriptor d;
    result.status = loadDescriptor(id, d);
    if (result.ok()) {
        result.tracks = existingTracks(id, d);
    }
    return result;
}

OpResult Catalog::refresh(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Descriptor d;
    OpResult loaded = loadDescriptor(id, d);
    if (!loaded.ok()) {
        return loaded;
    }

    fs::path dir = collectionDir(id);
    std::vector<std::string> onDisk = scanMediaFiles(dir, formats_);
    std::unordered_set<std::string> onDiskSet(onDisk.begin(), onDisk.end());

    size_t before = d.tracks.size();
    d.tracks.erase(std::remove_if(d.tracks.begin(), d.tracks.end(),
                                  [&](const TrackEntry& t) {
                                      return onDiskSet.count(t.relativePath) == 0;
                                  }),
                   d.tracks.end());
    size_t removed = before - d.tracks.size();

    int nextOrder = d.maxOrder() + 1;
    size_t added = 0;
    for (const auto& relative : onDisk) {
        if (d.findTrack(relative) != nullptr) {
            continue;
        }
        TrackEntry entry;
        entry.relativePath = relative;
        entry.displayName = fileStem(relative);
        entry.order = nextOrder++;
        entry.added = nowIso8601();
        d.tracks.push_back(std::move(entry));
        ++added;
    }

    if (added == 0 && removed == 0) {
        LOG_DEBUG("Catalog: '{}' already up to date", id);
        return OpResult::success();
    }

    d.modified = nowIso8601();
    OpResult saved = store_.save(dir, d);
    if (saved.ok()) {
        LOG_INFO("Catalog: refreshed '{}' (+{} / -{})", id, added, removed);
    }
    return saved;
}

OpResult Catalog::reorder(const std::string& id, const std::vector<std::string>& orderedPaths) {
    std::lock_guard<std::mutex> lock(mutex_);
    Descriptor d;
    OpResult loaded = loadDescriptor(id, d);
    if (!loaded.ok()) {
        return loaded;
    }

    int index = 1;
    for (const auto& path : orderedPaths) {
        if (TrackEntry* entry = d.findTrack(path)) {
            entry->order = index;
        } else {
            LOG_DEBUG("Catalog: reorder of '{}' ignores unknown path {}", id, path);
        }
        ++index;
    }

    d.modified = nowIso8601();
    return store_.save(collectionDir(id), d);
}

OpResult Catalog::createCollection(const std::string& id,
                                   const std::optional<std::string>& displayName,
                                   const std::optional<std::string>& description) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!isValidCollectionId(id)) {
        return OpResult::failure(ErrorCode::CATALOG_INVALID_NAME,
                                 "Invalid collection name: '" + id + "'");
    }

    fs::path dir = collectionDir(id);
    std::error_code ec;
    if (fs::exists(dir, ec)) {
        return OpResult::failure(ErrorCode::CATALOG_ALREADY_EXISTS,
                                 "Collection already exists: " + id);
    }
    if (!fs::create_directory(dir, ec) || ec) {
        return OpResult::failure(ErrorCode::CATALOG_PERSISTENCE_ERROR,
                                 "Cannot create " + dir.string() + ": " + ec.message());
    }

    Descriptor d;
    d.displayName = displayName.value_or(id);
    if (d.displayName.empty()) {
        d.displayName = id;
    }
    d.description = description.value_or("");
    d.created = nowIso8601();

    OpResult saved = store_.save(dir, d);
    if (!saved.ok()) {
        fs::remove_all(dir, ec);
        return saved;
    }
    LOG_INFO("Catalog: created collection '{}'", id);
    return OpResult::success();
}

OpResult Catalog::updateMetadata(const std::string& id, const CollectionFields& fields) {
    std::lock_guard<std::mutex> lock(mutex_);
    Descriptor d;
    OpResult loaded = loadDescriptor(id, d);
    if (!loaded.ok()) {
        return loaded;
    }

    if (fields.displayName) {
        d.displayName = *fields.displayName;
    }
    if (fields.description) {
        d.description = *fields.description;
    }
    d.modified = nowIso8601();
    return store_.save(collectionDir(id), d);
}

OpResult Catalog::updateTrack(const std::string& id, const std::string& relativePath,
                              const TrackFields& fields) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fields.order && *fields.order < 1) {
        return OpResult::failure(ErrorCode::VALIDATION_INVALID_ARGUMENT,
                                 "Track order must be >= 1");
    }

    Descriptor d;
    OpResult loaded = loadDescriptor(id, d);
    if (!loaded.ok()) {
        return loaded;
    }

    fs::path dir = collectionDir(id);
    TrackEntry* entry = d.findTrack(relativePath);
    if (entry == nullptr) {
        fs::path absolute = dir / fs::path(relativePath);
        std::error_code ec;
        if (!fs::is_regular_file(absolute, ec) || !formats_.isSupported(absolute)) {
            return OpResult::failure(ErrorCode::CATALOG_NOT_FOUND,
                                     "Track not found in '" + id + "': " + relativePath);
        }
        TrackEntry added;
        added.relativePath = relativePath;
        added.displayName = fileStem(relativePath);
        added.order = static_cast<int>(d.tracks.size()) + 1;
        added.added = nowIso8601();
        d.tracks.push_back(std::move(added));
        entry = &d.tracks.back();
    }

    if (fields.displayName) {
        entry->displayName = *fields.displayName;
    }
    if (fields.order) {
        entry->order = *fields.order;
    }
    std::string now = nowIso8601();
    entry->modified = now;
    d.modified = now;
    return store_.save(dir, d);
}

ExportResult Catalog::exportCollection(const std::string& id, const std::string& format) {
    ExportResult result;
    std::optional<ExportFormat> parsed = parseExportFormat(format);
    if (!parsed) {
        result.status = OpResult::failure(ErrorCode::CATALOG_UNSUPPORTED_EXPORT_FORMAT,
                                          "Unsupported export format: " + format);
        return result;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Descriptor d;
    result.status = loadDescriptor(id, d);
    if (!result.ok()) {
        return result;
    }

    std::vector<TrackView> tracks = existingTracks(id, d);
    if (tracks.empty()) {
        result.status = OpResult::failure(ErrorCode::CATALOG_EMPTY_COLLECTION,
                                          "Collection '" + id + "' has no tracks");
        return result;
    }

    std::vector<ExportEntry> entries;
    entries.reserve(tracks.size());
    for (const auto& t : tracks) {
        std::error_code ec;
        fs::path absolute = fs::absolute(t.absolutePath, ec);
        entries.push_back({(ec ? t.absolutePath : absolute).string(), t.displayName});
    }

    fs::path path = collectionDir(id) / (id + "." + exportFormatExtension(*parsed));
    std::string error;
    if (!writeFileAtomically(path, renderPlaylist(*parsed, entries), error)) {
        result.status = OpResult::failure(ErrorCode::CATALOG_PERSISTENCE_ERROR,
                                          "Export failed: " + error);
        return result;
    }
    LOG_INFO("Catalog: exported '{}' to {}", id, path.string());
    result.path = path;
    return result;
}

StatsResult Catalog::stats(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    StatsResult result;
    Descriptor d;
    result.status = loadDescriptor(id, d);
    if (!result.ok()) {
        return result;
    }

    std::vector<TrackView> tracks = existingTracks(id, d);
    std::set<std::string> formats;
    for (const auto& t : tracks) {
        std::error_code ec;
        std::uintmax_t size = fs::file_size(t.absolutePath, ec);
        if (ec) {
            continue;
        }
        result.stats.totalBytes += size;
        formats.insert(toLowerAscii(t.absolutePath.extension().string()));
    }
    result.stats.trackCount = tracks.size();
    result.stats.totalMegabytes =
        std::round(static_cast<double>(result.stats.totalBytes) / (1024.0 * 1024.0) * 100.0) /
        100.0;
    result.stats.formats.assign(formats.begin(), formats.end());
    result.stats.created = d.created;
    result.stats.modified = d.modified;
    return result;
}

OpResult Catalog::removeCollection(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    OpResult check = checkCollection(id);
    if (!check.ok()) {
        return check;
    }

    fs::path dir = collectionDir(id);
    OpResult removed = store_.remove(dir);
    if (!removed.ok()) {
        return removed;
    }
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        return OpResult::failure(ErrorCode::CATALOG_PERSISTENCE_ERROR,
                                 "Cannot remove " + dir.string() + ": " + ec.message());
    }
    LOG_INFO("Catalog: removed collection '{}'", id);
    return OpResult::success();
}

std::string Catalog::collectionDisplayName(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Descriptor d;
    if (loadDescriptor(id, d).ok() && !d.displayName.empty()) {
        return d.displayName;
    }
    return id;
}

std::string Catalog::trackDisplayName(const std::string& id, const std::string& relativePath) {
    std::lock_guard<std::mutex> lock(mutex_);
    Descriptor d;
    if (loadDescriptor(id, d).ok()) {
        if (const TrackEntry* entry = d.findTrack(relativePath)) {
            if (!entry->displayName.empty()) {
                return entry->displayName;
            }
        }
    }
    return fileStem(relativePath);
}

}  // namespace playdeck::catalog
