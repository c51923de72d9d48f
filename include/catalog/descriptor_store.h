#pragma once

#include "catalog/descriptor.h"
#include "core/error_codes.h"

#include <filesystem>
#include <optional>
#include <string>

namespace playdeck::catalog {

enum class DescriptorLoadStatus {
    Loaded,     // parsed successfully
    Missing,    // no descriptor file in the directory
    Recovered,  // file was corrupt and has been moved to <name>.backup
    Unreadable  // file exists but could not be opened or moved aside
};

struct DescriptorLoadResult {
    DescriptorLoadStatus status = DescriptorLoadStatus::Missing;
    std::optional<Descriptor> descriptor;  // set only for Loaded
};

/**
 * @brief Reads and writes the JSON descriptor of a collection directory.
 *
 * Writes go to "<name>.tmp" next to the descriptor and are renamed over it,
 * so a crash mid-write leaves the previous file intact.
 */
class DescriptorStore {
   public:
    explicit DescriptorStore(std::string fileName = "playlist.json");

    DescriptorLoadResult load(const std::filesystem::path& collectionDir) const;
    OpResult save(const std::filesystem::path& collectionDir, const Descriptor& descriptor) const;

    // Deletes the descriptor and its leftover .tmp file; a missing file is not an error
    OpResult remove(const std::filesystem::path& collectionDir) const;

    std::filesystem::path descriptorPath(const std::filesystem::path& collectionDir) const;
    std::filesystem::path backupPath(const std::filesystem::path& collectionDir) const;

    const std::string& fileName() const {
        return fileName_;
    }

   private:
    bool moveAside(const std::filesystem::path& path) const;

    std::string fileName_;
};

}  // namespace playdeck::catalog
