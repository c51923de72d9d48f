#include "catalog/descriptor_store.h"

#include "core/atomic_file.h"
#include "logging/logger.h"

#include <fstream>
#include <stdexcept>
#include <system_error>

namespace playdeck::catalog {

namespace fs = std::filesystem;

DescriptorStore::DescriptorStore(std::string fileName) : fileName_(std::move(fileName)) {}

fs::path DescriptorStore::descriptorPath(const fs::path& collectionDir) const {
    return collectionDir / fileName_;
}

fs::path DescriptorStore::backupPath(const fs::path& collectionDir) const {
    return collectionDir / (fileName_ + ".backup");
}

bool DescriptorStore::moveAside(const fs::path& path) const {
    fs::path backup = path;
    backup += ".backup";
    std::error_code ec;
    fs::rename(path, backup, ec);
    if (ec) {
        LOG_ERROR("Descriptor: failed to move {} to {}: {}", path.string(), backup.string(),
                  ec.message());
        return false;
    }
    LOG_WARN("Descriptor: {} is corrupt, moved to {}", path.string(), backup.string());
    return true;
}

DescriptorLoadResult DescriptorStore::load(const fs::path& collectionDir) const {
    DescriptorLoadResult result;
    fs::path path = descriptorPath(collectionDir);

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        result.status = DescriptorLoadStatus::Missing;
        return result;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Descriptor: cannot open {}", path.string());
        result.status = DescriptorLoadStatus::Unreadable;
        return result;
    }

    try {
        nlohmann::ordered_json j;
        file >> j;
        result.descriptor = descriptorFromJson(j);
        result.status = DescriptorLoadStatus::Loaded;
        return result;
    } catch (const nlohmann::json::exception& e) {
        LOG_DEBUG("Descriptor: parse error in {}: {}", path.string(), e.what());
    } catch (const std::invalid_argument& e) {
        LOG_DEBUG("Descriptor: unexpected layout in {}: {}", path.string(), e.what());
    }

    file.close();
    result.status =
        moveAside(path) ? DescriptorLoadStatus::Recovered : DescriptorLoadStatus::Unreadable;
    return result;
}

OpResult DescriptorStore::save(const fs::path& collectionDir, const Descriptor& descriptor) const {
    fs::path path = descriptorPath(collectionDir);

    std::string payload;
    try {
        payload = serializeDescriptor(descriptor);
    } catch (const nlohmann::json::exception& e) {
        // Invalid UTF-8 in a name makes dump() throw
        return OpResult::failure(ErrorCode::CATALOG_PERSISTENCE_ERROR,
                                 "Cannot serialize descriptor: " + std::string(e.what()));
    }

    std::string error;
    if (!writeFileAtomically(path, payload, error)) {
        LOG_ERROR("Descriptor: {}", error);
        return OpResult::failure(ErrorCode::CATALOG_PERSISTENCE_ERROR,
                                 "Cannot save descriptor: " + error);
    }
    LOG_DEBUG("Descriptor: wrote {}", path.string());
    return OpResult::success();
}

OpResult DescriptorStore::remove(const fs::path& collectionDir) const {
    fs::path path = descriptorPath(collectionDir);
    fs::path tmpPath = path;
    tmpPath += ".tmp";

    std::error_code ec;
    fs::remove(tmpPath, ec);
    ec.clear();
    fs::remove(path, ec);
    if (ec) {
        return OpResult::failure(ErrorCode::CATALOG_PERSISTENCE_ERROR,
                                 "Cannot remove " + path.string() + ": " + ec.message());
    }
    return OpResult::success();
}

}  // namespace playdeck::catalog
