#include "catalog/media_formats.h"

#include "core/config_loader.h"
#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <utility>

namespace playdeck::catalog {

namespace fs = std::filesystem;

const std::vector<std::string>& MediaFormats::defaultExtensions() {
    // .agg and .aif are accepted alongside the common set for older libraries
    static const std::vector<std::string> kDefaults = {".mp3",  ".wav", ".ogg", ".flac",
                                                       ".aiff", ".wma", ".agg", ".aif"};
    return kDefaults;
}

MediaFormats::MediaFormats() : extensions_(defaultExtensions()) {}

MediaFormats::MediaFormats(const std::vector<std::string>& extraExtensions)
    : extensions_(defaultExtensions()) {
    for (const auto& ext : extraExtensions) {
        add(ext);
    }
}

void MediaFormats::add(const std::string& ext) {
    std::string normalized = normalizeExtension(ext);
    if (normalized.empty()) {
        return;
    }
    if (std::find(extensions_.begin(), extensions_.end(), normalized) == extensions_.end()) {
        extensions_.push_back(normalized);
    }
}

bool MediaFormats::isSupported(const fs::path& path) const {
    std::string ext = toLowerAscii(path.extension().string());
    if (ext.empty()) {
        return false;
    }
    return std::find(extensions_.begin(), extensions_.end(), ext) != extensions_.end();
}

std::string toLowerAscii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string fileStem(const std::string& relativePath) {
    return fs::path(relativePath).stem().string();
}

std::vector<std::string> scanMediaFiles(const fs::path& dir, const MediaFormats& formats) {
    struct Found {
        std::string sortName;
        std::string sortPath;
        std::string relative;
    };
    std::vector<Found> found;

    std::error_code ec;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        LOG_WARN("Cannot scan {}: {}", dir.string(), ec.message());
        return {};
    }

    for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            LOG_WARN("Scan of {} stopped early: {}", dir.string(), ec.message());
            break;
        }
        std::error_code typeEc;
        if (!it->is_regular_file(typeEc) || typeEc) {
            continue;
        }
        const fs::path& path = it->path();
        if (!formats.isSupported(path)) {
            continue;
        }
        std::string relative = path.lexically_relative(dir).generic_string();
        found.push_back({toLowerAscii(path.filename().string()), toLowerAscii(relative),
                         std::move(relative)});
    }

    std::sort(found.begin(), found.end(), [](const Found& a, const Found& b) {
        if (a.sortName != b.sortName) {
            return a.sortName < b.sortName;
        }
        return a.sortPath < b.sortPath;
    });

    std::vector<std::string> result;
    result.reserve(found.size());
    for (auto& f : found) {
        result.push_back(std::move(f.relative));
    }
    return result;
}

}  // namespace playdeck::catalog
