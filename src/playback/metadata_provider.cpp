#include "playback/metadata_provider.h"

#include "logging/logger.h"

#include <algorithm>
#include <exception>
#include <sndfile.h>
#include <system_error>

namespace playdeck::playback {

namespace fs = std::filesystem;

std::optional<TrackMetadata> SndfileMetadataProvider::read(const fs::path& path) const {
    SF_INFO info{};
    SNDFILE* file = sf_open(path.c_str(), SFM_READ, &info);
    if (!file) {
        LOG_DEBUG("sndfile cannot read {}: {}", path.string(), sf_strerror(nullptr));
        return std::nullopt;
    }

    TrackMetadata meta;
    if (info.samplerate > 0 && info.frames > 0) {
        meta.durationSeconds = static_cast<double>(info.frames) / info.samplerate;
    }
    const char* title = sf_get_string(file, SF_STR_TITLE);
    if (title && *title) {
        meta.title = title;
    }
    sf_close(file);
    return meta;
}

FileSizeEstimateProvider::FileSizeEstimateProvider(int nominalBitrateKbps, double maxSeconds)
    : nominalBitrateKbps_(nominalBitrateKbps), maxSeconds_(maxSeconds) {}

std::optional<TrackMetadata> FileSizeEstimateProvider::read(const fs::path& path) const {
    if (nominalBitrateKbps_ <= 0) {
        return std::nullopt;
    }
    std::error_code ec;
    std::uintmax_t bytes = fs::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    double bytesPerSecond = nominalBitrateKbps_ * 1024.0 / 8.0;
    TrackMetadata meta;
    meta.durationSeconds = std::min(static_cast<double>(bytes) / bytesPerSecond, maxSeconds_);
    return meta;
}

MetadataResolver::MetadataResolver(double fallbackDurationSeconds)
    : fallbackDurationSeconds_(fallbackDurationSeconds) {}

void MetadataResolver::addProvider(std::unique_ptr<MetadataProvider> provider) {
    if (provider) {
        providers_.push_back(std::move(provider));
    }
}

ResolvedMetadata MetadataResolver::resolve(const fs::path& path) const {
    ResolvedMetadata result;
    std::optional<double> duration;

    for (const auto& provider : providers_) {
        std::optional<TrackMetadata> meta;
        try {
            meta = provider->read(path);
        } catch (const std::exception& e) {
            LOG_DEBUG("Metadata provider {} failed for {}: {}", provider->name(), path.string(),
                      e.what());
            continue;
        }
        if (!meta) {
            continue;
        }
        if (result.title.empty() && meta->title) {
            result.title = *meta->title;
        }
        if (meta->durationSeconds && *meta->durationSeconds >= 0.0) {
            duration = meta->durationSeconds;
            LOG_DEBUG("Metadata: {} -> {:.2f}s via {}", path.filename().string(), *duration,
                      provider->name());
            break;
        }
    }

    result.durationSeconds = duration.value_or(fallbackDurationSeconds_);
    if (result.title.empty()) {
        result.title = path.stem().string();
    }
    return result;
}

MetadataResolver MetadataResolver::createDefault(const AppConfig::MetadataConfig& config) {
    MetadataResolver resolver(config.defaultDurationSeconds);
    resolver.addProvider(std::make_unique<SndfileMetadataProvider>());
    resolver.addProvider(std::make_unique<FileSizeEstimateProvider>(config.nominalBitrateKbps,
                                                                    config.maxEstimatedSeconds));
    return resolver;
}

}  // namespace playdeck::playback
