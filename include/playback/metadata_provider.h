#pragma once

#include "core/config_loader.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace playdeck::playback {

struct TrackMetadata {
    std::optional<std::string> title;
    std::optional<double> durationSeconds;
};

// One source of track metadata; returns nullopt if it cannot read the file
class MetadataProvider {
   public:
    virtual ~MetadataProvider() = default;

    virtual std::optional<TrackMetadata> read(const std::filesystem::path& path) const = 0;
    virtual const char* name() const = 0;
};

// Exact duration (frames / samplerate) and title tag for formats libsndfile decodes
class SndfileMetadataProvider : public MetadataProvider {
   public:
    std::optional<TrackMetadata> read(const std::filesystem::path& path) const override;
    const char* name() const override {
        return "sndfile";
    }
};

/**
 * @brief Duration guessed from the file size at a nominal bitrate.
 *
 * bytes / (kbps * 1024 / 8), capped at maxSeconds.
 */
class FileSizeEstimateProvider : public MetadataProvider {
   public:
    FileSizeEstimateProvider(int nominalBitrateKbps, double maxSeconds);

    std::optional<TrackMetadata> read(const std::filesystem::path& path) const override;
    const char* name() const override {
        return "size-estimate";
    }

   private:
    int nominalBitrateKbps_;
    double maxSeconds_;
};

struct ResolvedMetadata {
    std::string title;
    double durationSeconds = 0.0;
};

/**
 * @brief Ranked provider list.
 *
 * The first provider that reports a duration wins. Without one the fallback
 * duration is used; the title falls back to the file stem.
 */
class MetadataResolver {
   public:
    explicit MetadataResolver(double fallbackDurationSeconds = 180.0);

    void addProvider(std::unique_ptr<MetadataProvider> provider);
    ResolvedMetadata resolve(const std::filesystem::path& path) const;

    size_t providerCount() const {
        return providers_.size();
    }

    // sndfile first, then the size estimate
    static MetadataResolver createDefault(const AppConfig::MetadataConfig& config);

   private:
    double fallbackDurationSeconds_;
    std::vector<std::unique_ptr<MetadataProvider>> providers_;
};

}  // namespace playdeck::playback
