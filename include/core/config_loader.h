#ifndef PLAYDECK_CORE_CONFIG_LOADER_H
#define PLAYDECK_CORE_CONFIG_LOADER_H

#include "logging/logger.h"

#include <filesystem>
#include <string>
#include <vector>

namespace playdeck {

constexpr const char* DEFAULT_CONFIG_FILE = "playdeck.json";

// What happens when the current track ends
enum class LoopMode {
    Off,       // advance, stop after the last track
    Playlist,  // advance, wrap around at both ends
    Single     // replay the same track
};

struct AppConfig {
    std::string libraryDir = "playlists";
    std::string descriptorFileName = "playlist.json";
    std::vector<std::string> extraExtensions;  // normalized: lowercase, leading dot

    struct OutputConfig {
        std::string device = "default";  // ALSA PCM name, or "null" for silent playback
        unsigned int periodFrames = 1024;
    } output;

    struct PlaybackConfig {
        float volume = 0.7f;
        float speed = 1.0f;
        bool shuffle = false;
        LoopMode loop = LoopMode::Off;
    } playback;

    struct TrackerConfig {
        int intervalMs = 1000;
        int shutdownTimeoutMs = 2000;
        int errorIntervalMs = 1000;  // minimum spacing of onError from the tracker
    } tracker;

    struct MetadataConfig {
        int nominalBitrateKbps = 128;
        double maxEstimatedSeconds = 3600.0;
        double defaultDurationSeconds = 180.0;
    } metadata;

    logging::LogConfig logging;
};

// "off" | "playlist" | "single" (case-insensitive); anything else -> Off
LoopMode parseLoopMode(const std::string& str);
const char* loopModeToString(LoopMode mode);

// ".MP3", "mp3" -> ".mp3"; empty input stays empty
std::string normalizeExtension(const std::string& ext);

/**
 * @brief Load the JSON application config.
 *
 * outConfig is reset to defaults first. Invalid individual fields are reported
 * (when verbose) and left at their defaults.
 *
 * @return false if the file is missing or is not valid JSON
 */
bool loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig,
                   bool verbose = true);

}  // namespace playdeck

#endif  // PLAYDECK_CORE_CONFIG_LOADER_H
