#include "core/config_loader.h"

#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <nlohmann/json.hpp>

namespace playdeck {

static std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

LoopMode parseLoopMode(const std::string& str) {
    std::string lower = toLower(str);
    if (lower == "playlist" || lower == "all") {
        return LoopMode::Playlist;
    }
    if (lower == "single" || lower == "one" || lower == "track") {
        return LoopMode::Single;
    }
    return LoopMode::Off;
}

const char* loopModeToString(LoopMode mode) {
    switch (mode) {
    case LoopMode::Playlist:
        return "playlist";
    case LoopMode::Single:
        return "single";
    case LoopMode::Off:
    default:
        return "off";
    }
}

std::string normalizeExtension(const std::string& ext) {
    if (ext.empty()) {
        return ext;
    }
    std::string lower = toLower(ext);
    if (lower.front() != '.') {
        lower.insert(lower.begin(), '.');
    }
    return lower;
}

static void parseLoggingSection(const nlohmann::json& section, logging::LogConfig& out) {
    if (section.contains("level") && section["level"].is_string()) {
        out.level = logging::stringToLevel(section["level"].get<std::string>());
    }
    if (section.contains("filePath") && section["filePath"].is_string()) {
        out.filePath = section["filePath"].get<std::string>();
    }
    if (section.contains("maxFileSize")) {
        out.maxFileSize = section["maxFileSize"].get<size_t>();
    }
    if (section.contains("maxBackups")) {
        out.maxBackups = section["maxBackups"].get<size_t>();
    }
    if (section.contains("consoleOutput")) {
        out.consoleOutput = section["consoleOutput"].get<bool>();
    }
    if (section.contains("coloredOutput")) {
        out.coloredOutput = section["coloredOutput"].get<bool>();
    }
    if (section.contains("pattern") && section["pattern"].is_string()) {
        out.pattern = section["pattern"].get<std::string>();
    }
}

bool loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig, bool verbose) {
    outConfig = AppConfig{};

    std::ifstream file(configPath);
    if (!file.is_open()) {
        if (verbose) {
            LOG_INFO("Config: {} not found, using defaults", configPath.string());
        }
        return false;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        if (verbose) {
            LOG_WARN("Config: {} is not valid JSON ({}), using defaults", configPath.string(),
                     e.what());
        }
        return false;
    }
    if (!j.is_object()) {
        if (verbose) {
            LOG_WARN("Config: {} must contain a JSON object, using defaults", configPath.string());
        }
        return false;
    }

    try {
        if (j.contains("libraryDir") && j["libraryDir"].is_string()) {
            outConfig.libraryDir = j["libraryDir"].get<std::string>();
        }
        if (j.contains("descriptorFileName") && j["descriptorFileName"].is_string()) {
            std::string name = j["descriptorFileName"].get<std::string>();
            if (!name.empty() && name.find('/') == std::string::npos) {
                outConfig.descriptorFileName = name;
            } else if (verbose) {
                LOG_WARN("Config: invalid descriptorFileName '{}', using '{}'", name,
                         outConfig.descriptorFileName);
            }
        }
        if (j.contains("extraExtensions") && j["extraExtensions"].is_array()) {
            for (const auto& ext : j["extraExtensions"]) {
                if (!ext.is_string()) {
                    continue;
                }
                std::string normalized = normalizeExtension(ext.get<std::string>());
                if (!normalized.empty()) {
                    outConfig.extraExtensions.push_back(normalized);
                }
            }
        }
    } catch (const std::exception& e) {
        if (verbose) {
            LOG_WARN("Config: invalid library settings, using defaults: {}", e.what());
        }
    }

    if (j.contains("output") && j["output"].is_object()) {
        const auto& output = j["output"];
        try {
            if (output.contains("device") && output["device"].is_string()) {
                outConfig.output.device = output["device"].get<std::string>();
            }
            if (output.contains("periodFrames")) {
                int frames = output["periodFrames"].get<int>();
                if (frames > 0) {
                    outConfig.output.periodFrames = static_cast<unsigned int>(frames);
                }
            }
        } catch (const std::exception& e) {
            if (verbose) {
                LOG_WARN("Config: invalid output settings, using defaults: {}", e.what());
            }
            outConfig.output = AppConfig::OutputConfig{};
        }
    }

    if (j.contains("playback") && j["playback"].is_object()) {
        const auto& pb = j["playback"];
        try {
            if (pb.contains("volume")) {
                outConfig.playback.volume = std::clamp(pb["volume"].get<float>(), 0.0f, 1.0f);
            }
            if (pb.contains("speed")) {
                outConfig.playback.speed = std::clamp(pb["speed"].get<float>(), 0.5f, 2.0f);
            }
            if (pb.contains("shuffle") && pb["shuffle"].is_boolean()) {
                outConfig.playback.shuffle = pb["shuffle"].get<bool>();
            }
            if (pb.contains("loop") && pb["loop"].is_string()) {
                outConfig.playback.loop = parseLoopMode(pb["loop"].get<std::string>());
            }
        } catch (const std::exception& e) {
            if (verbose) {
                LOG_WARN("Config: invalid playback settings, using defaults: {}", e.what());
            }
            outConfig.playback = AppConfig::PlaybackConfig{};
        }
    }

    if (j.contains("tracker") && j["tracker"].is_object()) {
        const auto& tr = j["tracker"];
        try {
            if (tr.contains("intervalMs")) {
                int interval = tr["intervalMs"].get<int>();
                if (interval > 0) {
                    outConfig.tracker.intervalMs = interval;
                } else if (verbose) {
                    LOG_WARN("Config: tracker.intervalMs must be > 0 (got {}), using {}",
                             interval, outConfig.tracker.intervalMs);
                }
            }
            if (tr.contains("shutdownTimeoutMs")) {
                int timeout = tr["shutdownTimeoutMs"].get<int>();
                if (timeout > 0) {
                    outConfig.tracker.shutdownTimeoutMs = timeout;
                }
            }
            if (tr.contains("errorIntervalMs")) {
                int errorInterval = tr["errorIntervalMs"].get<int>();
                if (errorInterval >= 0) {
                    outConfig.tracker.errorIntervalMs = errorInterval;
                }
            }
        } catch (const std::exception& e) {
            if (verbose) {
                LOG_WARN("Config: invalid tracker settings, using defaults: {}", e.what());
            }
            outConfig.tracker = AppConfig::TrackerConfig{};
        }
    }

    if (j.contains("metadata") && j["metadata"].is_object()) {
        const auto& md = j["metadata"];
        try {
            if (md.contains("nominalBitrateKbps")) {
                int kbps = md["nominalBitrateKbps"].get<int>();
                if (kbps > 0) {
                    outConfig.metadata.nominalBitrateKbps = kbps;
                }
            }
            if (md.contains("maxEstimatedSeconds")) {
                double cap = md["maxEstimatedSeconds"].get<double>();
                if (cap > 0.0) {
                    outConfig.metadata.maxEstimatedSeconds = cap;
                }
            }
            if (md.contains("defaultDurationSeconds")) {
                double fallback = md["defaultDurationSeconds"].get<double>();
                if (fallback >= 0.0) {
                    outConfig.metadata.defaultDurationSeconds = fallback;
                }
            }
        } catch (const std::exception& e) {
            if (verbose) {
                LOG_WARN("Config: invalid metadata settings, using defaults: {}", e.what());
            }
            outConfig.metadata = AppConfig::MetadataConfig{};
        }
    }

    if (j.contains("logging") && j["logging"].is_object()) {
        try {
            parseLoggingSection(j["logging"], outConfig.logging);
        } catch (const std::exception& e) {
            if (verbose) {
                LOG_WARN("Config: invalid logging settings, using defaults: {}", e.what());
            }
            outConfig.logging = logging::LogConfig{};
        }
    }

    return true;
}

}  // namespace playdeck
