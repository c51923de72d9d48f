#include "playback/backend_factory.h"

#include "logging/logger.h"
#include "playback/metadata_provider.h"
#include "playback/null_backend.h"
#include "playback/sndfile_alsa_backend.h"

namespace playdeck::playback {

std::unique_ptr<PlaybackBackend> createBackend(const AppConfig& config) {
    if (config.output.device == "null") {
        LOG_INFO("Output: null backend (no audio device)");
        return std::make_unique<NullBackend>(MetadataResolver::createDefault(config.metadata));
    }
    LOG_INFO("Output: ALSA device {}", config.output.device);
    return std::make_unique<SndfileAlsaBackend>(config.output.device, config.output.periodFrames);
}

}  // namespace playdeck::playback
