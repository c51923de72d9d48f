#pragma once

#include "core/config_loader.h"
#include "playback/playback_backend.h"

#include <memory>

namespace playdeck::playback {

// "null" selects the silent NullBackend, any other name is an ALSA PCM
std::unique_ptr<PlaybackBackend> createBackend(const AppConfig& config);

}  // namespace playdeck::playback
