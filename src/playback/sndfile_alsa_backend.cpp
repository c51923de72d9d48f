#include "playback/sndfile_alsa_backend.h"

#include "logging/logger.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <memory>

namespace playdeck::playback {

namespace {

struct HwParamsDeleter {
    void operator()(snd_pcm_hw_params_t* p) const {
        if (p) {
            snd_pcm_hw_params_free(p);
        }
    }
};

}  // namespace

SndfileAlsaBackend::SndfileAlsaBackend(std::string device, unsigned int periodFrames)
    : device_(std::move(device)), periodFrames_(periodFrames > 0 ? periodFrames : 1024) {}

SndfileAlsaBackend::~SndfileAlsaBackend() {
    close();
}

bool SndfileAlsaBackend::open(const std::string& path) {
    close();
    info_ = SF_INFO{};
    file_ = sf_open(path.c_str(), SFM_READ, &info_);
    if (!file_) {
        lastError_ = sf_strerror(nullptr);
        LOG_ERROR("[AlsaBackend] cannot decode {}: {}", path, lastError_);
        return false;
    }
    if (info_.channels <= 0 || info_.samplerate <= 0) {
        lastError_ = "invalid stream parameters";
        sf_close(file_);
        file_ = nullptr;
        return false;
    }
    LOG_DEBUG("[AlsaBackend] opened {} ({} Hz, {} ch, {} frames)", path, info_.samplerate,
              info_.channels, static_cast<long long>(info_.frames));
    return true;
}

bool SndfileAlsaBackend::openPcm() {
    int rc = snd_pcm_open(&pcm_, device_.c_str(), SND_PCM_STREAM_PLAYBACK, 0);
    if (rc < 0) {
        lastError_ = std::string("cannot open device ") + device_ + ": " + snd_strerror(rc);
        LOG_ERROR("[AlsaBackend] {} (check available devices with `aplay -L`)", lastError_);
        pcm_ = nullptr;
        return false;
    }

    std::unique_ptr<snd_pcm_hw_params_t, HwParamsDeleter> params;
    snd_pcm_hw_params_t* raw = nullptr;
    snd_pcm_hw_params_malloc(&raw);
    params.reset(raw);
    if (!params) {
        lastError_ = "failed to alloc hw_params";
        closePcm();
        return false;
    }

    const unsigned int channels = static_cast<unsigned int>(info_.channels);
    unsigned int rate = static_cast<unsigned int>(info_.samplerate);
    snd_pcm_uframes_t period = periodFrames_;
    snd_pcm_uframes_t buffer = period * 4;

    if (snd_pcm_hw_params_any(pcm_, params.get()) < 0 ||
        snd_pcm_hw_params_set_rate_resample(pcm_, params.get(), 1) < 0 ||
        snd_pcm_hw_params_set_access(pcm_, params.get(), SND_PCM_ACCESS_RW_INTERLEAVED) < 0 ||
        snd_pcm_hw_params_set_format(pcm_, params.get(), SND_PCM_FORMAT_S16) < 0 ||
        snd_pcm_hw_params_set_channels(pcm_, params.get(), channels) < 0 ||
        snd_pcm_hw_params_set_rate_near(pcm_, params.get(), &rate, nullptr) < 0 ||
        snd_pcm_hw_params_set_period_size_near(pcm_, params.get(), &period, nullptr) < 0 ||
        snd_pcm_hw_params_set_buffer_size_near(pcm_, params.get(), &buffer) < 0 ||
        snd_pcm_hw_params(pcm_, params.get()) < 0) {
        lastError_ = "device " + device_ + " rejected S16/" + std::to_string(channels) + "ch/" +
                     std::to_string(info_.samplerate) + "Hz";
        LOG_ERROR("[AlsaBackend] {}", lastError_);
        closePcm();
        return false;
    }
    if (rate != static_cast<unsigned int>(info_.samplerate)) {
        LOG_WARN("[AlsaBackend] rate mismatch (requested {}, got {})", info_.samplerate, rate);
    }

    LOG_DEBUG("[AlsaBackend] PCM {} ready: rate={} channels={} period={} buffer={}", device_,
              rate, channels, period, buffer);
    return true;
}

void SndfileAlsaBackend::closePcm() {
    if (!pcm_) {
        return;
    }
    snd_pcm_drop(pcm_);
    snd_pcm_close(pcm_);
    pcm_ = nullptr;
}

bool SndfileAlsaBackend::start(double offsetSeconds) {
    stop();
    if (!file_) {
        lastError_ = "no stream open";
        return false;
    }

    sf_count_t frame = static_cast<sf_count_t>(std::llround(std::max(0.0, offsetSeconds) *
                                                            info_.samplerate));
    if (sf_seek(file_, std::min(frame, info_.frames), SEEK_SET) < 0) {
        lastError_ = std::string("seek failed: ") + sf_strerror(file_);
        return false;
    }
    if (!openPcm()) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(controlMutex_);
        running_ = true;
        paused_ = false;
        pendingSeekFrame_ = -1;
    }
    busy_.store(true);
    writer_ = std::thread(&SndfileAlsaBackend::writerLoop, this);
    return true;
}

bool SndfileAlsaBackend::pause() {
    std::lock_guard<std::mutex> lock(controlMutex_);
    if (!running_) {
        lastError_ = "not playing";
        return false;
    }
    paused_ = true;
    return true;
}

bool SndfileAlsaBackend::resume() {
    {
        std::lock_guard<std::mutex> lock(controlMutex_);
        if (!running_) {
            lastError_ = "not playing";
            return false;
        }
        paused_ = false;
    }
    controlCv_.notify_all();
    return true;
}

void SndfileAlsaBackend::stop() {
    {
        std::lock_guard<std::mutex> lock(controlMutex_);
        running_ = false;
        paused_ = false;
    }
    controlCv_.notify_all();
    if (writer_.joinable()) {
        writer_.join();
    }
    closePcm();
    busy_.store(false);
}

void SndfileAlsaBackend::close() {
    stop();
    if (file_) {
        sf_close(file_);
        file_ = nullptr;
    }
}

void SndfileAlsaBackend::setVolume(float volume) {
    if (!std::isfinite(volume)) {
        return;
    }
    gain_.store(std::clamp(volume, 0.0f, 1.0f));
}

bool SndfileAlsaBackend::isBusy() const {
    return busy_.load();
}

bool SndfileAlsaBackend::canSeek() const {
    return info_.seekable != 0;
}

bool SndfileAlsaBackend::seek(double seconds) {
    std::lock_guard<std::mutex> lock(controlMutex_);
    if (!running_ || !file_) {
        return false;
    }
    pendingSeekFrame_ =
        std::min(static_cast<sf_count_t>(std::llround(std::max(0.0, seconds) * info_.samplerate)),
                 info_.frames);
    return true;
}

std::string SndfileAlsaBackend::pollError() {
    std::lock_guard<std::mutex> lock(errorMutex_);
    std::string error;
    error.swap(asyncError_);
    return error;
}

std::string SndfileAlsaBackend::lastError() const {
    return lastError_;
}

void SndfileAlsaBackend::setAsyncError(const std::string& message) {
    std::lock_guard<std::mutex> lock(errorMutex_);
    asyncError_ = message;
}

bool SndfileAlsaBackend::recoverFromXrun(int err) {
    int rc = snd_pcm_recover(pcm_, err, 1);
    if (rc < 0) {
        LOG_ERROR("[AlsaBackend] XRUN recover failed: {}", snd_strerror(rc));
        return false;
    }
    LOG_EVERY_N(WARN, 50, "[AlsaBackend] XRUN recovered ({})", snd_strerror(err));
    return true;
}

bool SndfileAlsaBackend::writeFrames(const int16_t* data, snd_pcm_uframes_t frames) {
    const int16_t* ptr = data;
    snd_pcm_uframes_t framesLeft = frames;
    while (framesLeft > 0) {
        snd_pcm_sframes_t written = snd_pcm_writei(pcm_, ptr, framesLeft);
        if (written == -EAGAIN) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            continue;
        }
        if (written == -EPIPE || written == -ESTRPIPE || written == -EINTR) {
            if (!recoverFromXrun(static_cast<int>(written))) {
                return false;
            }
            continue;
        }
        if (written < 0) {
            LOG_ERROR("[AlsaBackend] write failed: {}", snd_strerror(static_cast<int>(written)));
            return false;
        }
        framesLeft -= static_cast<snd_pcm_uframes_t>(written);
        ptr += static_cast<size_t>(written) * static_cast<size_t>(info_.channels);
    }
    return true;
}

void SndfileAlsaBackend::writerLoop() {
    const size_t channels = static_cast<size_t>(info_.channels);
    std::vector<int16_t> buffer(static_cast<size_t>(periodFrames_) * channels);
    bool drained = false;

    while (true) {
        {
            std::unique_lock<std::mutex> lock(controlMutex_);
            if (paused_ && running_) {
                snd_pcm_drop(pcm_);
                controlCv_.wait(lock, [this] { return !paused_ || !running_; });
                if (running_) {
                    snd_pcm_prepare(pcm_);
                }
            }
            if (!running_) {
                break;
            }
            if (pendingSeekFrame_ >= 0) {
                snd_pcm_drop(pcm_);
                snd_pcm_prepare(pcm_);
                sf_seek(file_, pendingSeekFrame_, SEEK_SET);
                pendingSeekFrame_ = -1;
            }
        }

        sf_count_t frames = sf_readf_short(file_, buffer.data(), periodFrames_);
        if (frames <= 0) {
            drained = true;
            break;
        }

        const float gain = gain_.load();
        if (gain < 0.999f) {
            const size_t samples = static_cast<size_t>(frames) * channels;
            for (size_t i = 0; i < samples; ++i) {
                buffer[i] = static_cast<int16_t>(std::lround(buffer[i] * gain));
            }
        }

        if (!writeFrames(buffer.data(), static_cast<snd_pcm_uframes_t>(frames))) {
            setAsyncError("Audio output failed on " + device_);
            break;
        }
    }

    if (drained) {
        snd_pcm_drain(pcm_);
    }
    busy_.store(false);
}

}  // namespace playdeck::playback
