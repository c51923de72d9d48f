#include "app/commands.h"

#include "app/shutdown_signal.h"
#include "core/error_codes.h"
#include "logging/logger.h"
#include "playback/backend_factory.h"
#include "playback/playback_engine.h"
#include "player/player_controller.h"

#include <chrono>
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <mutex>
#include <thread>

namespace playdeck::app {

namespace {

int reportResult(const OpResult& result, std::ostream& err) {
    if (result.ok()) {
        return kExitOk;
    }
    LOG_DEBUG("Command failed with {} error {}", getErrorCategory(result.code),
              errorCodeToHex(result.code));
    err << "error: " << result.message << " (" << errorCodeToString(result.code) << ' '
        << errorCodeToHex(result.code) << ")\n";
    return kExitFailure;
}

int runList(catalog::Catalog& catalog, std::ostream& out) {
    for (const auto& info : catalog.listCollections()) {
        out << info.id << '\t' << info.descriptor.displayName << '\t' << info.trackCount
            << (info.trackCount == 1 ? " track" : " tracks") << '\n';
    }
    return kExitOk;
}

int runTracks(catalog::Catalog& catalog, const std::string& id, std::ostream& out,
              std::ostream& err) {
    catalog::TrackListResult listed = catalog.getTracks(id);
    if (!listed.ok()) {
        return reportResult(listed.status, err);
    }
    for (const auto& track : listed.tracks) {
        out << std::setw(3) << track.order << ". " << track.displayName << "  ("
            << track.relativePath << ")\n";
    }
    return kExitOk;
}

int runStats(catalog::Catalog& catalog, const std::string& id, std::ostream& out,
             std::ostream& err) {
    catalog::StatsResult result = catalog.stats(id);
    if (!result.ok()) {
        return reportResult(result.status, err);
    }
    const catalog::CollectionStats& s = result.stats;
    out << "tracks:   " << s.trackCount << '\n';
    out << "size:     " << std::fixed << std::setprecision(2) << s.totalMegabytes << " MB ("
        << s.totalBytes << " bytes)\n";
    out << "formats: ";
    for (const auto& f : s.formats) {
        out << ' ' << f;
    }
    out << '\n';
    out << "created:  " << s.created << '\n';
    out << "modified: " << s.modified.value_or("-") << '\n';
    return kExitOk;
}

}  // namespace

std::string formatClock(double seconds) {
    long total = seconds > 0.0 ? static_cast<long>(std::floor(seconds)) : 0;
    long hours = total / 3600;
    long minutes = (total / 60) % 60;
    long secs = total % 60;
    char buf[32];
    if (hours > 0) {
        std::snprintf(buf, sizeof(buf), "%ld:%02ld:%02ld", hours, minutes, secs);
    } else {
        std::snprintf(buf, sizeof(buf), "%ld:%02ld", minutes, secs);
    }
    return buf;
}

int runCommand(const CliOptions& options, const AppConfig& config, catalog::Catalog& catalog,
               std::ostream& out, std::ostream& err) {
    const std::string& cmd = options.command;
    const auto& args = options.args;

    if (cmd == "list") {
        return runList(catalog, out);
    }
    if (cmd == "tracks") {
        return runTracks(catalog, args[0], out, err);
    }
    if (cmd == "refresh") {
        return reportResult(catalog.refresh(args[0]), err);
    }
    if (cmd == "reorder") {
        std::vector<std::string> paths(args.begin() + 1, args.end());
        return reportResult(catalog.reorder(args[0], paths), err);
    }
    if (cmd == "create") {
        return reportResult(catalog.createCollection(args[0], options.name, options.description),
                            err);
    }
    if (cmd == "rename") {
        catalog::CollectionFields fields;
        fields.displayName = args[1];
        return reportResult(catalog.updateMetadata(args[0], fields), err);
    }
    if (cmd == "describe") {
        catalog::CollectionFields fields;
        fields.description = args[1];
        return reportResult(catalog.updateMetadata(args[0], fields), err);
    }
    if (cmd == "rename-track") {
        catalog::TrackFields fields;
        fields.displayName = args[2];
        return reportResult(catalog.updateTrack(args[0], args[1], fields), err);
    }
    if (cmd == "export") {
        catalog::ExportResult exported = catalog.exportCollection(args[0], args[1]);
        if (!exported.ok()) {
            return reportResult(exported.status, err);
        }
        out << exported.path.string() << '\n';
        return kExitOk;
    }
    if (cmd == "stats") {
        return runStats(catalog, args[0], out, err);
    }
    if (cmd == "remove") {
        return reportResult(catalog.removeCollection(args[0]), err);
    }
    if (cmd == "play") {
        return runPlay(options, config, catalog, out, err);
    }

    err << "error: unknown command " << cmd << '\n';
    return kExitFailure;
}

int runPlay(const CliOptions& options, const AppConfig& config, catalog::Catalog& catalog,
            std::ostream& out, std::ostream& err) {
    const std::string& id = options.args[0];
    // Declared first so it outlives the tracker thread that prints through it
    std::mutex outputMutex;

    playback::PlaybackEngine engine(playback::createBackend(config),
                                    playback::MetadataResolver::createDefault(config.metadata),
                                    playback::makeEngineConfig(config));

    player::QueueNavigator navigator(options.loop.value_or(config.playback.loop),
                                     options.shuffle || config.playback.shuffle);
    player::PlayerController controller(catalog, engine, std::move(navigator));

    player::PlayerController::Observers observers;
    observers.onTrackStarted = [&](const catalog::TrackView& track) {
        std::lock_guard<std::mutex> lock(outputMutex);
        out << "\n> " << track.displayName << '\n' << std::flush;
    };
    observers.onPosition = [&](double position, double duration) {
        std::lock_guard<std::mutex> lock(outputMutex);
        out << "\r  " << formatClock(position) << " / " << formatClock(duration) << std::flush;
    };
    observers.onError = [&](const std::string& message) {
        std::lock_guard<std::mutex> lock(outputMutex);
        err << "\nplayback error: " << message << '\n';
    };
    controller.setObservers(std::move(observers));

    OpResult opened = controller.openCollection(id);
    if (!opened.ok()) {
        return reportResult(opened, err);
    }
    OpResult started = controller.playIndex(options.index.value_or(0));
    if (!started.ok()) {
        return reportResult(started, err);
    }

    installSignalHandlers();
    ShutdownSignal shutdown;
    shutdown.setSignalState(&getGlobalSignalState());
    shutdown.setStopCallback([&engine] { engine.stop(); });
    shutdown.setLogCallback([](const char* msg) { LOG_INFO("{}", msg); });

    while (shutdown.isRunning() && !controller.finished()) {
        shutdown.processPending();
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    engine.shutdown();
    {
        std::lock_guard<std::mutex> lock(outputMutex);
        out << '\n';
    }
    return kExitOk;
}

}  // namespace playdeck::app
