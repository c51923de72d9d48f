#include "app/cli_options.h"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <map>

namespace playdeck::app {

namespace {

struct CommandArity {
    size_t minArgs;
    size_t maxArgs;  // SIZE_MAX = unbounded
    const char* usage;
};

const std::map<std::string, CommandArity>& commandTable() {
    static const std::map<std::string, CommandArity> kCommands = {
        {"list", {0, 0, "list"}},
        {"tracks", {1, 1, "tracks <id>"}},
        {"refresh", {1, 1, "refresh <id>"}},
        {"reorder", {2, SIZE_MAX, "reorder <id> <path>..."}},
        {"create", {1, 1, "create <id> [--name <n>] [--description <d>]"}},
        {"rename", {2, 2, "rename <id> <display name>"}},
        {"describe", {2, 2, "describe <id> <description>"}},
        {"rename-track", {3, 3, "rename-track <id> <path> <display name>"}},
        {"export", {2, 2, "export <id> <m3u|pls>"}},
        {"stats", {1, 1, "stats <id>"}},
        {"remove", {1, 1, "remove <id>"}},
        {"play", {1, 1, "play <id> [--index <n>] [--shuffle] [--loop off|playlist|single]"}},
    };
    return kCommands;
}

bool parseIndex(const std::string& value, size_t& out) {
    if (value.empty()) {
        return false;
    }
    char* end = nullptr;
    unsigned long parsed = std::strtoul(value.c_str(), &end, 10);
    if (!end || *end != '\0' || value[0] == '-') {
        return false;
    }
    out = static_cast<size_t>(parsed);
    return true;
}

}  // namespace

void printHelp(const char* exeName) {
    std::cout << "playdeck - playlist catalog and player\n";
    std::cout << "Usage: " << exeName << " [options] <command> [args]\n\n";
    std::cout << "Commands:\n";
    for (const auto& [name, arity] : commandTable()) {
        std::cout << "  " << arity.usage << "\n";
    }
    std::cout << "\nOptions:\n";
    std::cout << "  -c, --config <path>     JSON config file (default: " << DEFAULT_CONFIG_FILE
              << ")\n";
    std::cout << "  -L, --library <dir>     library root directory\n";
    std::cout << "  -d, --device <name>     ALSA output device, or \"null\" for silent output\n";
    std::cout << "  -l, --log-level <lvl>   trace/debug/info/warn/error (default: info)\n";
    std::cout << "  -h, --help              Show this help\n";
    std::cout << "\nEnvironment: PLAYDECK_CONFIG, PLAYDECK_LIBRARY, PLAYDECK_DEVICE, "
                 "PLAYDECK_LOG_LEVEL\n";
    std::cout << std::endl;
}

void applyEnvOverrides(CliOptions& options) {
    if (const char* config = std::getenv("PLAYDECK_CONFIG")) {
        options.configPath = config;
    }
    if (const char* library = std::getenv("PLAYDECK_LIBRARY")) {
        options.libraryDir = library;
    }
    if (const char* device = std::getenv("PLAYDECK_DEVICE")) {
        options.device = device;
    }
    if (const char* level = std::getenv("PLAYDECK_LOG_LEVEL")) {
        options.logLevel = level;
    }
}

ParseStatus parseArgs(int argc, const char* const* argv, CliOptions& options, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        bool hasValue = i + 1 < argc;

        if (arg == "-h" || arg == "--help") {
            return ParseStatus::Help;
        }
        if ((arg == "-c" || arg == "--config") && hasValue) {
            options.configPath = argv[++i];
            continue;
        }
        if ((arg == "-L" || arg == "--library") && hasValue) {
            options.libraryDir = argv[++i];
            continue;
        }
        if ((arg == "-d" || arg == "--device") && hasValue) {
            options.device = argv[++i];
            continue;
        }
        if ((arg == "-l" || arg == "--log-level") && hasValue) {
            options.logLevel = argv[++i];
            continue;
        }
        if (arg == "--name" && hasValue) {
            options.name = argv[++i];
            continue;
        }
        if (arg == "--description" && hasValue) {
            options.description = argv[++i];
            continue;
        }
        if (arg == "--index" && hasValue) {
            size_t index = 0;
            std::string value = argv[++i];
            if (!parseIndex(value, index)) {
                error = "Invalid --index value: " + value;
                return ParseStatus::Error;
            }
            options.index = index;
            continue;
        }
        if (arg == "--shuffle") {
            options.shuffle = true;
            continue;
        }
        if (arg == "--loop" && hasValue) {
            std::string value = argv[++i];
            if (value != "off" && value != "playlist" && value != "single") {
                error = "Invalid --loop value: " + value + " (off|playlist|single)";
                return ParseStatus::Error;
            }
            options.loop = parseLoopMode(value);
            continue;
        }
        if (arg.size() > 1 && arg[0] == '-') {
            error = "Unknown option or missing value: " + arg;
            return ParseStatus::Error;
        }

        if (options.command.empty()) {
            options.command = arg;
        } else {
            options.args.push_back(arg);
        }
    }
    return ParseStatus::Ok;
}

bool validateCommand(const CliOptions& options, std::string& error) {
    if (options.command.empty()) {
        error = "No command given";
        return false;
    }
    auto it = commandTable().find(options.command);
    if (it == commandTable().end()) {
        error = "Unknown command: " + options.command;
        return false;
    }
    const CommandArity& arity = it->second;
    if (options.args.size() < arity.minArgs || options.args.size() > arity.maxArgs) {
        error = std::string("Usage: playdeck ") + arity.usage;
        return false;
    }
    return true;
}

}  // namespace playdeck::app
