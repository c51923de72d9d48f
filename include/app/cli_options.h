#pragma once

#include "core/config_loader.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace playdeck::app {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

struct CliOptions {
    std::string configPath = DEFAULT_CONFIG_FILE;
    std::optional<std::string> libraryDir;
    std::optional<std::string> logLevel;
    std::optional<std::string> device;

    std::string command;
    std::vector<std::string> args;  // positional arguments after the command

    // create
    std::optional<std::string> name;
    std::optional<std::string> description;

    // play
    std::optional<size_t> index;
    bool shuffle = false;
    std::optional<LoopMode> loop;
};

enum class ParseStatus { Ok, Help, Error };

// Options may appear anywhere; the first bare word is the command
ParseStatus parseArgs(int argc, const char* const* argv, CliOptions& options, std::string& error);

// PLAYDECK_CONFIG, PLAYDECK_LIBRARY, PLAYDECK_DEVICE, PLAYDECK_LOG_LEVEL
void applyEnvOverrides(CliOptions& options);

// Checks the command name and its positional argument count
bool validateCommand(const CliOptions& options, std::string& error);

void printHelp(const char* exeName);

}  // namespace playdeck::app
