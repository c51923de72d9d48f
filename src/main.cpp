#include "app/cli_options.h"
#include "app/commands.h"
#include "catalog/catalog.h"
#include "catalog/media_formats.h"
#include "core/config_loader.h"
#include "logging/logger.h"

#include <iostream>
#include <string>

using namespace playdeck;

int main(int argc, char** argv) {
    logging::initializeEarly();

    app::CliOptions options;
    app::applyEnvOverrides(options);

    std::string error;
    app::ParseStatus status = app::parseArgs(argc, argv, options, error);
    if (status == app::ParseStatus::Help) {
        app::printHelp(argv[0]);
        return app::kExitOk;
    }
    if (status == app::ParseStatus::Error || !app::validateCommand(options, error)) {
        std::cerr << error << std::endl;
        std::cerr << "Run '" << argv[0] << " --help' for usage." << std::endl;
        return app::kExitUsage;
    }

    AppConfig config;
    const bool explicitConfig = options.configPath != DEFAULT_CONFIG_FILE;
    if (!loadAppConfig(options.configPath, config, explicitConfig) && explicitConfig) {
        std::cerr << "Cannot load config " << options.configPath << std::endl;
        return app::kExitUsage;
    }
    if (options.libraryDir) {
        config.libraryDir = *options.libraryDir;
    }
    if (options.device) {
        config.output.device = *options.device;
    }
    if (options.logLevel) {
        config.logging.level = logging::stringToLevel(*options.logLevel);
    }
    logging::initialize(config.logging);

    int rc = app::kExitFailure;
    {
        catalog::Catalog catalog(config.libraryDir, config.descriptorFileName,
                                 catalog::MediaFormats(config.extraExtensions));
        rc = app::runCommand(options, config, catalog, std::cout, std::cerr);
    }

    logging::shutdown();
    return rc;
}
