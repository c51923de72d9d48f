#pragma once

#include "app/cli_options.h"
#include "catalog/catalog.h"
#include "core/config_loader.h"

#include <ostream>
#include <string>

namespace playdeck::app {

/**
 * @brief Execute a validated CLI command.
 *
 * @return kExitOk on success, kExitFailure if the operation failed
 */
int runCommand(const CliOptions& options, const AppConfig& config, catalog::Catalog& catalog,
               std::ostream& out, std::ostream& err);

// Plays a collection until the list ends or a shutdown signal arrives
int runPlay(const CliOptions& options, const AppConfig& config, catalog::Catalog& catalog,
            std::ostream& out, std::ostream& err);

// "m:ss", or "h:mm:ss" from one hour on
std::string formatClock(double seconds);

}  // namespace playdeck::app
