// clipexpire - keeps the Klipper clipboard history free of stale or sensitive entries
// Session daemon: polls Klipper over D-Bus, removes denied entries at once and
// everything else (except protected entries) once it outlives the expiry window.

#include "clipexpire/CommandLine.hpp"
#include "clipexpire/ConfigParser.hpp"
#include "clipexpire/Daemon.hpp"
#include "clipexpire/Errors.hpp"
#include "clipexpire/KlipperGateway.hpp"
#include "clipexpire/Logging.hpp"
#include "clipexpire/PatternFilter.hpp"
#include "clipexpire/Scheduler.hpp"
#include <iostream>
#include <memory>

using namespace clipexpire;

static const char* VERSION = "0.1.0";

static constexpr int EXIT_FATAL = 1;
static constexpr int EXIT_USAGE = 2;

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    const std::string program = argc > 0 ? argv[0] : "clipexpire";

    // Parse command
    CommandLine cmd;
    try {
        cmd = parseCommandLine(argc, argv);
    } catch (const UsageError& e) {
        std::cerr << program << ": " << e.what() << "\n\n" << usage(program);
        return EXIT_USAGE;
    }

    if (cmd.showHelp) {
        std::cout << usage(program);
        return 0;
    }
    if (cmd.showVersion) {
        std::cout << "clipexpire " << VERSION << "\n";
        return 0;
    }

    initLogging(cmd.verbosity);

    // Load and validate config; any error here is fatal
    ResolvedConfig config;
    PatternFilterPtr filter;
    try {
        FileConfig fileConfig = cmd.configPath ? loadConfigFile(*cmd.configPath, true)
                                               : loadConfigFile(getConfigPath());
        config = resolveConfig(fileConfig, cmd.overrides);
        filter = std::make_shared<const PatternFilter>(
            PatternFilter::compile(config.alwaysRemovePatterns, config.neverRemovePatterns));
    } catch (const ConfigError& e) {
        spdlog::critical("configuration error: {}", e.what());
        return EXIT_FATAL;
    }
    spdlog::info("loaded {} always-remove and {} never-remove patterns",
                 filter->denyCount(), filter->keepCount());

    // Connect to Klipper
    GDBusConnection* connection = nullptr;
    try {
        connection = KlipperGateway::connectSessionBus();
    } catch (const GatewayError& e) {
        spdlog::critical("{}", e.what());
        return EXIT_FATAL;
    }

    KlipperGateway gateway(connection, config.ipcTimeout);
    g_object_unref(connection);

    Scheduler scheduler(config, filter, gateway);

    if (cmd.once) {
        TickReport report = scheduler.tick();
        spdlog::info("single sync {}: removed {} denied and {} expired entries",
                     toString(report.outcome), report.deniedRemoved, report.expiredRemoved);
        return report.outcome == TickOutcome::Aborted ? EXIT_FATAL : 0;
    }

    Daemon daemon(scheduler, gateway, config.updateInterval);
    daemon.run();

    return 0;
}
