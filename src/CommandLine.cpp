// Single Responsibility: Command-line parsing

#include "clipexpire/CommandLine.hpp"
#include "clipexpire/Errors.hpp"
#include <sstream>

namespace clipexpire {

namespace {

std::int64_t parseInteger(const std::string& option, const std::string& value) {
    try {
        size_t used = 0;
        std::int64_t n = std::stoll(value, &used, 10);
        if (used == value.size()) return n;
    } catch (const std::exception&) {
        // reported below
    }
    throw UsageError(option + " expects an integer, got '" + value + "'");
}

// Split "--name=value" into name and value
bool splitInline(const std::string& arg, std::string& name, std::string& value) {
    size_t eq = arg.find('=');
    if (arg.rfind("--", 0) != 0 || eq == std::string::npos) return false;
    name = arg.substr(0, eq);
    value = arg.substr(eq + 1);
    return true;
}

} // namespace

CommandLine parseCommandLine(const std::vector<std::string>& args) {
    CommandLine cmd;

    for (size_t i = 0; i < args.size(); i++) {
        std::string arg = args[i];
        std::string inlineValue;
        std::string inlineName;
        bool hasInline = splitInline(args[i], inlineName, inlineValue);
        if (hasInline) arg = inlineName;

        auto takeValue = [&]() -> std::string {
            if (hasInline) return inlineValue;
            if (i + 1 >= args.size()) throw UsageError(arg + " requires a value");
            return args[++i];
        };

        if (arg == "--expiry-seconds" || arg == "--item-expiry-seconds") {
            cmd.overrides.itemExpirySeconds = parseInteger(arg, takeValue());
        } else if (arg == "--update-interval-seconds" || arg == "--resync-interval-seconds") {
            cmd.overrides.updateIntervalSeconds = parseInteger(arg, takeValue());
        } else if (arg == "--ipc-timeout-ms") {
            cmd.overrides.ipcTimeoutMs = parseInteger(arg, takeValue());
        } else if (arg == "--always-remove") {
            if (!cmd.overrides.alwaysRemovePatterns) cmd.overrides.alwaysRemovePatterns.emplace();
            cmd.overrides.alwaysRemovePatterns->push_back(takeValue());
        } else if (arg == "--never-remove") {
            if (!cmd.overrides.neverRemovePatterns) cmd.overrides.neverRemovePatterns.emplace();
            cmd.overrides.neverRemovePatterns->push_back(takeValue());
        } else if (arg == "--config" || arg == "-c") {
            cmd.configPath = takeValue();
        } else if (hasInline) {
            throw UsageError("unknown option: " + arg);
        } else if (arg == "--once") {
            cmd.once = true;
        } else if (arg == "--verbose") {
            cmd.verbosity++;
        } else if (arg == "--help" || arg == "-h") {
            cmd.showHelp = true;
        } else if (arg == "--version" || arg == "-V") {
            cmd.showVersion = true;
        } else if (arg.size() > 1 && arg[0] == '-' && arg[1] == 'v' &&
                   arg.find_first_not_of('v', 1) == std::string::npos) {
            // -v, -vv, -vvv
            cmd.verbosity += static_cast<int>(arg.size() - 1);
        } else {
            throw UsageError("unknown option: " + arg);
        }
    }

    return cmd;
}

CommandLine parseCommandLine(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; i++) {
        args.emplace_back(argv[i]);
    }
    return parseCommandLine(args);
}

std::string usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "\n"
        << "Removes stale and sensitive entries from the Klipper clipboard history.\n"
        << "\n"
        << "Options:\n"
        << "  --expiry-seconds N           seconds before an entry is removed\n"
        << "  --update-interval-seconds N  seconds between history syncs\n"
        << "  --ipc-timeout-ms N           D-Bus call timeout\n"
        << "  --always-remove REGEX        remove matching entries at once (repeatable)\n"
        << "  --never-remove REGEX         never expire matching entries (repeatable)\n"
        << "  -c, --config PATH            config file (default: $XDG_CONFIG_HOME/clipexpire.toml)\n"
        << "  --once                       run a single sync and exit\n"
        << "  -v, --verbose                more logging, up to three times\n"
        << "  -V, --version                print version and exit\n"
        << "  -h, --help                   print this help and exit\n";
    return out.str();
}

} // namespace clipexpire
