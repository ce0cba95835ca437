#pragma once
// Single Responsibility: Command-line parsing

#include "Config.hpp"
#include <optional>
#include <string>
#include <vector>

namespace clipexpire {

struct CommandLine {
    ConfigOverrides overrides;
    std::optional<std::string> configPath;  // --config, else getConfigPath()
    int verbosity = 0;                      // count of -v
    bool once = false;                      // single tick, then exit
    bool showHelp = false;
    bool showVersion = false;
};

// Throws UsageError on unknown options, missing or non-numeric values
CommandLine parseCommandLine(const std::vector<std::string>& args);
CommandLine parseCommandLine(int argc, char* argv[]);

std::string usage(const std::string& program);

} // namespace clipexpire
