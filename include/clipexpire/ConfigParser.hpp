#pragma once
// Single Responsibility: Configuration file parsing and resolution

#include "Config.hpp"
#include <istream>
#include <string>

namespace clipexpire {

// Config file path: $XDG_CONFIG_HOME/clipexpire.toml (or ~/.config/clipexpire.toml)
std::string getConfigPath();

// Load config from path. A missing file yields an empty FileConfig unless
// `required` is set (an explicit --config), in which case it throws ConfigError.
// A malformed file always throws ConfigError.
FileConfig loadConfigFile(const std::string& path, bool required = false);

// Parse config text. `origin` is only used in error messages.
FileConfig parseConfig(std::istream& in, const std::string& origin = "<config>");

// Merge file values with overrides (override wins key-by-key), apply defaults
// and validate. Throws ConfigError naming the offending key and value.
ResolvedConfig resolveConfig(const FileConfig& file, const ConfigOverrides& overrides);

} // namespace clipexpire
