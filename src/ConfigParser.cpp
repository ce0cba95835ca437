// Single Responsibility: Configuration file parsing and resolution

#include "clipexpire/ConfigParser.hpp"
#include "clipexpire/Errors.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace clipexpire {

std::string getConfigPath() {
    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    std::string configDir;

    if (xdgConfig && *xdgConfig) {
        configDir = xdgConfig;
    } else {
        const char* home = std::getenv("HOME");
        configDir = home ? std::string(home) + "/.config" : "/tmp";
    }

    return configDir + "/clipexpire.toml";
}

// Minimal TOML subset (manual, no external dependency): key = integer,
// key = "string" | 'string', key = [ "a", 'b', ... ] possibly over several lines
namespace {

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    size_t end = str.find_last_not_of(" \t\r\n");
    return (start == std::string::npos) ? "" : str.substr(start, end - start + 1);
}

// Cut a trailing # comment, ignoring # inside quoted strings
std::string stripComment(const std::string& line) {
    char quote = 0;
    for (size_t i = 0; i < line.size(); i++) {
        char c = line[i];
        if (quote) {
            if (quote == '"' && c == '\\') i++;
            else if (c == quote) quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return line.substr(0, i);
        }
    }
    return line;
}

// True once every [ opened outside a string has been closed
bool bracketsBalanced(const std::string& text) {
    int depth = 0;
    char quote = 0;
    for (size_t i = 0; i < text.size(); i++) {
        char c = text[i];
        if (quote) {
            if (quote == '"' && c == '\\') i++;
            else if (c == quote) quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '[') {
            depth++;
        } else if (c == ']') {
            depth--;
        }
    }
    return depth <= 0;
}

[[noreturn]] void fail(const std::string& origin, int lineNo, const std::string& message) {
    throw ConfigError(origin + ":" + std::to_string(lineNo) + ": " + message);
}

// Read one quoted string starting at pos; pos ends just past the closing quote
bool readQuoted(const std::string& text, size_t& pos, std::string& out) {
    char quote = text[pos];
    if (quote != '"' && quote != '\'') return false;
    pos++;

    out.clear();
    while (pos < text.size() && text[pos] != quote) {
        if (quote == '"' && text[pos] == '\\' && pos + 1 < text.size()) {
            pos++;
            switch (text[pos]) {
                case 'n': out += '\n'; break;
                case 't': out += '\t'; break;
                case 'r': out += '\r'; break;
                case '"': out += '"'; break;
                case '\\': out += '\\'; break;
                default: return false;  // \uXXXX and friends are not supported
            }
        } else {
            out += text[pos];
        }
        pos++;
    }
    if (pos >= text.size()) return false;
    pos++;
    return true;
}

std::int64_t parseInteger(const std::string& key, const std::string& value,
                          const std::string& origin, int lineNo) {
    std::string digits;
    for (char c : value) {
        if (c != '_') digits += c;
    }
    try {
        size_t used = 0;
        std::int64_t n = std::stoll(digits, &used, 10);
        if (used == digits.size()) return n;
    } catch (const std::exception&) {
        // fall through to the error below
    }
    fail(origin, lineNo, key + " must be an integer, got '" + value + "'");
}

std::vector<std::string> parseStringArray(const std::string& key, const std::string& value,
                                          const std::string& origin, int lineNo) {
    if (value.size() < 2 || value.front() != '[' || value.back() != ']') {
        fail(origin, lineNo, key + " must be an array of strings");
    }

    std::vector<std::string> items;
    std::string inner = value.substr(1, value.size() - 2);
    size_t pos = 0;
    bool expectItem = true;
    while (pos < inner.size()) {
        char c = inner[pos];
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            pos++;
        } else if (c == ',' && !expectItem) {
            expectItem = true;
            pos++;
        } else if (expectItem && (c == '"' || c == '\'')) {
            std::string item;
            if (!readQuoted(inner, pos, item)) {
                fail(origin, lineNo, "malformed string in " + key);
            }
            items.push_back(std::move(item));
            expectItem = false;
        } else {
            fail(origin, lineNo, key + " must be an array of strings");
        }
    }
    return items;
}

} // namespace

FileConfig parseConfig(std::istream& in, const std::string& origin) {
    FileConfig config;

    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        lineNo++;
        const int startLine = lineNo;
        line = trim(stripComment(line));

        // Skip empty lines and section headers
        if (line.empty() || line[0] == '[') {
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            fail(origin, lineNo, "expected key = value");
        }

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        // Arrays may continue on the following lines
        if (!value.empty() && value[0] == '[') {
            std::string next;
            while (!bracketsBalanced(value) && std::getline(in, next)) {
                lineNo++;
                value += "\n" + trim(stripComment(next));
            }
            value = trim(value);
        }

        if (key == "item_expiry_seconds") {
            config.itemExpirySeconds = parseInteger(key, value, origin, startLine);
        } else if (key == "update_interval_seconds") {
            config.updateIntervalSeconds = parseInteger(key, value, origin, startLine);
        } else if (key == "ipc_timeout_ms") {
            config.ipcTimeoutMs = parseInteger(key, value, origin, startLine);
        } else if (key == "always_remove_patterns") {
            config.alwaysRemovePatterns = parseStringArray(key, value, origin, startLine);
        } else if (key == "never_remove_patterns") {
            config.neverRemovePatterns = parseStringArray(key, value, origin, startLine);
        } else {
            spdlog::debug("{}:{}: ignoring unknown key '{}'", origin, startLine, key);
        }
    }

    return config;
}

FileConfig loadConfigFile(const std::string& path, bool required) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (required) {
            throw ConfigError("config file not found: " + path);
        }
        spdlog::debug("config file does not exist: {}", path);
        return {};
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("cannot read config file " + path);
    }

    spdlog::debug("reading config file: {}", path);
    return parseConfig(file, path);
}

namespace {

template <typename T>
const T& pick(const std::optional<T>& override, const std::optional<T>& file, const T& fallback) {
    if (override) return *override;
    if (file) return *file;
    return fallback;
}

std::int64_t requireInRange(const char* key, std::int64_t value, std::int64_t max) {
    if (value <= 0) {
        throw ConfigError(std::string(key) + " must be greater than zero (got " +
                          std::to_string(value) + ")");
    }
    if (value > max) {
        throw ConfigError(std::string(key) + " must be at most " + std::to_string(max) +
                          " (got " + std::to_string(value) + ")");
    }
    return value;
}

} // namespace

ResolvedConfig resolveConfig(const FileConfig& file, const ConfigOverrides& overrides) {
    static const std::vector<std::string> NO_PATTERNS;

    ResolvedConfig config;
    config.itemExpiry = std::chrono::seconds(requireInRange("item_expiry_seconds",
        pick(overrides.itemExpirySeconds, file.itemExpirySeconds, ResolvedConfig::DEFAULT_EXPIRY_SECONDS),
        ResolvedConfig::MAX_EXPIRY_SECONDS));
    config.updateInterval = std::chrono::seconds(requireInRange("update_interval_seconds",
        pick(overrides.updateIntervalSeconds, file.updateIntervalSeconds, ResolvedConfig::DEFAULT_INTERVAL_SECONDS),
        ResolvedConfig::MAX_INTERVAL_SECONDS));
    config.ipcTimeout = std::chrono::milliseconds(requireInRange("ipc_timeout_ms",
        pick(overrides.ipcTimeoutMs, file.ipcTimeoutMs, ResolvedConfig::DEFAULT_IPC_TIMEOUT_MS),
        ResolvedConfig::MAX_IPC_TIMEOUT_MS));

    config.alwaysRemovePatterns = pick(overrides.alwaysRemovePatterns, file.alwaysRemovePatterns, NO_PATTERNS);
    config.neverRemovePatterns = pick(overrides.neverRemovePatterns, file.neverRemovePatterns, NO_PATTERNS);

    spdlog::debug("resolved config: expiry={}s interval={}s ipc_timeout={}ms deny={} keep={}",
                  config.itemExpiry.count(), config.updateInterval.count(), config.ipcTimeout.count(),
                  config.alwaysRemovePatterns.size(), config.neverRemovePatterns.size());
    return config;
}

} // namespace clipexpire
