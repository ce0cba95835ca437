#pragma once
// Error taxonomy: fatal startup errors vs. transient IPC failures

#include <stdexcept>
#include <string>

namespace clipexpire {

// Bad configuration at startup. Fatal: the daemon exits before the loop starts.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

// A regex from the config that failed to compile
class InvalidPattern : public ConfigError {
public:
    InvalidPattern(const std::string& key, const std::string& pattern, const std::string& reason)
        : ConfigError("invalid regex in " + key + ": '" + pattern + "' (" + reason + ")"),
          m_key(key), m_pattern(pattern) {}

    const std::string& key() const { return m_key; }
    const std::string& pattern() const { return m_pattern; }

private:
    std::string m_key;
    std::string m_pattern;
};

// Bad command line
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message)
        : std::runtime_error(message) {}
};

// Clipboard manager unreachable, timed out or returned an error.
// Transient: the current tick is abandoned and the next one retries.
class GatewayError : public std::runtime_error {
public:
    explicit GatewayError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace clipexpire
