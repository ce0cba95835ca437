#pragma once
#include <chrono>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace clipexpire {

// Values as read from clipexpire.toml. Absent keys stay empty.
struct FileConfig {
    std::optional<std::int64_t> itemExpirySeconds;
    std::optional<std::int64_t> updateIntervalSeconds;
    std::optional<std::int64_t> ipcTimeoutMs;
    std::optional<std::vector<std::string>> alwaysRemovePatterns;
    std::optional<std::vector<std::string>> neverRemovePatterns;
};

// Values supplied on the command line. Each one set here wins over the file.
struct ConfigOverrides {
    std::optional<std::int64_t> itemExpirySeconds;
    std::optional<std::int64_t> updateIntervalSeconds;
    std::optional<std::int64_t> ipcTimeoutMs;
    std::optional<std::vector<std::string>> alwaysRemovePatterns;
    std::optional<std::vector<std::string>> neverRemovePatterns;
};

struct ResolvedConfig {
    // Defaults
    static constexpr std::int64_t DEFAULT_EXPIRY_SECONDS = 10 * 60;
    static constexpr std::int64_t DEFAULT_INTERVAL_SECONDS = 30;
    static constexpr std::int64_t DEFAULT_IPC_TIMEOUT_MS = 5000;

    // Upper bounds: ages are steady_clock durations, the timer takes a guint
    // and GDBus a gint timeout
    static constexpr std::int64_t MAX_EXPIRY_SECONDS =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::duration::max()).count();
    static constexpr std::int64_t MAX_INTERVAL_SECONDS = std::numeric_limits<unsigned int>::max();
    static constexpr std::int64_t MAX_IPC_TIMEOUT_MS = std::numeric_limits<int>::max();

    std::chrono::seconds itemExpiry{DEFAULT_EXPIRY_SECONDS};
    std::chrono::seconds updateInterval{DEFAULT_INTERVAL_SECONDS};
    std::chrono::milliseconds ipcTimeout{DEFAULT_IPC_TIMEOUT_MS};

    std::vector<std::string> alwaysRemovePatterns;  // deny: removed on sight
    std::vector<std::string> neverRemovePatterns;   // keep: never aged out
};

} // namespace clipexpire
