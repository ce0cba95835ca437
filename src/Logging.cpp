#include "clipexpire/Logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace clipexpire {

spdlog::level::level_enum levelForVerbosity(int verbosity) {
    switch (verbosity) {
        case 0: return spdlog::level::warn;
        case 1: return spdlog::level::info;
        case 2: return spdlog::level::debug;
        default: return verbosity < 0 ? spdlog::level::warn : spdlog::level::trace;
    }
}

void initLogging(int verbosity) {
    auto logger = spdlog::get("clipexpire");
    if (!logger) {
        logger = spdlog::stderr_color_mt("clipexpire");
    }
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v");
    logger->set_level(levelForVerbosity(verbosity));
    spdlog::set_default_logger(logger);

    if (verbosity > 3) {
        spdlog::info("already at maximum --verbose level");
    }
}

} // namespace clipexpire
