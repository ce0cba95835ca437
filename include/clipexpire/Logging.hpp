#pragma once
// Single Responsibility: spdlog setup

#include <spdlog/spdlog.h>

namespace clipexpire {

// 0 -> warn, 1 -> info, 2 -> debug, 3+ -> trace
spdlog::level::level_enum levelForVerbosity(int verbosity);

// Install the stderr logger as spdlog's default
void initLogging(int verbosity);

} // namespace clipexpire
