#pragma once

#include <string_view>

namespace lolcommits::app {

/// Routes the default spdlog logger to stderr at the given level
/// ("trace", "debug", "info", "warn", "error", "critical", "off").
/// SPDLOG_LEVEL from the environment overrides it (e.g. SPDLOG_LEVEL=debug).
void init_logging(std::string_view level);

}  // namespace lolcommits::app
