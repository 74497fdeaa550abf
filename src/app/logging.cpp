#include <lolcommits/app/logging.hpp>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>

namespace lolcommits::app {

void init_logging(std::string_view level) {
  if (!spdlog::get("lolcommits")) {
    auto logger = spdlog::stderr_color_mt("lolcommits");
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
  }

  const auto parsed = spdlog::level::from_str(std::string(level));
  // from_str maps unknown names to off.
  if (parsed == spdlog::level::off && level != "off") {
    spdlog::set_level(spdlog::level::info);
    spdlog::warn("unknown log_level '{}', using info", level);
  } else {
    spdlog::set_level(parsed);
  }
  spdlog::cfg::load_env_levels();
}

}  // namespace lolcommits::app
