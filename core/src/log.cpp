#include "geodb/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <string>

namespace geodb::log {

namespace {

std::string_view trim(std::string_view s) {
  const auto first = s.find_first_not_of(" \t");
  if (first == std::string_view::npos)
    return {};
  const auto last = s.find_last_not_of(" \t");
  return s.substr(first, last - first + 1);
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
  static std::shared_ptr<spdlog::logger> instance = [] {
    if (auto existing = spdlog::get(LOGGER_NAME))
      return existing;

    auto l = spdlog::stderr_color_mt(LOGGER_NAME);
    l->set_level(spdlog::level::warn);
    if (const char *env = std::getenv("SPDLOG_LEVEL")) {
      if (auto level = level_from_spec(env))
        l->set_level(*level);
    }
    return l;
  }();
  return instance;
}

void set_level(spdlog::level::level_enum level) { logger()->set_level(level); }

std::optional<spdlog::level::level_enum> parse_level(std::string_view name) {
  const std::string s(trim(name));
  const auto level = spdlog::level::from_str(s);
  // from_str maps unknown names to off
  if (level == spdlog::level::off && s != "off")
    return std::nullopt;
  return level;
}

std::optional<spdlog::level::level_enum> level_from_spec(std::string_view spec) {
  std::optional<spdlog::level::level_enum> bare;
  std::optional<spdlog::level::level_enum> named;

  while (!spec.empty()) {
    const auto comma = spec.find(',');
    const std::string_view entry = trim(spec.substr(0, comma));
    spec = comma == std::string_view::npos ? std::string_view{}
                                           : spec.substr(comma + 1);

    const auto eq = entry.find('=');
    if (eq == std::string_view::npos) {
      if (auto level = parse_level(entry))
        bare = level;
    } else if (trim(entry.substr(0, eq)) == LOGGER_NAME) {
      if (auto level = parse_level(entry.substr(eq + 1)))
        named = level;
    }
  }
  return named ? named : bare;
}

} // namespace geodb::log
