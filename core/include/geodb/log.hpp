#pragma once

#include <memory>
#include <optional>
#include <string_view>

#include <spdlog/spdlog.h>

namespace geodb::log {

/// Name the library logger is registered under in the spdlog registry.
inline constexpr const char *LOGGER_NAME = "geodb";

/**
 * @brief The library logger, created on first use.
 *
 * Logs to stderr at `warn` unless SPDLOG_LEVEL (e.g. "geodb=debug") or
 * set_level() says otherwise. If the host application already registered a
 * logger named "geodb", that one is used instead.
 *
 * Only the level of this logger is taken from SPDLOG_LEVEL; the spdlog
 * registry's global and per-logger levels are left as the host set them.
 */
std::shared_ptr<spdlog::logger> logger();

void set_level(spdlog::level::level_enum level);

/**
 * @brief Parse a level name ("trace" ... "critical", "off").
 * @return std::nullopt for anything spdlog does not recognise.
 */
std::optional<spdlog::level::level_enum> parse_level(std::string_view name);

/**
 * @brief The level SPDLOG_LEVEL-style @p spec assigns to the geodb logger.
 *
 * @p spec is a comma-separated list of `level` and `logger=level` entries.
 * A "geodb=" entry wins over a bare level; entries for other loggers and
 * unparseable levels are ignored.
 */
std::optional<spdlog::level::level_enum> level_from_spec(std::string_view spec);

} // namespace geodb::log
