#pragma once

/**
 * @file options.hpp
 * @brief Open-time configuration and its translation into libGeoIP flags.
 *
 * libGeoIP takes a single `int flags` argument in GeoIP_open(). The three
 * settings below are independent; the caching strategy always contributes
 * its flag, the two booleans contribute theirs only when set. Combinations
 * are not validated here: libGeoIP decides what they mean. A strategy value
 * outside the enumerators is rejected with std::invalid_argument.
 */

#include <string_view>

namespace geodb {

/// How much of the database file libGeoIP keeps in memory.
enum class CachingStrategy {
  Standard,    ///< No caching, every lookup reads the file (GEOIP_STANDARD)
  MemoryCache, ///< Whole database loaded into memory (GEOIP_MEMORY_CACHE)
  IndexCache   ///< Only the most recently used index (GEOIP_INDEX_CACHE)
};

struct Options {
  CachingStrategy caching = CachingStrategy::Standard;
  bool reload_on_update = true; ///< Watch the file and reload on change
  bool use_mmap = true;         ///< mmap the file instead of read()
};

/**
 * @brief Default options: no caching, reload on update, mmap.
 */
constexpr Options default_options() noexcept { return Options{}; }

/**
 * @brief The libGeoIP flag for a caching strategy.
 * @throws std::invalid_argument if @p strategy is not an enumerator.
 */
int caching_flag(CachingStrategy strategy);

/// Flag OR-ed in when reload_on_update is set (GEOIP_CHECK_CACHE).
int reload_flag() noexcept;

/// Flag OR-ed in when use_mmap is set (GEOIP_MMAP_CACHE).
int mmap_flag() noexcept;

/**
 * @brief Compose the GeoIP_open() flag bitmask for a set of options.
 */
int bitmask(const Options &options);

/// "standard", "memory", "index"; "unknown" for a non-enumerator value.
std::string_view to_string(CachingStrategy strategy) noexcept;

} // namespace geodb
