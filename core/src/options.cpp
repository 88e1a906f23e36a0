#include "geodb/options.hpp"

#include <GeoIP.h>

#include <array>
#include <stdexcept>
#include <string>

namespace geodb {

namespace {

struct CachingFlag {
  CachingStrategy strategy;
  int flag;
  std::string_view name;
};

constexpr std::array<CachingFlag, 3> CACHING_FLAGS{{
    {CachingStrategy::Standard, GEOIP_STANDARD, "standard"},
    {CachingStrategy::MemoryCache, GEOIP_MEMORY_CACHE, "memory"},
    {CachingStrategy::IndexCache, GEOIP_INDEX_CACHE, "index"},
}};

constexpr int RELOAD_FLAG = GEOIP_CHECK_CACHE;
constexpr int MMAP_FLAG = GEOIP_MMAP_CACHE;

const CachingFlag *entry_for(CachingStrategy strategy) noexcept {
  for (const auto &e : CACHING_FLAGS) {
    if (e.strategy == strategy)
      return &e;
  }
  return nullptr;
}

} // namespace

int caching_flag(CachingStrategy strategy) {
  const CachingFlag *e = entry_for(strategy);
  if (!e)
    throw std::invalid_argument("invalid caching strategy " +
                                std::to_string(static_cast<int>(strategy)));
  return e->flag;
}

int reload_flag() noexcept { return RELOAD_FLAG; }

int mmap_flag() noexcept { return MMAP_FLAG; }

int bitmask(const Options &options) {
  int v = caching_flag(options.caching);

  if (options.reload_on_update)
    v |= RELOAD_FLAG;

  if (options.use_mmap)
    v |= MMAP_FLAG;

  return v;
}

std::string_view to_string(CachingStrategy strategy) noexcept {
  const CachingFlag *e = entry_for(strategy);
  return e ? e->name : std::string_view("unknown");
}

} // namespace geodb
