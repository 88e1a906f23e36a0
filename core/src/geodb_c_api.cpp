/**
 * @file geodb_c_api.cpp
 * @brief C API implementation — exception-safe FFI boundary.
 *
 * Every extern "C" function is wrapped in:
 *   try { ... } catch (const <specific>&) { return GEODB_ERR_...; }
 *               catch (...) { return GEODB_ERR_UNKNOWN; }
 */

#include "geodb/geodb_c_api.h"
#include "geodb/core.hpp"
#include "geodb/database.hpp"
#include "geodb/error.hpp"
#include "geodb/log.hpp"

#include <GeoIP.h>

#include <algorithm>
#include <cstring>
#include <new>
#include <stdexcept>
#include <string>

// ===========================================================================
// Internal helpers
// ===========================================================================

static geodb::Database *to_db(geodb_t *handle) {
  return reinterpret_cast<geodb::Database *>(handle);
}

static const geodb::Database *to_db(const geodb_t *handle) {
  return reinterpret_cast<const geodb::Database *>(handle);
}

/// False if opts.caching is not one of the GEODB_CACHE_* values.
static bool to_options(const geodb_options_t &opts, geodb::Options &out) {
  switch (opts.caching) {
  case GEODB_CACHE_STANDARD:
    out.caching = geodb::CachingStrategy::Standard;
    break;
  case GEODB_CACHE_MEMORY:
    out.caching = geodb::CachingStrategy::MemoryCache;
    break;
  case GEODB_CACHE_INDEX:
    out.caching = geodb::CachingStrategy::IndexCache;
    break;
  default:
    return false;
  }
  out.reload_on_update = opts.reload_on_update != 0;
  out.use_mmap = opts.use_mmap != 0;
  return true;
}

/// Copy with NUL terminator; false if it does not fit.
template <size_t N> static bool copy_field(char (&dst)[N], const std::string &src) {
  if (src.size() >= N)
    return false;
  std::memcpy(dst, src.c_str(), src.size() + 1);
  return true;
}

static void write_message(char *buf, size_t size, const char *msg) {
  if (!buf || size == 0)
    return;
  size_t n = std::min(std::strlen(msg), size - 1);
  std::memcpy(buf, msg, n);
  buf[n] = '\0';
}

extern "C" {

// ===========================================================================
// Lifecycle
// ===========================================================================

GEODB_API geodb_options_t geodb_default_options(void) {
  geodb_options_t opts;
  opts.caching = GEODB_CACHE_STANDARD;
  opts.reload_on_update = 1;
  opts.use_mmap = 1;
  return opts;
}

GEODB_API geodb_error_t geodb_open(const char *path,
                                   const geodb_options_t *opts,
                                   geodb_t **out_db, char *err_buf,
                                   size_t err_buf_size) {
  if (!path || !out_db)
    return GEODB_ERR_NULL_PTR;

  *out_db = nullptr;
  write_message(err_buf, err_buf_size, "");

  geodb::Options options;
  if (!to_options(opts ? *opts : geodb_default_options(), options)) {
    write_message(err_buf, err_buf_size, "invalid caching strategy");
    return GEODB_ERR_INVALID_ARG;
  }

  try {
    auto *db = new geodb::Database(geodb::Database::open(path, options));
    *out_db = reinterpret_cast<geodb_t *>(db);
    return GEODB_OK;
  } catch (const geodb::OpenError &e) {
    write_message(err_buf, err_buf_size, e.what());
    return GEODB_ERR_OPEN;
  } catch (const std::invalid_argument &e) {
    write_message(err_buf, err_buf_size, e.what());
    return GEODB_ERR_INVALID_ARG;
  } catch (const std::bad_alloc &) {
    return GEODB_ERR_OUT_OF_MEMORY;
  } catch (...) {
    return GEODB_ERR_UNKNOWN;
  }
}

GEODB_API geodb_error_t geodb_close(geodb_t **db) {
  if (!db || !*db)
    return GEODB_OK;

  // Null the caller's pointer first: a repeated close sees NULL.
  geodb::Database *d = to_db(*db);
  *db = nullptr;
  delete d;
  return GEODB_OK;
}

// ===========================================================================
// Query
// ===========================================================================

GEODB_API geodb_error_t geodb_lookup(const geodb_t *db, const char *ip,
                                     geodb_record_t *out_record,
                                     int *out_found) {
  if (!db || !ip || !out_record || !out_found)
    return GEODB_ERR_NULL_PTR;

  *out_found = 0;

  try {
    auto r = to_db(db)->lookup(ip);
    if (!r)
      return GEODB_OK;

    // Fill a scratch copy so the caller never sees a half-written record.
    geodb_record_t tmp;
    std::memset(&tmp, 0, sizeof(tmp));
    bool fits = copy_field(tmp.country_code, r->country_code) &&
                copy_field(tmp.country_code3, r->country_code3) &&
                copy_field(tmp.country_name, r->country_name) &&
                copy_field(tmp.region, r->region) &&
                copy_field(tmp.city, r->city) &&
                copy_field(tmp.postal_code, r->postal_code) &&
                copy_field(tmp.continent_code, r->continent_code);
    if (!fits)
      return GEODB_ERR_BUFFER_TOO_SMALL;

    tmp.latitude = r->latitude;
    tmp.longitude = r->longitude;
    tmp.area_code = r->area_code;

    *out_record = tmp;
    *out_found = 1;
    return GEODB_OK;
  } catch (const std::bad_alloc &) {
    return GEODB_ERR_OUT_OF_MEMORY;
  } catch (...) {
    return GEODB_ERR_UNKNOWN;
  }
}

GEODB_API geodb_error_t geodb_info(const geodb_t *db, char *buf,
                                   size_t buf_size, size_t *out_len) {
  if (!db || !buf || !out_len)
    return GEODB_ERR_NULL_PTR;

  try {
    std::string info = to_db(db)->info();
    *out_len = info.size();
    if (buf_size <= info.size())
      return GEODB_ERR_BUFFER_TOO_SMALL;
    std::memcpy(buf, info.c_str(), info.size() + 1);
    return GEODB_OK;
  } catch (const std::bad_alloc &) {
    return GEODB_ERR_OUT_OF_MEMORY;
  } catch (...) {
    return GEODB_ERR_UNKNOWN;
  }
}

GEODB_API geodb_error_t geodb_edition(const geodb_t *db, int *out_edition) {
  if (!db || !out_edition)
    return GEODB_ERR_NULL_PTR;

  *out_edition = to_db(db)->edition();
  return GEODB_OK;
}

GEODB_API geodb_error_t geodb_bitmask(const geodb_options_t *opts,
                                      int *out_bitmask) {
  if (!opts || !out_bitmask)
    return GEODB_ERR_NULL_PTR;

  geodb::Options options;
  if (!to_options(*opts, options))
    return GEODB_ERR_INVALID_ARG;

  *out_bitmask = geodb::bitmask(options);
  return GEODB_OK;
}

// ===========================================================================
// Misc
// ===========================================================================

GEODB_API const char *geodb_version(void) {
  return geodb::core::version().data();
}

GEODB_API const char *geodb_native_version(void) {
  const char *v = GeoIP_lib_version();
  return v ? v : "unknown";
}

GEODB_API const char *geodb_error_string(geodb_error_t err) {
  switch (err) {
  case GEODB_OK:
    return "GEODB_OK";
  case GEODB_ERR_NULL_PTR:
    return "GEODB_ERR_NULL_PTR";
  case GEODB_ERR_OPEN:
    return "GEODB_ERR_OPEN";
  case GEODB_ERR_BUFFER_TOO_SMALL:
    return "GEODB_ERR_BUFFER_TOO_SMALL";
  case GEODB_ERR_OUT_OF_MEMORY:
    return "GEODB_ERR_OUT_OF_MEMORY";
  case GEODB_ERR_INVALID_ARG:
    return "GEODB_ERR_INVALID_ARG";
  case GEODB_ERR_UNKNOWN:
    return "GEODB_ERR_UNKNOWN";
  default:
    return "GEODB_ERR_UNRECOGNIZED";
  }
}

GEODB_API geodb_error_t geodb_set_log_level(int level) {
  if (level < spdlog::level::trace || level > spdlog::level::off)
    return GEODB_ERR_INVALID_ARG;

  try {
    geodb::log::set_level(static_cast<spdlog::level::level_enum>(level));
    return GEODB_OK;
  } catch (...) {
    return GEODB_ERR_UNKNOWN;
  }
}

} // extern "C"
