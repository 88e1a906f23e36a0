#pragma once

/**
 * @file database.hpp
 * @brief Owning wrapper around a libGeoIP City database handle.
 *
 * OWNERSHIP:
 *   A Database exclusively owns one native `GeoIP *`. The handle is released
 *   by close() or by the destructor, whichever runs first. close() nulls the
 *   pointer before calling GeoIP_delete(), so a second close() (explicit, from
 *   the destructor, or from a moved-from object) is a no-op.
 *
 * THREADING:
 *   No locks are taken here. Whether concurrent lookup() calls on a single
 *   handle are safe is up to libGeoIP and the caching strategy in use;
 *   callers that need it must synchronise externally.
 *
 * LOOKUP AFTER CLOSE:
 *   Not supported. A closed handle reports every address as absent.
 */

#include "geodb/options.hpp"
#include "geodb/record.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <utility>

// Forward declaration of libGeoIP's handle type (`typedef struct GeoIPTag GeoIP`)
struct GeoIPTag;

namespace geodb {

class Database {
public:
  /**
   * @brief Open a GeoIP database file.
   *
   * Translates @p options into the libGeoIP flag bitmask, opens the file and
   * switches the handle to UTF-8 output (GEOIP_CHARSET_UTF8). Without the
   * charset switch libGeoIP returns ISO-8859-1 place names.
   *
   * @throws OpenError if libGeoIP cannot open the file.
   * @throws std::invalid_argument if options.caching is not a CachingStrategy
   *         enumerator.
   */
  static Database open(const std::filesystem::path &path,
                       const Options &options = default_options());

  Database(const Database &) = delete;
  Database &operator=(const Database &) = delete;

  Database(Database &&other) noexcept;
  Database &operator=(Database &&other) noexcept;

  ~Database() { close(); }

  /**
   * @brief Look up the City record for a textual IP address.
   *
   * The address is handed to GeoIP_record_by_addr() as-is. The native record
   * is copied into the returned value and freed before returning.
   *
   * @return std::nullopt if the database has no entry for the address
   *         (including addresses libGeoIP cannot parse), the record otherwise.
   */
  std::optional<Record> lookup(const std::string &ip) const;

  /**
   * @brief Release the native handle. Idempotent.
   */
  void close() noexcept;

  bool is_open() const noexcept { return handle_ != nullptr; }

  const std::filesystem::path &path() const noexcept { return path_; }

  /// Database description string from the file trailer ("" if none).
  std::string info() const;

  /// libGeoIP database type id (GEOIP_CITY_EDITION_REV1, ...), -1 if closed.
  int edition() const noexcept;

private:
  Database(GeoIPTag *handle, std::filesystem::path path) noexcept
      : handle_(handle), path_(std::move(path)) {}

  GeoIPTag *handle_ = nullptr;
  std::filesystem::path path_;
};

} // namespace geodb
