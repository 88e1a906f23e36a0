#include "geodb/database.hpp"
#include "geodb/error.hpp"
#include "geodb/log.hpp"

#include <GeoIP.h>
#include <GeoIPCity.h>

#include <cerrno>
#include <cstdlib>
#include <memory>
#include <utility>

namespace geodb {

namespace {

struct RecordDeleter {
  void operator()(GeoIPRecord *r) const noexcept { GeoIPRecord_delete(r); }
};

using NativeRecord = std::unique_ptr<GeoIPRecord, RecordDeleter>;

std::string copy_string(const char *s) { return s ? std::string(s) : std::string(); }

} // namespace

Database Database::open(const std::filesystem::path &path,
                        const Options &options) {
  const int flags = bitmask(options);

  // Created here, before any handle exists, so close() never constructs it.
  const auto logger = log::logger();

  errno = 0;
  GeoIP *handle = GeoIP_open(path.c_str(), flags);
  if (!handle) {
    const int err = errno != 0 ? errno : EINVAL;
    OpenError e(path, err);
    logger->warn("open {} (flags=0x{:x}) failed: {}", path.string(), flags,
                 e.code().message());
    throw e;
  }

  Database db(handle, path);

  // libGeoIP defaults to ISO-8859-1; Record promises UTF-8.
  GeoIP_set_charset(handle, GEOIP_CHARSET_UTF8);

  logger->debug("opened {} (flags=0x{:x}, caching={}, edition={})",
                path.string(), flags, to_string(options.caching), db.edition());
  return db;
}

Database::Database(Database &&other) noexcept
    : handle_(std::exchange(other.handle_, nullptr)),
      path_(std::move(other.path_)) {}

Database &Database::operator=(Database &&other) noexcept {
  if (this != &other) {
    close();
    handle_ = std::exchange(other.handle_, nullptr);
    path_ = std::move(other.path_);
  }
  return *this;
}

std::optional<Record> Database::lookup(const std::string &ip) const {
  if (!handle_)
    return std::nullopt;

  NativeRecord r(GeoIP_record_by_addr(handle_, ip.c_str()));
  if (!r) {
    log::logger()->trace("no record for '{}'", ip);
    return std::nullopt;
  }

  Record out;
  out.country_code = copy_string(r->country_code);
  out.country_code3 = copy_string(r->country_code3);
  out.country_name = copy_string(r->country_name);
  out.region = copy_string(r->region);
  out.city = copy_string(r->city);
  out.postal_code = copy_string(r->postal_code);
  out.latitude = static_cast<double>(r->latitude);
  out.longitude = static_cast<double>(r->longitude);
  out.area_code = r->area_code;
  out.continent_code = copy_string(r->continent_code);
  return out;
}

void Database::close() noexcept {
  GeoIP *handle = std::exchange(handle_, nullptr);
  if (!handle)
    return;

  GeoIP_delete(handle);
  // A handle only comes from open(), which already created the logger.
  log::logger()->debug("closed {}", path_.c_str());
}

std::string Database::info() const {
  if (!handle_)
    return {};

  std::unique_ptr<char, decltype(&std::free)> s(GeoIP_database_info(handle_),
                                                &std::free);
  return s ? std::string(s.get()) : std::string();
}

int Database::edition() const noexcept {
  return handle_ ? GeoIP_database_edition(handle_) : -1;
}

} // namespace geodb
