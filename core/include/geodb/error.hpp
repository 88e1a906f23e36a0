#pragma once

#include <filesystem>
#include <string>
#include <system_error>

namespace geodb {

/**
 * @brief The database file could not be opened by libGeoIP.
 *
 * Carries the errno left behind by GeoIP_open() unmodified. libGeoIP can
 * also fail without touching errno (e.g. an allocation failure inside the
 * library); that case is reported as EINVAL.
 */
class OpenError : public std::system_error {
public:
  OpenError(const std::filesystem::path &path, int native_errno)
      : std::system_error(native_errno, std::generic_category(),
                          "cannot open GeoIP database '" + path.string() +
                              "'"),
        path_(path) {}

  const std::filesystem::path &path() const noexcept { return path_; }

private:
  std::filesystem::path path_;
};

} // namespace geodb
