#pragma once

#include <string>

namespace geodb {

/**
 * @brief Geolocation attributes for one matched address.
 *
 * Owned entirely by the caller: every field is copied out of the native
 * GeoIPRecord, which is freed before lookup() returns. Native NULL strings
 * become empty strings. All strings are UTF-8.
 */
struct Record {
  std::string country_code;  ///< ISO 3166 two-letter code, e.g. "US"
  std::string country_code3; ///< Three-letter code, e.g. "USA"
  std::string country_name;
  std::string region;
  std::string city;
  std::string postal_code;
  double latitude = 0.0;  ///< Degrees
  double longitude = 0.0; ///< Degrees
  int area_code = 0;      ///< Telephone area code (US only, else 0)
  std::string continent_code;

  bool operator==(const Record &) const = default;
};

} // namespace geodb
