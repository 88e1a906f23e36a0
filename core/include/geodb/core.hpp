#pragma once

#include <string>
#include <string_view>

// Symbol visibility macros
#if defined(_WIN32)
  #if defined(GEODB_CORE_EXPORTS)
    #define GEODB_CORE_EXPORT __declspec(dllexport)
  #else
    #define GEODB_CORE_EXPORT __declspec(dllimport)
  #endif
#else
  #define GEODB_CORE_EXPORT __attribute__((visibility("default")))
#endif

namespace geodb::core {

struct BuildInfo {
  std::string compiler;
  std::string architecture;
  std::string standard;
  std::string native_library; ///< "libGeoIP <version>"
  std::string charset;        ///< Encoding of Record strings
  int default_flags = 0;      ///< GeoIP_open() flags for default_options()
};

/**
 * @brief Returns the version of geodb.
 */
GEODB_CORE_EXPORT std::string_view version() noexcept;

/**
 * @brief Returns the version string of the linked libGeoIP.
 */
GEODB_CORE_EXPORT std::string native_version();

/**
 * @brief Returns build-time information about the library.
 */
GEODB_CORE_EXPORT BuildInfo get_build_info();

} // namespace geodb::core
