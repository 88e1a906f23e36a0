#include "geodb/core.hpp"
#include "geodb/options.hpp"

#include <GeoIP.h>
#include <format>

namespace geodb::core {

namespace {

std::string compiler_name() {
#if defined(__clang__)
  return std::format("Clang {}", __clang_version__);
#elif defined(__GNUC__)
  return std::format("GCC {}.{}.{}", __GNUC__, __GNUC_MINOR__,
                     __GNUC_PATCHLEVEL__);
#elif defined(_MSC_VER)
  return std::format("MSVC {}", _MSC_VER);
#else
  return "Unknown";
#endif
}

std::string architecture_name() {
#if defined(__x86_64__) || defined(_M_X64)
  return "x86_64";
#elif defined(__aarch64__) || defined(_M_ARM64)
  return "arm64";
#else
  return "Unknown";
#endif
}

} // namespace

std::string_view version() noexcept { return "0.3.0"; }

std::string native_version() {
  const char *v = GeoIP_lib_version();
  return v ? std::string(v) : std::string("unknown");
}

BuildInfo get_build_info() {
  BuildInfo info;
  info.compiler = compiler_name();
  info.architecture = architecture_name();
  info.standard = std::format("C++{}", __cplusplus / 100 % 100);
  info.native_library = std::format("libGeoIP {}", native_version());

  // Database::open() always switches handles to GEOIP_CHARSET_UTF8
  info.charset = "UTF-8";
  info.default_flags = bitmask(default_options());
  return info;
}

} // namespace geodb::core
