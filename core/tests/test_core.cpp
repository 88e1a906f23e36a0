#include "geodb/core.hpp"
#include "geodb/log.hpp"

#include <GeoIP.h>

#include <cstdlib>
#include <gtest/gtest.h>
#include <spdlog/sinks/null_sink.h>

TEST(CoreTest, VersionIsSet) {
  EXPECT_FALSE(geodb::core::version().empty());
  EXPECT_FALSE(geodb::core::native_version().empty());
}

TEST(CoreTest, BuildInfo) {
  auto info = geodb::core::get_build_info();
  EXPECT_FALSE(info.compiler.empty());
  EXPECT_FALSE(info.architecture.empty());
  EXPECT_EQ(info.standard.rfind("C++", 0), 0u);
  EXPECT_NE(info.native_library.find(geodb::core::native_version()),
            std::string::npos);
  EXPECT_EQ(info.charset, "UTF-8");
  EXPECT_EQ(info.default_flags, GEOIP_STANDARD | GEOIP_CHECK_CACHE |
                                    GEOIP_MMAP_CACHE);
}

TEST(LogTest, SharedNamedLogger) {
  auto a = geodb::log::logger();
  auto b = geodb::log::logger();
  ASSERT_NE(a, nullptr);
  EXPECT_EQ(a, b);
  EXPECT_EQ(a->name(), geodb::log::LOGGER_NAME);
  EXPECT_EQ(spdlog::get(geodb::log::LOGGER_NAME), a);
}

TEST(LogTest, SetLevel) {
  auto previous = geodb::log::logger()->level();
  geodb::log::set_level(spdlog::level::debug);
  EXPECT_EQ(geodb::log::logger()->level(), spdlog::level::debug);
  geodb::log::set_level(previous);
}

TEST(LogTest, ParseLevel) {
  EXPECT_EQ(geodb::log::parse_level("debug"), spdlog::level::debug);
  EXPECT_EQ(geodb::log::parse_level(" warn "), spdlog::level::warn);
  EXPECT_EQ(geodb::log::parse_level("off"), spdlog::level::off);
  EXPECT_FALSE(geodb::log::parse_level("degub").has_value());
  EXPECT_FALSE(geodb::log::parse_level("").has_value());
}

TEST(LogTest, LevelFromSpec) {
  using geodb::log::level_from_spec;
  EXPECT_EQ(level_from_spec("geodb=debug"), spdlog::level::debug);
  EXPECT_EQ(level_from_spec("info,geodb=trace"), spdlog::level::trace);
  EXPECT_EQ(level_from_spec("geodb=trace,info"), spdlog::level::trace);
  EXPECT_EQ(level_from_spec("error"), spdlog::level::err);
  EXPECT_EQ(level_from_spec("other=trace,geodb = critical"),
            spdlog::level::critical);
  EXPECT_FALSE(level_from_spec("other=trace").has_value());
  EXPECT_FALSE(level_from_spec("geodb=bogus").has_value());
  EXPECT_FALSE(level_from_spec("").has_value());
}

TEST(LogTest, LibraryLoggerLeavesRegistryLevelsAlone) {
  auto host = std::make_shared<spdlog::logger>(
      "geodb_test_host", std::make_shared<spdlog::sinks::null_sink_mt>());
  host->set_level(spdlog::level::critical);
  spdlog::register_logger(host);

  // A bare level in SPDLOG_LEVEL is a process-wide default; the library
  // logger only reads it for itself.
  const bool first_use = spdlog::get(geodb::log::LOGGER_NAME) == nullptr;
  ::setenv("SPDLOG_LEVEL", "info,geodb=debug", 1);
  auto lib = geodb::log::logger();
  ::unsetenv("SPDLOG_LEVEL");

  EXPECT_EQ(host->level(), spdlog::level::critical);
  if (first_use) {
    EXPECT_EQ(lib->level(), spdlog::level::debug);
  }

  spdlog::drop("geodb_test_host");
}
