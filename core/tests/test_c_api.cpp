#include "city_fixture.hpp"
#include "geodb/geodb_c_api.h"

#include <GeoIP.h>

#include <cstring>
#include <filesystem>
#include <gtest/gtest.h>
#include <string>

namespace fs = std::filesystem;

class CApiTest : public ::testing::Test {
protected:
  fs::path db_path_;

  void SetUp() override {
    const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
    db_path_ = fs::temp_directory_path() /
               (std::string("geodb_c_api_") + info->name() + ".dat");
    geodb::fixture::write_city_database(db_path_,
                                        geodb::fixture::default_locations());
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove(db_path_, ec);
  }
};

TEST_F(CApiTest, OpenLookupClose) {
  geodb_t *db = nullptr;
  ASSERT_EQ(geodb_open(db_path_.c_str(), nullptr, &db, nullptr, 0), GEODB_OK);
  ASSERT_NE(db, nullptr);

  geodb_record_t rec;
  int found = 0;
  ASSERT_EQ(geodb_lookup(db, "1.2.3.4", &rec, &found), GEODB_OK);
  ASSERT_EQ(found, 1);
  EXPECT_STREQ(rec.country_code, "US");
  EXPECT_STREQ(rec.country_code3, "USA");
  EXPECT_STREQ(rec.country_name, "United States");
  EXPECT_STREQ(rec.region, "CA");
  EXPECT_STREQ(rec.city, "Mountain View");
  EXPECT_STREQ(rec.postal_code, "94043");
  EXPECT_NEAR(rec.latitude, 37.386, 1e-4);
  EXPECT_NEAR(rec.longitude, -122.0838, 1e-4);
  EXPECT_EQ(rec.area_code, 650);
  EXPECT_STREQ(rec.continent_code, "NA");

  EXPECT_EQ(geodb_close(&db), GEODB_OK);
  EXPECT_EQ(db, nullptr);
}

TEST_F(CApiTest, MissIsNotAnError) {
  geodb_t *db = nullptr;
  ASSERT_EQ(geodb_open(db_path_.c_str(), nullptr, &db, nullptr, 0), GEODB_OK);

  geodb_record_t rec;
  int found = -1;
  EXPECT_EQ(geodb_lookup(db, "9.9.9.9", &rec, &found), GEODB_OK);
  EXPECT_EQ(found, 0);

  found = -1;
  EXPECT_EQ(geodb_lookup(db, "garbage", &rec, &found), GEODB_OK);
  EXPECT_EQ(found, 0);

  geodb_close(&db);
}

TEST_F(CApiTest, CloseIsIdempotentAndNullSafe) {
  geodb_t *db = nullptr;
  ASSERT_EQ(geodb_open(db_path_.c_str(), nullptr, &db, nullptr, 0), GEODB_OK);

  EXPECT_EQ(geodb_close(&db), GEODB_OK);
  EXPECT_EQ(geodb_close(&db), GEODB_OK);
  EXPECT_EQ(geodb_close(nullptr), GEODB_OK);
}

TEST_F(CApiTest, FailedOpenReportsDiagnostic) {
  const fs::path missing = fs::temp_directory_path() / "geodb_c_api_missing.dat";
  fs::remove(missing);

  geodb_t *db = reinterpret_cast<geodb_t *>(0x1); // must be overwritten
  char err[256];
  EXPECT_EQ(geodb_open(missing.c_str(), nullptr, &db, err, sizeof(err)),
            GEODB_ERR_OPEN);
  EXPECT_EQ(db, nullptr);
  EXPECT_NE(std::string(err).find(missing.string()), std::string::npos);

  // Closing the never-opened handle is a no-op
  EXPECT_EQ(geodb_close(&db), GEODB_OK);
}

TEST_F(CApiTest, ErrorMessageIsTruncatedToBuffer) {
  geodb_t *db = nullptr;
  char err[8];
  std::memset(err, 'x', sizeof(err));
  EXPECT_EQ(geodb_open("/nonexistent/geodb.dat", nullptr, &db, err, sizeof(err)),
            GEODB_ERR_OPEN);
  EXPECT_EQ(std::strlen(err), sizeof(err) - 1);
}

TEST_F(CApiTest, NullArguments) {
  geodb_t *db = nullptr;
  EXPECT_EQ(geodb_open(nullptr, nullptr, &db, nullptr, 0), GEODB_ERR_NULL_PTR);
  EXPECT_EQ(geodb_open(db_path_.c_str(), nullptr, nullptr, nullptr, 0),
            GEODB_ERR_NULL_PTR);

  geodb_record_t rec;
  int found = 0;
  EXPECT_EQ(geodb_lookup(nullptr, "1.2.3.4", &rec, &found), GEODB_ERR_NULL_PTR);
  EXPECT_EQ(geodb_bitmask(nullptr, &found), GEODB_ERR_NULL_PTR);
}

TEST_F(CApiTest, ExplicitOptions) {
  geodb_options_t opts = geodb_default_options();
  EXPECT_EQ(opts.caching, GEODB_CACHE_STANDARD);
  EXPECT_EQ(opts.reload_on_update, 1);
  EXPECT_EQ(opts.use_mmap, 1);

  int mask = 0;
  ASSERT_EQ(geodb_bitmask(&opts, &mask), GEODB_OK);
  EXPECT_EQ(mask, GEOIP_STANDARD | GEOIP_CHECK_CACHE | GEOIP_MMAP_CACHE);

  opts.caching = GEODB_CACHE_MEMORY;
  opts.reload_on_update = 0;
  opts.use_mmap = 0;
  ASSERT_EQ(geodb_bitmask(&opts, &mask), GEODB_OK);
  EXPECT_EQ(mask, GEOIP_MEMORY_CACHE);

  opts.caching = GEODB_CACHE_INDEX;
  ASSERT_EQ(geodb_bitmask(&opts, &mask), GEODB_OK);
  EXPECT_EQ(mask, GEOIP_INDEX_CACHE);

  geodb_t *db = nullptr;
  ASSERT_EQ(geodb_open(db_path_.c_str(), &opts, &db, nullptr, 0), GEODB_OK);
  geodb_record_t rec;
  int found = 0;
  ASSERT_EQ(geodb_lookup(db, "5.6.7.8", &rec, &found), GEODB_OK);
  EXPECT_EQ(found, 1);
  EXPECT_STREQ(rec.city, "Z\xC3\xBC"
                         "rich");
  geodb_close(&db);
}

TEST_F(CApiTest, UnknownCachingStrategyIsRejected) {
  geodb_options_t opts = geodb_default_options();
  opts.caching = 7;

  int mask = -1;
  EXPECT_EQ(geodb_bitmask(&opts, &mask), GEODB_ERR_INVALID_ARG);
  EXPECT_EQ(mask, -1);

  geodb_t *db = nullptr;
  char err[128];
  EXPECT_EQ(geodb_open(db_path_.c_str(), &opts, &db, err, sizeof(err)),
            GEODB_ERR_INVALID_ARG);
  EXPECT_EQ(db, nullptr);
  EXPECT_NE(std::string(err).find("caching"), std::string::npos);

  opts.caching = -1;
  EXPECT_EQ(geodb_bitmask(&opts, &mask), GEODB_ERR_INVALID_ARG);
}

TEST_F(CApiTest, InfoAndEdition) {
  geodb_t *db = nullptr;
  ASSERT_EQ(geodb_open(db_path_.c_str(), nullptr, &db, nullptr, 0), GEODB_OK);

  int edition = 0;
  ASSERT_EQ(geodb_edition(db, &edition), GEODB_OK);
  EXPECT_EQ(edition, GEOIP_CITY_EDITION_REV1);

  char buf[128];
  size_t len = 0;
  ASSERT_EQ(geodb_info(db, buf, sizeof(buf), &len), GEODB_OK);
  EXPECT_EQ(std::strlen(buf), len);
  EXPECT_NE(std::string(buf).find(geodb::fixture::INFO), std::string::npos);

  char tiny[4];
  EXPECT_EQ(geodb_info(db, tiny, sizeof(tiny), &len), GEODB_ERR_BUFFER_TOO_SMALL);
  EXPECT_GE(len, sizeof(tiny));

  // The reported length is enough for a second attempt
  std::string grown(len + 1, '\0');
  size_t grown_len = 0;
  ASSERT_EQ(geodb_info(db, grown.data(), grown.size(), &grown_len), GEODB_OK);
  EXPECT_EQ(grown_len, len);
  EXPECT_EQ(std::string(grown.c_str()), std::string(buf));

  geodb_close(&db);
}

TEST(CApiMiscTest, ErrorStringsAndVersions) {
  EXPECT_STREQ(geodb_error_string(GEODB_OK), "GEODB_OK");
  EXPECT_STREQ(geodb_error_string(GEODB_ERR_OPEN), "GEODB_ERR_OPEN");
  EXPECT_STREQ(geodb_error_string(static_cast<geodb_error_t>(-50)),
               "GEODB_ERR_UNRECOGNIZED");
  EXPECT_GT(std::strlen(geodb_version()), 0u);
  EXPECT_GT(std::strlen(geodb_native_version()), 0u);
}

TEST(CApiMiscTest, LogLevelRange) {
  EXPECT_EQ(geodb_set_log_level(3), GEODB_OK);
  EXPECT_EQ(geodb_set_log_level(-1), GEODB_ERR_INVALID_ARG);
  EXPECT_EQ(geodb_set_log_level(7), GEODB_ERR_INVALID_ARG);
}
