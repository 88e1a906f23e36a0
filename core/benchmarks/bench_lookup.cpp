// ===========================================================================
// Lookup latency per caching strategy, and open/close cost.
// ---------------------------------------------------------------------------
// Runs against a generated City fixture (two /24 networks), so the numbers
// measure binding + libGeoIP overhead, not a realistic tree depth.
// ===========================================================================

#include "city_fixture.hpp"
#include "geodb/database.hpp"
#include <benchmark/benchmark.h>
#include <filesystem>
#include <string>

namespace {

const std::filesystem::path &fixture_path() {
  static const std::filesystem::path path = [] {
    auto p = std::filesystem::temp_directory_path() / "geodb_bench.dat";
    geodb::fixture::write_city_database(p, geodb::fixture::default_locations());
    return p;
  }();
  return path;
}

geodb::Options options_for(int64_t strategy) {
  geodb::Options opts;
  opts.caching = static_cast<geodb::CachingStrategy>(strategy);
  opts.reload_on_update = false;
  opts.use_mmap = false;
  return opts;
}

} // namespace

static void BM_LookupHit(benchmark::State &state) {
  auto db = geodb::Database::open(fixture_path(), options_for(state.range(0)));
  const std::string ip = "1.2.3.4";

  for (auto _ : state) {
    auto r = db.lookup(ip);
    benchmark::DoNotOptimize(r);
  }
  state.SetLabel(std::string(geodb::to_string(
      static_cast<geodb::CachingStrategy>(state.range(0)))));
}
BENCHMARK(BM_LookupHit)->DenseRange(0, 2);

static void BM_LookupMiss(benchmark::State &state) {
  auto db = geodb::Database::open(fixture_path(), options_for(state.range(0)));
  const std::string ip = "9.9.9.9";

  for (auto _ : state) {
    auto r = db.lookup(ip);
    benchmark::DoNotOptimize(r);
  }
  state.SetLabel(std::string(geodb::to_string(
      static_cast<geodb::CachingStrategy>(state.range(0)))));
}
BENCHMARK(BM_LookupMiss)->DenseRange(0, 2);

static void BM_OpenClose(benchmark::State &state) {
  const auto opts = options_for(state.range(0));
  for (auto _ : state) {
    auto db = geodb::Database::open(fixture_path(), opts);
    db.close();
  }
}
BENCHMARK(BM_OpenClose)->DenseRange(0, 2);

BENCHMARK_MAIN();
