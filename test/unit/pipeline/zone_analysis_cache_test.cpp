#include "common/fake_zone_series.h"

#include <epoch_zones/core/frame_utils.h>
#include <epoch_zones/pipeline/zone_analysis_cache.h>
#include <epoch_zones/serialization/serialization.h>

#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <memory>

using namespace epoch_zones;
using namespace epoch_zones::pipeline;
using namespace std::chrono_literals;

namespace {

struct FakeClock {
  std::shared_ptr<std::chrono::system_clock::time_point> now =
      std::make_shared<std::chrono::system_clock::time_point>(
          std::chrono::system_clock::time_point{} + 1000h);

  ZoneAnalysisCache::Clock AsClock() const {
    return [now = now] { return *now; };
  }
  void Advance(std::chrono::seconds delta) const { *now += delta; }
};

AnalysisResultPtr MakeResult(size_t zone_count) {
  auto result = std::make_shared<AnalysisResult>();
  result->zones = test::MakeAlternatingZones(zone_count);
  result->statistics.total_zones = static_cast<int64_t>(zone_count);
  result->metadata.total_zones = static_cast<int64_t>(zone_count);
  result->data = test::MakeOscillatorSeries(20, 5.0);
  return result;
}

std::filesystem::path TempDir(const std::string &name) {
  auto dir = std::filesystem::temp_directory_path() / ("epoch_zones_" + name);
  std::filesystem::remove_all(dir);
  return dir;
}

} // namespace

TEST_CASE("Memory cache tier", "[pipeline][cache]") {
  FakeClock clock;
  ZoneAnalysisCache cache(std::nullopt, clock.AsClock());
  const auto result = MakeResult(3);

  SECTION("Hit returns the stored shared result") {
    REQUIRE(cache.Get("k") == nullptr);
    cache.Put("k", result, 60s);
    REQUIRE(cache.Get("k") == result);
    REQUIRE(cache.MemoryEntries() == 1);
  }

  SECTION("Entries expire after their ttl") {
    cache.Put("k", result, 60s);
    clock.Advance(59s);
    REQUIRE(cache.Get("k") == result);
    clock.Advance(1s);
    REQUIRE(cache.Get("k") == nullptr);
    REQUIRE(cache.MemoryEntries() == 0);
  }

  SECTION("Invalidate and clear") {
    cache.Put("a", result, 60s);
    cache.Put("b", result, 60s);
    cache.Invalidate("a");
    REQUIRE(cache.Get("a") == nullptr);
    REQUIRE(cache.Get("b") == result);
    cache.Clear();
    REQUIRE(cache.MemoryEntries() == 0);
  }

  SECTION("Null results are not stored") {
    cache.Put("k", nullptr, 60s);
    REQUIRE(cache.MemoryEntries() == 0);
  }

  SECTION("Put replaces the previous entry") {
    const auto other = MakeResult(4);
    cache.Put("k", result, 60s);
    cache.Put("k", other, 60s);
    REQUIRE(cache.Get("k") == other);
  }
}

TEST_CASE("Disk cache tier", "[pipeline][cache]") {
  FakeClock clock;
  const auto dir = TempDir("cache_test");
  const auto result = MakeResult(5);

  SECTION("A fresh cache instance reads entries written by another") {
    {
      ZoneAnalysisCache writer(dir, clock.AsClock());
      writer.Put("zone_analysis_abc", result, 600s);
    }
    REQUIRE(std::filesystem::exists(dir / "zone_analysis_abc.beve"));

    ZoneAnalysisCache reader(dir, clock.AsClock());
    const auto loaded = reader.Get("zone_analysis_abc");
    REQUIRE(loaded != nullptr);
    REQUIRE(loaded->zones.size() == 5);
    REQUIRE(loaded->zones[1].label == "bear");
    REQUIRE(frame::RowCount(loaded->zones[1].data) ==
            frame::RowCount(result->zones[1].data));
    REQUIRE(frame::RowCount(loaded->data) == 20);
    // Promoted into memory
    REQUIRE(reader.MemoryEntries() == 1);
    REQUIRE(reader.Get("zone_analysis_abc") == loaded);
  }

  SECTION("Expired disk entries are removed") {
    {
      ZoneAnalysisCache writer(dir, clock.AsClock());
      writer.Put("k", result, 10s);
    }
    clock.Advance(11s);
    ZoneAnalysisCache reader(dir, clock.AsClock());
    REQUIRE(reader.Get("k") == nullptr);
    REQUIRE_FALSE(std::filesystem::exists(dir / "k.beve"));
  }

  SECTION("Unreadable entries are discarded as misses") {
    serialization::WriteFileAtomic(dir / "k.beve", "garbage");
    ZoneAnalysisCache reader(dir, clock.AsClock());
    REQUIRE(reader.Get("k") == nullptr);
    REQUIRE_FALSE(std::filesystem::exists(dir / "k.beve"));
  }

  SECTION("Invalidate removes the file") {
    ZoneAnalysisCache cache(dir, clock.AsClock());
    cache.Put("k", result, 600s);
    cache.Invalidate("k");
    REQUIRE_FALSE(std::filesystem::exists(dir / "k.beve"));
    REQUIRE(cache.Get("k") == nullptr);
  }

  SECTION("Clear empties both tiers") {
    ZoneAnalysisCache cache(dir, clock.AsClock());
    cache.Put("k", result, 600s);
    cache.Put("other", result, 600s);
    serialization::WriteFileAtomic(dir / "notes.txt", "kept");
    cache.Clear();
    REQUIRE(cache.MemoryEntries() == 0);
    REQUIRE_FALSE(std::filesystem::exists(dir / "k.beve"));
    REQUIRE_FALSE(std::filesystem::exists(dir / "other.beve"));
    REQUIRE(std::filesystem::exists(dir / "notes.txt"));
    REQUIRE(cache.Get("k") == nullptr);
    REQUIRE(ZoneAnalysisCache(dir, clock.AsClock()).Get("other") == nullptr);
  }

  SECTION("Clear on a directory that was never written") {
    ZoneAnalysisCache cache(dir / "unused", clock.AsClock());
    REQUIRE_NOTHROW(cache.Clear());
  }

  std::filesystem::remove_all(dir);
}

TEST_CASE("Default cache directory", "[pipeline][cache]") {
  const auto dir = TempDir("default_dir");
  ::setenv("EPOCH_ZONES_CACHE_DIR", dir.c_str(), 1);
  REQUIRE(ZoneAnalysisCache::DefaultDirectory() == dir);

  ::setenv("EPOCH_ZONES_CACHE_DIR", "", 1);
  ::setenv("XDG_CACHE_HOME", dir.c_str(), 1);
  REQUIRE(ZoneAnalysisCache::DefaultDirectory() == dir / "epoch_zones");

  ::unsetenv("EPOCH_ZONES_CACHE_DIR");
  ::unsetenv("XDG_CACHE_HOME");
  REQUIRE(ZoneAnalysisCache::DefaultDirectory().filename() == "epoch_zones");
}
