#pragma once
//
// Two-tier cache of analysis results
//
// Memory tier: key -> shared result guarded by a shared_mutex. Disk tier
// (optional): one BEVE envelope per key under the cache directory, written
// through a temp file and renamed into place. Expired or version-mismatched
// entries are removed on lookup. Disk and decoding failures are logged and
// reported as misses.
//

#include <epoch_zones/analysis/analysis_result.h>

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace epoch_zones::pipeline {

constexpr int64_t kCacheVersion = 1;

class ZoneAnalysisCache {
public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  // Without a directory the cache is memory only
  explicit ZoneAnalysisCache(
      std::optional<std::filesystem::path> directory = std::nullopt,
      Clock clock = {});

  // $EPOCH_ZONES_CACHE_DIR, else $XDG_CACHE_HOME/epoch_zones, else
  // $HOME/.cache/epoch_zones, else <temp>/epoch_zones
  [[nodiscard]] static std::filesystem::path DefaultDirectory();

  [[nodiscard]] AnalysisResultPtr Get(const std::string &key);

  void Put(const std::string &key, AnalysisResultPtr result,
           std::chrono::seconds ttl);

  // Removes the key from both tiers
  void Invalidate(const std::string &key);

  // Empties the memory tier and deletes every entry file in the directory
  void Clear();

  [[nodiscard]] size_t MemoryEntries() const;

  [[nodiscard]] const std::optional<std::filesystem::path> &
  GetDirectory() const {
    return m_directory;
  }

private:
  struct Entry {
    AnalysisResultPtr result;
    int64_t expires_at{0}; // epoch nanoseconds
  };

  [[nodiscard]] int64_t NowNs() const;
  [[nodiscard]] std::filesystem::path DiskPath(const std::string &key) const;
  [[nodiscard]] AnalysisResultPtr LoadFromDisk(const std::string &key,
                                               int64_t &expires_at) const;
  void StoreOnDisk(const std::string &key, const AnalysisResult &result,
                   int64_t expires_at) const;
  void RemoveFromDisk(const std::string &key) const;

  mutable std::shared_mutex m_mutex;
  std::unordered_map<std::string, Entry> m_entries;
  std::optional<std::filesystem::path> m_directory;
  Clock m_clock;
};

using ZoneAnalysisCachePtr = std::shared_ptr<ZoneAnalysisCache>;

} // namespace epoch_zones::pipeline
