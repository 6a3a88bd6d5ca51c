#include <epoch_zones/pipeline/zone_analysis_cache.h>
#include <epoch_zones/serialization/records.h>
#include <epoch_zones/serialization/serialization.h>

#include <glaze/beve.hpp>

#include <cstdlib>
#include <mutex>
#include <spdlog/spdlog.h>

namespace epoch_zones::pipeline {

namespace {
struct CacheEnvelope {
  int64_t version{kCacheVersion};
  int64_t expires_at{0};
  serialization::AnalysisRecord snapshot;
};
} // namespace

ZoneAnalysisCache::ZoneAnalysisCache(
    std::optional<std::filesystem::path> directory, Clock clock)
    : m_directory(std::move(directory)), m_clock(std::move(clock)) {
  if (!m_clock) {
    m_clock = [] { return std::chrono::system_clock::now(); };
  }
}

std::filesystem::path ZoneAnalysisCache::DefaultDirectory() {
  const auto from_env = [](const char *name) -> std::optional<std::string> {
    const char *value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
      return std::nullopt;
    }
    return std::string(value);
  };

  if (auto dir = from_env("EPOCH_ZONES_CACHE_DIR")) {
    return *dir;
  }
  if (auto dir = from_env("XDG_CACHE_HOME")) {
    return std::filesystem::path(*dir) / "epoch_zones";
  }
  if (auto dir = from_env("HOME")) {
    return std::filesystem::path(*dir) / ".cache" / "epoch_zones";
  }
  return std::filesystem::temp_directory_path() / "epoch_zones";
}

int64_t ZoneAnalysisCache::NowNs() const {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             m_clock().time_since_epoch())
      .count();
}

std::filesystem::path
ZoneAnalysisCache::DiskPath(const std::string &key) const {
  return *m_directory / (key + ".beve");
}

AnalysisResultPtr ZoneAnalysisCache::Get(const std::string &key) {
  const int64_t now = NowNs();
  {
    std::shared_lock lock(m_mutex);
    auto it = m_entries.find(key);
    if (it != m_entries.end() && it->second.expires_at > now) {
      SPDLOG_DEBUG("cache hit (memory): {}", key);
      return it->second.result;
    }
  }
  {
    std::unique_lock lock(m_mutex);
    auto it = m_entries.find(key);
    if (it != m_entries.end() && it->second.expires_at <= now) {
      SPDLOG_DEBUG("cache entry expired: {}", key);
      m_entries.erase(it);
    }
  }

  if (!m_directory) {
    return nullptr;
  }
  int64_t expires_at{0};
  auto result = LoadFromDisk(key, expires_at);
  if (result) {
    std::unique_lock lock(m_mutex);
    m_entries.insert_or_assign(key, Entry{result, expires_at});
    SPDLOG_DEBUG("cache hit (disk): {}", key);
  }
  return result;
}

void ZoneAnalysisCache::Put(const std::string &key, AnalysisResultPtr result,
                            std::chrono::seconds ttl) {
  if (!result) {
    return;
  }
  const int64_t expires_at =
      NowNs() +
      std::chrono::duration_cast<std::chrono::nanoseconds>(ttl).count();
  {
    std::unique_lock lock(m_mutex);
    m_entries.insert_or_assign(key, Entry{result, expires_at});
  }
  if (m_directory) {
    StoreOnDisk(key, *result, expires_at);
  }
}

void ZoneAnalysisCache::Invalidate(const std::string &key) {
  {
    std::unique_lock lock(m_mutex);
    m_entries.erase(key);
  }
  if (m_directory) {
    RemoveFromDisk(key);
  }
  SPDLOG_DEBUG("cache entry invalidated: {}", key);
}

void ZoneAnalysisCache::Clear() {
  {
    std::unique_lock lock(m_mutex);
    m_entries.clear();
  }
  if (!m_directory) {
    return;
  }

  std::error_code ec;
  if (!std::filesystem::is_directory(*m_directory, ec)) {
    return;
  }
  size_t removed = 0;
  for (const auto &entry :
       std::filesystem::directory_iterator(*m_directory, ec)) {
    if (entry.path().extension() != ".beve") {
      continue;
    }
    std::error_code remove_ec;
    if (std::filesystem::remove(entry.path(), remove_ec)) {
      ++removed;
    } else if (remove_ec) {
      SPDLOG_WARN("failed to remove cache file {}: {}", entry.path().string(),
                  remove_ec.message());
    }
  }
  if (ec) {
    SPDLOG_WARN("failed to list cache directory {}: {}",
                m_directory->string(), ec.message());
  }
  SPDLOG_DEBUG("cache cleared, {} files removed", removed);
}

size_t ZoneAnalysisCache::MemoryEntries() const {
  std::shared_lock lock(m_mutex);
  return m_entries.size();
}

AnalysisResultPtr ZoneAnalysisCache::LoadFromDisk(const std::string &key,
                                                  int64_t &expires_at) const {
  const auto path = DiskPath(key);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return nullptr;
  }

  try {
    const auto bytes = serialization::ReadFile(path);
    CacheEnvelope envelope;
    if (auto error = glz::read_beve(envelope, bytes)) {
      SPDLOG_WARN("cache entry {} is unreadable, discarded: {}", key,
                  glz::format_error(error, bytes));
      RemoveFromDisk(key);
      return nullptr;
    }
    if (envelope.version != kCacheVersion ||
        envelope.snapshot.version != serialization::kFormatVersion) {
      SPDLOG_INFO("cache entry {} has version {}, discarded", key,
                  envelope.version);
      RemoveFromDisk(key);
      return nullptr;
    }
    if (envelope.expires_at <= NowNs()) {
      SPDLOG_DEBUG("cache entry expired on disk: {}", key);
      RemoveFromDisk(key);
      return nullptr;
    }
    expires_at = envelope.expires_at;
    return std::make_shared<const AnalysisResult>(
        serialization::FromRecord(std::move(envelope.snapshot)));
  } catch (const std::exception &e) {
    SPDLOG_WARN("cache read failed for {}: {}", key, e.what());
    return nullptr;
  }
}

void ZoneAnalysisCache::StoreOnDisk(const std::string &key,
                                    const AnalysisResult &result,
                                    int64_t expires_at) const {
  try {
    CacheEnvelope envelope{kCacheVersion, expires_at,
                           serialization::ToRecord(result, true)};
    auto bytes = glz::write_beve(envelope);
    if (!bytes) {
      SPDLOG_WARN("cache entry {} could not be encoded, not persisted", key);
      return;
    }
    serialization::WriteFileAtomic(DiskPath(key), bytes.value());
  } catch (const std::exception &e) {
    SPDLOG_WARN("cache write failed for {}: {}", key, e.what());
  }
}

void ZoneAnalysisCache::RemoveFromDisk(const std::string &key) const {
  std::error_code ec;
  std::filesystem::remove(DiskPath(key), ec);
  if (ec) {
    SPDLOG_WARN("failed to remove cache file for {}: {}", key, ec.message());
  }
}

} // namespace epoch_zones::pipeline
