#include <epoch_zones/core/errors.h>
#include <epoch_zones/detection/detection_registry.h>

#include <format>
#include <spdlog/spdlog.h>

namespace epoch_zones::detection {

ZoneDetectionRegistry &ZoneDetectionRegistry::Instance() {
  static ZoneDetectionRegistry instance;
  return instance;
}

void ZoneDetectionRegistry::Register(const std::string &name,
                                     DetectionStrategyFactory factory,
                                     StrategyInfo info) {
  std::lock_guard lock(m_mutex);
  if (m_entries.contains(name)) {
    SPDLOG_WARN("Overwriting zone detection strategy '{}'", name);
  }
  m_entries.insert_or_assign(name, Entry{std::move(factory), std::move(info)});
  SPDLOG_DEBUG("Registered zone detection strategy '{}'", name);
}

IZoneDetectionStrategyPtr
ZoneDetectionRegistry::Get(const std::string &name) const {
  DetectionStrategyFactory factory;
  {
    std::lock_guard lock(m_mutex);
    auto it = m_entries.find(name);
    if (it == m_entries.end()) {
      ThrowUnknown(name);
    }
    factory = it->second.factory;
  }
  return factory();
}

bool ZoneDetectionRegistry::Contains(const std::string &name) const {
  std::lock_guard lock(m_mutex);
  return m_entries.contains(name);
}

std::vector<std::string> ZoneDetectionRegistry::Names() const {
  std::lock_guard lock(m_mutex);
  std::vector<std::string> names;
  names.reserve(m_entries.size());
  for (const auto &[name, _] : m_entries) {
    names.push_back(name);
  }
  return names;
}

StrategyInfo ZoneDetectionRegistry::Info(const std::string &name) const {
  std::lock_guard lock(m_mutex);
  auto it = m_entries.find(name);
  if (it == m_entries.end()) {
    ThrowUnknown(name);
  }
  return it->second.info;
}

void ZoneDetectionRegistry::ThrowUnknown(const std::string &name) const {
  std::string available;
  for (const auto &[registered, _] : m_entries) {
    if (!available.empty()) {
      available += ", ";
    }
    available += registered;
  }
  throw UnknownStrategyError(
      name, std::format("Unknown zone detection strategy: '{}'. Available: {}",
                        name, available));
}

} // namespace epoch_zones::detection
