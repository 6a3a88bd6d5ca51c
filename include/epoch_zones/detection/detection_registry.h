#pragma once
//
// Registry of named zone detection strategies
//
// New strategies register a factory at startup; existing dispatch code is
// never touched.
//

#include <epoch_zones/detection/idetection_strategy.h>

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace epoch_zones::detection {

struct StrategyInfo {
  std::string description;
  std::vector<std::string> supported_zones;
  std::vector<std::string> required_rules;
};

using DetectionStrategyFactory = std::function<IZoneDetectionStrategyPtr()>;

class ZoneDetectionRegistry {
public:
  static ZoneDetectionRegistry &Instance();

  // Overwriting an existing name is allowed and logged
  void Register(const std::string &name, DetectionStrategyFactory factory,
                StrategyInfo info = {});

  // Throws UnknownStrategyError listing the available names
  [[nodiscard]] IZoneDetectionStrategyPtr Get(const std::string &name) const;

  [[nodiscard]] bool Contains(const std::string &name) const;
  [[nodiscard]] std::vector<std::string> Names() const;
  [[nodiscard]] StrategyInfo Info(const std::string &name) const;

private:
  ZoneDetectionRegistry() = default;

  struct Entry {
    DetectionStrategyFactory factory;
    StrategyInfo info;
  };

  [[noreturn]] void ThrowUnknown(const std::string &name) const;

  mutable std::mutex m_mutex;
  std::map<std::string, Entry> m_entries;
};

template <typename T>
void Register(const std::string &name, StrategyInfo info = {}) {
  ZoneDetectionRegistry::Instance().Register(
      name, [] { return std::make_unique<T>(); }, std::move(info));
}

// Registers zero_crossing, threshold, line_crossing, preloaded and combined.
// Safe to call more than once.
void RegisterBuiltinDetectionStrategies();

} // namespace epoch_zones::detection
