#pragma once
//
// One registry per analytical slot. Registration replaces any previous
// factory of the same name.
//

#include <epoch_zones/core/errors.h>
#include <epoch_zones/strategies/ianalytical_strategy.h>

#include <format>
#include <functional>
#include <map>
#include <mutex>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace epoch_zones::strategies {

template <typename Interface> struct SlotTraits;

template <> struct SlotTraits<IShapeStrategy> {
  static constexpr auto slot = epoch_core::AnalyticalSlot::shape;
};
template <> struct SlotTraits<IDivergenceStrategy> {
  static constexpr auto slot = epoch_core::AnalyticalSlot::divergence;
};
template <> struct SlotTraits<IVolatilityStrategy> {
  static constexpr auto slot = epoch_core::AnalyticalSlot::volatility;
};
template <> struct SlotTraits<IVolumeStrategy> {
  static constexpr auto slot = epoch_core::AnalyticalSlot::volume;
};
template <> struct SlotTraits<ISwingStrategy> {
  static constexpr auto slot = epoch_core::AnalyticalSlot::swing;
};

template <typename Interface> class AnalyticalStrategyRegistry {
public:
  using Ptr = std::shared_ptr<const Interface>;
  using Factory = std::function<Ptr()>;

  static AnalyticalStrategyRegistry &Instance() {
    static AnalyticalStrategyRegistry registry;
    return registry;
  }

  static std::string SlotName() {
    return epoch_core::AnalyticalSlotWrapper::ToString(
        SlotTraits<Interface>::slot);
  }

  void Register(const std::string &name, Factory factory) {
    std::lock_guard lock(m_mutex);
    if (m_factories.contains(name)) {
      SPDLOG_WARN("{} strategy '{}' re-registered, previous factory replaced",
                  SlotName(), name);
    }
    m_factories[name] = std::move(factory);
  }

  [[nodiscard]] Ptr Create(const std::string &name) const {
    std::lock_guard lock(m_mutex);
    auto it = m_factories.find(name);
    if (it == m_factories.end()) {
      std::string available;
      for (const auto &[key, _] : m_factories) {
        available += available.empty() ? key : ", " + key;
      }
      throw UnknownStrategyError(
          name, std::format("Unknown {} strategy: '{}'. Available: {}",
                            SlotName(), name, available));
    }
    return it->second();
  }

  [[nodiscard]] bool Contains(const std::string &name) const {
    std::lock_guard lock(m_mutex);
    return m_factories.contains(name);
  }

  [[nodiscard]] std::vector<std::string> Names() const {
    std::lock_guard lock(m_mutex);
    std::vector<std::string> names;
    for (const auto &[key, _] : m_factories) {
      names.push_back(key);
    }
    return names;
  }

private:
  AnalyticalStrategyRegistry() = default;

  mutable std::mutex m_mutex;
  std::map<std::string, Factory> m_factories;
};

using ShapeStrategyRegistry = AnalyticalStrategyRegistry<IShapeStrategy>;
using DivergenceStrategyRegistry =
    AnalyticalStrategyRegistry<IDivergenceStrategy>;
using VolatilityStrategyRegistry =
    AnalyticalStrategyRegistry<IVolatilityStrategy>;
using VolumeStrategyRegistry = AnalyticalStrategyRegistry<IVolumeStrategy>;
using SwingStrategyRegistry = AnalyticalStrategyRegistry<ISwingStrategy>;

// Default strategy name per slot
inline constexpr const char *kDefaultShape = "statistical";
inline constexpr const char *kDefaultDivergence = "classic";
inline constexpr const char *kDefaultVolatility = "combined";
inline constexpr const char *kDefaultVolume = "standard";
inline constexpr const char *kDefaultSwing = "zigzag";

// Registers statistical, classic, combined, standard and the zigzag,
// find_peaks and pivot_points swing strategies. Safe to call more than once.
void RegisterBuiltinAnalyticalStrategies();

} // namespace epoch_zones::strategies
