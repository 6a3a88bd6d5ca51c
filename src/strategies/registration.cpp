#include <epoch_zones/strategies/default_strategies.h>
#include <epoch_zones/strategies/strategy_registry.h>

#include <mutex>

namespace epoch_zones::strategies {

void RegisterBuiltinAnalyticalStrategies() {
  static std::once_flag once;
  std::call_once(once, [] {
    ShapeStrategyRegistry::Instance().Register(kDefaultShape, [] {
      return std::make_shared<const StatisticalShapeStrategy>();
    });
    DivergenceStrategyRegistry::Instance().Register(kDefaultDivergence, [] {
      return std::make_shared<const ClassicDivergenceStrategy>();
    });
    VolatilityStrategyRegistry::Instance().Register(kDefaultVolatility, [] {
      return std::make_shared<const CombinedVolatilityStrategy>();
    });
    VolumeStrategyRegistry::Instance().Register(kDefaultVolume, [] {
      return std::make_shared<const StandardVolumeStrategy>();
    });
    SwingStrategyRegistry::Instance().Register(kDefaultSwing, [] {
      return std::make_shared<const ZigZagSwingStrategy>();
    });
    SwingStrategyRegistry::Instance().Register("find_peaks", [] {
      return std::make_shared<const FindPeaksSwingStrategy>();
    });
    SwingStrategyRegistry::Instance().Register("pivot_points", [] {
      return std::make_shared<const PivotPointsSwingStrategy>();
    });
  });
}

} // namespace epoch_zones::strategies
