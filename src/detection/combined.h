#pragma once
//
// Combined-rules detection: boolean row predicates joined by AND/OR
//
// Predicates come from DetectionConfig::conditions and/or the "conditions"
// rule (list of "<column> <op> <number|column>" strings).
// Rules: logic ("AND" | "OR", default AND),
//        zone_type_map {"true": label, "false": label} (default active/inactive),
//        indicator_col (primary column recorded in the context, default "combined")
//

#include <epoch_core/enum_wrapper.h>
#include <epoch_zones/detection/idetection_strategy.h>

CREATE_ENUM(ZoneConditionLogic, AND, OR);

namespace epoch_zones::detection {

struct CombinedOptions {
  std::vector<ZoneCondition> conditions;
  epoch_core::ZoneConditionLogic logic{epoch_core::ZoneConditionLogic::AND};
  std::string active_label{"active"};
  std::string inactive_label{"inactive"};
  std::optional<std::string> indicator_col;

  static CombinedOptions FromConfig(const DetectionConfig &config);
};

class CombinedRulesDetection final : public IZoneDetectionStrategy {
public:
  [[nodiscard]] ZoneList Detect(const epoch_frame::DataFrame &series,
                                const DetectionConfig &config) const override;
};

} // namespace epoch_zones::detection
