#include <epoch_zones/core/errors.h>
#include <format>

namespace {
std::string JoinKeys(const std::vector<std::string> &keys) {
  std::string joined;
  for (const auto &key : keys) {
    if (!joined.empty()) {
      joined += ", ";
    }
    joined += key;
  }
  return joined;
}
} // namespace

namespace epoch_zones {

MissingRuleError::MissingRuleError(std::string strategy,
                                   std::vector<std::string> missing)
    : ZoneAnalysisError(std::format("Missing required rules for {}: [{}]",
                                    strategy, JoinKeys(missing))),
      m_strategy(std::move(strategy)), m_missing(std::move(missing)) {}

DataShapeError::DataShapeError(std::string strategy, std::string column)
    : ZoneAnalysisError(
          std::format("{}: required column '{}' not found in data", strategy,
                      column)),
      m_strategy(std::move(strategy)), m_column(std::move(column)) {}

} // namespace epoch_zones
