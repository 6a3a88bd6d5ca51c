#pragma once
//
// Error taxonomy for zone detection and analysis
//

#include <stdexcept>
#include <string>
#include <vector>

namespace epoch_zones {

class ZoneAnalysisError : public std::runtime_error {
public:
  explicit ZoneAnalysisError(const std::string &message)
      : std::runtime_error(message) {}
};

// Pipeline or strategy was configured inconsistently (no strategy chosen,
// upper <= lower, unsupported logic, ...)
class ConfigurationError : public ZoneAnalysisError {
public:
  explicit ConfigurationError(const std::string &message)
      : ZoneAnalysisError(message) {}
};

class UnknownStrategyError : public ZoneAnalysisError {
public:
  UnknownStrategyError(std::string name, const std::string &message)
      : ZoneAnalysisError(message), m_name(std::move(name)) {}

  [[nodiscard]] const std::string &GetStrategyName() const { return m_name; }

private:
  std::string m_name;
};

class MissingRuleError : public ZoneAnalysisError {
public:
  MissingRuleError(std::string strategy, std::vector<std::string> missing);

  [[nodiscard]] const std::string &GetStrategyName() const {
    return m_strategy;
  }
  [[nodiscard]] const std::vector<std::string> &GetMissingRules() const {
    return m_missing;
  }

private:
  std::string m_strategy;
  std::vector<std::string> m_missing;
};

// A column required at detection time is absent from the series
class DataShapeError : public ZoneAnalysisError {
public:
  DataShapeError(std::string strategy, std::string column);

  [[nodiscard]] const std::string &GetColumn() const { return m_column; }

private:
  std::string m_strategy;
  std::string m_column;
};

// Non-fatal: a sub-analysis was skipped. Recorded in result metadata, never
// thrown.
struct AnalysisDegraded {
  std::string component;
  std::string reason;

  bool operator==(const AnalysisDegraded &) const = default;
};

} // namespace epoch_zones
