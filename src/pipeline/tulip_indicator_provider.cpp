#include "core/tulip.h"

#include <epoch_zones/core/errors.h>
#include <epoch_zones/core/frame_utils.h>
#include <epoch_zones/pipeline/tulip_indicator_provider.h>

#include <algorithm>
#include <format>
#include <spdlog/spdlog.h>

namespace epoch_zones::pipeline {

namespace {

tulip::IndicatorShape Describe(const IndicatorDescriptor &descriptor) {
  if (descriptor.source != kTulipSource) {
    throw ConfigurationError(
        std::format("Tulip provider cannot compute '{}.{}'", descriptor.source,
                    descriptor.name));
  }
  try {
    return tulip::Describe(descriptor.name);
  } catch (const std::runtime_error &e) {
    throw ConfigurationError(e.what());
  }
}

std::string ParameterKey(std::string option) {
  std::ranges::replace(option, ' ', '_');
  return option;
}

} // namespace

std::vector<std::string>
TulipIndicatorProvider::OutputColumns(const IndicatorDescriptor &descriptor) const {
  return Describe(descriptor).outputs;
}

epoch_frame::DataFrame
TulipIndicatorProvider::Compute(const IndicatorDescriptor &descriptor,
                                const epoch_frame::DataFrame &series) const {
  const auto shape = Describe(descriptor);
  const auto strategy = std::format("tulip.{}", descriptor.name);

  std::vector<double> options;
  std::vector<std::string> missing;
  for (const auto &option : shape.options) {
    const auto key = ParameterKey(option);
    if (auto value = rules::GetNumber(descriptor.parameters, key)) {
      options.push_back(*value);
    } else {
      missing.push_back(key);
    }
  }
  if (!missing.empty()) {
    throw MissingRuleError(strategy, missing);
  }

  std::vector<std::vector<double>> columns;
  for (const auto &input : shape.inputs) {
    const auto column =
        input == "real"
            ? rules::GetString(descriptor.parameters, "input").value_or("close")
            : input;
    if (!frame::HasColumn(series, column)) {
      throw DataShapeError(strategy, column);
    }
    columns.push_back(frame::ColumnValues(series, column));
  }
  std::vector<const double *> inputs;
  for (const auto &column : columns) {
    inputs.push_back(column.data());
  }

  const size_t rows = frame::RowCount(series);
  SPDLOG_DEBUG("Computing {} over {} bars", strategy, rows);
  auto outputs = tulip::Run(descriptor.name, inputs, options, rows);
  return frame::MakeFrame(frame::Timestamps(series), shape.outputs, outputs);
}

} // namespace epoch_zones::pipeline
