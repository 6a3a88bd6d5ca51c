#include "tulip.h"

#include <indicators.h>

#include <format>
#include <limits>
#include <stdexcept>

namespace epoch_zones::tulip {

namespace {

const ti_indicator_info &Find(const std::string &name) {
  const ti_indicator_info *info = ti_find_indicator(name.c_str());
  if (info == nullptr) {
    throw std::runtime_error(std::format("Tulip indicator '{}' not found", name));
  }
  return *info;
}

} // namespace

std::vector<std::vector<double>> Run(const std::string &name,
                                     const std::vector<const double *> &inputs,
                                     const std::vector<double> &options,
                                     size_t size) {
  const auto &info = Find(name);
  if (inputs.size() != static_cast<size_t>(info.inputs) ||
      options.size() != static_cast<size_t>(info.options)) {
    throw std::runtime_error(std::format(
        "Tulip indicator '{}' takes {} inputs and {} options, got {} and {}",
        name, info.inputs, info.options, inputs.size(), options.size()));
  }

  std::vector<std::vector<double>> outputs(
      static_cast<size_t>(info.outputs),
      std::vector<double>(size, std::numeric_limits<double>::quiet_NaN()));
  const int start = info.start(options.data());
  if (start < 0 || static_cast<size_t>(start) >= size) {
    return outputs;
  }

  std::vector<double *> output_ptrs;
  for (auto &output : outputs) {
    output_ptrs.push_back(output.data() + start);
  }
  const int rc = info.indicator(static_cast<int>(size), inputs.data(),
                                options.data(), output_ptrs.data());
  if (rc != TI_OKAY) {
    throw std::runtime_error(
        std::format("Tulip indicator '{}' failed with code {}", name, rc));
  }
  return outputs;
}

IndicatorShape Describe(const std::string &name) {
  const auto &info = Find(name);
  IndicatorShape shape;
  for (int i = 0; i < info.inputs; ++i) {
    shape.inputs.emplace_back(info.input_names[i]);
  }
  for (int i = 0; i < info.options; ++i) {
    shape.options.emplace_back(info.option_names[i]);
  }
  for (int i = 0; i < info.outputs; ++i) {
    shape.outputs.emplace_back(info.output_names[i]);
  }
  return shape;
}

} // namespace epoch_zones::tulip
