#pragma once
//
// Tulip Indicators invocation over aligned columns
//

#include <string>
#include <vector>

namespace epoch_zones::tulip {

// Runs a Tulip indicator over size bars. Outputs are aligned to the input,
// warm-up positions stay NaN. Throws std::runtime_error for an unknown
// indicator or a Tulip error code.
[[nodiscard]] std::vector<std::vector<double>>
Run(const std::string &name, const std::vector<const double *> &inputs,
    const std::vector<double> &options, size_t size);

struct IndicatorShape {
  std::vector<std::string> inputs;
  std::vector<std::string> options;
  std::vector<std::string> outputs;
};

// Input, option and output names as Tulip declares them
[[nodiscard]] IndicatorShape Describe(const std::string &name);

} // namespace epoch_zones::tulip
