#pragma once
//
// Indicator provider collaborator
//
// Computes indicator columns for a series. The pipeline merges the returned
// columns into the series under the names the provider chose.
//

#include <epoch_zones/core/zone.h>

#include <memory>
#include <string>
#include <vector>

namespace epoch_zones::pipeline {

struct IIndicatorProvider {
  virtual ~IIndicatorProvider() = default;

  // Frame aligned to the series index holding only the indicator columns
  [[nodiscard]] virtual epoch_frame::DataFrame
  Compute(const IndicatorDescriptor &descriptor,
          const epoch_frame::DataFrame &series) const = 0;

  [[nodiscard]] virtual std::vector<std::string>
  OutputColumns(const IndicatorDescriptor &descriptor) const = 0;
};

using IIndicatorProviderPtr = std::shared_ptr<const IIndicatorProvider>;

} // namespace epoch_zones::pipeline
