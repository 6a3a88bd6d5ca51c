#pragma once
//
// Indicator column resolution and base per-zone features
//

#include <epoch_zones/core/zone.h>
#include <epoch_zones/strategies/ianalytical_strategy.h>

#include <optional>
#include <string>
#include <vector>

namespace epoch_zones::analysis {

// Price, volume and bookkeeping columns never taken as an oscillator
// (compared case-insensitively)
const std::vector<std::string> &DefaultExcludedColumns();

// First numeric column not in exclude whose values cross zero, or stay
// within [-100, 100] while varying. Used only when a zone carries no
// primary column.
[[nodiscard]] std::optional<std::string>
FindOscillatorColumn(const epoch_frame::DataFrame &data,
                     const std::vector<std::string> &exclude =
                         DefaultExcludedColumns());

// Primary column from the context when present in the data, otherwise the
// oscillator heuristic (only when the context names no primary column).
// The secondary column is taken from the context only.
[[nodiscard]] strategies::ColumnSelection ResolveColumns(const Zone &zone);

// duration, start_price, end_price, price_return, price_range_pct,
// indicator_amplitude, indicator_max_slope, correlation_price_indicator,
// num_peaks, num_troughs, atr_normalized_return and the label-specific
// drawdown_from_peak / peak_time_ratio ("bull", "overbought") or
// rally_from_trough / trough_time_ratio ("bear", "oversold")
[[nodiscard]] FeatureMap
ExtractBaseFeatures(const Zone &zone,
                    const std::optional<std::string> &primary_column);

} // namespace epoch_zones::analysis
