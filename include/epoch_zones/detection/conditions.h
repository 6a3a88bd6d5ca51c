#pragma once
//
// Row predicates for the combined detection strategy
//

#include <epoch_zones/core/zone.h>

#include <string>

namespace epoch_zones::detection {

// column <op> constant, op in {>, >=, <, <=, ==, !=}
ZoneCondition MakeColumnCondition(const std::string &column,
                                  const std::string &op, double value);

// column <op> other_column
ZoneCondition MakeColumnCondition(const std::string &column,
                                  const std::string &op,
                                  const std::string &other_column);

// Parses "<column> <op> <number|column>", e.g. "rsi < 70" or
// "close > sma_50". Throws ConfigurationError on malformed input.
ZoneCondition ParseCondition(const std::string &expression);

} // namespace epoch_zones::detection
