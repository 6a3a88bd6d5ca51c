#include <epoch_zones/core/errors.h>
#include <epoch_zones/core/frame_utils.h>
#include <epoch_zones/detection/conditions.h>

#include <array>
#include <charconv>
#include <format>

namespace epoch_zones::detection {

namespace {

using Comparator = bool (*)(double, double);

Comparator LookupComparator(const std::string &op) {
  static const std::array<std::pair<std::string_view, Comparator>, 6> kOps{{
      {">=", [](double a, double b) { return a >= b; }},
      {"<=", [](double a, double b) { return a <= b; }},
      {"==", [](double a, double b) { return a == b; }},
      {"!=", [](double a, double b) { return a != b; }},
      {">", [](double a, double b) { return a > b; }},
      {"<", [](double a, double b) { return a < b; }},
  }};
  for (const auto &[name, fn] : kOps) {
    if (name == op) {
      return fn;
    }
  }
  throw ConfigurationError(
      std::format("combined: unsupported comparison operator '{}'", op));
}

std::vector<double> ConditionColumn(const epoch_frame::DataFrame &df,
                                    const std::string &column) {
  if (!frame::HasColumn(df, column)) {
    throw DataShapeError("combined", column);
  }
  return frame::ColumnValues(df, column);
}

std::string Trim(std::string_view text) {
  const auto first = text.find_first_not_of(" \t");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(" \t");
  return std::string(text.substr(first, last - first + 1));
}

bool IsOperand(const std::string &text) {
  return !text.empty() && text.find_first_of("<>=! \t") == std::string::npos;
}

} // namespace

ZoneCondition MakeColumnCondition(const std::string &column,
                                  const std::string &op, double value) {
  const auto compare = LookupComparator(op);
  return ZoneCondition{
      .description = std::format("{} {} {}", column, op, value),
      .evaluate = [column, compare, value](const epoch_frame::DataFrame &df) {
        const auto values = ConditionColumn(df, column);
        std::vector<bool> mask(values.size());
        for (size_t i = 0; i < values.size(); ++i) {
          mask[i] = compare(values[i], value);
        }
        return mask;
      },
      .declarative = true};
}

ZoneCondition MakeColumnCondition(const std::string &column,
                                  const std::string &op,
                                  const std::string &other_column) {
  const auto compare = LookupComparator(op);
  return ZoneCondition{
      .description = std::format("{} {} {}", column, op, other_column),
      .evaluate = [column, compare,
                   other_column](const epoch_frame::DataFrame &df) {
        const auto lhs = ConditionColumn(df, column);
        const auto rhs = ConditionColumn(df, other_column);
        std::vector<bool> mask(lhs.size());
        for (size_t i = 0; i < lhs.size(); ++i) {
          mask[i] = compare(lhs[i], rhs[i]);
        }
        return mask;
      },
      .declarative = true};
}

ZoneCondition ParseCondition(const std::string &expression) {
  // Two-character operators first so ">=" is not read as ">"
  static constexpr std::array<std::string_view, 6> kOperators{">=", "<=", "==",
                                                             "!=", ">", "<"};
  for (const auto op : kOperators) {
    const auto pos = expression.find(op);
    if (pos == std::string::npos) {
      continue;
    }
    const auto lhs = Trim(std::string_view(expression).substr(0, pos));
    const auto rhs =
        Trim(std::string_view(expression).substr(pos + op.size()));
    if (!IsOperand(lhs) || !IsOperand(rhs)) {
      break;
    }

    double number{};
    const auto *begin = rhs.data();
    const auto *end = rhs.data() + rhs.size();
    if (auto [ptr, ec] = std::from_chars(begin, end, number);
        ec == std::errc{} && ptr == end) {
      return MakeColumnCondition(lhs, std::string(op), number);
    }
    return MakeColumnCondition(lhs, std::string(op), rhs);
  }
  throw ConfigurationError(std::format(
      "combined: cannot parse condition '{}', expected '<column> <op> "
      "<number|column>'",
      expression));
}

} // namespace epoch_zones::detection
