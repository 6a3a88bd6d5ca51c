//
// Descriptive statistics on plain vectors
//
#include <epoch_zones/core/numeric.h>

#include <arrow/array/builder_primitive.h>
#include <arrow/compute/api.h>
#include <armadillo>

#include <algorithm>
#include <cmath>
#include <format>
#include <numeric>
#include <stdexcept>

namespace epoch_zones::numeric {

namespace {
arma::vec Finite(const std::vector<double> &values) {
  const arma::vec all(values);
  return all.elem(arma::find_finite(all));
}

std::vector<double> ToVector(const arma::vec &values) {
  return arma::conv_to<std::vector<double>>::from(values);
}

double ArrowQuantile(const arma::vec &finite, double q) {
  arrow::DoubleBuilder builder;
  auto status = builder.AppendValues(finite.memptr(), finite.n_elem);
  std::shared_ptr<arrow::Array> array;
  if (status.ok()) {
    status = builder.Finish(&array);
  }
  if (!status.ok()) {
    throw std::runtime_error(
        std::format("Quantile: failed to build input: {}", status.ToString()));
  }

  auto result = arrow::compute::Quantile(
      array, arrow::compute::QuantileOptions{std::clamp(q, 0.0, 1.0)});
  if (!result.ok()) {
    throw std::runtime_error(std::format("Quantile: {}",
                                         result.status().ToString()));
  }
  return std::static_pointer_cast<arrow::DoubleArray>(result->make_array())
      ->Value(0);
}

// Biased second and k-th central moments
std::optional<std::pair<double, double>> CentralMoments(const arma::vec &finite,
                                                        double order) {
  if (finite.n_elem < 3) {
    return std::nullopt;
  }
  const arma::vec centered = finite - arma::mean(finite);
  const double m2 = arma::mean(arma::square(centered));
  if (m2 <= 0.0) {
    return std::nullopt;
  }
  return std::make_pair(m2, arma::mean(arma::pow(centered, order)));
}
} // namespace

std::vector<double> DropNaN(const std::vector<double> &values) {
  return ToVector(Finite(values));
}

std::optional<double> Mean(const std::vector<double> &values) {
  const auto finite = Finite(values);
  if (finite.is_empty()) {
    return std::nullopt;
  }
  return arma::mean(finite);
}

std::optional<double> StdDev(const std::vector<double> &values, size_t ddof) {
  const auto finite = Finite(values);
  if (finite.n_elem <= ddof) {
    return std::nullopt;
  }
  if (ddof <= 1) {
    // norm_type 0 divides by N-1, 1 divides by N
    return arma::stddev(finite, ddof == 1 ? 0 : 1);
  }
  const double ss = arma::accu(arma::square(finite - arma::mean(finite)));
  return std::sqrt(ss / static_cast<double>(finite.n_elem - ddof));
}

std::optional<double> Median(const std::vector<double> &values) {
  const auto finite = Finite(values);
  if (finite.is_empty()) {
    return std::nullopt;
  }
  return arma::median(finite);
}

std::optional<double> Quantile(const std::vector<double> &values, double q) {
  const auto finite = Finite(values);
  if (finite.is_empty()) {
    return std::nullopt;
  }
  return ArrowQuantile(finite, q);
}

std::optional<double> Skewness(const std::vector<double> &values) {
  const auto moments = CentralMoments(Finite(values), 3.0);
  if (!moments) {
    return std::nullopt;
  }
  return moments->second / std::pow(moments->first, 1.5);
}

std::optional<double> Kurtosis(const std::vector<double> &values) {
  const auto moments = CentralMoments(Finite(values), 4.0);
  if (!moments) {
    return std::nullopt;
  }
  return moments->second / (moments->first * moments->first);
}

std::optional<double> Correlation(const std::vector<double> &x,
                                  const std::vector<double> &y,
                                  size_t min_periods) {
  const size_t n = std::min(x.size(), y.size());
  const arma::vec xs(x.data(), n);
  const arma::vec ys(y.data(), n);
  const arma::uvec both =
      arma::intersect(arma::find_finite(xs), arma::find_finite(ys));
  if (both.n_elem < std::max<size_t>(min_periods, 2)) {
    return std::nullopt;
  }

  const arma::vec a = xs.elem(both);
  const arma::vec b = ys.elem(both);
  if (arma::var(a) <= 0.0 || arma::var(b) <= 0.0) {
    return std::nullopt;
  }
  return std::clamp(arma::as_scalar(arma::cor(a, b)), -1.0, 1.0);
}

std::vector<double> Diff(const std::vector<double> &values) {
  if (values.size() < 2) {
    return {};
  }
  return ToVector(arma::diff(arma::vec(values)));
}

namespace {
std::vector<size_t> LocalMaxima(const std::vector<double> &x) {
  std::vector<size_t> peaks;
  if (x.size() < 3) {
    return peaks;
  }
  size_t i = 1;
  const size_t last = x.size() - 1;
  while (i < last) {
    if (x[i - 1] < x[i]) {
      size_t ahead = i + 1;
      while (ahead < last && x[ahead] == x[i]) {
        ++ahead;
      }
      if (x[ahead] < x[i]) {
        peaks.push_back((i + ahead - 1) / 2);
        i = ahead;
      }
    }
    ++i;
  }
  return peaks;
}

double Prominence(const std::vector<double> &x, size_t peak) {
  double left_min = x[peak];
  for (size_t i = peak; i-- > 0;) {
    if (x[i] > x[peak]) {
      break;
    }
    left_min = std::min(left_min, x[i]);
  }
  double right_min = x[peak];
  for (size_t i = peak + 1; i < x.size(); ++i) {
    if (x[i] > x[peak]) {
      break;
    }
    right_min = std::min(right_min, x[i]);
  }
  return x[peak] - std::max(left_min, right_min);
}
} // namespace

std::vector<size_t> FindPeaks(const std::vector<double> &values,
                              const PeakOptions &options) {
  auto peaks = LocalMaxima(values);

  if (options.distance > 1 && peaks.size() > 1) {
    std::vector<size_t> order(peaks.size());
    std::iota(order.begin(), order.end(), 0);
    std::ranges::stable_sort(order, [&](size_t a, size_t b) {
      return values[peaks[a]] > values[peaks[b]];
    });
    std::vector<bool> keep(peaks.size(), true);
    for (size_t rank : order) {
      if (!keep[rank]) {
        continue;
      }
      for (size_t j = 0; j < peaks.size(); ++j) {
        if (j != rank && keep[j] &&
            std::max(peaks[j], peaks[rank]) - std::min(peaks[j], peaks[rank]) <
                options.distance) {
          keep[j] = false;
        }
      }
    }
    std::vector<size_t> kept;
    for (size_t j = 0; j < peaks.size(); ++j) {
      if (keep[j]) {
        kept.push_back(peaks[j]);
      }
    }
    peaks = std::move(kept);
  }

  if (options.prominence > 0.0) {
    std::erase_if(peaks, [&](size_t peak) {
      return Prominence(values, peak) < options.prominence;
    });
  }
  return peaks;
}

} // namespace epoch_zones::numeric
