//
// Augmented Dickey-Fuller test with a constant term
//
// Regression: dy_t = a + g * y_{t-1} + sum_i b_i * dy_{t-i} + e_t
// Statistic: g / SE(g). The p-value interpolates MacKinnon (2010) critical
// values for the constant-only case.
//

#pragma once

#include <algorithm>
#include <armadillo>
#include <array>
#include <cmath>
#include <optional>
#include <vector>

namespace epoch_zones::analysis::adf {

struct ADFResult {
  double adf_stat;
  double pvalue;
  int used_lag;
  int nobs;
  double gamma;
  double se_gamma;
  std::array<double, 3> critical_values; // 1%, 5%, 10%
};

struct CriticalValueCoeffs {
  double tau_inf;
  double tau_1;
  double tau_2;
};

// MacKinnon (2010) Table 1, constant only: 1%, 5%, 10%
inline constexpr std::array<CriticalValueCoeffs, 3> kConstantCoefficients = {{
    {-3.4336, -5.999, -29.25},
    {-2.8621, -2.738, -8.36},
    {-2.5671, -1.438, -4.48},
}};

inline std::array<double, 3> CriticalValues(size_t T) {
  const double t_inv = 1.0 / static_cast<double>(T);
  std::array<double, 3> values{};
  for (size_t i = 0; i < 3; ++i) {
    const auto &coef = kConstantCoefficients[i];
    values[i] = coef.tau_inf + coef.tau_1 * t_inv + coef.tau_2 * t_inv * t_inv;
  }
  return values;
}

// Piecewise-linear p-value between the 1%, 5% and 10% critical values,
// extrapolated outside and clamped to [0.0001, 0.9999]
inline double PValue(double tau, const std::array<double, 3> &cv) {
  const auto [cv_1, cv_5, cv_10] = cv;
  if (tau <= cv_1) {
    const double slope = (0.05 - 0.01) / (cv_5 - cv_1);
    return std::max(0.0001, 0.01 + slope * (tau - cv_1));
  }
  if (tau <= cv_5) {
    return 0.01 + (tau - cv_1) / (cv_5 - cv_1) * (0.05 - 0.01);
  }
  if (tau <= cv_10) {
    return 0.05 + (tau - cv_5) / (cv_10 - cv_5) * (0.10 - 0.05);
  }
  const double slope = (0.10 - 0.05) / (cv_10 - cv_5);
  return std::min(0.9999, 0.10 + slope * (tau - cv_10));
}

inline std::optional<ADFResult> ComputeAdf(const std::vector<double> &y,
                                            int maxlag = 1) {
  const size_t n = y.size();
  if (n < static_cast<size_t>(maxlag + 3)) {
    return std::nullopt;
  }

  std::vector<double> dy(n - 1);
  for (size_t i = 0; i < n - 1; ++i) {
    dy[i] = y[i + 1] - y[i];
  }

  const size_t nobs = n - maxlag - 1;
  const int n_regressors = 2 + maxlag; // constant, y_{t-1}, lagged diffs
  if (nobs < 5 || nobs <= static_cast<size_t>(n_regressors)) {
    return std::nullopt;
  }

  arma::vec Y(nobs);
  arma::mat X(nobs, n_regressors);
  for (size_t i = 0; i < nobs; ++i) {
    const size_t t = i + maxlag;
    Y(i) = dy[t];
    X(i, 0) = 1.0;
    X(i, 1) = y[t];
    for (int lag = 1; lag <= maxlag; ++lag) {
      X(i, 1 + lag) = dy[t - lag];
    }
  }

  arma::mat XtX = X.t() * X;
  arma::mat XtX_inv;
  if (!arma::inv(XtX_inv, XtX)) {
    XtX_inv = arma::pinv(XtX);
  }
  const arma::vec beta = XtX_inv * (X.t() * Y);
  const arma::vec residuals = Y - X * beta;
  const double s2 =
      arma::dot(residuals, residuals) / static_cast<double>(nobs - n_regressors);
  const arma::mat var_beta = s2 * XtX_inv;

  const double gamma = beta(1);
  const double se_gamma = std::sqrt(var_beta(1, 1));
  if (!(se_gamma > 0.0) || !std::isfinite(se_gamma)) {
    return std::nullopt;
  }

  ADFResult result{};
  result.adf_stat = gamma / se_gamma;
  result.used_lag = maxlag;
  result.nobs = static_cast<int>(nobs);
  result.gamma = gamma;
  result.se_gamma = se_gamma;
  result.critical_values = CriticalValues(nobs);
  result.pvalue = PValue(result.adf_stat, result.critical_values);
  return result;
}

} // namespace epoch_zones::analysis::adf
