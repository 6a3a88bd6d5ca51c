#include <epoch_zones/analysis/regression.h>

#include <armadillo>
#include <boost/math/distributions/students_t.hpp>

#include <algorithm>
#include <format>
#include <spdlog/spdlog.h>

namespace epoch_zones::analysis {

std::variant<RegressionModel, AnalysisDegraded>
FitOls(const ZoneList &zones, const std::string &target,
       const std::vector<std::string> &predictors) {
  const std::string component = "regression." + target;

  std::vector<std::vector<double>> rows;
  std::vector<double> y;
  for (const auto &zone : zones) {
    auto target_value = zone.GetNumericFeature(target);
    if (!target_value) {
      continue;
    }
    std::vector<double> row;
    for (const auto &predictor : predictors) {
      if (auto value = zone.GetNumericFeature(predictor)) {
        row.push_back(*value);
      }
    }
    if (row.size() == predictors.size()) {
      rows.push_back(std::move(row));
      y.push_back(*target_value);
    }
  }

  const size_t n = rows.size();
  const size_t p = predictors.size() + 1; // with intercept
  if (predictors.empty()) {
    return AnalysisDegraded{component, "no predictors available"};
  }
  if (n < p + 2) {
    return AnalysisDegraded{
        component, std::format("insufficient observations: {} < {}", n, p + 2)};
  }

  arma::mat X(n, p);
  arma::vec Y(y);
  for (size_t i = 0; i < n; ++i) {
    X(i, 0) = 1.0;
    for (size_t j = 1; j < p; ++j) {
      X(i, j) = rows[i][j - 1];
    }
  }

  arma::mat XtX_inv;
  if (!arma::inv_sympd(XtX_inv, X.t() * X) &&
      !arma::pinv(XtX_inv, X.t() * X)) {
    return AnalysisDegraded{component, "design matrix is singular"};
  }
  const arma::vec beta = XtX_inv * (X.t() * Y);
  const arma::vec residuals = Y - X * beta;
  const double rss = arma::dot(residuals, residuals);
  const double dof = static_cast<double>(n - p);
  const double tss = arma::accu(arma::square(Y - arma::mean(Y)));
  const arma::mat var_beta = rss / dof * XtX_inv;

  RegressionModel model;
  model.target = target;
  model.predictors = predictors;
  model.n_obs = static_cast<int64_t>(n);
  model.r_squared = tss > 0.0 ? 1.0 - rss / tss : 0.0;
  model.adj_r_squared =
      1.0 - (1.0 - model.r_squared) * static_cast<double>(n - 1) / dof;

  boost::math::students_t dist(dof);
  for (size_t j = 0; j < p; ++j) {
    const std::string name = j == 0 ? "intercept" : predictors[j - 1];
    const double se = std::sqrt(std::max(var_beta(j, j), 0.0));
    model.coefficients[name] = beta(j);
    model.std_errors[name] = se;
    model.p_values[name] =
        se > 0.0 ? 2.0 * boost::math::cdf(boost::math::complement(
                             dist, std::abs(beta(j) / se)))
                 : 0.0;
  }
  return model;
}

std::variant<RegressionResult, AnalysisDegraded>
RunRegression(const ZoneList &zones, const RegressionOptions &options,
              std::vector<AnalysisDegraded> &degraded) {
  if (zones.size() <= options.min_zones) {
    return AnalysisDegraded{"regression",
                            std::format("insufficient zones: {} <= {}",
                                        zones.size(), options.min_zones)};
  }

  RegressionResult result;
  for (const auto &target : options.targets) {
    std::vector<std::string> predictors;
    for (const auto &predictor : options.predictors) {
      if (predictor == target) {
        continue;
      }
      const bool present = std::ranges::any_of(zones, [&](const Zone &zone) {
        return zone.GetNumericFeature(predictor).has_value();
      });
      if (present) {
        predictors.push_back(predictor);
      }
    }

    auto fitted = FitOls(zones, target, predictors);
    if (auto *model = std::get_if<RegressionModel>(&fitted)) {
      SPDLOG_INFO("regression {}: n={}, r2={:.3f}", target, model->n_obs,
                  model->r_squared);
      result.models[target] = std::move(*model);
    } else {
      degraded.push_back(std::get<AnalysisDegraded>(fitted));
    }
  }
  if (result.models.empty()) {
    return AnalysisDegraded{"regression", "no target could be fitted"};
  }
  return result;
}

} // namespace epoch_zones::analysis
