#include "helio-corr/causality/granger.hpp"
#include "helio-corr/alignment/aligner.hpp"
#include "helio-corr/core/errors.hpp"
#include "helio-corr/interpretation/labels.hpp"
#include "helio-corr/utils/logging.hpp"
#include "helio-corr/utils/statistics.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace heliocorr::causality {

namespace {

constexpr const char *kMethodName = "granger";

// Below this fraction of the total sum of squares the unrestricted fit is treated as exact.
constexpr double kPerfectFitTolerance = 1e-12;

double residualSumOfSquares(const Eigen::MatrixXd &design, const Eigen::VectorXd &target, int lag) {
	const auto qr = design.colPivHouseholderQr();
	if (qr.rank() < design.cols()) {
		throw core::ComputationError(kMethodName, "singular design matrix at lag " + std::to_string(lag) +
		                                              " (collinear lagged predictors)");
	}
	const Eigen::VectorXd beta = qr.solve(target);
	const double ssr = (target - design * beta).squaredNorm();
	if (!std::isfinite(ssr)) {
		throw core::ComputationError(kMethodName, "non-finite residuals at lag " + std::to_string(lag));
	}
	return ssr;
}

} // namespace

std::string toString(GrangerTest test) {
	switch (test) {
	case GrangerTest::SsrChi2:
		return "ssr_chi2test";
	case GrangerTest::SsrF:
		return "ssr_ftest";
	case GrangerTest::LikelihoodRatio:
		return "lrtest";
	}
	return "unknown";
}

GrangerCausality::GrangerCausality(int max_lag, GrangerTest test, double alpha, bool bonferroni)
    : max_lag_(max_lag), test_(test), alpha_(alpha), bonferroni_(bonferroni) {}

GrangerCausality::Builder &GrangerCausality::Builder::maxLag(int value) {
	max_lag_ = value;
	return *this;
}

GrangerCausality::Builder &GrangerCausality::Builder::statistic(GrangerTest value) {
	test_ = value;
	return *this;
}

GrangerCausality::Builder &GrangerCausality::Builder::alpha(double value) {
	alpha_ = value;
	return *this;
}

GrangerCausality::Builder &GrangerCausality::Builder::bonferroni(bool value) {
	bonferroni_ = value;
	return *this;
}

GrangerCausality GrangerCausality::Builder::build() const {
	if (max_lag_ < 1) {
		throw std::invalid_argument("Granger max_lag must be at least 1");
	}
	if (!(alpha_ > 0.0 && alpha_ < 1.0)) {
		throw std::invalid_argument("alpha must lie in (0, 1)");
	}
	return GrangerCausality(max_lag_, test_, alpha_, bonferroni_);
}

GrangerCausality::Builder GrangerCausality::builder() {
	return Builder();
}

std::size_t GrangerCausality::minimumObservations() const {
	return alignment::kGrangerObservationsPerLag * static_cast<std::size_t>(max_lag_);
}

LagTestResult GrangerCausality::testLag(const std::vector<double> &x, const std::vector<double> &y, int lag) const {
	const int n = static_cast<int>(y.size());
	const int nobs = n - lag;
	const int restricted_cols = 1 + lag;
	const int unrestricted_cols = 1 + 2 * lag;
	const int df_unrestricted = nobs - unrestricted_cols;
	if (df_unrestricted <= 0) {
		throw core::ComputationError(kMethodName, "no residual degrees of freedom at lag " + std::to_string(lag));
	}

	Eigen::VectorXd target(nobs);
	Eigen::MatrixXd restricted(nobs, restricted_cols);
	Eigen::MatrixXd unrestricted(nobs, unrestricted_cols);
	for (int row = 0; row < nobs; ++row) {
		const int t = row + lag;
		target(row) = y[t];
		restricted(row, 0) = 1.0;
		unrestricted(row, 0) = 1.0;
		for (int k = 1; k <= lag; ++k) {
			restricted(row, k) = y[t - k];
			unrestricted(row, k) = y[t - k];
			unrestricted(row, lag + k) = x[t - k];
		}
	}

	const double ssr_restricted = residualSumOfSquares(restricted, target, lag);
	const double ssr_unrestricted = residualSumOfSquares(unrestricted, target, lag);

	const double total = (target.array() - target.mean()).square().sum();
	if (ssr_unrestricted <= kPerfectFitTolerance * total) {
		throw core::ComputationError(kMethodName, "unrestricted model fits exactly at lag " + std::to_string(lag));
	}

	// Restricted SSR cannot be below the unrestricted one; clamp rounding noise.
	const double improvement = std::max(0.0, ssr_restricted - ssr_unrestricted);
	const double lag_d = static_cast<double>(lag);
	const double nobs_d = static_cast<double>(nobs);

	LagTestResult result;
	result.lag = lag;
	switch (test_) {
	case GrangerTest::SsrChi2:
		result.f_statistic = nobs_d * improvement / ssr_unrestricted;
		result.p_value = utils::Statistics::chiSquaredSurvival(result.f_statistic, lag_d);
		break;
	case GrangerTest::SsrF:
		result.f_statistic = (improvement / ssr_unrestricted) * static_cast<double>(df_unrestricted) / lag_d;
		result.p_value =
		    utils::Statistics::fisherSurvival(result.f_statistic, lag_d, static_cast<double>(df_unrestricted));
		break;
	case GrangerTest::LikelihoodRatio:
		result.f_statistic = nobs_d * std::log((ssr_unrestricted + improvement) / ssr_unrestricted);
		result.p_value = utils::Statistics::chiSquaredSurvival(result.f_statistic, lag_d);
		break;
	}
	if (!std::isfinite(result.p_value)) {
		throw core::ComputationError(kMethodName, "undefined p-value at lag " + std::to_string(lag));
	}
	result.significant = interpretation::isSignificant(result.p_value, alpha_);
	return result;
}

CausalityResult GrangerCausality::compute(const std::vector<double> &x, const std::vector<double> &y) const {
	const auto pair = alignment::prepare(x, y, minimumObservations(), kMethodName);

	CausalityResult result;
	result.test = test_;
	result.max_lag_tested = max_lag_;
	result.n_observations = pair.size();
	result.lags.reserve(static_cast<std::size_t>(max_lag_));

	bool have_best = false;
	for (int lag = 1; lag <= max_lag_; ++lag) {
		auto lag_result = testLag(pair.x, pair.y, lag);
		HELIOCORR_TRACE("granger lag={} stat={:.4f} p={:.4g}", lag, lag_result.f_statistic, lag_result.p_value);
		if (!have_best || lag_result.p_value < result.best_p_value) {
			result.best_lag = lag;
			result.best_p_value = lag_result.p_value;
			result.best_f_statistic = lag_result.f_statistic;
			have_best = true;
		}
		result.lags.push_back(lag_result);
	}

	result.best_p_value_adjusted = std::min(1.0, result.best_p_value * static_cast<double>(max_lag_));
	const double decisive_p = bonferroni_ ? result.best_p_value_adjusted : result.best_p_value;
	result.is_significant = interpretation::isSignificant(decisive_p, alpha_);

	std::ostringstream interpretation;
	if (result.is_significant) {
		result.causality = "x Granger-causes y at lag " + std::to_string(result.best_lag);
		interpretation << "Past values of x (up to " << result.best_lag
		               << " periods) significantly improve the prediction of y (p=" << std::fixed
		               << std::setprecision(4) << decisive_p << ")";
	} else {
		result.causality = "No Granger-causality detected";
		interpretation << "No evidence that x improves the prediction of y beyond the past values of y";
	}
	result.interpretation = interpretation.str();

	HELIOCORR_DEBUG("granger best_lag={} p={:.4g} ({})", result.best_lag, result.best_p_value, result.causality);
	return result;
}

} // namespace heliocorr::causality
