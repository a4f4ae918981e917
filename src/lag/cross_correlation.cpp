#include "helio-corr/lag/cross_correlation.hpp"
#include "helio-corr/alignment/aligner.hpp"
#include "helio-corr/interpretation/labels.hpp"
#include "helio-corr/utils/logging.hpp"
#include "helio-corr/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace heliocorr::lag {

namespace {

constexpr const char *kMethodName = "cross_correlation";

double maxAbsolute(const std::vector<double> &values) {
	double best = 0.0;
	for (double v : values) {
		best = std::max(best, std::abs(v));
	}
	return best;
}

} // namespace

CrossCorrelationAnalyzer::CrossCorrelationAnalyzer(int max_lag, std::size_t permutations, double alpha)
    : max_lag_(max_lag), permutations_(permutations), alpha_(alpha) {}

CrossCorrelationAnalyzer::Builder &CrossCorrelationAnalyzer::Builder::maxLag(int value) {
	max_lag_ = value;
	return *this;
}

CrossCorrelationAnalyzer::Builder &CrossCorrelationAnalyzer::Builder::permutations(std::size_t value) {
	permutations_ = value;
	return *this;
}

CrossCorrelationAnalyzer::Builder &CrossCorrelationAnalyzer::Builder::alpha(double value) {
	alpha_ = value;
	return *this;
}

CrossCorrelationAnalyzer CrossCorrelationAnalyzer::Builder::build() const {
	if (max_lag_ < 0) {
		throw std::invalid_argument("Cross-correlation max_lag must not be negative");
	}
	if (permutations_ == 0) {
		throw std::invalid_argument("Permutation count must be positive");
	}
	if (!(alpha_ > 0.0 && alpha_ < 1.0)) {
		throw std::invalid_argument("alpha must lie in (0, 1)");
	}
	return CrossCorrelationAnalyzer(max_lag_, permutations_, alpha_);
}

CrossCorrelationAnalyzer::Builder CrossCorrelationAnalyzer::builder() {
	return Builder();
}

std::vector<double> CrossCorrelationAnalyzer::normalizedCrossCorrelation(const std::vector<double> &x,
                                                                         const std::vector<double> &y, int max_lag) {
	if (x.size() != y.size()) {
		throw std::invalid_argument("x and y must have same size");
	}
	const int n = static_cast<int>(x.size());
	if (max_lag < 0 || max_lag >= n) {
		throw std::invalid_argument("max_lag must lie in [0, n)");
	}

	const double mx = utils::Statistics::mean(x);
	const double my = utils::Statistics::mean(y);
	const double scale =
	    utils::Statistics::populationStdDev(x) * utils::Statistics::populationStdDev(y) * static_cast<double>(n);

	std::vector<double> result;
	result.reserve(static_cast<std::size_t>(2 * max_lag + 1));
	for (int lag = -max_lag; lag <= max_lag; ++lag) {
		const int begin = std::max(0, -lag);
		const int end = std::min(n, n - lag);
		double sum = 0.0;
		for (int t = begin; t < end; ++t) {
			sum += (x[t + lag] - mx) * (y[t] - my);
		}
		result.push_back(sum / scale);
	}
	return result;
}

CrossCorrelationResult CrossCorrelationAnalyzer::compute(const std::vector<double> &x, const std::vector<double> &y,
                                                         utils::RandomEngine &rng) const {
	const auto pair = alignment::prepare(x, y, alignment::kMinCorrelationObservations, kMethodName);
	const int n = static_cast<int>(pair.size());
	const int window = std::min(max_lag_, n - 1);

	CrossCorrelationResult result;
	result.n_observations = pair.size();
	result.permutations = permutations_;
	result.max_lag_tested = window;
	result.correlations = normalizedCrossCorrelation(pair.x, pair.y, window);
	result.lags.reserve(result.correlations.size());
	for (int lag = -window; lag <= window; ++lag) {
		result.lags.push_back(lag);
	}

	std::size_t best = 0;
	for (std::size_t i = 1; i < result.correlations.size(); ++i) {
		if (std::abs(result.correlations[i]) > std::abs(result.correlations[best])) {
			best = i;
		}
	}
	result.optimal_lag = result.lags[best];
	result.max_correlation = result.correlations[best];

	const double observed = std::abs(result.max_correlation);
	std::vector<double> shuffled = pair.y;
	std::size_t at_least_as_extreme = 0;
	for (std::size_t p = 0; p < permutations_; ++p) {
		std::shuffle(shuffled.begin(), shuffled.end(), rng);
		const auto null_correlations = normalizedCrossCorrelation(pair.x, shuffled, window);
		if (maxAbsolute(null_correlations) >= observed) {
			++at_least_as_extreme;
		}
	}
	result.p_value = static_cast<double>(at_least_as_extreme) / static_cast<double>(permutations_);
	result.is_significant = interpretation::isSignificant(result.p_value, alpha_);

	std::ostringstream interpretation;
	interpretation << "Maximum correlation at lag " << result.optimal_lag << ": " << std::fixed
	               << std::setprecision(3) << result.max_correlation;
	result.interpretation = interpretation.str();

	HELIOCORR_DEBUG("cross_correlation lag={} r={:.4f} p={:.4g}", result.optimal_lag, result.max_correlation,
	                result.p_value);
	return result;
}

} // namespace heliocorr::lag
