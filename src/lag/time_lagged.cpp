#include "helio-corr/alignment/aligner.hpp"
#include "helio-corr/interpretation/labels.hpp"
#include "helio-corr/lag/cross_correlation.hpp"
#include "helio-corr/utils/logging.hpp"
#include "helio-corr/utils/statistics.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace heliocorr::lag {

namespace {

std::string describeLag(int lag) {
	if (lag < 0) {
		return "x leads by " + std::to_string(-lag);
	}
	if (lag > 0) {
		return "y leads by " + std::to_string(lag);
	}
	return "no lag";
}

} // namespace

std::vector<LaggedCorrelation> timeLaggedCorrelation(const std::vector<double> &x, const std::vector<double> &y,
                                                     int max_lag, double alpha) {
	if (x.size() != y.size()) {
		throw std::invalid_argument("x and y must have same size");
	}
	if (max_lag < 0) {
		throw std::invalid_argument("max_lag must not be negative");
	}
	if (!(alpha > 0.0 && alpha < 1.0)) {
		throw std::invalid_argument("alpha must lie in (0, 1)");
	}

	const std::size_t n = x.size();
	std::vector<LaggedCorrelation> rows;
	for (int lag = -max_lag; lag <= max_lag; ++lag) {
		const std::size_t shift = static_cast<std::size_t>(lag < 0 ? -lag : lag);
		if (shift >= n) {
			continue;
		}

		std::vector<double> x_window;
		std::vector<double> y_window;
		x_window.reserve(n - shift);
		y_window.reserve(n - shift);
		for (std::size_t t = shift; t < n; ++t) {
			if (lag < 0) {
				x_window.push_back(x[t - shift]);
				y_window.push_back(y[t]);
			} else {
				x_window.push_back(x[t]);
				y_window.push_back(y[t - shift]);
			}
		}

		const auto pair = alignment::cleanPairwise(x_window, y_window);
		if (pair.size() <= alignment::kMinCorrelationObservations) {
			continue;
		}
		const double r = utils::Statistics::pearson(pair.x, pair.y);
		if (!std::isfinite(r)) {
			HELIOCORR_DEBUG("time_lagged_correlation: lag {} skipped, constant window", lag);
			continue;
		}

		LaggedCorrelation row;
		row.lag = lag;
		row.description = describeLag(lag);
		row.correlation = r;
		row.p_value = utils::Statistics::correlationPValue(r, pair.size());
		row.n_observations = pair.size();
		row.significant = interpretation::isSignificant(row.p_value, alpha);
		rows.push_back(std::move(row));
	}
	return rows;
}

} // namespace heliocorr::lag
