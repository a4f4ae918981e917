#include "helio-corr/utils/statistics.hpp"

#include <boost/math/distributions/chi_squared.hpp>
#include <boost/math/distributions/fisher_f.hpp>
#include <boost/math/distributions/students_t.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace heliocorr::utils {

namespace Statistics {

double mean(const std::vector<double> &data) {
	if (data.empty()) {
		throw std::invalid_argument("Cannot compute mean of empty vector");
	}
	return std::accumulate(data.begin(), data.end(), 0.0) / static_cast<double>(data.size());
}

// Exact comparison: summing identical values can leave a tiny nonzero variance.
bool isConstant(const std::vector<double> &data) {
	if (data.empty()) {
		return true;
	}
	const auto [lowest, highest] = std::minmax_element(data.begin(), data.end());
	return *lowest == *highest;
}

double sumOfSquares(const std::vector<double> &data) {
	if (data.empty()) {
		return 0.0;
	}
	const double m = mean(data);
	double total = 0.0;
	for (double v : data) {
		const double d = v - m;
		total += d * d;
	}
	return total;
}

double variance(const std::vector<double> &data) {
	if (data.size() < 2) {
		return 0.0;
	}
	return sumOfSquares(data) / static_cast<double>(data.size() - 1);
}

double populationStdDev(const std::vector<double> &data) {
	if (data.empty()) {
		return 0.0;
	}
	return std::sqrt(sumOfSquares(data) / static_cast<double>(data.size()));
}

double pearson(const std::vector<double> &x, const std::vector<double> &y) {
	if (x.size() != y.size()) {
		throw std::invalid_argument("x and y must have same size");
	}
	const std::size_t n = x.size();
	if (n < 2 || isConstant(x) || isConstant(y)) {
		return std::numeric_limits<double>::quiet_NaN();
	}

	const double mx = mean(x);
	const double my = mean(y);
	double sxy = 0.0;
	double sxx = 0.0;
	double syy = 0.0;
	for (std::size_t i = 0; i < n; ++i) {
		const double dx = x[i] - mx;
		const double dy = y[i] - my;
		sxy += dx * dy;
		sxx += dx * dx;
		syy += dy * dy;
	}
	if (sxx <= 0.0 || syy <= 0.0) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	const double r = sxy / std::sqrt(sxx * syy);
	return std::clamp(r, -1.0, 1.0);
}

std::vector<double> ranks(const std::vector<double> &data) {
	const std::size_t n = data.size();
	std::vector<std::size_t> order(n);
	std::iota(order.begin(), order.end(), 0);
	std::sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) { return data[a] < data[b]; });

	std::vector<double> result(n);
	std::size_t i = 0;
	while (i < n) {
		std::size_t j = i + 1;
		while (j < n && data[order[j]] == data[order[i]]) {
			++j;
		}
		const double average_rank = 0.5 * (static_cast<double>(i + 1) + static_cast<double>(j));
		for (std::size_t k = i; k < j; ++k) {
			result[order[k]] = average_rank;
		}
		i = j;
	}
	return result;
}

double spearman(const std::vector<double> &x, const std::vector<double> &y) {
	return pearson(ranks(x), ranks(y));
}

double percentile(const std::vector<double> &sorted, double q) {
	if (sorted.empty()) {
		throw std::invalid_argument("Cannot compute percentile of empty sample");
	}
	if (q < 0.0 || q > 100.0) {
		throw std::invalid_argument("Percentile must lie in [0, 100]");
	}
	const double position = (q / 100.0) * static_cast<double>(sorted.size() - 1);
	const auto lower = static_cast<std::size_t>(std::floor(position));
	const auto upper = std::min(lower + 1, sorted.size() - 1);
	const double fraction = position - static_cast<double>(lower);
	return sorted[lower] + fraction * (sorted[upper] - sorted[lower]);
}

double correlationPValue(double r, std::size_t n) {
	if (n < 3) {
		throw std::invalid_argument("Need at least 3 observations for a correlation p-value");
	}
	if (!std::isfinite(r)) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	const double one_minus_r2 = 1.0 - r * r;
	if (one_minus_r2 <= 0.0) {
		return 0.0;
	}
	const double df = static_cast<double>(n - 2);
	const double t = std::abs(r) * std::sqrt(df / one_minus_r2);
	if (!std::isfinite(t)) {
		return 0.0;
	}
	boost::math::students_t dist{df};
	const double p = 2.0 * boost::math::cdf(boost::math::complement(dist, t));
	return std::clamp(p, 0.0, 1.0);
}

double chiSquaredSurvival(double statistic, double df) {
	if (!(df > 0.0)) {
		throw std::invalid_argument("Chi-squared degrees of freedom must be positive");
	}
	if (std::isnan(statistic)) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	if (statistic <= 0.0) {
		return 1.0;
	}
	if (std::isinf(statistic)) {
		return 0.0;
	}
	boost::math::chi_squared dist{df};
	return boost::math::cdf(boost::math::complement(dist, statistic));
}

double fisherSurvival(double statistic, double df1, double df2) {
	if (!(df1 > 0.0) || !(df2 > 0.0)) {
		throw std::invalid_argument("F distribution degrees of freedom must be positive");
	}
	if (std::isnan(statistic)) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	if (statistic <= 0.0) {
		return 1.0;
	}
	if (std::isinf(statistic)) {
		return 0.0;
	}
	boost::math::fisher_f dist{df1, df2};
	return boost::math::cdf(boost::math::complement(dist, statistic));
}

} // namespace Statistics
} // namespace heliocorr::utils
