#pragma once

#include "helio-corr/utils/random.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace heliocorr::lag {

struct CrossCorrelationResult {
	// Negative: fluctuations of the first series precede those of the second.
	int optimal_lag = 0;
	double max_correlation = 0.0;
	double p_value = 1.0;
	bool is_significant = false;
	std::vector<int> lags;
	std::vector<double> correlations;
	std::size_t n_observations = 0;
	std::size_t permutations = 0;
	int max_lag_tested = 0;
	std::string interpretation;
};

/**
 * @class CrossCorrelationAnalyzer
 * @brief Optimal lag search over the normalized cross-correlation function.
 *
 * c(L) = sum_t (x[t+L] - mean_x)(y[t] - mean_y) / (n * sd_x * sd_y), using
 * population standard deviations, for |L| <= max_lag. The lag with the largest
 * |c(L)| wins; its significance comes from a permutation test that shuffles y
 * and records the maximum |c| over the same lag window.
 */
class CrossCorrelationAnalyzer {
public:
	class Builder {
	public:
		Builder &maxLag(int value);
		Builder &permutations(std::size_t value);
		Builder &alpha(double value);
		CrossCorrelationAnalyzer build() const;

	private:
		int max_lag_ = 30;
		std::size_t permutations_ = 1000;
		double alpha_ = 0.05;
	};

	static Builder builder();

	/**
	 * @throws core::InsufficientDataError Fewer than 10 jointly observed values.
	 * @throws core::DegenerateInputError Either series is constant.
	 */
	CrossCorrelationResult compute(const std::vector<double> &x, const std::vector<double> &y,
	                               utils::RandomEngine &rng) const;

	/**
	 * @brief Normalized cross-correlation for lags -max_lag..max_lag (inclusive, ascending).
	 *
	 * Inputs must be clean, equal length and non-constant; max_lag must be below the length.
	 */
	static std::vector<double> normalizedCrossCorrelation(const std::vector<double> &x, const std::vector<double> &y,
	                                                      int max_lag);

	int maxLag() const {
		return max_lag_;
	}
	std::size_t permutations() const {
		return permutations_;
	}

private:
	CrossCorrelationAnalyzer(int max_lag, std::size_t permutations, double alpha);

	int max_lag_;
	std::size_t permutations_;
	double alpha_;
};

/**
 * @brief One row of the lag profile produced by timeLaggedCorrelation().
 */
struct LaggedCorrelation {
	int lag = 0;
	std::string description;
	double correlation = 0.0;
	double p_value = 1.0;
	std::size_t n_observations = 0;
	bool significant = false;
};

/**
 * @brief Shift-and-Pearson table for every lag in [-max_lag, max_lag].
 *
 * Lag -k pairs x[t-k] with y[t] (x leads by k), lag +k pairs x[t] with
 * y[t-k] (y leads by k). Missing values are removed per lag. Lags whose
 * overlap has 10 or fewer observations, or a constant side, are omitted.
 *
 * @throws std::invalid_argument If x and y differ in length or max_lag is negative.
 */
std::vector<LaggedCorrelation> timeLaggedCorrelation(const std::vector<double> &x, const std::vector<double> &y,
                                                     int max_lag = 14, double alpha = 0.05);

} // namespace heliocorr::lag
