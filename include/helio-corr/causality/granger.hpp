#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace heliocorr::causality {

/**
 * @brief Statistic used to compare the restricted and unrestricted fits.
 */
enum class GrangerTest {
	SsrChi2,        ///< nobs * (ssr_r - ssr_u) / ssr_u, chi-squared(lag)
	SsrF,           ///< ((ssr_r - ssr_u) / ssr_u) * df_u / lag, F(lag, df_u)
	LikelihoodRatio ///< nobs * log(ssr_r / ssr_u), chi-squared(lag)
};

std::string toString(GrangerTest test);

struct LagTestResult {
	int lag = 0;
	double f_statistic = 0.0;
	double p_value = 1.0;
	bool significant = false;
};

struct CausalityResult {
	int best_lag = 0;
	double best_p_value = 1.0;
	double best_f_statistic = 0.0;
	// Bonferroni correction over the number of lags searched.
	double best_p_value_adjusted = 1.0;
	bool is_significant = false;
	std::vector<LagTestResult> lags;
	std::string causality;
	std::string interpretation;
	GrangerTest test = GrangerTest::SsrChi2;
	int max_lag_tested = 0;
	std::size_t n_observations = 0;
};

/**
 * @class GrangerCausality
 * @brief Tests whether lagged values of x improve an autoregression of y.
 *
 * For every lag L in 1..max_lag two OLS models are fitted over the same rows:
 * y[t] on an intercept and y[t-1..t-L] (restricted) and the same plus
 * x[t-1..t-L] (unrestricted). The residual sums of squares are compared with
 * the configured statistic. The best lag is the one with the smallest p-value;
 * that selection is not corrected for the number of lags unless Bonferroni
 * mode is enabled, in which case the verdict uses the adjusted p-value.
 */
class GrangerCausality {
public:
	class Builder {
	public:
		Builder &maxLag(int value);
		Builder &statistic(GrangerTest value);
		Builder &alpha(double value);
		Builder &bonferroni(bool value);
		GrangerCausality build() const;

	private:
		int max_lag_ = 7;
		GrangerTest test_ = GrangerTest::SsrChi2;
		double alpha_ = 0.05;
		bool bonferroni_ = false;
	};

	static Builder builder();

	/**
	 * @brief Runs the lag search for "x Granger-causes y".
	 * @param x Candidate cause, chronological.
	 * @param y Effect, chronological, same length as x.
	 * @throws core::InsufficientDataError Fewer than 5 * max_lag jointly observed values.
	 * @throws core::DegenerateInputError Either series is constant.
	 * @throws core::ComputationError Singular design matrix or a perfect unrestricted fit.
	 */
	CausalityResult compute(const std::vector<double> &x, const std::vector<double> &y) const;

	int maxLag() const {
		return max_lag_;
	}
	GrangerTest statistic() const {
		return test_;
	}
	double alpha() const {
		return alpha_;
	}

	std::size_t minimumObservations() const;

private:
	GrangerCausality(int max_lag, GrangerTest test, double alpha, bool bonferroni);

	LagTestResult testLag(const std::vector<double> &x, const std::vector<double> &y, int lag) const;

	int max_lag_;
	GrangerTest test_;
	double alpha_;
	bool bonferroni_;
};

} // namespace heliocorr::causality
