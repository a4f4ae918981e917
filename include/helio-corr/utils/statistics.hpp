#pragma once

#include <cstddef>
#include <vector>

namespace heliocorr::utils {

/**
 * @brief Small numerical kernels shared by the analysis modules.
 *
 * All functions operate on already-cleaned input (finite values, matching
 * sizes); validation belongs to the alignment layer.
 */
namespace Statistics {

double mean(const std::vector<double> &data);

/// True when every element compares equal (or the vector is empty).
bool isConstant(const std::vector<double> &data);

/// Sum of squared deviations from the mean.
double sumOfSquares(const std::vector<double> &data);

/// Sample variance (n - 1 denominator). Returns 0 for fewer than two values.
double variance(const std::vector<double> &data);

/// Population standard deviation (n denominator).
double populationStdDev(const std::vector<double> &data);

/**
 * @brief Pearson product-moment coefficient.
 * @return The coefficient clamped to [-1, 1], or NaN when either input has zero variance.
 */
double pearson(const std::vector<double> &x, const std::vector<double> &y);

/// Ranks starting at 1; tied values share their average rank.
std::vector<double> ranks(const std::vector<double> &data);

/// Spearman coefficient: Pearson on average ranks.
double spearman(const std::vector<double> &x, const std::vector<double> &y);

/**
 * @brief Percentile with linear interpolation between order statistics.
 * @param sorted Ascending sample, must be non-empty.
 * @param q Percentile in [0, 100].
 */
double percentile(const std::vector<double> &sorted, double q);

/// Two-sided p-value of a correlation coefficient under H0: rho = 0 (Student's t, n - 2 df).
double correlationPValue(double r, std::size_t n);

/// Upper tail of the chi-squared distribution.
double chiSquaredSurvival(double statistic, double df);

/// Upper tail of the F distribution.
double fisherSurvival(double statistic, double df1, double df2);

} // namespace Statistics
} // namespace heliocorr::utils
