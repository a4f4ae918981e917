#pragma once

#include "helio-corr/interpretation/labels.hpp"
#include "helio-corr/utils/random.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace heliocorr::correlation {

enum class CorrelationMethod {
	Pearson,
	Spearman
};

std::string toString(CorrelationMethod method);

struct PairwiseOptions {
	double alpha = 0.05;
	std::size_t bootstrap_samples = 1000;
	interpretation::StrengthThresholds strength{};
	interpretation::EffectSizeThresholds effect{};
};

struct ConfidenceInterval {
	double lower = 0.0;
	double upper = 0.0;
};

struct CorrelationResult {
	CorrelationMethod method = CorrelationMethod::Pearson;
	double correlation_coefficient = 0.0;
	double p_value = 1.0;
	ConfidenceInterval confidence_interval;
	std::size_t n_observations = 0;
	std::optional<int> lag;
	interpretation::CorrelationStrength interpretation = interpretation::CorrelationStrength::VeryWeak;
	interpretation::EffectSize effect_size = interpretation::EffectSize::Negligible;
	bool is_significant = false;
	double alpha = 0.05;
	// Replicates that produced a defined coefficient; resamples with zero variance are dropped.
	std::size_t bootstrap_samples = 0;
};

using CoefficientFunction = std::function<double(const std::vector<double> &, const std::vector<double> &)>;

/**
 * @brief Percentile bootstrap interval for a paired coefficient.
 *
 * Each replicate draws `samples` index sets with replacement and applies the
 * same indices to both arrays so the pairing is preserved. The interval is
 * the (alpha/2, 1-alpha/2) percentile pair of the replicate distribution.
 *
 * @param valid_replicates Optional output: number of replicates with a defined coefficient.
 * @throws core::ComputationError If no replicate produced a defined coefficient.
 */
ConfidenceInterval bootstrapInterval(const std::vector<double> &x, const std::vector<double> &y,
                                     const CoefficientFunction &coefficient, std::size_t samples, double alpha,
                                     utils::RandomEngine &rng, std::size_t *valid_replicates = nullptr);

/**
 * @brief Pearson correlation with analytic p-value and bootstrap CI.
 * @throws core::InsufficientDataError Fewer than 10 jointly observed values.
 * @throws core::DegenerateInputError Either input is constant.
 */
CorrelationResult pearsonCorrelation(const std::vector<double> &x, const std::vector<double> &y,
                                     utils::RandomEngine &rng, const PairwiseOptions &options = {});

/**
 * @brief Spearman rank correlation with t-approximation p-value and bootstrap CI.
 */
CorrelationResult spearmanCorrelation(const std::vector<double> &x, const std::vector<double> &y,
                                      utils::RandomEngine &rng, const PairwiseOptions &options = {});

CorrelationResult correlate(CorrelationMethod method, const std::vector<double> &x, const std::vector<double> &y,
                            utils::RandomEngine &rng, const PairwiseOptions &options = {});

} // namespace heliocorr::correlation
