#include "helio-corr/correlation/pairwise.hpp"
#include "helio-corr/alignment/aligner.hpp"
#include "helio-corr/core/errors.hpp"
#include "helio-corr/utils/logging.hpp"
#include "helio-corr/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace heliocorr::correlation {

namespace {

void validateOptions(const PairwiseOptions &options) {
	if (!(options.alpha > 0.0 && options.alpha < 1.0)) {
		throw std::invalid_argument("alpha must lie in (0, 1)");
	}
	if (options.bootstrap_samples == 0) {
		throw std::invalid_argument("bootstrap_samples must be positive");
	}
}

CorrelationResult runPairwise(CorrelationMethod method, const std::vector<double> &x, const std::vector<double> &y,
                              utils::RandomEngine &rng, const PairwiseOptions &options) {
	validateOptions(options);
	const auto name = toString(method);
	const auto pair = alignment::prepare(x, y, alignment::kMinCorrelationObservations, name);

	const CoefficientFunction coefficient = method == CorrelationMethod::Pearson
	                                            ? CoefficientFunction(utils::Statistics::pearson)
	                                            : CoefficientFunction(utils::Statistics::spearman);

	const double r = coefficient(pair.x, pair.y);
	if (!std::isfinite(r)) {
		throw core::ComputationError(name, "coefficient is undefined");
	}

	CorrelationResult result;
	result.method = method;
	result.correlation_coefficient = r;
	result.p_value = utils::Statistics::correlationPValue(r, pair.size());
	result.n_observations = pair.size();
	result.alpha = options.alpha;
	result.confidence_interval = bootstrapInterval(pair.x, pair.y, coefficient, options.bootstrap_samples,
	                                               options.alpha, rng, &result.bootstrap_samples);
	result.interpretation = interpretation::classifyStrength(r, options.strength);
	result.effect_size = interpretation::classifyEffectSize(r, options.effect);
	result.is_significant = interpretation::isSignificant(result.p_value, options.alpha);

	HELIOCORR_DEBUG("{} r={:.4f} p={:.4g} n={} ci=[{:.4f}, {:.4f}]", name, r, result.p_value, result.n_observations,
	                result.confidence_interval.lower, result.confidence_interval.upper);
	return result;
}

} // namespace

std::string toString(CorrelationMethod method) {
	switch (method) {
	case CorrelationMethod::Pearson:
		return "pearson";
	case CorrelationMethod::Spearman:
		return "spearman";
	}
	return "unknown";
}

ConfidenceInterval bootstrapInterval(const std::vector<double> &x, const std::vector<double> &y,
                                     const CoefficientFunction &coefficient, std::size_t samples, double alpha,
                                     utils::RandomEngine &rng, std::size_t *valid_replicates) {
	if (x.size() != y.size() || x.empty()) {
		throw std::invalid_argument("Bootstrap requires two non-empty arrays of equal length");
	}

	const std::size_t n = x.size();
	std::uniform_int_distribution<std::size_t> pick(0, n - 1);
	std::vector<double> x_boot(n);
	std::vector<double> y_boot(n);
	std::vector<double> replicates;
	replicates.reserve(samples);

	for (std::size_t b = 0; b < samples; ++b) {
		for (std::size_t i = 0; i < n; ++i) {
			const std::size_t index = pick(rng);
			x_boot[i] = x[index];
			y_boot[i] = y[index];
		}
		const double value = coefficient(x_boot, y_boot);
		if (std::isfinite(value)) {
			replicates.push_back(std::clamp(value, -1.0, 1.0));
		}
	}

	if (valid_replicates) {
		*valid_replicates = replicates.size();
	}
	if (replicates.empty()) {
		throw core::ComputationError("bootstrap", "no replicate produced a defined coefficient");
	}
	if (replicates.size() < samples) {
		HELIOCORR_DEBUG("Bootstrap dropped {} degenerate replicates out of {}", samples - replicates.size(), samples);
	}

	std::sort(replicates.begin(), replicates.end());
	ConfidenceInterval interval;
	interval.lower = utils::Statistics::percentile(replicates, 100.0 * alpha / 2.0);
	interval.upper = utils::Statistics::percentile(replicates, 100.0 * (1.0 - alpha / 2.0));
	return interval;
}

CorrelationResult pearsonCorrelation(const std::vector<double> &x, const std::vector<double> &y,
                                     utils::RandomEngine &rng, const PairwiseOptions &options) {
	return runPairwise(CorrelationMethod::Pearson, x, y, rng, options);
}

CorrelationResult spearmanCorrelation(const std::vector<double> &x, const std::vector<double> &y,
                                      utils::RandomEngine &rng, const PairwiseOptions &options) {
	return runPairwise(CorrelationMethod::Spearman, x, y, rng, options);
}

CorrelationResult correlate(CorrelationMethod method, const std::vector<double> &x, const std::vector<double> &y,
                            utils::RandomEngine &rng, const PairwiseOptions &options) {
	return runPairwise(method, x, y, rng, options);
}

} // namespace heliocorr::correlation
