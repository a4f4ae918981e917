#include "helio-corr/engine/correlation_engine.hpp"
#include "helio-corr/alignment/aligner.hpp"
#include "helio-corr/core/errors.hpp"
#include "helio-corr/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace heliocorr::engine {

namespace {

correlation::PairwiseOptions pairwiseOptions(const EngineConfig &config) {
	if (!(config.alpha > 0.0 && config.alpha < 1.0)) {
		throw std::invalid_argument("alpha must lie in (0, 1)");
	}
	if (config.bootstrap_samples == 0) {
		throw std::invalid_argument("bootstrap_samples must be positive");
	}
	if (config.lagged_max_lag < 0) {
		throw std::invalid_argument("Time-lagged max_lag must not be negative");
	}
	correlation::PairwiseOptions options;
	options.alpha = config.alpha;
	options.bootstrap_samples = config.bootstrap_samples;
	return options;
}

std::string pairKey(const std::string &solar, const std::string &mental) {
	return solar + "__" + mental;
}

// Significant findings carry the coefficient (NaN when the method has none) and p-value.
bool extractFinding(const AnalysisResult &result, double &coefficient, double &p_value) {
	if (const auto *corr = std::get_if<correlation::CorrelationResult>(&result)) {
		coefficient = corr->correlation_coefficient;
		p_value = corr->p_value;
		return corr->is_significant;
	}
	if (const auto *cross = std::get_if<lag::CrossCorrelationResult>(&result)) {
		coefficient = cross->max_correlation;
		p_value = cross->p_value;
		return cross->is_significant;
	}
	if (const auto *causal = std::get_if<causality::CausalityResult>(&result)) {
		coefficient = std::nan("");
		p_value = causal->best_p_value;
		return causal->is_significant;
	}
	return false;
}

} // namespace

std::string toString(Method method) {
	switch (method) {
	case Method::Pearson:
		return "pearson";
	case Method::Spearman:
		return "spearman";
	case Method::Granger:
		return "granger";
	case Method::CrossCorrelation:
		return "cross_correlation";
	case Method::Wavelet:
		return "wavelet";
	}
	return "unknown";
}

Method parseMethod(const std::string &name) {
	for (auto method : {Method::Pearson, Method::Spearman, Method::Granger, Method::CrossCorrelation, Method::Wavelet}) {
		if (toString(method) == name) {
			return method;
		}
	}
	throw core::InvalidMethodError(name);
}

CorrelationEngine::CorrelationEngine(EngineConfig config)
    : config_(std::move(config)), pairwise_(pairwiseOptions(config_)),
      granger_(causality::GrangerCausality::builder()
                   .maxLag(config_.granger_max_lag)
                   .statistic(config_.granger_test)
                   .alpha(config_.alpha)
                   .bonferroni(config_.granger_bonferroni)
                   .build()),
      cross_correlation_(lag::CrossCorrelationAnalyzer::builder()
                             .maxLag(config_.cross_correlation_max_lag)
                             .permutations(config_.permutations)
                             .alpha(config_.alpha)
                             .build()),
      wavelet_(wavelet::WaveletCoherence::builder()
                   .scales(config_.wavelet_scales)
                   .motherWavelet(config_.mother_wavelet)
                   .samplingPeriod(config_.sampling_period)
                   .build()) {}

correlation::CorrelationResult CorrelationEngine::pearson(const std::vector<double> &x, const std::vector<double> &y,
                                                          utils::RandomEngine &rng) const {
	return correlation::pearsonCorrelation(x, y, rng, pairwise_);
}

correlation::CorrelationResult CorrelationEngine::spearman(const std::vector<double> &x, const std::vector<double> &y,
                                                           utils::RandomEngine &rng) const {
	return correlation::spearmanCorrelation(x, y, rng, pairwise_);
}

causality::CausalityResult CorrelationEngine::granger(const std::vector<double> &x,
                                                      const std::vector<double> &y) const {
	return granger_.compute(x, y);
}

lag::CrossCorrelationResult CorrelationEngine::crossCorrelation(const std::vector<double> &x,
                                                                const std::vector<double> &y,
                                                                utils::RandomEngine &rng) const {
	return cross_correlation_.compute(x, y, rng);
}

std::vector<lag::LaggedCorrelation> CorrelationEngine::timeLaggedCorrelation(const std::vector<double> &x,
                                                                             const std::vector<double> &y) const {
	return lag::timeLaggedCorrelation(x, y, config_.lagged_max_lag, config_.alpha);
}

wavelet::CoherenceResult CorrelationEngine::waveletCoherence(const std::vector<double> &x,
                                                             const std::vector<double> &y) const {
	return wavelet_.compute(x, y);
}

AnalysisResult CorrelationEngine::analyze(const std::vector<double> &x, const std::vector<double> &y, Method method,
                                          utils::RandomEngine &rng) const {
	HELIOCORR_DEBUG("Running {} on {} observations", toString(method), x.size());
	switch (method) {
	case Method::Pearson:
		return pearson(x, y, rng);
	case Method::Spearman:
		return spearman(x, y, rng);
	case Method::Granger:
		return granger(x, y);
	case Method::CrossCorrelation:
		return crossCorrelation(x, y, rng);
	case Method::Wavelet:
		return waveletCoherence(x, y);
	}
	throw core::InvalidMethodError(toString(method));
}

AnalysisResult CorrelationEngine::analyze(const std::vector<double> &x, const std::vector<double> &y,
                                          const std::string &method, utils::RandomEngine &rng) const {
	return analyze(x, y, parseMethod(method), rng);
}

AnalysisResult CorrelationEngine::analyze(const core::TimeSeries &x, const core::TimeSeries &y, Method method,
                                          utils::RandomEngine &rng) const {
	const auto pair = alignment::alignOnTimestamps(x, y);
	return analyze(pair.x, pair.y, method, rng);
}

MultiPairReport CorrelationEngine::analyzeMultiple(const SeriesMap &solar, const SeriesMap &mental_health,
                                                   const std::vector<Method> &methods) const {
	MultiPairReport report;
	auto &summary = report.summary;

	// Each method runs once per pair, in first-seen order.
	std::vector<Method> unique_methods;
	for (const auto method : methods) {
		if (std::find(unique_methods.begin(), unique_methods.end(), method) == unique_methods.end()) {
			unique_methods.push_back(method);
		}
	}

	std::uint64_t solar_index = 0;
	for (const auto &[solar_name, solar_series] : solar) {
		std::uint64_t mental_index = 0;
		for (const auto &[mental_name, mental_series] : mental_health) {
			const auto key = pairKey(solar_name, mental_name);
			const auto pair = alignment::alignOnTimestamps(solar_series, mental_series);

			for (const auto method : unique_methods) {
				++summary.total_analyses;
				auto rng = utils::makeEngine(
				    {config_.seed, solar_index, mental_index, static_cast<std::uint64_t>(method)});
				try {
					auto result = analyze(pair.x, pair.y, method, rng);

					double coefficient = 0.0;
					double p_value = 1.0;
					if (extractFinding(result, coefficient, p_value)) {
						report.significant_correlations.push_back({key, method, coefficient, p_value});
						++summary.significant_findings;
						summary.most_significant = std::min(summary.most_significant, p_value);
						if (std::isfinite(coefficient)) {
							summary.strongest_correlation =
							    std::max(summary.strongest_correlation, std::abs(coefficient));
						}
					}
					report.results[key].emplace(method, std::move(result));
					++summary.completed_analyses;
				} catch (const core::InsufficientDataError &e) {
					HELIOCORR_WARN("Skipping {} for {}: {}", toString(method), key, e.what());
					report.failures.push_back({key, method, e.what(), true});
					++summary.skipped_analyses;
				} catch (const core::DegenerateInputError &e) {
					HELIOCORR_WARN("Skipping {} for {}: {}", toString(method), key, e.what());
					report.failures.push_back({key, method, e.what(), true});
					++summary.skipped_analyses;
				} catch (const core::ComputationError &e) {
					HELIOCORR_ERROR("{} failed for {}: {}", toString(method), key, e.what());
					report.failures.push_back({key, method, e.what(), false});
					++summary.failed_analyses;
				}
			}
			++mental_index;
		}
		++solar_index;
	}

	HELIOCORR_INFO("Multi-pair analysis: {} attempted, {} completed, {} skipped, {} failed, {} significant",
	               summary.total_analyses, summary.completed_analyses, summary.skipped_analyses,
	               summary.failed_analyses, summary.significant_findings);
	return report;
}

} // namespace heliocorr::engine
