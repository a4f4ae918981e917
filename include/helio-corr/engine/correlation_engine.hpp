#pragma once

#include "helio-corr/causality/granger.hpp"
#include "helio-corr/core/time_series.hpp"
#include "helio-corr/correlation/pairwise.hpp"
#include "helio-corr/lag/cross_correlation.hpp"
#include "helio-corr/utils/random.hpp"
#include "helio-corr/wavelet/coherence.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace heliocorr::engine {

enum class Method {
	Pearson,
	Spearman,
	Granger,
	CrossCorrelation,
	Wavelet
};

/// Canonical method names: pearson, spearman, granger, cross_correlation, wavelet.
std::string toString(Method method);

/**
 * @throws core::InvalidMethodError For names outside the closed method set.
 */
Method parseMethod(const std::string &name);

/**
 * @brief Defaults applied to every analysis the engine runs.
 */
struct EngineConfig {
	double alpha = 0.05;
	std::size_t bootstrap_samples = 1000;
	std::size_t permutations = 1000;
	int granger_max_lag = 7;
	causality::GrangerTest granger_test = causality::GrangerTest::SsrChi2;
	bool granger_bonferroni = false;
	int cross_correlation_max_lag = 30;
	int lagged_max_lag = 14;
	std::vector<double> wavelet_scales; ///< empty selects 1..64
	wavelet::MotherWavelet mother_wavelet = wavelet::MotherWavelet::Morlet;
	double sampling_period = 1.0;
	std::uint64_t seed = utils::kDefaultSeed; ///< base seed for aggregate runs
};

using AnalysisResult = std::variant<correlation::CorrelationResult, causality::CausalityResult,
                                    lag::CrossCorrelationResult, wavelet::CoherenceResult>;

using SeriesMap = std::map<std::string, core::TimeSeries>;

struct Finding {
	std::string pair;
	Method method = Method::Pearson;
	double correlation = 0.0;
	double p_value = 1.0;
};

struct AnalysisFailure {
	std::string pair;
	Method method = Method::Pearson;
	std::string message;
	// True for precondition failures (too little data, constant series).
	bool skipped = false;
};

/**
 * @brief Aggregate counters of a multi-pair run.
 *
 * total_analyses counts every attempted (pair, method) combination,
 * including the skipped and failed ones.
 */
struct MultiPairSummary {
	std::size_t total_analyses = 0;
	std::size_t completed_analyses = 0;
	std::size_t skipped_analyses = 0;
	std::size_t failed_analyses = 0;
	std::size_t significant_findings = 0;
	double strongest_correlation = 0.0;
	double most_significant = 1.0;
};

struct MultiPairReport {
	/// Keyed by "<solar>__<mental>", then by method.
	std::map<std::string, std::map<Method, AnalysisResult>> results;
	std::vector<Finding> significant_correlations;
	std::vector<AnalysisFailure> failures;
	MultiPairSummary summary;
};

/**
 * @class CorrelationEngine
 * @brief Dispatches analyses by method and aggregates variable-pair sweeps.
 *
 * The engine is immutable after construction; all randomness comes from the
 * generator passed by the caller (or, for aggregate runs, from generators
 * derived from the configured seed), so instances can be shared across
 * threads.
 */
class CorrelationEngine {
public:
	/**
	 * @throws std::invalid_argument If the configuration is invalid.
	 */
	explicit CorrelationEngine(EngineConfig config = {});

	const EngineConfig &config() const {
		return config_;
	}

	correlation::CorrelationResult pearson(const std::vector<double> &x, const std::vector<double> &y,
	                                       utils::RandomEngine &rng) const;
	correlation::CorrelationResult spearman(const std::vector<double> &x, const std::vector<double> &y,
	                                        utils::RandomEngine &rng) const;
	causality::CausalityResult granger(const std::vector<double> &x, const std::vector<double> &y) const;
	lag::CrossCorrelationResult crossCorrelation(const std::vector<double> &x, const std::vector<double> &y,
	                                             utils::RandomEngine &rng) const;
	std::vector<lag::LaggedCorrelation> timeLaggedCorrelation(const std::vector<double> &x,
	                                                          const std::vector<double> &y) const;
	wavelet::CoherenceResult waveletCoherence(const std::vector<double> &x, const std::vector<double> &y) const;

	/**
	 * @brief Runs one method on two raw, index-aligned arrays.
	 */
	AnalysisResult analyze(const std::vector<double> &x, const std::vector<double> &y, Method method,
	                       utils::RandomEngine &rng) const;

	/**
	 * @throws core::InvalidMethodError Before any computation when the name is unknown.
	 */
	AnalysisResult analyze(const std::vector<double> &x, const std::vector<double> &y, const std::string &method,
	                       utils::RandomEngine &rng) const;

	/**
	 * @brief Inner-joins the two series on timestamps, then runs the method.
	 */
	AnalysisResult analyze(const core::TimeSeries &x, const core::TimeSeries &y, Method method,
	                       utils::RandomEngine &rng) const;

	/**
	 * @brief Runs every (solar variable, mental-health variable, method) combination.
	 *
	 * Combinations failing a precondition are logged and counted as skipped;
	 * numerical failures are logged and counted as failed. Neither aborts the
	 * run nor appears in `results`. A method listed twice runs once.
	 */
	MultiPairReport analyzeMultiple(const SeriesMap &solar, const SeriesMap &mental_health,
	                                const std::vector<Method> &methods = {Method::Pearson, Method::Spearman}) const;

private:
	EngineConfig config_;
	correlation::PairwiseOptions pairwise_;
	causality::GrangerCausality granger_;
	lag::CrossCorrelationAnalyzer cross_correlation_;
	wavelet::WaveletCoherence wavelet_;
};

} // namespace heliocorr::engine
