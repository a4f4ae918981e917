#pragma once

#include "helio-corr/causality/granger.hpp"
#include "helio-corr/correlation/pairwise.hpp"
#include "helio-corr/engine/correlation_engine.hpp"
#include "helio-corr/lag/cross_correlation.hpp"
#include "helio-corr/utils/random.hpp"
#include "helio-corr/wavelet/coherence.hpp"
#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace heliocorr::quick {

// --- Internal Helpers ---
namespace internal {
// Daily timestamps from a fixed origin so two vectors of equal length join index by index.
inline core::TimeSeries series_from_vector(const std::vector<double> &data, std::string name = {}) {
	std::vector<core::TimeSeries::TimePoint> timestamps;
	timestamps.reserve(data.size());
	const core::TimeSeries::TimePoint origin{};
	for (std::size_t i = 0; i < data.size(); ++i) {
		timestamps.push_back(origin + std::chrono::hours(24 * static_cast<long long>(i)));
	}
	return core::TimeSeries(std::move(timestamps), data, std::move(name));
}
} // namespace internal

// --- Public API ---

inline correlation::CorrelationResult pearson(const std::vector<double> &x, const std::vector<double> &y,
                                              std::size_t bootstrap_samples = 1000, double alpha = 0.05) {
	auto rng = utils::makeEngine({utils::kDefaultSeed});
	correlation::PairwiseOptions options;
	options.alpha = alpha;
	options.bootstrap_samples = bootstrap_samples;
	return correlation::pearsonCorrelation(x, y, rng, options);
}

inline correlation::CorrelationResult spearman(const std::vector<double> &x, const std::vector<double> &y,
                                               std::size_t bootstrap_samples = 1000, double alpha = 0.05) {
	auto rng = utils::makeEngine({utils::kDefaultSeed});
	correlation::PairwiseOptions options;
	options.alpha = alpha;
	options.bootstrap_samples = bootstrap_samples;
	return correlation::spearmanCorrelation(x, y, rng, options);
}

inline causality::CausalityResult grangerCausality(const std::vector<double> &x, const std::vector<double> &y,
                                                   int max_lag = 7, double alpha = 0.05) {
	return causality::GrangerCausality::builder().maxLag(max_lag).alpha(alpha).build().compute(x, y);
}

inline lag::CrossCorrelationResult crossCorrelation(const std::vector<double> &x, const std::vector<double> &y,
                                                    int max_lag = 30, std::size_t permutations = 1000) {
	auto rng = utils::makeEngine({utils::kDefaultSeed});
	return lag::CrossCorrelationAnalyzer::builder().maxLag(max_lag).permutations(permutations).build().compute(x, y,
	                                                                                                         rng);
}

inline std::vector<lag::LaggedCorrelation> timeLaggedCorrelation(const std::vector<double> &x,
                                                                 const std::vector<double> &y, int max_lag = 14) {
	return lag::timeLaggedCorrelation(x, y, max_lag);
}

inline wavelet::CoherenceResult waveletCoherence(const std::vector<double> &x, const std::vector<double> &y,
                                                 const std::vector<double> &scales = {},
                                                 wavelet::MotherWavelet mother = wavelet::MotherWavelet::Morlet) {
	return wavelet::WaveletCoherence::builder().scales(scales).motherWavelet(mother).build().compute(x, y);
}

/**
 * @brief Runs a method by name on two index-aligned arrays with default settings.
 * @throws core::InvalidMethodError For an unknown method name.
 */
inline engine::AnalysisResult analyze(const std::vector<double> &x, const std::vector<double> &y,
                                      const std::string &method) {
	auto rng = utils::makeEngine({utils::kDefaultSeed});
	return engine::CorrelationEngine().analyze(x, y, method, rng);
}

/**
 * @brief Multi-pair sweep over untimed arrays; index i of every array is day i.
 */
inline engine::MultiPairReport analyzeMultiple(const std::map<std::string, std::vector<double>> &solar,
                                               const std::map<std::string, std::vector<double>> &mental_health,
                                               const std::vector<engine::Method> &methods = {
                                                   engine::Method::Pearson, engine::Method::Spearman}) {
	engine::SeriesMap solar_series;
	for (const auto &[name, values] : solar) {
		solar_series.emplace(name, internal::series_from_vector(values, name));
	}
	engine::SeriesMap mental_series;
	for (const auto &[name, values] : mental_health) {
		mental_series.emplace(name, internal::series_from_vector(values, name));
	}
	return engine::CorrelationEngine().analyzeMultiple(solar_series, mental_series, methods);
}

} // namespace heliocorr::quick
