#include "helio-corr/engine/correlation_engine.hpp"
#include "helio-corr/core/time_series.hpp"
#include "helio-corr/interpretation/labels.hpp"
#include "helio-corr/utils/logging.hpp"
#include "helio-corr/utils/random.hpp"
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace heliocorr;

namespace {

constexpr double kPi = 3.14159265358979323846;

// Synthetic daily solar wind speed with a 27-day rotation cycle.
std::vector<double> generateSolarWind(std::size_t n, utils::RandomEngine &rng) {
	std::normal_distribution<double> noise(0.0, 25.0);
	std::vector<double> data(n);
	for (std::size_t i = 0; i < n; ++i) {
		data[i] = 420.0 + 80.0 * std::sin(2.0 * kPi * static_cast<double>(i) / 27.0) + noise(rng);
	}
	return data;
}

// Daily admissions responding to solar wind three days later.
std::vector<double> generateAdmissions(const std::vector<double> &solar, std::size_t delay, utils::RandomEngine &rng) {
	std::normal_distribution<double> noise(0.0, 4.0);
	std::vector<double> data(solar.size());
	for (std::size_t i = 0; i < solar.size(); ++i) {
		const double driver = i >= delay ? solar[i - delay] : solar[0];
		data[i] = 30.0 + 0.08 * (driver - 420.0) + noise(rng);
	}
	return data;
}

std::vector<double> generateNoise(std::size_t n, utils::RandomEngine &rng) {
	std::normal_distribution<double> noise(50.0, 10.0);
	std::vector<double> data(n);
	for (auto &value : data) {
		value = noise(rng);
	}
	return data;
}

core::TimeSeries createTimeSeries(const std::vector<double> &data, const std::string &name) {
	std::vector<core::TimeSeries::TimePoint> timestamps;
	timestamps.reserve(data.size());
	auto start = core::TimeSeries::TimePoint{};
	for (std::size_t i = 0; i < data.size(); ++i) {
		timestamps.push_back(start + std::chrono::hours(24 * static_cast<long>(i)));
	}
	return core::TimeSeries(std::move(timestamps), data, name);
}

void printHeader(const std::string &title) {
	std::cout << "\n=== " << title << " ===\n\n";
}

} // namespace

int main() {
	utils::Logging::init(spdlog::level::warn);

	auto data_rng = utils::makeEngine({2024});
	const std::size_t n = 365;
	const auto solar_wind = generateSolarWind(n, data_rng);
	const auto admissions = generateAdmissions(solar_wind, 3, data_rng);
	const auto unrelated = generateNoise(n, data_rng);

	engine::CorrelationEngine analysis_engine;
	auto rng = utils::makeEngine({utils::kDefaultSeed});

	printHeader("Pairwise correlation");
	for (const std::string method : {"pearson", "spearman"}) {
		const auto result = std::get<correlation::CorrelationResult>(
		    analysis_engine.analyze(solar_wind, admissions, method, rng));
		std::cout << "  " << std::setw(10) << std::left << method << " r = " << std::fixed << std::setprecision(3)
		          << result.correlation_coefficient << "  95% CI [" << result.confidence_interval.lower << ", "
		          << result.confidence_interval.upper << "]  p = " << std::scientific << std::setprecision(2)
		          << result.p_value << "  (" << interpretation::toString(result.interpretation) << ")\n";
		std::cout.unsetf(std::ios::floatfield);
	}

	printHeader("Lead/lag structure");
	const auto cross = analysis_engine.crossCorrelation(solar_wind, admissions, rng);
	std::cout << "  optimal lag: " << cross.optimal_lag << " days, |c| = " << std::fixed << std::setprecision(3)
	          << cross.max_correlation << ", permutation p = " << cross.p_value << "\n";
	std::cout << "  " << cross.interpretation << "\n";
	std::cout.unsetf(std::ios::floatfield);

	for (const auto &row : analysis_engine.timeLaggedCorrelation(solar_wind, admissions)) {
		if (std::abs(row.lag) <= 4) {
			std::cout << "  " << std::setw(14) << std::left << row.description << std::fixed << std::setprecision(3)
			          << row.correlation << (row.significant ? "  *" : "") << "\n";
		}
	}
	std::cout.unsetf(std::ios::floatfield);

	printHeader("Granger causality");
	const auto causal = analysis_engine.granger(solar_wind, admissions);
	std::cout << "  " << causal.causality << " (best lag " << causal.best_lag << ", p = " << std::scientific
	          << std::setprecision(2) << causal.best_p_value << ")\n";
	std::cout.unsetf(std::ios::floatfield);

	printHeader("Wavelet coherence");
	const auto coherence = analysis_engine.waveletCoherence(solar_wind, admissions);
	std::cout << "  average " << std::fixed << std::setprecision(3) << coherence.average_coherence << ", max "
	          << coherence.max_coherence << "\n";
	std::cout << "  " << coherence.interpretation << "\n";
	std::cout.unsetf(std::ios::floatfield);

	printHeader("Multi-pair sweep");
	engine::SeriesMap solar{{"solar_wind_speed", createTimeSeries(solar_wind, "solar_wind_speed")}};
	engine::SeriesMap mental{{"admissions", createTimeSeries(admissions, "admissions")},
	                         {"unrelated", createTimeSeries(unrelated, "unrelated")}};
	const auto report = analysis_engine.analyzeMultiple(
	    solar, mental, {engine::Method::Pearson, engine::Method::Spearman, engine::Method::CrossCorrelation});
	const auto &summary = report.summary;
	std::cout << "  analyses: " << summary.total_analyses << " attempted, " << summary.completed_analyses
	          << " completed, " << summary.skipped_analyses << " skipped\n";
	std::cout << "  significant findings: " << summary.significant_findings << "\n";
	std::cout << "  strongest |r|: " << std::fixed << std::setprecision(3) << summary.strongest_correlation << "\n";
	std::cout << "  smallest p: " << std::scientific << std::setprecision(2) << summary.most_significant << "\n";
	std::cout.unsetf(std::ios::floatfield);
	for (const auto &finding : report.significant_correlations) {
		std::cout << "  - " << finding.pair << " [" << engine::toString(finding.method) << "]\n";
	}

	return 0;
}
