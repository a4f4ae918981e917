#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "helio-corr/core/errors.hpp"
#include "helio-corr/quick.hpp"
#include "common/series_helpers.hpp"

#include <map>
#include <string>
#include <variant>
#include <vector>

using namespace heliocorr;

TEST_CASE("Quick correlation helpers use reproducible defaults", "[quick]") {
	const auto x = tests::helpers::gaussianNoise(60, 301);
	const auto y = tests::helpers::delayed(x, 1, 302);

	const auto first = quick::pearson(x, y);
	const auto second = quick::pearson(x, y);
	REQUIRE(first.confidence_interval.lower == second.confidence_interval.lower);
	REQUIRE(first.confidence_interval.upper == second.confidence_interval.upper);
	REQUIRE(first.bootstrap_samples == 1000);

	const auto spearman = quick::spearman(x, x, 200);
	REQUIRE(spearman.correlation_coefficient == Catch::Approx(1.0));
	REQUIRE(spearman.bootstrap_samples == 200);
}

TEST_CASE("Quick lag helpers", "[quick]") {
	const auto x = tests::helpers::gaussianNoise(150, 303);
	const auto y = tests::helpers::delayed(x, 3, 304);

	const auto cross = quick::crossCorrelation(x, y, 10, 100);
	REQUIRE(cross.optimal_lag == -3);

	const auto rows = quick::timeLaggedCorrelation(x, y, 5);
	REQUIRE(rows.size() == 11);
}

TEST_CASE("Quick Granger and wavelet helpers", "[quick]") {
	const auto x = tests::helpers::gaussianNoise(200, 305);
	const auto noise = tests::helpers::gaussianNoise(200, 306, 0.5);
	std::vector<double> y(200);
	y[0] = noise[0];
	for (std::size_t t = 1; t < y.size(); ++t) {
		y[t] = 0.7 * x[t - 1] + noise[t];
	}

	const auto granger = quick::grangerCausality(x, y, 3);
	REQUIRE(granger.is_significant);
	REQUIRE(granger.lags.size() == 3);

	const auto coherence = quick::waveletCoherence(x, x, {2.0, 4.0, 8.0});
	REQUIRE(coherence.average_coherence > 0.99);
	REQUIRE(coherence.scales.size() == 3);
}

TEST_CASE("Quick analyze dispatches by name", "[quick]") {
	const auto x = tests::helpers::gaussianNoise(40, 307);
	const auto y = tests::helpers::gaussianNoise(40, 308);

	const auto result = quick::analyze(x, y, "spearman");
	REQUIRE(std::holds_alternative<correlation::CorrelationResult>(result));
	REQUIRE_THROWS_AS(quick::analyze(x, y, "kendall"), core::InvalidMethodError);
}

TEST_CASE("Quick multi-pair sweep treats array positions as days", "[quick]") {
	const auto kp = tests::helpers::gaussianNoise(50, 309);
	const std::map<std::string, std::vector<double>> solar{{"kp_index", kp}};
	const std::map<std::string, std::vector<double>> mental{{"same", kp},
	                                                         {"short", tests::helpers::gaussianNoise(6, 310)}};

	const auto report = quick::analyzeMultiple(solar, mental);

	REQUIRE(report.summary.total_analyses == 4);
	REQUIRE(report.summary.completed_analyses == 2);
	REQUIRE(report.summary.skipped_analyses == 2);
	REQUIRE(report.summary.strongest_correlation == Catch::Approx(1.0));
	REQUIRE(report.results.count("kp_index__same") == 1);
}
