#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "helio-corr/engine/correlation_engine.hpp"
#include "common/series_helpers.hpp"

#include <string>
#include <variant>
#include <vector>

using namespace heliocorr;
using heliocorr::engine::CorrelationEngine;
using heliocorr::engine::Method;
using heliocorr::engine::SeriesMap;

namespace {

engine::EngineConfig fastConfig() {
	engine::EngineConfig config;
	config.bootstrap_samples = 200;
	config.permutations = 100;
	config.granger_max_lag = 3;
	return config;
}

std::vector<double> linkedTo(const std::vector<double> &driver, std::uint64_t seed) {
	const auto noise = tests::helpers::gaussianNoise(driver.size(), seed, 0.3);
	std::vector<double> data(driver.size());
	for (std::size_t i = 0; i < driver.size(); ++i) {
		data[i] = 0.9 * driver[i] + noise[i];
	}
	return data;
}

} // namespace

TEST_CASE("Multi-pair analysis aggregates completed and skipped combinations", "[engine][multi_pair]") {
	const auto kp = tests::helpers::gaussianNoise(120, 201);
	const SeriesMap solar{{"kp_index", tests::helpers::makeDailySeries(kp, "kp_index")},
	                      {"flat", tests::helpers::makeDailySeries(std::vector<double>(120, 2.0), "flat")}};
	const SeriesMap mental{
	    {"admissions", tests::helpers::makeDailySeries(linkedTo(kp, 202), "admissions")},
	    {"sparse", tests::helpers::makeDailySeries(tests::helpers::gaussianNoise(8, 203), "sparse")}};

	const auto report = CorrelationEngine(fastConfig()).analyzeMultiple(solar, mental);
	const auto &summary = report.summary;

	REQUIRE(summary.total_analyses == 8);
	REQUIRE(summary.completed_analyses == 2);
	REQUIRE(summary.skipped_analyses == 6);
	REQUIRE(summary.failed_analyses == 0);
	REQUIRE(summary.significant_findings == 2);
	REQUIRE(summary.strongest_correlation > 0.9);
	REQUIRE(summary.strongest_correlation <= 1.0);
	REQUIRE(summary.most_significant < 1e-10);

	REQUIRE(report.results.size() == 1);
	const auto &pair = report.results.at("kp_index__admissions");
	REQUIRE(pair.size() == 2);
	REQUIRE(std::holds_alternative<correlation::CorrelationResult>(pair.at(Method::Pearson)));
	REQUIRE(report.failures.size() == 6);
	for (const auto &failure : report.failures) {
		REQUIRE(failure.skipped);
		REQUIRE_FALSE(failure.message.empty());
	}
	REQUIRE(report.significant_correlations.size() == 2);
	REQUIRE(report.significant_correlations.front().pair == "kp_index__admissions");
}

TEST_CASE("Multi-pair analysis with no usable pair keeps neutral summary values", "[engine][multi_pair]") {
	const SeriesMap solar{{"flat", tests::helpers::makeDailySeries(std::vector<double>(60, 1.0), "flat")}};
	const SeriesMap mental{{"short", tests::helpers::makeDailySeries(tests::helpers::gaussianNoise(5, 204))},
	                       {"steady", tests::helpers::makeDailySeries(tests::helpers::gaussianNoise(60, 205))}};

	const auto report = CorrelationEngine(fastConfig())
	                        .analyzeMultiple(solar, mental, {Method::Pearson, Method::Spearman, Method::Granger});

	REQUIRE(report.summary.total_analyses == 6);
	REQUIRE(report.summary.completed_analyses == 0);
	REQUIRE(report.summary.skipped_analyses == 6);
	REQUIRE(report.summary.significant_findings == 0);
	REQUIRE(report.summary.strongest_correlation == 0.0);
	REQUIRE(report.summary.most_significant == 1.0);
	REQUIRE(report.results.empty());
	REQUIRE(report.significant_correlations.empty());
}

TEST_CASE("Multi-pair analysis records numerical failures separately", "[engine][multi_pair]") {
	const auto kp = tests::helpers::gaussianNoise(80, 206);
	const SeriesMap solar{{"kp_index", tests::helpers::makeDailySeries(kp)}};
	const SeriesMap mental{{"mirror", tests::helpers::makeDailySeries(kp)}};

	const auto report = CorrelationEngine(fastConfig()).analyzeMultiple(solar, mental, {Method::Granger, Method::Pearson});

	REQUIRE(report.summary.total_analyses == 2);
	REQUIRE(report.summary.failed_analyses == 1);
	REQUIRE(report.summary.completed_analyses == 1);
	REQUIRE(report.failures.size() == 1);
	REQUIRE(report.failures.front().method == Method::Granger);
	REQUIRE_FALSE(report.failures.front().skipped);
	REQUIRE(report.summary.strongest_correlation == Catch::Approx(1.0));
}

TEST_CASE("Multi-pair results do not depend on method order", "[engine][multi_pair]") {
	const auto kp = tests::helpers::gaussianNoise(100, 207);
	const SeriesMap solar{{"kp_index", tests::helpers::makeDailySeries(kp)}};
	const SeriesMap mental{{"admissions", tests::helpers::makeDailySeries(linkedTo(kp, 208))}};
	const CorrelationEngine analysis(fastConfig());

	const auto forward = analysis.analyzeMultiple(solar, mental, {Method::Pearson, Method::Spearman});
	const auto backward = analysis.analyzeMultiple(solar, mental, {Method::Spearman, Method::Pearson});

	const auto &first = std::get<correlation::CorrelationResult>(
	    forward.results.at("kp_index__admissions").at(Method::Pearson));
	const auto &second = std::get<correlation::CorrelationResult>(
	    backward.results.at("kp_index__admissions").at(Method::Pearson));
	REQUIRE(first.confidence_interval.lower == second.confidence_interval.lower);
	REQUIRE(first.confidence_interval.upper == second.confidence_interval.upper);
}

TEST_CASE("Multi-pair analysis runs a repeated method once", "[engine][multi_pair]") {
	const auto kp = tests::helpers::gaussianNoise(100, 209);
	const SeriesMap solar{{"kp_index", tests::helpers::makeDailySeries(kp)}};
	const SeriesMap mental{{"admissions", tests::helpers::makeDailySeries(linkedTo(kp, 210))}};

	const auto report = CorrelationEngine(fastConfig())
	                        .analyzeMultiple(solar, mental, {Method::Pearson, Method::Pearson, Method::Spearman});

	REQUIRE(report.summary.total_analyses == 2);
	REQUIRE(report.summary.completed_analyses == 2);
	REQUIRE(report.summary.significant_findings == 2);
	REQUIRE(report.results.at("kp_index__admissions").size() == 2);
	REQUIRE(report.significant_correlations.size() == 2);
}
