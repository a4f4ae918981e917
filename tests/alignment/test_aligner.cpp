#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "helio-corr/alignment/aligner.hpp"
#include "helio-corr/core/errors.hpp"
#include "common/series_helpers.hpp"

#include <algorithm>
#include <chrono>
#include <limits>
#include <stdexcept>
#include <vector>

using namespace heliocorr;

namespace {
const double kNaN = std::numeric_limits<double>::quiet_NaN();
}

TEST_CASE("cleanPairwise drops positions missing on either side", "[alignment]") {
	const std::vector<double> x{1.0, kNaN, 3.0, 4.0, std::numeric_limits<double>::infinity()};
	const std::vector<double> y{10.0, 20.0, kNaN, 40.0, 50.0};

	const auto pair = alignment::cleanPairwise(x, y);

	REQUIRE(pair.size() == 2);
	REQUIRE(pair.x == std::vector<double>{1.0, 4.0});
	REQUIRE(pair.y == std::vector<double>{10.0, 40.0});
	REQUIRE(pair.timestamps.empty());
}

TEST_CASE("cleanPairwise rejects arrays of different length", "[alignment]") {
	REQUIRE_THROWS_AS(alignment::cleanPairwise({1.0, 2.0}, {1.0}), std::invalid_argument);
}

TEST_CASE("alignOnTimestamps keeps only shared timestamps", "[alignment]") {
	const auto solar = tests::helpers::makeDailySeries(tests::helpers::linearRange(10, 0.0), "solar");
	const auto mental = tests::helpers::makeDailySeries(tests::helpers::linearRange(10, 100.0), "mental", 5);

	const auto pair = alignment::alignOnTimestamps(solar, mental);

	REQUIRE(pair.size() == 5);
	REQUIRE(pair.x == std::vector<double>{5.0, 6.0, 7.0, 8.0, 9.0});
	REQUIRE(pair.y == std::vector<double>{100.0, 101.0, 102.0, 103.0, 104.0});
	REQUIRE(pair.timestamps.size() == 5);
	REQUIRE(pair.timestamps.front() == solar.getTimestamps()[5]);
}

TEST_CASE("alignOnTimestamps orders the output chronologically", "[alignment]") {
	using TimePoint = core::TimeSeries::TimePoint;
	const TimePoint base{};
	const std::vector<TimePoint> reversed{base + std::chrono::hours(48), base + std::chrono::hours(24), base};
	const core::TimeSeries first(reversed, {3.0, 2.0, 1.0});
	const auto second = tests::helpers::makeDailySeries({10.0, 20.0, 30.0});

	const auto pair = alignment::alignOnTimestamps(first, second);

	REQUIRE(pair.x == std::vector<double>{1.0, 2.0, 3.0});
	REQUIRE(pair.y == std::vector<double>{10.0, 20.0, 30.0});
	REQUIRE(std::is_sorted(pair.timestamps.begin(), pair.timestamps.end()));
}

TEST_CASE("alignOnTimestamps removes missing values after the join", "[alignment]") {
	const auto first = tests::helpers::makeDailySeries({1.0, kNaN, 3.0, 4.0});
	const auto second = tests::helpers::makeDailySeries({1.0, 2.0, 3.0, kNaN});

	const auto pair = alignment::alignOnTimestamps(first, second);

	REQUIRE(pair.x == std::vector<double>{1.0, 3.0});
	REQUIRE(pair.y == std::vector<double>{1.0, 3.0});
}

TEST_CASE("prepare enforces the observation minimum", "[alignment]") {
	const auto x = tests::helpers::linearRange(9);
	const auto y = tests::helpers::linearRange(9, 5.0, 2.0);

	try {
		alignment::prepare(x, y, alignment::kMinCorrelationObservations, "pearson");
		FAIL("expected InsufficientDataError");
	} catch (const core::InsufficientDataError &error) {
		REQUIRE(error.required() == 10);
		REQUIRE(error.actual() == 9);
		REQUIRE(error.method() == "pearson");
	}
}

TEST_CASE("prepare counts only jointly observed values", "[alignment]") {
	auto x = tests::helpers::linearRange(11);
	const auto y = tests::helpers::linearRange(11, 3.0);
	x[4] = kNaN;
	REQUIRE(alignment::prepare(x, y, 10, "pearson").size() == 10);

	x[5] = kNaN;
	REQUIRE_THROWS_AS(alignment::prepare(x, y, 10, "pearson"), core::InsufficientDataError);
}

TEST_CASE("prepare rejects constant input", "[alignment]") {
	const std::vector<double> constant(20, 3.5);
	const auto varying = tests::helpers::linearRange(20);

	REQUIRE_THROWS_AS(alignment::prepare(constant, varying, 10, "pearson"), core::DegenerateInputError);
	REQUIRE_THROWS_AS(alignment::prepare(varying, constant, 10, "pearson"), core::DegenerateInputError);
}

TEST_CASE("prepare checks size before variance", "[alignment]") {
	const std::vector<double> constant(5, 1.0);
	REQUIRE_THROWS_AS(alignment::prepare(constant, constant, 10, "pearson"), core::InsufficientDataError);
}
