#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "helio-corr/lag/cross_correlation.hpp"
#include "common/series_helpers.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

using namespace heliocorr;

TEST_CASE("Time-lagged table has one row per admissible lag", "[lag][time_lagged]") {
	const auto x = tests::helpers::gaussianNoise(100, 71);
	const auto y = tests::helpers::gaussianNoise(100, 72);

	const auto rows = lag::timeLaggedCorrelation(x, y);

	REQUIRE(rows.size() == 29);
	REQUIRE(rows.front().lag == -14);
	REQUIRE(rows.back().lag == 14);
	REQUIRE(rows[14].lag == 0);
	REQUIRE(rows[14].description == "no lag");
	REQUIRE(rows[14].n_observations == 100);
	REQUIRE(rows.front().n_observations == 86);
}

TEST_CASE("Time-lagged table locates the leading series", "[lag][time_lagged]") {
	const auto x = tests::helpers::gaussianNoise(120, 73);
	const auto y = tests::helpers::delayed(x, 3, 74);

	const auto rows = lag::timeLaggedCorrelation(x, y, 5);

	const auto best = std::max_element(rows.begin(), rows.end(), [](const auto &a, const auto &b) {
		return std::abs(a.correlation) < std::abs(b.correlation);
	});
	REQUIRE(best->lag == -3);
	REQUIRE(best->description == "x leads by 3");
	REQUIRE(best->correlation == Catch::Approx(1.0));
	REQUIRE(best->significant);

	const auto y_leads = std::find_if(rows.begin(), rows.end(), [](const auto &row) { return row.lag == 2; });
	REQUIRE(y_leads != rows.end());
	REQUIRE(y_leads->description == "y leads by 2");
}

TEST_CASE("Time-lagged table omits lags with too little overlap", "[lag][time_lagged]") {
	const auto x = tests::helpers::gaussianNoise(15, 75);
	const auto y = tests::helpers::gaussianNoise(15, 76);

	const auto rows = lag::timeLaggedCorrelation(x, y, 14);

	// More than ten pairs are needed, so only |lag| <= 4 survives.
	REQUIRE(rows.size() == 9);
	for (const auto &row : rows) {
		REQUIRE(row.n_observations > 10);
		REQUIRE(std::abs(row.lag) <= 4);
	}
}

TEST_CASE("Time-lagged table drops missing values per lag", "[lag][time_lagged]") {
	auto x = tests::helpers::gaussianNoise(40, 77);
	const auto y = tests::helpers::gaussianNoise(40, 78);
	x[20] = std::numeric_limits<double>::quiet_NaN();

	const auto rows = lag::timeLaggedCorrelation(x, y, 0);

	REQUIRE(rows.size() == 1);
	REQUIRE(rows.front().n_observations == 39);
}

TEST_CASE("Time-lagged table validates its arguments", "[lag][time_lagged]") {
	const auto x = tests::helpers::gaussianNoise(30, 79);
	REQUIRE_THROWS_AS(lag::timeLaggedCorrelation(x, std::vector<double>(29, 1.0)), std::invalid_argument);
	REQUIRE_THROWS_AS(lag::timeLaggedCorrelation(x, x, -1), std::invalid_argument);
	REQUIRE(lag::timeLaggedCorrelation(x, std::vector<double>(30, 1.0)).empty());
}
