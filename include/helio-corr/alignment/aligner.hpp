#pragma once

#include "helio-corr/core/time_series.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace heliocorr::alignment {

/**
 * @brief Two equal-length, fully observed numeric arrays.
 *
 * `timestamps` is filled only when the pair came from timestamped series;
 * then it is strictly increasing.
 */
struct AlignedPair {
	std::vector<double> x;
	std::vector<double> y;
	std::vector<core::TimeSeries::TimePoint> timestamps;

	std::size_t size() const {
		return x.size();
	}

	bool empty() const {
		return x.empty();
	}
};

/// Minimum observation counts per method.
constexpr std::size_t kMinCorrelationObservations = 10;
constexpr std::size_t kGrangerObservationsPerLag = 5;
constexpr std::size_t kMinWaveletObservations = 128;

/**
 * @brief Pairwise deletion: drops every position where either value is non-finite.
 * @throws std::invalid_argument If the inputs differ in length.
 */
AlignedPair cleanPairwise(const std::vector<double> &x, const std::vector<double> &y);

/**
 * @brief Inner join on timestamps followed by pairwise deletion.
 *
 * Only timestamps present in both series survive and the output is in
 * chronological order regardless of the input ordering.
 */
AlignedPair alignOnTimestamps(const core::TimeSeries &first, const core::TimeSeries &second);

/**
 * @throws core::InsufficientDataError If the pair holds fewer than `minimum` observations.
 */
void requireObservations(const AlignedPair &pair, std::size_t minimum, const std::string &method);

/**
 * @throws core::DegenerateInputError If either side has zero sample variance.
 */
void requireVariance(const AlignedPair &pair);

/**
 * @brief Cleans, then checks size and variance in that order.
 *
 * The entry point used by every analysis method.
 */
AlignedPair prepare(const std::vector<double> &x, const std::vector<double> &y, std::size_t minimum,
                    const std::string &method);

} // namespace heliocorr::alignment
