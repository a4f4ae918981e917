#include "helio-corr/alignment/aligner.hpp"
#include "helio-corr/core/errors.hpp"
#include "helio-corr/utils/statistics.hpp"

#include <cmath>
#include <stdexcept>

namespace heliocorr::alignment {

AlignedPair cleanPairwise(const std::vector<double> &x, const std::vector<double> &y) {
	if (x.size() != y.size()) {
		throw std::invalid_argument("x and y must have same size");
	}

	AlignedPair pair;
	pair.x.reserve(x.size());
	pair.y.reserve(y.size());
	for (std::size_t i = 0; i < x.size(); ++i) {
		if (std::isfinite(x[i]) && std::isfinite(y[i])) {
			pair.x.push_back(x[i]);
			pair.y.push_back(y[i]);
		}
	}
	return pair;
}

AlignedPair alignOnTimestamps(const core::TimeSeries &first, const core::TimeSeries &second) {
	const auto left = first.isChronological() ? first : first.sortedByTime();
	const auto right = second.isChronological() ? second : second.sortedByTime();

	const auto &left_times = left.getTimestamps();
	const auto &right_times = right.getTimestamps();
	const auto &left_values = left.getValues();
	const auto &right_values = right.getValues();

	AlignedPair pair;
	std::size_t i = 0;
	std::size_t j = 0;
	while (i < left_times.size() && j < right_times.size()) {
		if (left_times[i] < right_times[j]) {
			++i;
		} else if (right_times[j] < left_times[i]) {
			++j;
		} else {
			if (std::isfinite(left_values[i]) && std::isfinite(right_values[j])) {
				pair.timestamps.push_back(left_times[i]);
				pair.x.push_back(left_values[i]);
				pair.y.push_back(right_values[j]);
			}
			++i;
			++j;
		}
	}
	return pair;
}

void requireObservations(const AlignedPair &pair, std::size_t minimum, const std::string &method) {
	if (pair.size() < minimum) {
		throw core::InsufficientDataError(method, minimum, pair.size());
	}
}

void requireVariance(const AlignedPair &pair) {
	if (utils::Statistics::isConstant(pair.x)) {
		throw core::DegenerateInputError("First series has zero variance");
	}
	if (utils::Statistics::isConstant(pair.y)) {
		throw core::DegenerateInputError("Second series has zero variance");
	}
}

AlignedPair prepare(const std::vector<double> &x, const std::vector<double> &y, std::size_t minimum,
                    const std::string &method) {
	auto pair = cleanPairwise(x, y);
	requireObservations(pair, minimum, method);
	requireVariance(pair);
	return pair;
}

} // namespace heliocorr::alignment
