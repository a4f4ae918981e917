#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace heliocorr::core {

/**
 * @class TimeSeries
 * @brief A named sequence of timestamped observations.
 *
 * Timestamps and values live in separate vectors for cache-efficient
 * numerical processing. Timestamps must be unique but need not be sorted;
 * non-finite values mark missing observations and are tolerated here, the
 * alignment layer removes them.
 */
class TimeSeries {
public:
	using TimePoint = std::chrono::system_clock::time_point;
	using Value = double;

	/**
	 * @brief Constructs a TimeSeries object.
	 * @param timestamps A vector of time points.
	 * @param values A vector of corresponding values.
	 * @param name Optional label used in logs and aggregate reports.
	 * @throws std::invalid_argument If the sizes differ or a timestamp repeats.
	 */
	TimeSeries(std::vector<TimePoint> timestamps, std::vector<Value> values, std::string name = {})
	    : timestamps_(std::move(timestamps)), values_(std::move(values)), name_(std::move(name)) {
		if (timestamps_.size() != values_.size()) {
			throw std::invalid_argument("Timestamps and values vectors must have the same size.");
		}
		validateUniqueTimestamps();
	}

	/**
	 * @brief Gets the timestamps.
	 * @return A const reference to the vector of timestamps.
	 */
	const std::vector<TimePoint> &getTimestamps() const {
		return timestamps_;
	}

	/**
	 * @brief Gets the values, possibly containing missing (non-finite) entries.
	 */
	const std::vector<Value> &getValues() const {
		return values_;
	}

	const std::string &name() const {
		return name_;
	}

	void setName(std::string name) {
		name_ = std::move(name);
	}

	/**
	 * @brief Gets the number of data points in the series.
	 */
	std::size_t size() const {
		return timestamps_.size();
	}

	bool isEmpty() const {
		return size() == 0;
	}

	bool hasMissingValues() const {
		return std::any_of(values_.begin(), values_.end(), [](double v) { return !std::isfinite(v); });
	}

	bool isChronological() const {
		return std::is_sorted(timestamps_.begin(), timestamps_.end());
	}

	/**
	 * @brief Returns a copy ordered by timestamp. The original is left untouched.
	 */
	TimeSeries sortedByTime() const {
		std::vector<std::size_t> order(size());
		std::iota(order.begin(), order.end(), 0);
		std::sort(order.begin(), order.end(),
		          [this](std::size_t a, std::size_t b) { return timestamps_[a] < timestamps_[b]; });

		std::vector<TimePoint> sorted_timestamps;
		std::vector<Value> sorted_values;
		sorted_timestamps.reserve(size());
		sorted_values.reserve(size());
		for (std::size_t index : order) {
			sorted_timestamps.push_back(timestamps_[index]);
			sorted_values.push_back(values_[index]);
		}
		return TimeSeries(std::move(sorted_timestamps), std::move(sorted_values), name_);
	}

private:
	void validateUniqueTimestamps() const {
		std::vector<TimePoint> copy = timestamps_;
		std::sort(copy.begin(), copy.end());
		if (std::adjacent_find(copy.begin(), copy.end()) != copy.end()) {
			throw std::invalid_argument("TimeSeries timestamps must be unique.");
		}
	}

	std::vector<TimePoint> timestamps_;
	std::vector<Value> values_;
	std::string name_;
};

} // namespace heliocorr::core
