#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace heliocorr::core {

/**
 * @brief Fewer aligned observations than the requested method needs.
 */
class InsufficientDataError : public std::invalid_argument {
public:
	InsufficientDataError(const std::string &method, std::size_t required, std::size_t actual)
	    : std::invalid_argument("Insufficient data for " + method + ": need at least " + std::to_string(required) +
	                            " observations, got " + std::to_string(actual)),
	      method_(method), required_(required), actual_(actual) {}

	const std::string &method() const {
		return method_;
	}
	std::size_t required() const {
		return required_;
	}
	std::size_t actual() const {
		return actual_;
	}

private:
	std::string method_;
	std::size_t required_;
	std::size_t actual_;
};

/**
 * @brief An input series has zero variance, so the statistic is undefined.
 */
class DegenerateInputError : public std::invalid_argument {
public:
	explicit DegenerateInputError(const std::string &what) : std::invalid_argument(what) {}
};

/**
 * @brief Numerical failure inside an analysis (singular regression, non-finite transform, ...).
 */
class ComputationError : public std::runtime_error {
public:
	ComputationError(const std::string &method, const std::string &cause)
	    : std::runtime_error(method + " computation failed: " + cause), method_(method), cause_(cause) {}

	const std::string &method() const {
		return method_;
	}
	const std::string &cause() const {
		return cause_;
	}

private:
	std::string method_;
	std::string cause_;
};

/**
 * @brief Unknown analysis method requested by name.
 */
class InvalidMethodError : public std::invalid_argument {
public:
	explicit InvalidMethodError(const std::string &name)
	    : std::invalid_argument("Unknown analysis method '" + name + "'"), name_(name) {}

	const std::string &name() const {
		return name_;
	}

private:
	std::string name_;
};

} // namespace heliocorr::core
