#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace telepulse::core {

/// Raised when no usable sample is available for the selected system.
class EmptyInputError : public std::invalid_argument {
public:
	explicit EmptyInputError(const std::string &what) : std::invalid_argument(what) {
	}
};

/// Raised when a series has zero variance and a statistic is undefined for it.
class DegenerateSeriesError : public std::runtime_error {
public:
	explicit DegenerateSeriesError(const std::string &what) : std::runtime_error(what) {
	}
};

/// Raised when a series carries no well-defined dominant frequency.
class DegeneratePeriodError : public DegenerateSeriesError {
public:
	explicit DegeneratePeriodError(const std::string &what) : DegenerateSeriesError(what) {
	}
};

/// Raised when a series is shorter than a sliding window requires.
class InsufficientWindowError : public std::runtime_error {
public:
	InsufficientWindowError(std::size_t length, std::size_t window)
	    : std::runtime_error("Series of length " + std::to_string(length) + " is shorter than window " +
	                         std::to_string(window) + "."),
	      length_(length), window_(window) {
	}

	std::size_t length() const noexcept {
		return length_;
	}

	std::size_t window() const noexcept {
		return window_;
	}

private:
	std::size_t length_;
	std::size_t window_;
};

} // namespace telepulse::core
