#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace telepulse::core {

/**
 * @struct Sample
 * @brief A single raw observation as handed over by the ingest layer.
 *
 * A non-finite value marks a missing observation.
 */
struct Sample {
	std::chrono::system_clock::time_point timestamp{};
	double value = 0.0;
};

/**
 * @class TimeSeries
 * @brief Represents a univariate sequence of data points over time.
 *
 * Timestamps and values are stored in separate vectors for cache-efficient
 * numerical processing. The number of timestamps always matches the number
 * of values and timestamps are strictly increasing.
 */
class TimeSeries {
public:
	using TimePoint = std::chrono::system_clock::time_point;
	using Value = double;

	/**
	 * @brief Constructs a TimeSeries object.
	 * @param timestamps A vector of time points.
	 * @param values A vector of corresponding values.
	 * @param label Optional identifier of the system the series belongs to.
	 * @throws std::invalid_argument If the sizes differ or timestamps are not strictly increasing.
	 */
	TimeSeries(std::vector<TimePoint> timestamps, std::vector<Value> values, std::string label = {})
	    : timestamps_(std::move(timestamps)), values_(std::move(values)), label_(std::move(label)) {
		if (timestamps_.size() != values_.size()) {
			throw std::invalid_argument("Timestamps and values vectors must have the same size.");
		}
		validateTimestampOrder();
	}

	/**
	 * @brief Gets the timestamps.
	 * @return A const reference to the vector of timestamps.
	 */
	const std::vector<TimePoint> &getTimestamps() const {
		return timestamps_;
	}

	/**
	 * @brief Gets the values.
	 * @return A const reference to the vector of values.
	 */
	const std::vector<Value> &getValues() const {
		return values_;
	}

	const std::string &label() const {
		return label_;
	}

	std::optional<std::chrono::nanoseconds> frequency() const {
		return frequency_;
	}

	void setFrequency(std::chrono::nanoseconds frequency) {
		if (frequency <= std::chrono::nanoseconds::zero()) {
			throw std::invalid_argument("Frequency must be positive.");
		}
		frequency_ = frequency;
	}

	/**
	 * @brief Infers the sampling step when all consecutive differences agree.
	 * @param tolerance Maximum deviation allowed between individual differences.
	 * @return The common step, or nullopt for fewer than two samples or irregular spacing.
	 */
	std::optional<std::chrono::nanoseconds>
	inferFrequency(std::chrono::nanoseconds tolerance = std::chrono::nanoseconds{0}) const {
		if (timestamps_.size() < 2) {
			return std::nullopt;
		}
		const auto normalized_tolerance =
		    (tolerance >= std::chrono::nanoseconds::zero()) ? tolerance : -tolerance;

		const auto base_diff =
		    std::chrono::duration_cast<std::chrono::nanoseconds>(timestamps_[1] - timestamps_[0]);
		for (std::size_t i = 1; i + 1 < timestamps_.size(); ++i) {
			const auto diff =
			    std::chrono::duration_cast<std::chrono::nanoseconds>(timestamps_[i + 1] - timestamps_[i]);
			const auto delta = diff > base_diff ? diff - base_diff : base_diff - diff;
			if (delta > normalized_tolerance) {
				return std::nullopt;
			}
		}
		return base_diff;
	}

	/**
	 * @brief Gets the number of data points in the series.
	 */
	std::size_t size() const {
		return timestamps_.size();
	}

	/**
	 * @brief Checks if the time series is empty.
	 */
	bool isEmpty() const {
		return size() == 0;
	}

	TimeSeries slice(std::size_t start, std::size_t end) const {
		if (start > end) {
			throw std::invalid_argument("Slice start index must not exceed end index.");
		}
		if (end > size()) {
			throw std::out_of_range("Slice end index exceeds the length of the time series.");
		}

		std::vector<TimePoint> sliced_timestamps(timestamps_.begin() + static_cast<std::ptrdiff_t>(start),
		                                         timestamps_.begin() + static_cast<std::ptrdiff_t>(end));
		std::vector<Value> sliced_values(values_.begin() + static_cast<std::ptrdiff_t>(start),
		                                 values_.begin() + static_cast<std::ptrdiff_t>(end));

		TimeSeries result(std::move(sliced_timestamps), std::move(sliced_values), label_);
		if (frequency_) {
			result.setFrequency(*frequency_);
		}
		return result;
	}

	bool hasMissingValues() const {
		return std::any_of(values_.begin(), values_.end(), [](double v) { return !std::isfinite(v); });
	}

	/**
	 * @brief Returns the half-open index range [first, last) spanning the finite values.
	 *
	 * Leading and trailing non-finite values fall outside the range. Returns
	 * nullopt when the series holds no finite value at all.
	 */
	std::optional<std::pair<std::size_t, std::size_t>> definedRange() const {
		const auto is_finite = [](double v) { return std::isfinite(v); };
		const auto first = std::find_if(values_.begin(), values_.end(), is_finite);
		if (first == values_.end()) {
			return std::nullopt;
		}
		const auto last = std::find_if(values_.rbegin(), values_.rend(), is_finite);
		return std::make_pair(static_cast<std::size_t>(first - values_.begin()),
		                      static_cast<std::size_t>(values_.rend() - last));
	}

private:
	void validateTimestampOrder() const {
		for (std::size_t i = 1; i < timestamps_.size(); ++i) {
			if (timestamps_[i] <= timestamps_[i - 1]) {
				throw std::invalid_argument("Timestamps must be strictly increasing.");
			}
		}
	}

	std::vector<TimePoint> timestamps_;
	std::vector<Value> values_;
	std::string label_;
	std::optional<std::chrono::nanoseconds> frequency_;
};

} // namespace telepulse::core
