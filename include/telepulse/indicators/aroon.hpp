#pragma once

#include "telepulse/core/time_series.hpp"

#include <cstddef>
#include <vector>

namespace telepulse::indicators {

/**
 * @struct AroonResult
 * @brief Aroon-Up/Down sequences aligned with the analysed series.
 *
 * Positions before `first_defined` hold NaN. A reversal is a bullish crossover,
 * i.e. Up moving from not-above Down to strictly above it.
 */
struct AroonResult {
	std::vector<double> up;
	std::vector<double> down;
	std::size_t window = 0;
	std::size_t first_defined = 0;
	std::size_t reversals = 0;
	std::vector<std::size_t> reversal_indices;
	bool insufficient_history = false;
};

/**
 * @class AroonIndicator
 * @brief Time-since-extreme indicator over a trailing window.
 *
 * For position i the window covers [i - W + 1, i]. With p the number of steps
 * back to the most recent maximum (minimum), Up (Down) is 100 * (W - 1 - p) / W.
 */
class AroonIndicator {
public:
	class Builder {
	public:
		Builder &window(std::size_t value) {
			window_ = value;
			return *this;
		}

		AroonIndicator build() const;

	private:
		std::size_t window_ = 1440;
	};

	static Builder builder();

	/**
	 * @brief Computes both indicators and counts the crossovers.
	 * @throws core::InsufficientWindowError If values holds fewer than window samples.
	 */
	AroonResult compute(const std::vector<double> &values) const;

	/**
	 * @brief Computes the indicators for a series, tolerating short history.
	 *
	 * A series shorter than the window yields all-NaN indicators, zero
	 * reversals and `insufficient_history` set.
	 */
	AroonResult detectReversals(const core::TimeSeries &ts) const;

	std::size_t window() const noexcept {
		return window_;
	}

private:
	explicit AroonIndicator(std::size_t window);

	std::size_t window_;
};

} // namespace telepulse::indicators
