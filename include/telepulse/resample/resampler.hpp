#pragma once

#include "telepulse/core/time_series.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace telepulse::resample {

/**
 * @class Resampler
 * @brief Reindexes raw samples onto a regular grid and fills interior gaps.
 *
 * The grid starts at the earliest raw timestamp and advances by the cadence up
 * to the latest raw timestamp. Grid points between two known samples are
 * linearly interpolated in time; grid points before the first or after the last
 * known sample stay NaN.
 */
class Resampler {
public:
	explicit Resampler(std::chrono::seconds cadence = std::chrono::seconds{60});

	/**
	 * @brief Builds the uniformly spaced series for one system.
	 * @param samples Raw samples, in any order. Non-finite values count as missing.
	 * @param label System identifier attached to the result.
	 * @throws core::EmptyInputError If there is no sample, or no finite sample.
	 * @throws std::invalid_argument If two samples share a timestamp.
	 */
	core::TimeSeries resample(std::vector<core::Sample> samples, const std::string &label = {}) const;

	std::chrono::seconds cadence() const noexcept {
		return cadence_;
	}

private:
	std::chrono::seconds cadence_;
};

} // namespace telepulse::resample
