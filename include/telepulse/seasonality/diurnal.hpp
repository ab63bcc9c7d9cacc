#pragma once

#include "telepulse/core/time_series.hpp"

#include <array>
#include <cstddef>
#include <optional>

namespace telepulse::seasonality {

constexpr std::size_t kHoursPerDay = 24;

/**
 * @struct DiurnalProfile
 * @brief Mean value per hour of day.
 *
 * Hours without any sample have no mean and are never selected as peak or trough.
 */
struct DiurnalProfile {
	std::array<std::optional<double>, kHoursPerDay> hourly_mean{};
	std::array<std::size_t, kHoursPerDay> hourly_count{};
	int peak_hour = 0;
	int trough_hour = 0;
};

/**
 * @class DiurnalProfiler
 * @brief Aggregates a series by the hour-of-day of its timestamps.
 *
 * Hours are taken from the timestamps as given, without timezone conversion.
 * Ties between hours resolve to the lowest hour.
 */
class DiurnalProfiler {
public:
	/**
	 * @throws core::EmptyInputError If the series holds no finite value.
	 */
	DiurnalProfile profile(const core::TimeSeries &ts) const;

	/// Hour of day (0-23) of a time point.
	static int hourOfDay(const core::TimeSeries::TimePoint &tp);
};

} // namespace telepulse::seasonality
