#include "telepulse/seasonality/diurnal.hpp"

#include "telepulse/core/errors.hpp"
#include "telepulse/utils/logging.hpp"

#include <chrono>
#include <cmath>

namespace telepulse::seasonality {

int DiurnalProfiler::hourOfDay(const core::TimeSeries::TimePoint &tp) {
	const auto since_epoch = std::chrono::floor<std::chrono::hours>(tp.time_since_epoch());
	const auto hours = since_epoch.count() % static_cast<long long>(kHoursPerDay);
	return static_cast<int>(hours < 0 ? hours + static_cast<long long>(kHoursPerDay) : hours);
}

DiurnalProfile DiurnalProfiler::profile(const core::TimeSeries &ts) const {
	std::array<double, kHoursPerDay> sums{};
	DiurnalProfile result;

	const auto &timestamps = ts.getTimestamps();
	const auto &values = ts.getValues();
	for (std::size_t i = 0; i < values.size(); ++i) {
		if (!std::isfinite(values[i])) {
			continue;
		}
		const auto hour = static_cast<std::size_t>(hourOfDay(timestamps[i]));
		sums[hour] += values[i];
		++result.hourly_count[hour];
	}

	std::optional<std::size_t> peak;
	std::optional<std::size_t> trough;
	for (std::size_t hour = 0; hour < kHoursPerDay; ++hour) {
		if (result.hourly_count[hour] == 0) {
			continue;
		}
		const double mean = sums[hour] / static_cast<double>(result.hourly_count[hour]);
		result.hourly_mean[hour] = mean;
		if (!peak || mean > *result.hourly_mean[*peak]) {
			peak = hour;
		}
		if (!trough || mean < *result.hourly_mean[*trough]) {
			trough = hour;
		}
	}

	if (!peak || !trough) {
		throw core::EmptyInputError("Diurnal profile requires at least one finite sample.");
	}
	result.peak_hour = static_cast<int>(*peak);
	result.trough_hour = static_cast<int>(*trough);

	TELEPULSE_INFO("Diurnal profile of '{}': peak at {:02d}:00, trough at {:02d}:00.", ts.label(), result.peak_hour,
	               result.trough_hour);
	return result;
}

} // namespace telepulse::seasonality
