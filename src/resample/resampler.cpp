#include "telepulse/resample/resampler.hpp"

#include "telepulse/core/errors.hpp"
#include "telepulse/utils/logging.hpp"

#include <algorithm>
#include <iterator>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace telepulse::resample {

using core::Sample;
using core::TimeSeries;

Resampler::Resampler(std::chrono::seconds cadence) : cadence_(cadence) {
	if (cadence_ <= std::chrono::seconds::zero()) {
		throw std::invalid_argument("Resampling cadence must be positive.");
	}
}

TimeSeries Resampler::resample(std::vector<Sample> samples, const std::string &label) const {
	if (samples.empty()) {
		throw core::EmptyInputError("No samples available for system '" + label + "'.");
	}

	std::stable_sort(samples.begin(), samples.end(),
	                 [](const Sample &lhs, const Sample &rhs) { return lhs.timestamp < rhs.timestamp; });
	for (std::size_t i = 1; i < samples.size(); ++i) {
		if (samples[i].timestamp == samples[i - 1].timestamp) {
			throw std::invalid_argument("Duplicate sample timestamp for system '" + label + "'.");
		}
	}

	std::vector<Sample> known;
	known.reserve(samples.size());
	std::copy_if(samples.begin(), samples.end(), std::back_inserter(known),
	             [](const Sample &s) { return std::isfinite(s.value); });
	if (known.empty()) {
		throw core::EmptyInputError("No finite samples available for system '" + label + "'.");
	}

	const auto step = std::chrono::duration_cast<TimeSeries::TimePoint::duration>(cadence_);
	const auto start = samples.front().timestamp;
	const auto extent = samples.back().timestamp - start;
	const auto grid_size = static_cast<std::size_t>(extent / step) + 1;

	std::vector<TimeSeries::TimePoint> timestamps;
	std::vector<double> values;
	timestamps.reserve(grid_size);
	values.reserve(grid_size);

	std::size_t next = 0;
	std::size_t exact = 0;
	std::size_t interpolated = 0;
	for (std::size_t g = 0; g < grid_size; ++g) {
		const auto t = start + step * static_cast<long long>(g);
		while (next < known.size() && known[next].timestamp < t) {
			++next;
		}

		double value = std::numeric_limits<double>::quiet_NaN();
		if (next < known.size() && known[next].timestamp == t) {
			value = known[next].value;
			++exact;
		} else if (next > 0 && next < known.size()) {
			const auto &prev = known[next - 1];
			const auto &succ = known[next];
			const double span = static_cast<double>((succ.timestamp - prev.timestamp).count());
			const double ratio = static_cast<double>((t - prev.timestamp).count()) / span;
			value = prev.value + (succ.value - prev.value) * ratio;
			++interpolated;
		}

		timestamps.push_back(t);
		values.push_back(value);
	}

	TELEPULSE_DEBUG("Resampled {} raw samples of '{}' onto {} grid points ({} exact, {} interpolated).",
	                samples.size(), label, grid_size, exact, interpolated);
	if (exact + interpolated < grid_size) {
		TELEPULSE_WARN("Series '{}' has {} undefined boundary points after resampling.", label,
		               grid_size - exact - interpolated);
	}

	TimeSeries result(std::move(timestamps), std::move(values), label);
	result.setFrequency(cadence_);
	return result;
}

} // namespace telepulse::resample
