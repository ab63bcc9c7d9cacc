#include "telepulse/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace telepulse::utils {

double Statistics::mean(const std::vector<double> &values) {
	if (values.empty()) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double Statistics::sampleStdDev(const std::vector<double> &values) {
	if (values.size() < 2) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	const double mu = mean(values);
	double sum_sq = 0.0;
	for (double v : values) {
		const double diff = v - mu;
		sum_sq += diff * diff;
	}
	return std::sqrt(sum_sq / static_cast<double>(values.size() - 1));
}

double Statistics::percentile(std::vector<double> values, double q) {
	if (values.empty()) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	if (q < 0.0 || q > 100.0) {
		throw std::invalid_argument("Percentile must be within [0, 100].");
	}
	std::sort(values.begin(), values.end());
	const double rank = q / 100.0 * static_cast<double>(values.size() - 1);
	const auto lower = static_cast<std::size_t>(std::floor(rank));
	const auto upper = std::min(lower + 1, values.size() - 1);
	const double fraction = rank - static_cast<double>(lower);
	return values[lower] + (values[upper] - values[lower]) * fraction;
}

std::vector<double> Statistics::rollingMean(const std::vector<double> &values, std::size_t window) {
	if (window == 0) {
		throw std::invalid_argument("Rolling window must be at least 1.");
	}
	std::vector<double> result(values.size());
	double running = 0.0;
	for (std::size_t i = 0; i < values.size(); ++i) {
		running += values[i];
		if (i >= window) {
			running -= values[i - window];
		}
		const std::size_t count = std::min(i + 1, window);
		result[i] = running / static_cast<double>(count);
	}
	return result;
}

} // namespace telepulse::utils
