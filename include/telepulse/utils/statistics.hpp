#pragma once

#include <cstddef>
#include <vector>

namespace telepulse::utils {

/**
 * @class Statistics
 * @brief Summary statistics shared by the analytics stages.
 *
 * All functions return NaN when the statistic is undefined for the input.
 */
class Statistics {
public:
	static double mean(const std::vector<double> &values);

	/// Standard deviation with an N-1 denominator.
	static double sampleStdDev(const std::vector<double> &values);

	/**
	 * @brief Percentile with linear interpolation between closest ranks.
	 * @param values Input values (copied and sorted internally).
	 * @param q Percentile in [0, 100].
	 */
	static double percentile(std::vector<double> values, double q);

	/**
	 * @brief Trailing moving average with a minimum of one observation.
	 *
	 * Position i averages values[max(0, i - window + 1) .. i].
	 */
	static std::vector<double> rollingMean(const std::vector<double> &values, std::size_t window);
};

} // namespace telepulse::utils
