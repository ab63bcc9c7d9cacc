#pragma once

#include "telepulse/core/config.hpp"
#include "telepulse/core/time_series.hpp"
#include "telepulse/pipeline/metrics_report.hpp"

#include <string>
#include <vector>

namespace telepulse::pipeline {

/**
 * @class AnalyticsPipeline
 * @brief Resamples one system's samples and fans the analyzers out over the result.
 *
 * The analyzers share the same immutable series and run concurrently when the
 * configuration enables it. A failing analyzer does not abort the run.
 */
class AnalyticsPipeline {
public:
	/**
	 * @throws std::invalid_argument If the configuration is invalid.
	 */
	explicit AnalyticsPipeline(core::AnalyticsConfig config = {});

	/**
	 * @brief Runs every analyzer for one system.
	 * @throws core::EmptyInputError If no usable sample is available; no report is produced.
	 */
	MetricsReport run(std::vector<core::Sample> samples, const std::string &system) const;

	/**
	 * @brief Runs every analyzer on an already resampled series.
	 *
	 * Undefined boundary points are trimmed before analysis. Window lengths are
	 * derived from the series' own cadence (its frequency, else the inferred
	 * step); the configured cadence applies only when neither is available.
	 * @throws core::EmptyInputError If the series holds no finite value.
	 * @throws std::invalid_argument If the cadence is not a whole number of seconds.
	 */
	MetricsReport runOnSeries(const core::TimeSeries &resampled) const;

	const core::AnalyticsConfig &config() const noexcept {
		return config_;
	}

private:
	core::AnalyticsConfig config_;
};

} // namespace telepulse::pipeline
