#pragma once

#include "telepulse/core/time_series.hpp"
#include "telepulse/detectors/ioutlier_detector.hpp"
#include "telepulse/indicators/aroon.hpp"
#include "telepulse/seasonality/diurnal.hpp"
#include "telepulse/seasonality/periodicity.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace telepulse::pipeline {

/**
 * @struct MetricsReport
 * @brief Everything one analytics run produced for one system.
 *
 * All arrays are aligned with `series`. An analyzer that failed leaves its
 * field empty and records its error message in `failures`.
 */
struct MetricsReport {
	std::string system;
	core::TimeSeries series{{}, {}};
	std::chrono::seconds cadence{60};

	/// Undefined boundary points removed from the resampled series.
	std::size_t leading_trimmed = 0;
	std::size_t trailing_trimmed = 0;

	double mean_value = 0.0;
	std::vector<double> rolling_mean;

	std::optional<detectors::OutlierResult> zscore;
	std::optional<detectors::OutlierResult> isolation;
	/// Samples flagged by both detectors; present when both succeeded.
	std::optional<std::size_t> overlap;

	std::optional<seasonality::PeriodicityResult> periodicity;
	std::optional<seasonality::DiurnalProfile> diurnal;
	std::optional<indicators::AroonResult> trend;

	/// Analyzer name to error message.
	std::map<std::string, std::string> failures;

	std::optional<std::size_t> zscoreCount() const {
		return zscore ? std::optional<std::size_t>(zscore->count()) : std::nullopt;
	}

	std::optional<std::size_t> isolationCount() const {
		return isolation ? std::optional<std::size_t>(isolation->count()) : std::nullopt;
	}

	std::optional<double> periodHours() const {
		return periodicity ? std::optional<double>(periodicity->period_hours) : std::nullopt;
	}

	std::optional<int> peakHour() const {
		return diurnal ? std::optional<int>(diurnal->peak_hour) : std::nullopt;
	}

	std::optional<int> troughHour() const {
		return diurnal ? std::optional<int>(diurnal->trough_hour) : std::nullopt;
	}

	std::optional<std::size_t> reversalCount() const {
		return trend ? std::optional<std::size_t>(trend->reversals) : std::nullopt;
	}

	bool hasFailures() const {
		return !failures.empty();
	}
};

} // namespace telepulse::pipeline
