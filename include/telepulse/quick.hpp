#pragma once

#include "telepulse/core/config.hpp"
#include "telepulse/core/errors.hpp"
#include "telepulse/core/time_series.hpp"
#include "telepulse/detectors/isolation_forest.hpp"
#include "telepulse/detectors/zscore.hpp"
#include "telepulse/indicators/aroon.hpp"
#include "telepulse/pipeline/analytics_pipeline.hpp"
#include "telepulse/pipeline/metrics_report.hpp"
#include "telepulse/resample/resampler.hpp"
#include "telepulse/seasonality/diurnal.hpp"
#include "telepulse/seasonality/periodicity.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace telepulse::quick {

// --- Internal Helpers ---
namespace internal {
inline core::TimeSeries series_from_vector(const std::vector<double> &data,
                                           std::chrono::seconds cadence = std::chrono::seconds{60}) {
	std::vector<core::TimeSeries::TimePoint> timestamps;
	timestamps.reserve(data.size());
	const core::TimeSeries::TimePoint origin{};
	for (std::size_t i = 0; i < data.size(); ++i) {
		timestamps.push_back(origin + cadence * static_cast<long long>(i));
	}
	core::TimeSeries series(std::move(timestamps), data);
	series.setFrequency(cadence);
	return series;
}
} // namespace internal

inline core::TimeSeries resample(std::vector<core::Sample> samples, const std::string &system = {},
                                 std::chrono::seconds cadence = std::chrono::seconds{60}) {
	return resample::Resampler(cadence).resample(std::move(samples), system);
}

inline detectors::OutlierResult detectOutliersZScore(const std::vector<double> &data, double threshold = 3.0) {
	auto detector = detectors::ZScoreDetectorBuilder().withThreshold(threshold).build();
	return detector->detect(internal::series_from_vector(data));
}

inline detectors::OutlierResult detectOutliersIsolationForest(const std::vector<double> &data,
                                                              double contamination = 0.01,
                                                              std::uint64_t seed = 42) {
	auto detector = detectors::IsolationForestBuilder().withContamination(contamination).withSeed(seed).build();
	return detector->detect(internal::series_from_vector(data));
}

inline seasonality::PeriodicityResult dominantPeriod(const std::vector<double> &data,
                                                     std::chrono::seconds cadence = std::chrono::seconds{60}) {
	const auto analyzer = seasonality::PeriodicityAnalyzer::builder().sampleSpacing(cadence).build();
	return analyzer.analyze(internal::series_from_vector(data, cadence));
}

inline seasonality::DiurnalProfile hourlyProfile(const core::TimeSeries &series) {
	return seasonality::DiurnalProfiler().profile(series);
}

inline indicators::AroonResult aroon(const std::vector<double> &data, std::size_t window = 1440) {
	const auto indicator = indicators::AroonIndicator::builder().window(window).build();
	return indicator.detectReversals(internal::series_from_vector(data));
}

inline pipeline::MetricsReport analyze(std::vector<core::Sample> samples, const std::string &system,
                                       const core::AnalyticsConfig &config = {}) {
	return pipeline::AnalyticsPipeline(config).run(std::move(samples), system);
}

} // namespace telepulse::quick
