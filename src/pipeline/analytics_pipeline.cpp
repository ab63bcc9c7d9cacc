#include "telepulse/pipeline/analytics_pipeline.hpp"

#include "telepulse/core/errors.hpp"
#include "telepulse/detectors/isolation_forest.hpp"
#include "telepulse/detectors/zscore.hpp"
#include "telepulse/resample/resampler.hpp"
#include "telepulse/utils/logging.hpp"
#include "telepulse/utils/statistics.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <stdexcept>
#include <utility>

namespace telepulse::pipeline {

namespace {

template <typename Fn>
auto launch(bool parallel, Fn &&fn) {
	return std::async(parallel ? std::launch::async : std::launch::deferred, std::forward<Fn>(fn));
}

// Joins one analyzer task, turning its failure into a report entry.
template <typename T>
std::optional<T> collect(const std::string &name, std::future<T> &task, MetricsReport &report) {
	try {
		return task.get();
	} catch (const std::exception &e) {
		TELEPULSE_ERROR("Analyzer '{}' failed for '{}': {}", name, report.system, e.what());
		report.failures.emplace(name, e.what());
		return std::nullopt;
	}
}

// Cadence of the series itself: its tagged frequency, else the inferred step, else the configured one.
std::chrono::seconds seriesCadence(const core::TimeSeries &series, std::chrono::seconds fallback) {
	auto step = series.frequency();
	if (!step) {
		step = series.inferFrequency();
	}
	if (!step) {
		return fallback;
	}
	const auto cadence = std::chrono::duration_cast<std::chrono::seconds>(*step);
	if (cadence <= std::chrono::seconds::zero() || cadence != *step) {
		throw std::invalid_argument("Series '" + series.label() + "' must be sampled at a whole number of seconds.");
	}
	return cadence;
}

} // namespace

AnalyticsPipeline::AnalyticsPipeline(core::AnalyticsConfig config) : config_(std::move(config)) {
	config_.validate();
}

MetricsReport AnalyticsPipeline::run(std::vector<core::Sample> samples, const std::string &system) const {
	const resample::Resampler resampler(config_.cadence);
	const auto resampled = resampler.resample(std::move(samples), system);
	return runOnSeries(resampled);
}

MetricsReport AnalyticsPipeline::runOnSeries(const core::TimeSeries &resampled) const {
	TELEPULSE_INFO("Running analytics for '{}' over {} samples.", resampled.label(), resampled.size());

	const auto range = resampled.definedRange();
	if (!range) {
		throw core::EmptyInputError("Series '" + resampled.label() + "' holds no finite value.");
	}

	// Windows are counted in samples, so derive them from the series' own cadence.
	auto config = config_;
	config.cadence = seriesCadence(resampled, config_.cadence);

	MetricsReport report;
	report.system = resampled.label();
	report.cadence = config.cadence;
	report.leading_trimmed = range->first;
	report.trailing_trimmed = resampled.size() - range->second;
	report.series = resampled.slice(range->first, range->second);
	if (report.series.hasMissingValues()) {
		throw std::invalid_argument("Series '" + report.system + "' has interior gaps; resample it first.");
	}

	const core::TimeSeries &series = report.series;
	const auto zscore = detectors::ZScoreDetectorBuilder().withThreshold(config.zscore_threshold).build();
	detectors::IsolationForestBuilder forest_builder;
	forest_builder.withContamination(config.contamination).withSeed(config.seed).withTrees(config.n_trees);
	if (config.subsample_size) {
		forest_builder.withSubsampleSize(*config.subsample_size);
	}
	const auto forest = forest_builder.build();
	const auto periodicity = seasonality::PeriodicityAnalyzer::builder().sampleSpacing(config.cadence).build();
	const seasonality::DiurnalProfiler diurnal;
	const auto aroon = indicators::AroonIndicator::builder().window(config.aroonWindow()).build();
	const auto rolling_window = config.rollingWindow();

	const bool parallel = config.parallel;
	auto zscore_task = launch(parallel, [&] { return zscore->detect(series); });
	auto forest_task = launch(parallel, [&] { return forest->detect(series); });
	auto period_task = launch(parallel, [&] { return periodicity.analyze(series); });
	auto diurnal_task = launch(parallel, [&] { return diurnal.profile(series); });
	auto trend_task = launch(parallel, [&] { return aroon.detectReversals(series); });
	auto rolling_task =
	    launch(parallel, [&] { return utils::Statistics::rollingMean(series.getValues(), rolling_window); });

	report.zscore = collect(zscore->getName(), zscore_task, report);
	report.isolation = collect(forest->getName(), forest_task, report);
	report.periodicity = collect("PeriodicityAnalyzer", period_task, report);
	report.diurnal = collect("DiurnalProfiler", diurnal_task, report);
	report.trend = collect("AroonIndicator", trend_task, report);
	if (auto rolling = collect("RollingMean", rolling_task, report)) {
		report.rolling_mean = std::move(*rolling);
	}

	report.mean_value = utils::Statistics::mean(series.getValues());
	if (report.zscore && report.isolation) {
		report.overlap = detectors::overlapCount(*report.zscore, *report.isolation);
	}

	TELEPULSE_INFO("Analytics for '{}' finished with {} failed analyzers.", report.system, report.failures.size());
	return report;
}

} // namespace telepulse::pipeline
