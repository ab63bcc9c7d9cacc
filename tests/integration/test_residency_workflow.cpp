#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "telepulse/pipeline/analytics_pipeline.hpp"
#include "telepulse/pipeline/series_cache.hpp"
#include "telepulse/pipeline/summary.hpp"
#include "common/telemetry_fixtures.hpp"
#include "common/time_series_helpers.hpp"

#include <future>
#include <string>
#include <vector>

using telepulse::pipeline::AnalyticsPipeline;
using telepulse::pipeline::MetricsReport;
using telepulse::pipeline::SeriesCache;
using telepulse::pipeline::SeriesKey;

TEST_CASE("Residency workflow analyses several systems concurrently", "[integration][residency]") {
	const std::vector<std::string> systems{"edge-node-01", "edge-node-02", "edge-node-03"};
	SeriesCache cache;
	const AnalyticsPipeline pipeline;

	std::vector<std::future<MetricsReport>> runs;
	for (std::size_t s = 0; s < systems.size(); ++s) {
		const auto samples = tests::helpers::makeSamples(tests::fixtures::residencySignal(2, 7 + static_cast<unsigned>(s)));
		runs.push_back(std::async(std::launch::async, [&, samples, s] {
			const SeriesKey key{"synthetic", systems[s], pipeline.config().cadence};
			return pipeline.runOnSeries(*cache.getOrResample(key, samples));
		}));
	}

	for (std::size_t s = 0; s < runs.size(); ++s) {
		const auto report = runs[s].get();
		REQUIRE(report.system == systems[s]);
		REQUIRE_FALSE(report.hasFailures());
		REQUIRE(*report.periodHours() == Catch::Approx(24.0));
		for (const auto index : tests::fixtures::residencyIncidents()) {
			REQUIRE(report.zscore->flags[index]);
			REQUIRE(report.isolation->flags[index]);
		}

		const auto text = telepulse::pipeline::formatSummary(telepulse::pipeline::summarize(report));
		REQUIRE(text.find(systems[s]) != std::string::npos);
		REQUIRE(text.find("n/a") == std::string::npos);
	}
	REQUIRE(cache.size() == systems.size());
}

TEST_CASE("Residency workflow reuses cached series on a rerun", "[integration][residency][cache]") {
	SeriesCache cache;
	const AnalyticsPipeline pipeline;
	const SeriesKey key{"synthetic", "edge-node-01", pipeline.config().cadence};
	const auto samples = tests::helpers::makeSamples(tests::fixtures::residencySignal());

	const auto first = pipeline.runOnSeries(*cache.getOrResample(key, samples));
	const auto second = pipeline.runOnSeries(*cache.getOrResample(key, {}));

	REQUIRE(cache.size() == 1);
	REQUIRE(first.isolation->outlier_indices == second.isolation->outlier_indices);
	REQUIRE(first.zscore->outlier_indices == second.zscore->outlier_indices);
	REQUIRE(first.rolling_mean == second.rolling_mean);
}
