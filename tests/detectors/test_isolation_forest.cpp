#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "telepulse/detectors/isolation_forest.hpp"
#include "telepulse/detectors/zscore.hpp"
#include "common/telemetry_fixtures.hpp"
#include "common/time_series_helpers.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

using telepulse::detectors::IsolationForestBuilder;
using telepulse::detectors::IsolationForestDetector;
using telepulse::detectors::OutlierResult;
using telepulse::detectors::ZScoreDetectorBuilder;

TEST_CASE("Isolation forest builder validates parameters", "[detectors][isolation_forest][builder]") {
	IsolationForestBuilder builder;
	REQUIRE_THROWS_AS(builder.withContamination(0.0), std::invalid_argument);
	REQUIRE_THROWS_AS(builder.withContamination(0.75), std::invalid_argument);
	REQUIRE_THROWS_AS(builder.withTrees(0), std::invalid_argument);
	REQUIRE_THROWS_AS(builder.withSubsampleSize(1), std::invalid_argument);

	const auto detector = builder.withContamination(0.05).withSeed(7).withTrees(25).build();
	REQUIRE(detector->contamination() == Catch::Approx(0.05));
	REQUIRE(detector->seed() == 7);
	REQUIRE(detector->trees() == 25);
	REQUIRE(detector->getName() == "IsolationForestDetector");
}

TEST_CASE("Isolation forest average path length", "[detectors][isolation_forest]") {
	REQUIRE(IsolationForestDetector::averagePathLength(0) == 0.0);
	REQUIRE(IsolationForestDetector::averagePathLength(1) == 0.0);
	REQUIRE(IsolationForestDetector::averagePathLength(2) == 1.0);
	REQUIRE(IsolationForestDetector::averagePathLength(256) == Catch::Approx(10.2447).epsilon(1e-4));
}

TEST_CASE("Isolation forest flags the spike of a flat series", "[detectors][isolation_forest]") {
	const auto data = tests::fixtures::constantWithSpike(1000);
	const auto detector = IsolationForestBuilder().withContamination(0.01).withSeed(42).build();
	const auto result = detector->detect(tests::helpers::makeMinuteSeries(data));

	REQUIRE(result.flags.size() == data.size());
	REQUIRE(result.scores.size() == data.size());
	REQUIRE(result.threshold.has_value());
	REQUIRE(result.flags[1000]);
	// Tied scores sit exactly on the threshold and are not flagged.
	REQUIRE(result.count() == 1);
	REQUIRE(result.scores[1000] < result.scores[0]);
}

TEST_CASE("Isolation forest flags about the contamination share of noisy data", "[detectors][isolation_forest]") {
	const auto data = tests::fixtures::residencySignal();
	const auto detector = IsolationForestBuilder().withContamination(0.01).withSeed(42).build();
	const auto result = detector->detect(tests::helpers::makeMinuteSeries(data));

	REQUIRE(result.count() >= 20);
	REQUIRE(result.count() <= 40);
	for (const auto index : tests::fixtures::residencyIncidents()) {
		REQUIRE(result.flags[index]);
	}
	for (const auto score : result.scores) {
		REQUIRE(score < 0.0);
		REQUIRE(score >= -1.0);
	}
	REQUIRE(std::is_sorted(result.outlier_indices.begin(), result.outlier_indices.end()));
}

TEST_CASE("Isolation forest is deterministic for a fixed seed", "[detectors][isolation_forest][determinism]") {
	const auto series = tests::helpers::makeMinuteSeries(tests::fixtures::residencySignal(1));

	const auto first = IsolationForestBuilder().withSeed(42).build()->detect(series);
	const auto second = IsolationForestBuilder().withSeed(42).build()->detect(series);
	REQUIRE(first.flags == second.flags);
	REQUIRE(first.scores == second.scores);

	const auto reseeded = IsolationForestBuilder().withSeed(43).build()->detect(series);
	REQUIRE(reseeded.scores != first.scores);
}

TEST_CASE("Isolation forest handles degenerate input", "[detectors][isolation_forest][degenerate]") {
	const auto detector = IsolationForestBuilder().build();

	const auto constant = detector->detect(tests::helpers::makeMinuteSeries(std::vector<double>(300, 5.0)));
	REQUIRE(constant.count() == 0);

	const auto single = detector->detect(tests::helpers::makeMinuteSeries({5.0}));
	REQUIRE(single.flags.size() == 1);
	REQUIRE(single.count() == 0);

	const auto small = IsolationForestBuilder().withSubsampleSize(512).build()->scoreSamples({1.0, 2.0, 3.0});
	REQUIRE(small.size() == 3);
}

TEST_CASE("Detector overlap never exceeds either count", "[detectors][overlap]") {
	const auto series = tests::helpers::makeMinuteSeries(tests::fixtures::residencySignal());
	const auto zscore = ZScoreDetectorBuilder().build()->detect(series);
	const auto forest = IsolationForestBuilder().build()->detect(series);

	const auto shared = telepulse::detectors::overlapCount(zscore, forest);
	REQUIRE(shared <= std::min(zscore.count(), forest.count()));
	REQUIRE(shared >= 2);

	const auto shorter = OutlierResult::fromFlags({true, false});
	REQUIRE_THROWS_AS(telepulse::detectors::overlapCount(zscore, shorter), std::invalid_argument);
}
