#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "telepulse/utils/statistics.hpp"

#include <cmath>
#include <stdexcept>
#include <vector>

using telepulse::utils::Statistics;

TEST_CASE("Statistics mean and sample standard deviation", "[utils][statistics]") {
	const std::vector<double> values{2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};
	REQUIRE(Statistics::mean(values) == Catch::Approx(5.0));
	// Sum of squared deviations is 32, so the N-1 estimate is sqrt(32 / 7).
	REQUIRE(Statistics::sampleStdDev(values) == Catch::Approx(std::sqrt(32.0 / 7.0)));

	REQUIRE(std::isnan(Statistics::mean({})));
	REQUIRE(std::isnan(Statistics::sampleStdDev({1.0})));
}

TEST_CASE("Statistics percentile interpolates linearly", "[utils][statistics]") {
	const std::vector<double> values{4.0, 1.0, 3.0, 2.0, 5.0};
	REQUIRE(Statistics::percentile(values, 0.0) == Catch::Approx(1.0));
	REQUIRE(Statistics::percentile(values, 50.0) == Catch::Approx(3.0));
	REQUIRE(Statistics::percentile(values, 100.0) == Catch::Approx(5.0));
	REQUIRE(Statistics::percentile(values, 10.0) == Catch::Approx(1.4));

	REQUIRE(std::isnan(Statistics::percentile({}, 50.0)));
	REQUIRE_THROWS_AS(Statistics::percentile(values, 101.0), std::invalid_argument);
	REQUIRE_THROWS_AS(Statistics::percentile(values, -1.0), std::invalid_argument);
}

TEST_CASE("Statistics rolling mean uses a trailing window", "[utils][statistics][rolling]") {
	const auto rolled = Statistics::rollingMean({1.0, 2.0, 3.0, 4.0, 5.0}, 3);
	REQUIRE(rolled.size() == 5);
	REQUIRE(rolled[0] == Catch::Approx(1.0));
	REQUIRE(rolled[1] == Catch::Approx(1.5));
	REQUIRE(rolled[2] == Catch::Approx(2.0));
	REQUIRE(rolled[4] == Catch::Approx(4.0));

	const auto identity = Statistics::rollingMean({3.0, 7.0}, 1);
	REQUIRE(identity[1] == Catch::Approx(7.0));

	REQUIRE_THROWS_AS(Statistics::rollingMean({1.0}, 0), std::invalid_argument);
}
