#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "telepulse/core/errors.hpp"
#include "telepulse/seasonality/periodicity.hpp"
#include "common/telemetry_fixtures.hpp"
#include "common/time_series_helpers.hpp"

#include <chrono>
#include <cmath>
#include <complex>
#include <random>
#include <vector>

using telepulse::core::DegeneratePeriodError;
using telepulse::core::DegenerateSeriesError;
using telepulse::core::TimeSeries;
using telepulse::seasonality::FrequencySpectrum;
using telepulse::seasonality::PeriodicityAnalyzer;

TEST_CASE("Periodicity recovers a daily cycle", "[seasonality][periodicity]") {
	const auto series = tests::helpers::makeMinuteSeries(tests::fixtures::sineWave(2880, 1440.0, 20.0, 60.0));
	const auto result = PeriodicityAnalyzer::builder().build().analyze(series);

	REQUIRE(result.dominant_bin == 2);
	REQUIRE(result.period_minutes == Catch::Approx(1440.0));
	REQUIRE(result.period_hours == Catch::Approx(24.0));
	REQUIRE(result.spectrum.size() == 2880 / 2 + 1);
	REQUIRE(result.spectrum.frequencies[1] == Catch::Approx(1.0 / 2880.0));
}

TEST_CASE("Periodicity is accurate to one frequency bin", "[seasonality][periodicity]") {
	const std::size_t n = 1000;
	const double period = 137.0;
	const auto series = tests::helpers::makeMinuteSeries(tests::fixtures::sineWave(n, period));
	const auto result = PeriodicityAnalyzer::builder().build().analyze(series);

	const double bin_width = 1.0 / static_cast<double>(n);
	REQUIRE(std::abs(result.dominant_frequency - 1.0 / period) <= bin_width);
	REQUIRE(result.spectrum.size() == n / 2 + 1);
}

TEST_CASE("Periodicity converts coarser cadences to minutes", "[seasonality][periodicity]") {
	// Five-minute cadence, two days, one cycle per day.
	const auto values = tests::fixtures::sineWave(576, 288.0);

	TimeSeries tagged(tests::helpers::makeTimestamps(values.size(), std::chrono::minutes(5)), values);
	tagged.setFrequency(std::chrono::minutes(5));
	REQUIRE(PeriodicityAnalyzer::builder().build().analyze(tagged).period_hours == Catch::Approx(24.0));

	const TimeSeries untagged(tests::helpers::makeTimestamps(values.size(), std::chrono::minutes(5)), values);
	const auto analyzer = PeriodicityAnalyzer::builder().sampleSpacing(std::chrono::minutes(5)).build();
	REQUIRE(analyzer.analyze(untagged).period_hours == Catch::Approx(24.0));
}

TEST_CASE("Periodicity rejects series without a cycle", "[seasonality][periodicity][degenerate]") {
	const auto analyzer = PeriodicityAnalyzer::builder().build();

	const auto constant = tests::helpers::makeMinuteSeries(std::vector<double>(1440, 55.0));
	REQUIRE_THROWS_AS(analyzer.analyze(constant), DegeneratePeriodError);
	REQUIRE_THROWS_AS(analyzer.analyze(constant), DegenerateSeriesError);

	REQUIRE_THROWS_AS(analyzer.analyze(tests::helpers::makeMinuteSeries({1.0})), DegeneratePeriodError);
}

TEST_CASE("Spectrum of a demeaned signal has no DC energy", "[seasonality][periodicity][spectrum]") {
	const auto analyzer = PeriodicityAnalyzer::builder().build();
	const auto spectrum = analyzer.spectrum(tests::fixtures::sineWave(64, 16.0, 3.0, 100.0), 1.0);

	REQUIRE(spectrum.size() == 33);
	REQUIRE(spectrum.magnitudes[0] == Catch::Approx(0.0).margin(1e-9));
	REQUIRE(spectrum.peakBin() == 4);
	REQUIRE(spectrum.magnitudes[4] == Catch::Approx(3.0 * 64.0 / 2.0));

	REQUIRE(analyzer.spectrum({}, 1.0).size() == 0);

	FrequencySpectrum flat;
	flat.frequencies = {0.0, 0.5};
	flat.magnitudes = {0.0, 0.0};
	REQUIRE(flat.peakBin() == 0);
}

namespace {

std::vector<double> directMagnitudes(const std::vector<double> &values) {
	const std::size_t n = values.size();
	double mean = 0.0;
	for (double v : values) {
		mean += v / static_cast<double>(n);
	}
	std::vector<double> magnitudes(n / 2 + 1);
	for (std::size_t k = 0; k < magnitudes.size(); ++k) {
		std::complex<double> sum(0.0, 0.0);
		for (std::size_t j = 0; j < n; ++j) {
			const double angle = -2.0 * tests::fixtures::kPi * static_cast<double>((j * k) % n) / static_cast<double>(n);
			sum += (values[j] - mean) * std::polar(1.0, angle);
		}
		magnitudes[k] = std::abs(sum);
	}
	return magnitudes;
}

} // namespace

TEST_CASE("Spectrum of awkward lengths matches the direct transform", "[seasonality][periodicity][spectrum]") {
	std::mt19937 rng(3);
	std::normal_distribution<double> noise(0.0, 1.0);
	const auto analyzer = PeriodicityAnalyzer::builder().build();

	for (const std::size_t n : {211, 343, 2 * 199}) {
		std::vector<double> values(n);
		for (auto &v : values) {
			v = 20.0 + noise(rng);
		}
		const auto spectrum = analyzer.spectrum(values, 1.0);
		const auto expected = directMagnitudes(values);
		REQUIRE(spectrum.size() == expected.size());
		for (std::size_t k = 0; k < expected.size(); ++k) {
			REQUIRE(spectrum.magnitudes[k] == Catch::Approx(expected[k]).margin(1e-8));
		}
	}
}

TEST_CASE("Spectrum of a prime-length sinusoid peaks on its bin", "[seasonality][periodicity][spectrum]") {
	// 997 samples with exactly ten cycles.
	const auto values = tests::fixtures::sineWave(997, 99.7, 3.0, 40.0);
	const auto spectrum = PeriodicityAnalyzer::builder().build().spectrum(values, 1.0);

	REQUIRE(spectrum.size() == 499);
	REQUIRE(spectrum.peakBin() == 10);
	REQUIRE(spectrum.magnitudes[10] == Catch::Approx(3.0 * 997.0 / 2.0));
	REQUIRE(spectrum.magnitudes[0] == Catch::Approx(0.0).margin(1e-6));
	REQUIRE(spectrum.magnitudes[11] == Catch::Approx(0.0).margin(1e-6));
}

TEST_CASE("Periodicity handles long prime-length series", "[seasonality][periodicity]") {
	const std::size_t n = 100003;
	const auto series = tests::helpers::makeMinuteSeries(tests::fixtures::sineWave(n, 1440.0, 20.0, 60.0));
	const auto result = PeriodicityAnalyzer::builder().build().analyze(series);

	REQUIRE(result.spectrum.size() == n / 2 + 1);
	REQUIRE(std::abs(result.dominant_frequency - 1.0 / 1440.0) <= 1.0 / static_cast<double>(n));
	REQUIRE(result.period_hours == Catch::Approx(24.0).epsilon(0.01));
}
