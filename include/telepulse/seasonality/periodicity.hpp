#pragma once

#include "telepulse/core/time_series.hpp"

#include <chrono>
#include <cstddef>
#include <vector>

namespace telepulse::seasonality {

/**
 * @struct FrequencySpectrum
 * @brief Magnitude of every non-negative frequency bin of a demeaned signal.
 *
 * Frequencies are expressed in cycles per minute. Bin 0 is the DC component.
 */
struct FrequencySpectrum {
	std::vector<double> frequencies;
	std::vector<double> magnitudes;

	std::size_t size() const {
		return frequencies.size();
	}

	/// Index of the first maximum magnitude among bins 1..size()-1; 0 if there is none.
	[[nodiscard]] std::size_t peakBin() const;
};

struct PeriodicityResult {
	FrequencySpectrum spectrum;
	std::size_t dominant_bin = 0;
	double dominant_frequency = 0.0;
	double period_minutes = 0.0;
	double period_hours = 0.0;
};

/**
 * @class PeriodicityAnalyzer
 * @brief Extracts the dominant cycle of a uniformly sampled series with a real FFT.
 */
class PeriodicityAnalyzer {
public:
	class Builder {
	public:
		/// Spacing used when the analysed series carries no frequency.
		Builder &sampleSpacing(std::chrono::seconds value);
		/// Relative standard deviation under which a series counts as constant.
		Builder &flatnessTolerance(double value);
		PeriodicityAnalyzer build() const;

	private:
		std::chrono::seconds sample_spacing_{60};
		double flatness_tolerance_ = 1e-12;
	};

	static Builder builder();

	/**
	 * @brief Computes the magnitude spectrum of the demeaned values.
	 * @param values Uniformly spaced samples.
	 * @param spacing_minutes Sample spacing in minutes.
	 */
	FrequencySpectrum spectrum(const std::vector<double> &values, double spacing_minutes) const;

	/**
	 * @brief Finds the dominant period of the series.
	 * @throws core::DegeneratePeriodError If the series is constant or too short to carry a cycle.
	 */
	PeriodicityResult analyze(const core::TimeSeries &ts) const;

private:
	PeriodicityAnalyzer(std::chrono::seconds sample_spacing, double flatness_tolerance);

	std::chrono::seconds sample_spacing_;
	double flatness_tolerance_;
};

} // namespace telepulse::seasonality
