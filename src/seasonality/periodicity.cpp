#include "telepulse/seasonality/periodicity.hpp"

#include "telepulse/core/errors.hpp"
#include "telepulse/utils/logging.hpp"
#include "telepulse/utils/statistics.hpp"

#include <unsupported/Eigen/FFT>

#include <algorithm>
#include <cmath>
#include <complex>
#include <stdexcept>
#include <string>
#include <vector>

namespace telepulse::seasonality {

namespace {

using Complex = std::complex<double>;

constexpr double kPi = 3.14159265358979323846;

// The radix kernels cover factors 2, 3 and 5; any other prime factor runs a quadratic butterfly.
bool hasSmoothLength(std::size_t n) {
	for (const std::size_t radix : {2, 3, 5}) {
		while (n % radix == 0) {
			n /= radix;
		}
	}
	return n == 1;
}

std::size_t nextPowerOfTwo(std::size_t n) {
	std::size_t m = 1;
	while (m < n) {
		m <<= 1;
	}
	return m;
}

// exp(-i*pi*j^2/n), with j^2 reduced modulo 2n to keep the phase exact for long series.
Complex chirp(std::size_t j, std::size_t n) {
	const auto phase = static_cast<unsigned long long>(j) * j % (2ULL * n);
	return std::polar(1.0, -kPi * static_cast<double>(phase) / static_cast<double>(n));
}

/**
 * Half spectrum of a real signal of arbitrary length via the Bluestein chirp-z identity
 * jk = (j^2 + k^2 - (k - j)^2) / 2, evaluated as a power-of-two circular convolution.
 */
std::vector<Complex> chirpHalfSpectrum(const std::vector<double> &signal) {
	const std::size_t n = signal.size();
	const std::size_t m = nextPowerOfTwo(2 * n - 1);

	std::vector<Complex> chirps(n);
	for (std::size_t j = 0; j < n; ++j) {
		chirps[j] = chirp(j, n);
	}

	std::vector<Complex> weighted(m, Complex(0.0, 0.0));
	std::vector<Complex> kernel(m, Complex(0.0, 0.0));
	for (std::size_t j = 0; j < n; ++j) {
		weighted[j] = signal[j] * chirps[j];
	}
	kernel[0] = std::conj(chirps[0]);
	for (std::size_t j = 1; j < n; ++j) {
		kernel[j] = std::conj(chirps[j]);
		kernel[m - j] = kernel[j];
	}

	Eigen::FFT<double> fft;
	std::vector<Complex> weighted_bins;
	std::vector<Complex> kernel_bins;
	fft.fwd(weighted_bins, weighted);
	fft.fwd(kernel_bins, kernel);
	for (std::size_t k = 0; k < m; ++k) {
		weighted_bins[k] *= kernel_bins[k];
	}
	std::vector<Complex> convolved;
	fft.inv(convolved, weighted_bins);

	std::vector<Complex> bins(n / 2 + 1);
	for (std::size_t k = 0; k < bins.size(); ++k) {
		bins[k] = chirps[k] * convolved[k];
	}
	return bins;
}

} // namespace

std::size_t FrequencySpectrum::peakBin() const {
	std::size_t best = 0;
	double best_magnitude = 0.0;
	for (std::size_t j = 1; j < magnitudes.size(); ++j) {
		if (magnitudes[j] > best_magnitude) {
			best = j;
			best_magnitude = magnitudes[j];
		}
	}
	return best;
}

PeriodicityAnalyzer::PeriodicityAnalyzer(std::chrono::seconds sample_spacing, double flatness_tolerance)
    : sample_spacing_(sample_spacing), flatness_tolerance_(flatness_tolerance) {
	if (sample_spacing_ <= std::chrono::seconds::zero()) {
		throw std::invalid_argument("Sample spacing must be positive.");
	}
}

PeriodicityAnalyzer::Builder &PeriodicityAnalyzer::Builder::sampleSpacing(std::chrono::seconds value) {
	sample_spacing_ = value;
	return *this;
}

PeriodicityAnalyzer::Builder &PeriodicityAnalyzer::Builder::flatnessTolerance(double value) {
	flatness_tolerance_ = std::max(value, 0.0);
	return *this;
}

PeriodicityAnalyzer PeriodicityAnalyzer::Builder::build() const {
	return PeriodicityAnalyzer(sample_spacing_, flatness_tolerance_);
}

PeriodicityAnalyzer::Builder PeriodicityAnalyzer::builder() {
	return Builder();
}

FrequencySpectrum PeriodicityAnalyzer::spectrum(const std::vector<double> &values, double spacing_minutes) const {
	FrequencySpectrum result;
	const std::size_t n = values.size();
	if (n == 0) {
		return result;
	}
	if (!(spacing_minutes > 0.0)) {
		throw std::invalid_argument("Sample spacing must be positive.");
	}

	const double mean = utils::Statistics::mean(values);
	std::vector<double> centered(n);
	std::transform(values.begin(), values.end(), centered.begin(), [mean](double v) { return v - mean; });

	// The FFT object caches plans, so each call owns its own instance.
	std::vector<Complex> bins;
	if (hasSmoothLength(n)) {
		Eigen::FFT<double> fft;
		fft.SetFlag(Eigen::FFT<double>::HalfSpectrum);
		fft.fwd(bins, centered);
	} else {
		TELEPULSE_DEBUG("Spectrum of length {} computed through a chirp-z transform.", n);
		bins = chirpHalfSpectrum(centered);
	}

	const double span = static_cast<double>(n) * spacing_minutes;
	result.frequencies.resize(bins.size());
	result.magnitudes.resize(bins.size());
	for (std::size_t j = 0; j < bins.size(); ++j) {
		result.frequencies[j] = static_cast<double>(j) / span;
		result.magnitudes[j] = std::abs(bins[j]);
	}
	return result;
}

PeriodicityResult PeriodicityAnalyzer::analyze(const core::TimeSeries &ts) const {
	const auto &values = ts.getValues();
	if (values.size() < 2) {
		throw core::DegeneratePeriodError("Periodicity requires at least 2 samples, got " +
		                                  std::to_string(values.size()) + ".");
	}

	const double mean = utils::Statistics::mean(values);
	const double stddev = utils::Statistics::sampleStdDev(values);
	if (!(stddev > flatness_tolerance_ * std::max(1.0, std::abs(mean)))) {
		TELEPULSE_WARN("Periodicity analysis skipped: series '{}' has zero variance.", ts.label());
		throw core::DegeneratePeriodError("Constant series has no dominant period.");
	}

	const auto spacing = ts.frequency().value_or(sample_spacing_);
	const double spacing_minutes = std::chrono::duration<double, std::ratio<60>>(spacing).count();

	PeriodicityResult result;
	result.spectrum = spectrum(values, spacing_minutes);
	result.dominant_bin = result.spectrum.peakBin();
	double energy = 0.0;
	for (double magnitude : result.spectrum.magnitudes) {
		energy += magnitude * magnitude;
	}
	if (result.dominant_bin == 0 ||
	    !(result.spectrum.magnitudes[result.dominant_bin] > flatness_tolerance_ * std::sqrt(energy))) {
		throw core::DegeneratePeriodError("Spectrum carries no energy outside the DC bin.");
	}

	result.dominant_frequency = result.spectrum.frequencies[result.dominant_bin];
	result.period_minutes = 1.0 / result.dominant_frequency;
	result.period_hours = result.period_minutes / 60.0;

	TELEPULSE_INFO("Dominant period of '{}': {:.3f} h (bin {} of {}).", ts.label(), result.period_hours,
	               result.dominant_bin, result.spectrum.size());
	return result;
}

} // namespace telepulse::seasonality
