#pragma once

#include <cmath>
#include <cstddef>
#include <random>
#include <vector>

namespace tests::fixtures {

constexpr double kPi = 3.14159265358979323846;
constexpr std::size_t kMinutesPerDay = 1440;

/// Two days of constant residency with one spike.
inline std::vector<double> constantWithSpike(std::size_t spike_index, std::size_t length = 2 * kMinutesPerDay,
                                             double base = 50.0, double spike = 95.0) {
	std::vector<double> data(length, base);
	data[spike_index] = spike;
	return data;
}

inline std::vector<double> sineWave(std::size_t length, double period, double amplitude = 1.0, double offset = 0.0) {
	std::vector<double> data(length);
	for (std::size_t i = 0; i < length; ++i) {
		data[i] = offset + amplitude * std::sin(2.0 * kPi * static_cast<double>(i) / period);
	}
	return data;
}

/// Per-minute residency with a daily cycle peaking at noon, gaussian noise and a few injected incidents.
inline std::vector<double> residencySignal(std::size_t days = 2, unsigned seed = 7) {
	std::mt19937 rng(seed);
	std::normal_distribution<double> noise(0.0, 1.0);

	std::vector<double> data;
	data.reserve(days * kMinutesPerDay);
	for (std::size_t i = 0; i < days * kMinutesPerDay; ++i) {
		const double minute_of_day = static_cast<double>(i % kMinutesPerDay);
		double value = 60.0 + 20.0 * std::sin(2.0 * kPi * (minute_of_day - 360.0) / kMinutesPerDay) + noise(rng);
		if (i == 700 || i == 2100) {
			value += 45.0;
		}
		data.push_back(value);
	}
	return data;
}

inline const std::vector<std::size_t> &residencyIncidents() {
	static const std::vector<std::size_t> indices{700, 2100};
	return indices;
}

} // namespace tests::fixtures
