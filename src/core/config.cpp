#include "telepulse/core/config.hpp"

#include <stdexcept>

namespace telepulse::core {

namespace {
constexpr std::chrono::seconds kOneDay{86400};
constexpr std::chrono::seconds kOneHour{3600};
} // namespace

void AnalyticsConfig::validate() const {
	if (cadence <= std::chrono::seconds::zero()) {
		throw std::invalid_argument("Cadence must be positive.");
	}
	if (!(zscore_threshold > 0.0)) {
		throw std::invalid_argument("Z-score threshold must be positive.");
	}
	if (!(contamination > 0.0 && contamination <= 0.5)) {
		throw std::invalid_argument("Contamination must be in (0, 0.5].");
	}
	if (n_trees == 0) {
		throw std::invalid_argument("Isolation forest requires at least one tree.");
	}
	if (subsample_size && *subsample_size < 2) {
		throw std::invalid_argument("Isolation forest subsample size must be at least 2.");
	}
	if (aroon_window && *aroon_window == 0) {
		throw std::invalid_argument("Aroon window must be at least 1.");
	}
	if (rolling_window && *rolling_window == 0) {
		throw std::invalid_argument("Rolling window must be at least 1.");
	}
}

std::size_t AnalyticsConfig::samplesPer(std::chrono::seconds span) const {
	if (cadence <= std::chrono::seconds::zero()) {
		throw std::invalid_argument("Cadence must be positive.");
	}
	const auto count = span / cadence;
	return count > 0 ? static_cast<std::size_t>(count) : 1;
}

std::size_t AnalyticsConfig::aroonWindow() const {
	return aroon_window.value_or(samplesPer(kOneDay));
}

std::size_t AnalyticsConfig::rollingWindow() const {
	return rolling_window.value_or(samplesPer(kOneHour));
}

} // namespace telepulse::core
