#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace telepulse::core {

/**
 * @struct AnalyticsConfig
 * @brief Parameters threaded explicitly into every analytics stage.
 *
 * Window lengths left unset are derived from the resampling cadence so that
 * "one day" and "one hour" keep their meaning when the cadence changes.
 */
struct AnalyticsConfig {
	std::chrono::seconds cadence{60};

	// z-score detector
	double zscore_threshold = 3.0;

	// isolation forest detector
	double contamination = 0.01;
	std::uint64_t seed = 42;
	std::size_t n_trees = 100;
	std::optional<std::size_t> subsample_size;

	// Aroon window in samples; defaults to one day of samples.
	std::optional<std::size_t> aroon_window;

	// Rolling mean window in samples; defaults to one hour of samples.
	std::optional<std::size_t> rolling_window;

	// Run the analyzers concurrently.
	bool parallel = true;

	/**
	 * @brief Checks every parameter.
	 * @throws std::invalid_argument on the first invalid parameter.
	 */
	void validate() const;

	std::size_t aroonWindow() const;
	std::size_t rollingWindow() const;

	/// Number of samples spanning the given duration at this cadence (at least 1).
	std::size_t samplesPer(std::chrono::seconds span) const;
};

} // namespace telepulse::core
