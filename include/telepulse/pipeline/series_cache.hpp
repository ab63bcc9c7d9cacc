#pragma once

#include "telepulse/core/time_series.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <tuple>
#include <vector>

namespace telepulse::pipeline {

struct SeriesKey {
	std::string source;
	std::string system;
	std::chrono::seconds cadence{60};

	bool operator<(const SeriesKey &other) const {
		return std::tie(source, system, cadence) < std::tie(other.source, other.system, other.cadence);
	}
};

/**
 * @class SeriesCache
 * @brief Thread-safe read-through cache of resampled series.
 *
 * Cached series are immutable and shared, so concurrent runs over the same
 * (source, system, cadence) reuse one resampling result.
 */
class SeriesCache {
public:
	using SeriesPtr = std::shared_ptr<const core::TimeSeries>;

	/**
	 * @brief Returns the cached series for key, resampling samples on a miss.
	 * @throws core::EmptyInputError If resampling finds no usable sample.
	 */
	SeriesPtr getOrResample(const SeriesKey &key, const std::vector<core::Sample> &samples);

	/// Returns the cached series, or nullptr on a miss.
	SeriesPtr find(const SeriesKey &key) const;

	void clear();
	std::size_t size() const;

private:
	mutable std::mutex mutex_;
	std::map<SeriesKey, SeriesPtr> entries_;
};

} // namespace telepulse::pipeline
