#include "telepulse/pipeline/series_cache.hpp"

#include "telepulse/resample/resampler.hpp"
#include "telepulse/utils/logging.hpp"

namespace telepulse::pipeline {

SeriesCache::SeriesPtr SeriesCache::getOrResample(const SeriesKey &key, const std::vector<core::Sample> &samples) {
	if (auto cached = find(key)) {
		TELEPULSE_DEBUG("Series cache hit for '{}/{}'.", key.source, key.system);
		return cached;
	}

	// Resample outside the lock; a concurrent miss for the same key keeps the first insert.
	const resample::Resampler resampler(key.cadence);
	auto series = std::make_shared<const core::TimeSeries>(resampler.resample(samples, key.system));

	std::lock_guard<std::mutex> lock(mutex_);
	const auto inserted = entries_.emplace(key, std::move(series));
	TELEPULSE_DEBUG("Series cache {} for '{}/{}' ({} entries).", inserted.second ? "filled" : "raced", key.source,
	                key.system, entries_.size());
	return inserted.first->second;
}

SeriesCache::SeriesPtr SeriesCache::find(const SeriesKey &key) const {
	std::lock_guard<std::mutex> lock(mutex_);
	const auto it = entries_.find(key);
	return it == entries_.end() ? nullptr : it->second;
}

void SeriesCache::clear() {
	std::lock_guard<std::mutex> lock(mutex_);
	entries_.clear();
}

std::size_t SeriesCache::size() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return entries_.size();
}

} // namespace telepulse::pipeline
