#include "telepulse/indicators/aroon.hpp"

#include "telepulse/core/errors.hpp"
#include "telepulse/utils/logging.hpp"

#include <deque>
#include <limits>
#include <stdexcept>

namespace telepulse::indicators {

AroonIndicator::AroonIndicator(std::size_t window) : window_(window) {
	if (window_ == 0) {
		throw std::invalid_argument("Aroon window must be at least 1.");
	}
}

AroonIndicator AroonIndicator::Builder::build() const {
	return AroonIndicator(window_);
}

AroonIndicator::Builder AroonIndicator::builder() {
	return Builder();
}

AroonResult AroonIndicator::compute(const std::vector<double> &values) const {
	const std::size_t n = values.size();
	if (n < window_) {
		throw core::InsufficientWindowError(n, window_);
	}

	AroonResult result;
	result.window = window_;
	result.first_defined = window_ - 1;
	result.up.assign(n, std::numeric_limits<double>::quiet_NaN());
	result.down.assign(n, std::numeric_limits<double>::quiet_NaN());

	// Monotonic deques of candidate extremes. Equal values evict older entries,
	// so the front always holds the most recent occurrence of the extreme.
	std::deque<std::size_t> maxima;
	std::deque<std::size_t> minima;
	const double scale = 100.0 / static_cast<double>(window_);

	for (std::size_t i = 0; i < n; ++i) {
		while (!maxima.empty() && values[maxima.back()] <= values[i]) {
			maxima.pop_back();
		}
		maxima.push_back(i);
		while (!minima.empty() && values[minima.back()] >= values[i]) {
			minima.pop_back();
		}
		minima.push_back(i);

		if (i + 1 < window_) {
			continue;
		}
		const std::size_t window_start = i + 1 - window_;
		while (maxima.front() < window_start) {
			maxima.pop_front();
		}
		while (minima.front() < window_start) {
			minima.pop_front();
		}

		const std::size_t since_max = i - maxima.front();
		const std::size_t since_min = i - minima.front();
		result.up[i] = scale * static_cast<double>(window_ - 1 - since_max);
		result.down[i] = scale * static_cast<double>(window_ - 1 - since_min);

		if (i > result.first_defined && result.up[i] > result.down[i] && result.up[i - 1] <= result.down[i - 1]) {
			result.reversal_indices.push_back(i);
		}
	}

	result.reversals = result.reversal_indices.size();
	TELEPULSE_DEBUG("Aroon indicator over window {} found {} bullish crossovers.", window_, result.reversals);
	return result;
}

AroonResult AroonIndicator::detectReversals(const core::TimeSeries &ts) const {
	try {
		auto result = compute(ts.getValues());
		TELEPULSE_INFO("Trend reversals in '{}': {} over {} samples.", ts.label(), result.reversals, ts.size());
		return result;
	} catch (const core::InsufficientWindowError &e) {
		TELEPULSE_WARN("Aroon indicator skipped for '{}': {}", ts.label(), e.what());
		AroonResult result;
		result.window = window_;
		result.first_defined = window_ - 1;
		result.up.assign(ts.size(), std::numeric_limits<double>::quiet_NaN());
		result.down.assign(ts.size(), std::numeric_limits<double>::quiet_NaN());
		result.insufficient_history = true;
		return result;
	}
}

} // namespace telepulse::indicators
