#include "telepulse/detectors/zscore.hpp"

#include "telepulse/utils/logging.hpp"
#include "telepulse/utils/statistics.hpp"

#include <cmath>
#include <stdexcept>

namespace telepulse::detectors {

using utils::Statistics;

// --- Detector Implementation ---

ZScoreDetector::ZScoreDetector(double threshold) : threshold_(threshold) {
	if (!(threshold_ > 0.0)) {
		throw std::invalid_argument("Threshold must be positive.");
	}
}

OutlierResult ZScoreDetector::detect(const core::TimeSeries &ts) const {
	const auto &values = ts.getValues();
	std::vector<bool> flags(values.size(), false);
	if (values.size() < 2) {
		TELEPULSE_WARN("ZScoreDetector requires at least 2 data points. Returning no outliers.");
		return OutlierResult::fromFlags(std::move(flags));
	}

	const double mean = Statistics::mean(values);
	const double stddev = Statistics::sampleStdDev(values);

	// A constant series has no deviation to flag.
	if (!(stddev > 0.0) || !std::isfinite(stddev)) {
		TELEPULSE_INFO("Standard deviation is zero. No outliers will be detected.");
		return OutlierResult::fromFlags(std::move(flags));
	}

	for (std::size_t i = 0; i < values.size(); ++i) {
		const double z = std::abs(values[i] - mean) / stddev;
		flags[i] = z > threshold_;
	}

	auto result = OutlierResult::fromFlags(std::move(flags));
	TELEPULSE_INFO("ZScoreDetector found {} outliers (mean={:.4f}, std={:.4f}).", result.count(), mean, stddev);
	return result;
}

// --- Builder Implementation ---

ZScoreDetectorBuilder &ZScoreDetectorBuilder::withThreshold(double threshold) {
	threshold_ = threshold;
	return *this;
}

std::unique_ptr<ZScoreDetector> ZScoreDetectorBuilder::build() const {
	TELEPULSE_DEBUG("Building ZScoreDetector with threshold {}.", threshold_);
	return std::unique_ptr<ZScoreDetector>(new ZScoreDetector(threshold_));
}

} // namespace telepulse::detectors
