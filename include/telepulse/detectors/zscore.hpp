#pragma once

#include "telepulse/detectors/ioutlier_detector.hpp"

#include <memory>

namespace telepulse::detectors {

class ZScoreDetectorBuilder; // Forward declaration

/**
 * @class ZScoreDetector
 * @brief An outlier detector based on the global standard score.
 *
 * Mean and standard deviation are estimated once over the whole series,
 * including the samples that end up flagged. A sample is an outlier when its
 * absolute z-score strictly exceeds the threshold.
 */
class ZScoreDetector final : public IOutlierDetector {
public:
	friend class ZScoreDetectorBuilder;

	OutlierResult detect(const core::TimeSeries &ts) const override;
	std::string getName() const override {
		return "ZScoreDetector";
	}

	double threshold() const noexcept {
		return threshold_;
	}

private:
	/**
	 * @brief Private constructor for ZScoreDetector.
	 * @param threshold The number of standard deviations away from the mean.
	 */
	explicit ZScoreDetector(double threshold);

	double threshold_;
};

/**
 * @class ZScoreDetectorBuilder
 * @brief A builder for fluently configuring and creating ZScoreDetector instances.
 */
class ZScoreDetectorBuilder {
public:
	/**
	 * @brief Sets the threshold for outlier detection.
	 * @param threshold The number of standard deviations from the mean.
	 * @return A reference to the builder for chaining.
	 */
	ZScoreDetectorBuilder &withThreshold(double threshold);

	/**
	 * @brief Creates a new ZScoreDetector instance.
	 * @throws std::invalid_argument If the threshold is not positive.
	 */
	std::unique_ptr<ZScoreDetector> build() const;

private:
	double threshold_ = 3.0;
};

} // namespace telepulse::detectors
