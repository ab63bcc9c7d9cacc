#pragma once

#include "telepulse/core/time_series.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace telepulse::detectors {

/**
 * @struct OutlierResult
 * @brief Holds the results of an outlier detection operation.
 */
struct OutlierResult {
	/// One flag per position of the analysed series.
	std::vector<bool> flags;
	/// Positions of the flagged samples, ascending.
	std::vector<std::size_t> outlier_indices;
	/// Per-sample scores, when the detector produces them.
	std::vector<double> scores;
	/// Decision threshold applied to the scores, when the detector fits one.
	std::optional<double> threshold;

	std::size_t count() const {
		return outlier_indices.size();
	}

	/// Fraction of flagged samples; 0 for an empty series.
	double rate() const {
		return flags.empty() ? 0.0 : static_cast<double>(count()) / static_cast<double>(flags.size());
	}

	/// Builds the result from a flag vector, deriving the index list.
	static OutlierResult fromFlags(std::vector<bool> flags) {
		OutlierResult result;
		for (std::size_t i = 0; i < flags.size(); ++i) {
			if (flags[i]) {
				result.outlier_indices.push_back(i);
			}
		}
		result.flags = std::move(flags);
		return result;
	}
};

/**
 * @brief Counts the positions flagged by both results.
 * @throws std::invalid_argument If the flag sets are not aligned.
 */
std::size_t overlapCount(const OutlierResult &lhs, const OutlierResult &rhs);

/**
 * @class IOutlierDetector
 * @brief An interface for all point outlier detection algorithms.
 */
class IOutlierDetector {
public:
	virtual ~IOutlierDetector() = default;

	/**
	 * @brief Detects outliers in the given time series.
	 * @param ts The time series data to analyze.
	 * @return An OutlierResult aligned with the series.
	 */
	virtual OutlierResult detect(const core::TimeSeries &ts) const = 0;

	/**
	 * @brief Gets the name of the outlier detector.
	 */
	virtual std::string getName() const = 0;
};

} // namespace telepulse::detectors
