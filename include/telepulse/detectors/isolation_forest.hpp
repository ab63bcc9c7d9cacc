#pragma once

#include "telepulse/detectors/ioutlier_detector.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace telepulse::detectors {

class IsolationForestBuilder; // Forward declaration

/**
 * @class IsolationForestDetector
 * @brief Unsupervised outlier detector isolating samples by random partitioning.
 *
 * Every sample is treated as an independent single-feature observation. Each
 * tree is grown on a random subsample by splitting the value axis at uniform
 * random thresholds; samples that are isolated after few splits receive low
 * scores. The decision threshold is the contamination percentile of the
 * training scores and samples scoring strictly below it are flagged.
 *
 * Results are deterministic for a given series and seed.
 */
class IsolationForestDetector final : public IOutlierDetector {
public:
	friend class IsolationForestBuilder;

	OutlierResult detect(const core::TimeSeries &ts) const override;
	std::string getName() const override {
		return "IsolationForestDetector";
	}

	/**
	 * @brief Computes the anomaly score of every value, higher meaning more normal.
	 *
	 * Scores lie in [-1, 0). The forest is fitted on the same values.
	 */
	std::vector<double> scoreSamples(const std::vector<double> &values) const;

	double contamination() const noexcept {
		return contamination_;
	}

	std::uint64_t seed() const noexcept {
		return seed_;
	}

	std::size_t trees() const noexcept {
		return n_trees_;
	}

	/**
	 * @brief Expected path length of an unsuccessful search in a binary search tree of n items.
	 */
	static double averagePathLength(std::size_t n);

private:
	IsolationForestDetector(double contamination, std::uint64_t seed, std::size_t n_trees,
	                        std::optional<std::size_t> subsample_size);

	double contamination_;
	std::uint64_t seed_;
	std::size_t n_trees_;
	std::optional<std::size_t> subsample_size_;
};

/**
 * @class IsolationForestBuilder
 * @brief Fluent builder for configuring the isolation forest detector.
 */
class IsolationForestBuilder {
public:
	IsolationForestBuilder &withContamination(double contamination);
	IsolationForestBuilder &withSeed(std::uint64_t seed);
	IsolationForestBuilder &withTrees(std::size_t n_trees);

	/// Samples drawn per tree; defaults to min(256, series length).
	IsolationForestBuilder &withSubsampleSize(std::size_t subsample_size);

	std::unique_ptr<IsolationForestDetector> build() const;

private:
	double contamination_ = 0.01;
	std::uint64_t seed_ = 42;
	std::size_t n_trees_ = 100;
	std::optional<std::size_t> subsample_size_;
};

} // namespace telepulse::detectors
