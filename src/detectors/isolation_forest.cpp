#include "telepulse/detectors/isolation_forest.hpp"

#include "telepulse/utils/logging.hpp"
#include "telepulse/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>
#include <stdexcept>

namespace telepulse::detectors {

namespace {

constexpr std::size_t kDefaultSubsampleSize = 256;
constexpr double kEulerGamma = 0.5772156649015329;

struct IsolationNode {
	double threshold = 0.0;
	std::size_t left = 0;
	std::size_t right = 0;
	std::size_t size = 0;
	bool leaf = true;
};

// A single isolation tree stored as a flat node array; node 0 is the root.
class IsolationTree {
public:
	IsolationTree(std::vector<double> sample, std::size_t max_depth, std::mt19937_64 &rng) {
		nodes_.reserve(2 * sample.size());
		grow(sample.begin(), sample.end(), 0, max_depth, rng);
	}

	double pathLength(double value) const {
		std::size_t index = 0;
		std::size_t depth = 0;
		while (!nodes_[index].leaf) {
			index = value <= nodes_[index].threshold ? nodes_[index].left : nodes_[index].right;
			++depth;
		}
		return static_cast<double>(depth) + IsolationForestDetector::averagePathLength(nodes_[index].size);
	}

private:
	using Iter = std::vector<double>::iterator;

	std::size_t grow(Iter begin, Iter end, std::size_t depth, std::size_t max_depth, std::mt19937_64 &rng) {
		const auto index = nodes_.size();
		nodes_.emplace_back();
		nodes_[index].size = static_cast<std::size_t>(end - begin);

		if (nodes_[index].size <= 1 || depth >= max_depth) {
			return index;
		}
		const auto [min_it, max_it] = std::minmax_element(begin, end);
		const double lo = *min_it;
		const double hi = *max_it;
		if (!(lo < hi)) {
			return index;
		}

		std::uniform_real_distribution<double> split(lo, hi);
		const double threshold = split(rng);
		const auto middle = std::partition(begin, end, [threshold](double v) { return v <= threshold; });

		nodes_[index].leaf = false;
		nodes_[index].threshold = threshold;
		const auto left = grow(begin, middle, depth + 1, max_depth, rng);
		nodes_[index].left = left;
		const auto right = grow(middle, end, depth + 1, max_depth, rng);
		nodes_[index].right = right;
		return index;
	}

	std::vector<IsolationNode> nodes_;
};

} // namespace

// --- Detector Implementation ---

IsolationForestDetector::IsolationForestDetector(double contamination, std::uint64_t seed, std::size_t n_trees,
                                                 std::optional<std::size_t> subsample_size)
    : contamination_(contamination), seed_(seed), n_trees_(n_trees), subsample_size_(subsample_size) {
	if (!(contamination_ > 0.0 && contamination_ <= 0.5)) {
		throw std::invalid_argument("Contamination must be in (0, 0.5].");
	}
	if (n_trees_ == 0) {
		throw std::invalid_argument("Isolation forest requires at least one tree.");
	}
	if (subsample_size_ && *subsample_size_ < 2) {
		throw std::invalid_argument("Subsample size must be at least 2.");
	}
}

double IsolationForestDetector::averagePathLength(std::size_t n) {
	if (n <= 1) {
		return 0.0;
	}
	if (n == 2) {
		return 1.0;
	}
	const double m = static_cast<double>(n);
	return 2.0 * (std::log(m - 1.0) + kEulerGamma) - 2.0 * (m - 1.0) / m;
}

std::vector<double> IsolationForestDetector::scoreSamples(const std::vector<double> &values) const {
	const std::size_t n = values.size();
	std::vector<double> scores(n, 0.0);
	if (n == 0) {
		return scores;
	}

	const std::size_t psi = std::min(subsample_size_.value_or(kDefaultSubsampleSize), n);
	const auto max_depth = static_cast<std::size_t>(std::ceil(std::log2(std::max<double>(psi, 2.0))));

	std::mt19937_64 rng(seed_);
	std::vector<std::size_t> order(n);
	std::iota(order.begin(), order.end(), 0);
	std::vector<double> depth_sums(n, 0.0);

	for (std::size_t t = 0; t < n_trees_; ++t) {
		// Partial Fisher-Yates shuffle: the first psi entries form the subsample.
		std::vector<double> sample;
		sample.reserve(psi);
		for (std::size_t i = 0; i < psi; ++i) {
			std::uniform_int_distribution<std::size_t> pick(i, n - 1);
			std::swap(order[i], order[pick(rng)]);
			sample.push_back(values[order[i]]);
		}

		const IsolationTree tree(std::move(sample), max_depth, rng);
		for (std::size_t i = 0; i < n; ++i) {
			depth_sums[i] += tree.pathLength(values[i]);
		}
	}

	const double normalizer = averagePathLength(psi);
	for (std::size_t i = 0; i < n; ++i) {
		const double mean_depth = depth_sums[i] / static_cast<double>(n_trees_);
		scores[i] = -std::pow(2.0, -mean_depth / normalizer);
	}

	TELEPULSE_DEBUG("Isolation forest fitted {} trees on subsamples of {} (max depth {}).", n_trees_, psi,
	                max_depth);
	return scores;
}

OutlierResult IsolationForestDetector::detect(const core::TimeSeries &ts) const {
	const auto &values = ts.getValues();
	if (values.size() < 2) {
		TELEPULSE_WARN("IsolationForestDetector requires at least 2 data points. Returning no outliers.");
		return OutlierResult::fromFlags(std::vector<bool>(values.size(), false));
	}

	auto scores = scoreSamples(values);
	const double threshold = utils::Statistics::percentile(scores, 100.0 * contamination_);

	std::vector<bool> flags(values.size(), false);
	for (std::size_t i = 0; i < values.size(); ++i) {
		flags[i] = scores[i] < threshold;
	}

	auto result = OutlierResult::fromFlags(std::move(flags));
	result.scores = std::move(scores);
	result.threshold = threshold;
	TELEPULSE_INFO("IsolationForestDetector found {} outliers (contamination={}, threshold={:.6f}).",
	               result.count(), contamination_, threshold);
	return result;
}

// --- Builder Implementation ---

IsolationForestBuilder &IsolationForestBuilder::withContamination(double contamination) {
	if (!(contamination > 0.0 && contamination <= 0.5)) {
		throw std::invalid_argument("contamination must be in (0, 0.5]");
	}
	contamination_ = contamination;
	return *this;
}

IsolationForestBuilder &IsolationForestBuilder::withSeed(std::uint64_t seed) {
	seed_ = seed;
	return *this;
}

IsolationForestBuilder &IsolationForestBuilder::withTrees(std::size_t n_trees) {
	if (n_trees < 1) {
		throw std::invalid_argument("n_trees must be at least 1");
	}
	n_trees_ = n_trees;
	return *this;
}

IsolationForestBuilder &IsolationForestBuilder::withSubsampleSize(std::size_t subsample_size) {
	if (subsample_size < 2) {
		throw std::invalid_argument("subsample_size must be at least 2");
	}
	subsample_size_ = subsample_size;
	return *this;
}

std::unique_ptr<IsolationForestDetector> IsolationForestBuilder::build() const {
	TELEPULSE_DEBUG("Building IsolationForestDetector with contamination {} and seed {}.", contamination_, seed_);
	return std::unique_ptr<IsolationForestDetector>(
	    new IsolationForestDetector(contamination_, seed_, n_trees_, subsample_size_));
}

} // namespace telepulse::detectors
