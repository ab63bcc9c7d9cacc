#include "telepulse/detectors/ioutlier_detector.hpp"

#include <stdexcept>

namespace telepulse::detectors {

std::size_t overlapCount(const OutlierResult &lhs, const OutlierResult &rhs) {
	if (lhs.flags.size() != rhs.flags.size()) {
		throw std::invalid_argument("Outlier flag sets must be aligned to compute their overlap.");
	}
	std::size_t overlap = 0;
	for (std::size_t i = 0; i < lhs.flags.size(); ++i) {
		if (lhs.flags[i] && rhs.flags[i]) {
			++overlap;
		}
	}
	return overlap;
}

} // namespace telepulse::detectors
