#pragma once

#include "telepulse/pipeline/metrics_report.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace telepulse::pipeline {

/**
 * @struct ReportSummary
 * @brief Headline numbers of a report, flattened for display collaborators.
 *
 * Rates are percentages. Fields of failed analyzers stay empty.
 */
struct ReportSummary {
	std::string system;
	std::size_t samples = 0;
	double mean_value = 0.0;
	std::optional<std::size_t> zscore_anomalies;
	std::optional<double> zscore_rate_pct;
	std::optional<std::size_t> isolation_anomalies;
	std::optional<double> isolation_rate_pct;
	std::optional<std::size_t> shared_anomalies;
	std::optional<double> period_hours;
	std::optional<int> peak_hour;
	std::optional<int> trough_hour;
	std::optional<std::size_t> trend_reversals;
};

ReportSummary summarize(const MetricsReport &report);

/// Plain multi-line rendering of the summary; "n/a" marks absent fields.
std::string formatSummary(const ReportSummary &summary);

} // namespace telepulse::pipeline
