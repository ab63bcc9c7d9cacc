#include "telepulse/pipeline/summary.hpp"

#include <iomanip>
#include <sstream>

namespace telepulse::pipeline {

namespace {

template <typename T>
void printField(std::ostringstream &out, const char *label, const std::optional<T> &value, const char *unit = "") {
	out << "  " << std::left << std::setw(22) << label << ": ";
	if (value) {
		out << *value << unit;
	} else {
		out << "n/a";
	}
	out << '\n';
}

void printHour(std::ostringstream &out, const char *label, const std::optional<int> &hour) {
	out << "  " << std::left << std::setw(22) << label << ": ";
	if (hour) {
		out << std::right << std::setw(2) << std::setfill('0') << *hour << ":00" << std::setfill(' ');
	} else {
		out << "n/a";
	}
	out << '\n';
}

} // namespace

ReportSummary summarize(const MetricsReport &report) {
	ReportSummary summary;
	summary.system = report.system;
	summary.samples = report.series.size();
	summary.mean_value = report.mean_value;
	if (report.zscore) {
		summary.zscore_anomalies = report.zscore->count();
		summary.zscore_rate_pct = report.zscore->rate() * 100.0;
	}
	if (report.isolation) {
		summary.isolation_anomalies = report.isolation->count();
		summary.isolation_rate_pct = report.isolation->rate() * 100.0;
	}
	summary.shared_anomalies = report.overlap;
	summary.period_hours = report.periodHours();
	summary.peak_hour = report.peakHour();
	summary.trough_hour = report.troughHour();
	summary.trend_reversals = report.reversalCount();
	return summary;
}

std::string formatSummary(const ReportSummary &summary) {
	std::ostringstream out;
	out << "System: " << summary.system << " (" << summary.samples << " samples)\n";
	out << std::fixed << std::setprecision(1);
	out << "  " << std::left << std::setw(22) << "Mean residency" << ": " << summary.mean_value << "%\n";
	printField(out, "Z-score anomalies", summary.zscore_anomalies);
	printField(out, "Z-score anomaly rate", summary.zscore_rate_pct, "%");
	printField(out, "ML anomalies", summary.isolation_anomalies);
	printField(out, "ML anomaly rate", summary.isolation_rate_pct, "%");
	printField(out, "Shared anomalies", summary.shared_anomalies);
	printField(out, "Dominant cycle", summary.period_hours, " h");
	printHour(out, "Peak time", summary.peak_hour);
	printHour(out, "Trough time", summary.trough_hour);
	printField(out, "Trend reversals", summary.trend_reversals);
	return out.str();
}

} // namespace telepulse::pipeline
