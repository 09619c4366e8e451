#pragma once
#include "define.h"
#include "MetricsSampler.h"

struct SummaryReport
{
	uint64_t syn_total{};
	uint64_t syn_blocked{};
	uint64_t syn_accepted{};
	double success_rate_pct{};  // 0 when nothing was observed
	double avg_cpu_pct{};
	double avg_pps{};
	double p95_pps{};
	uint64_t peak_pps{};
	uint64_t blocked_sources{};
	double duration_sec{};
	size_t samples{};
};

// End-of-run aggregation over the sample series. Pure functions, the
// writers only format what Summarize produced.
class SummaryReporter
{
public:
	static SummaryReport Summarize(const std::vector<MetricsSample> &samples);

	// flat (name, value) list in report order
	static std::vector<std::pair<std::string, double>> ToKeyValues(const SummaryReport &report);

	static void Print(const SummaryReport &report, const std::string &title);
	static bool WriteJson(const std::string &path, const SummaryReport &report);
	static bool WriteCsv(const std::string &path, const std::vector<MetricsSample> &samples);

	// 19th cut point of 20 quantiles (exclusive method), 0 below two values
	static double Percentile95(std::vector<double> values);
};
