#include "SummaryReporter.h"
#include "Logger.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdio>
#include <fstream>
using json = nlohmann::json;

SummaryReport SummaryReporter::Summarize(const std::vector<MetricsSample> &samples)
{
    SummaryReport report;
    report.samples = samples.size();
    if (samples.empty())
        return report;

    const MetricsSample &last = samples.back();
    report.syn_total = last.syn_total;
    report.syn_blocked = last.syn_dropped;
    report.syn_accepted = last.syn_total >= last.syn_dropped ? last.syn_total - last.syn_dropped : 0;
    report.blocked_sources = last.blocked_sources;
    report.duration_sec = last.offset_sec;

    if (report.syn_total > 0)
        report.success_rate_pct = (double)report.syn_accepted / (double)report.syn_total * 100.0;

    double cpu_sum = 0.0;
    double pps_sum = 0.0;
    std::vector<double> pps_values;
    pps_values.reserve(samples.size());
    for (const auto &s : samples)
    {
        cpu_sum += s.cpu_pct;
        pps_sum += (double)s.pps;
        pps_values.push_back((double)s.pps);
        report.peak_pps = std::max(report.peak_pps, s.pps);
    }
    report.avg_cpu_pct = cpu_sum / samples.size();
    report.avg_pps = pps_sum / samples.size();
    report.p95_pps = Percentile95(std::move(pps_values));

    return report;
}

double SummaryReporter::Percentile95(std::vector<double> values)
{
    const long n = 20;
    const long i = 19;
    const long ld = (long)values.size();
    if (ld < 2)
        return 0.0;

    std::sort(values.begin(), values.end());

    long m = ld + 1;
    long j = i * m / n;
    if (j < 1)
        j = 1;
    else if (j > ld - 1)
        j = ld - 1;
    long delta = i * m - j * n;

    return (values[j - 1] * (double)(n - delta) + values[j] * (double)delta) / (double)n;
}

std::vector<std::pair<std::string, double>> SummaryReporter::ToKeyValues(const SummaryReport &report)
{
    return {
        {"syn_total", (double)report.syn_total},
        {"syn_blocked", (double)report.syn_blocked},
        {"syn_accepted", (double)report.syn_accepted},
        {"success_rate_pct", report.success_rate_pct},
        {"avg_cpu_pct", report.avg_cpu_pct},
        {"avg_pps", report.avg_pps},
        {"p95_pps", report.p95_pps},
        {"peak_pps", (double)report.peak_pps},
        {"blocked_sources", (double)report.blocked_sources},
        {"duration_sec", report.duration_sec},
        {"samples", (double)report.samples},
    };
}

void SummaryReporter::Print(const SummaryReport &report, const std::string &title)
{
    printf("\n=== %s ===\n", title.c_str());
    printf("%18s %14s\n", "Metric", "Value");
    printf("%18s %14llu\n", "SYN Total", (unsigned long long)report.syn_total);
    printf("%18s %14llu\n", "SYN Blocked", (unsigned long long)report.syn_blocked);
    printf("%18s %14llu\n", "SYN Accepted", (unsigned long long)report.syn_accepted);
    printf("%18s %14.2f\n", "Success Rate (%)", report.success_rate_pct);
    printf("%18s %14.2f\n", "Avg CPU (%)", report.avg_cpu_pct);
    printf("%18s %14.2f\n", "Avg PPS", report.avg_pps);
    printf("%18s %14.2f\n", "P95 PPS", report.p95_pps);
    printf("%18s %14llu\n", "Peak PPS", (unsigned long long)report.peak_pps);
    printf("%18s %14llu\n", "Blocked Sources", (unsigned long long)report.blocked_sources);
    printf("%18s %14.1f\n", "Duration (s)", report.duration_sec);
    fflush(stdout);
}

bool SummaryReporter::WriteJson(const std::string &path, const SummaryReport &report)
{
    json j;
    for (const auto &[name, value] : ToKeyValues(report))
        j[name] = value;
    // counters stay integral in the file
    j["syn_total"] = report.syn_total;
    j["syn_blocked"] = report.syn_blocked;
    j["syn_accepted"] = report.syn_accepted;
    j["peak_pps"] = report.peak_pps;
    j["blocked_sources"] = report.blocked_sources;
    j["samples"] = report.samples;

    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open())
    {
        LogMsg(LOG_ERROR, "[Report] can not write %s", path.c_str());
        return false;
    }
    file << j.dump(2) << std::endl;
    LogMsg(LOG_INFO, "[Report] summary saved to %s", path.c_str());
    return true;
}

bool SummaryReporter::WriteCsv(const std::string &path, const std::vector<MetricsSample> &samples)
{
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open())
    {
        LogMsg(LOG_ERROR, "[Report] can not write %s", path.c_str());
        return false;
    }

    file << "time_s,syn_total,syn_dropped,cpu_pct,pps,blocked_sources\n";
    char line[160];
    for (const auto &s : samples)
    {
        snprintf(line, sizeof(line), "%.3f,%llu,%llu,%.2f,%llu,%llu\n", s.offset_sec,
                 (unsigned long long)s.syn_total, (unsigned long long)s.syn_dropped, s.cpu_pct,
                 (unsigned long long)s.pps, (unsigned long long)s.blocked_sources);
        file << line;
    }
    LogMsg(LOG_INFO, "[Report] %zu samples saved to %s", samples.size(), path.c_str());
    return true;
}
