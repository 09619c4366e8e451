#pragma once
#include "define.h"

// aggregate jiffies of the "cpu" line in /proc/stat
struct CpuTimes
{
	uint64_t busy{};
	uint64_t total{};
};

class CpuProbe
{
public:
	virtual ~CpuProbe() = default;

	// host-wide utilization in percent since the previous call, 0 on the first call
	virtual double Sample() = 0;
};

class ProcStatCpuProbe : public CpuProbe
{
public:
	explicit ProcStatCpuProbe(const std::string &path = "/proc/stat");

	double Sample() override;

	static bool ParseCpuLine(const std::string &line, CpuTimes &out);
	static double Utilization(const CpuTimes &prev, const CpuTimes &cur);

private:
	bool _Read(CpuTimes &out) const;

	std::string m_path;
	CpuTimes m_prev;
	bool m_has_prev{false};
};
