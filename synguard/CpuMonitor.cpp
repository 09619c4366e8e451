#include "CpuMonitor.h"
#include "Logger.h"
#include <fstream>
#include <sstream>

ProcStatCpuProbe::ProcStatCpuProbe(const std::string &path) : m_path(path)
{
}

double ProcStatCpuProbe::Sample()
{
    CpuTimes cur;
    if (!_Read(cur))
        return 0.0;

    double pct = m_has_prev ? Utilization(m_prev, cur) : 0.0;
    m_prev = cur;
    m_has_prev = true;
    return pct;
}

bool ProcStatCpuProbe::_Read(CpuTimes &out) const
{
    std::ifstream file(m_path);
    if (!file.is_open())
    {
        LogMsg(LOG_WARN, "[Cpu] can not open %s", m_path.c_str());
        return false;
    }

    std::string line;
    if (!std::getline(file, line) || !ParseCpuLine(line, out))
    {
        LogMsg(LOG_WARN, "[Cpu] unexpected first line in %s", m_path.c_str());
        return false;
    }
    return true;
}

// cpu  user nice system idle iowait irq softirq steal [guest guest_nice]
// guest time is already part of user, so only the first eight fields count
bool ProcStatCpuProbe::ParseCpuLine(const std::string &line, CpuTimes &out)
{
    std::istringstream iss(line);
    std::string label;
    if (!(iss >> label) || label != "cpu")
        return false;

    uint64_t fields[8] = {0};
    int n = 0;
    while (n < 8 && iss >> fields[n])
        ++n;

    // idle is the 4th field, kernels before 2.6 stop after it
    if (n < 4)
        return false;

    uint64_t total = 0;
    for (int i = 0; i < n; ++i)
        total += fields[i];

    uint64_t idle = fields[3] + (n > 4 ? fields[4] : 0);
    out.total = total;
    out.busy = total - idle;
    return true;
}

double ProcStatCpuProbe::Utilization(const CpuTimes &prev, const CpuTimes &cur)
{
    if (cur.total <= prev.total || cur.busy < prev.busy)
        return 0.0;

    double dtotal = (double)(cur.total - prev.total);
    double dbusy = (double)(cur.busy - prev.busy);
    double pct = dbusy / dtotal * 100.0;
    return pct > 100.0 ? 100.0 : pct;
}
