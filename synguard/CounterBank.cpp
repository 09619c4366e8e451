#include "CounterBank.h"

void CounterBank::RemoveBlockedSource()
{
    uint64_t cur = m_blocked_sources.load(std::memory_order_relaxed);
    while (cur > 0 &&
           !m_blocked_sources.compare_exchange_weak(cur, cur - 1, std::memory_order_relaxed))
    {
    }
}

CounterSnapshot CounterBank::Snapshot() const
{
    CounterSnapshot snap;
    // dropped first: a concurrent SYN can only raise total afterwards, keeps dropped <= total
    snap.syn_dropped = m_syn_dropped.load(std::memory_order_acquire);
    snap.syn_total = m_syn_total.load(std::memory_order_acquire);
    snap.other_dropped = m_other_dropped.load(std::memory_order_relaxed);
    snap.malformed = m_malformed.load(std::memory_order_relaxed);
    snap.table_full = m_table_full.load(std::memory_order_relaxed);
    snap.blocked_sources = m_blocked_sources.load(std::memory_order_relaxed);
    return snap;
}

bool CounterBank::Read(const std::string &name, uint64_t &out_value) const
{
    static const std::map<std::string, const std::atomic<uint64_t> CounterBank::*> counters = {
        {"syn_total", &CounterBank::m_syn_total},
        {"syn_dropped", &CounterBank::m_syn_dropped},
        {"other_dropped", &CounterBank::m_other_dropped},
        {"malformed", &CounterBank::m_malformed},
        {"table_full", &CounterBank::m_table_full},
        {"blocked_sources", &CounterBank::m_blocked_sources},
    };

    auto it = counters.find(name);
    if (it == counters.end())
        return false;

    out_value = (this->*(it->second)).load(std::memory_order_relaxed);
    return true;
}
