#pragma once
#include "define.h"

// Point-in-time copy of the counters. Fields are read one by one, so a
// snapshot taken during traffic may mix two neighbouring states; every field
// is monotonic except blocked_sources.
struct CounterSnapshot
{
	uint64_t syn_total{};
	uint64_t syn_dropped{};
	uint64_t other_dropped{};    // non-SYN packets of a blocked source (all_traffic scope)
	uint64_t malformed{};
	uint64_t table_full{};
	uint64_t blocked_sources{};  // gauge

	uint64_t Admitted() const { return syn_total >= syn_dropped ? syn_total - syn_dropped : 0; }
};

// Process-lifetime counters shared by the classification path (writers)
// and the sampler (reader). Handed around as shared_ptr, never a global.
class CounterBank
{
public:
	CounterBank() = default;
	CounterBank(const CounterBank &) = delete;
	CounterBank &operator=(const CounterBank &) = delete;

	void AddSynTotal() { m_syn_total.fetch_add(1, std::memory_order_relaxed); }
	void AddSynDropped() { m_syn_dropped.fetch_add(1, std::memory_order_release); }
	void AddOtherDropped() { m_other_dropped.fetch_add(1, std::memory_order_relaxed); }
	void AddMalformed() { m_malformed.fetch_add(1, std::memory_order_relaxed); }
	void AddTableFull() { m_table_full.fetch_add(1, std::memory_order_relaxed); }
	void AddBlockedSource() { m_blocked_sources.fetch_add(1, std::memory_order_relaxed); }
	void RemoveBlockedSource();

	uint64_t SynTotal() const { return m_syn_total.load(std::memory_order_relaxed); }
	uint64_t SynDropped() const { return m_syn_dropped.load(std::memory_order_relaxed); }

	CounterSnapshot Snapshot() const;

	// named export: "syn_total", "syn_dropped", ...
	bool Read(const std::string &name, uint64_t &out_value) const;

private:
	std::atomic<uint64_t> m_syn_total{0};
	std::atomic<uint64_t> m_syn_dropped{0};
	std::atomic<uint64_t> m_other_dropped{0};
	std::atomic<uint64_t> m_malformed{0};
	std::atomic<uint64_t> m_table_full{0};
	std::atomic<uint64_t> m_blocked_sources{0};
};
