#pragma once
#include "define.h"
#include "HeaderView.h"
#include "FlowTable.h"
#include "BlocklistPolicy.h"
#include "CounterBank.h"
#include "DataLoader.h"

struct Decision
{
	Verdict verdict{Verdict::PASS};
	bool newly_blocked{false};  // this packet moved the source onto the blocklist
};

// Per-packet SYN admission control with a fixed-window counter per source.
// Safe to call from several capture threads at once; the only shared state
// is the flow table (per-shard locks) and the counter bank (atomics).
class AdmissionEngine
{
public:
	AdmissionEngine(const AdmissionConfig &config, std::shared_ptr<CounterBank> counters);
	AdmissionEngine(const AdmissionConfig &config, std::shared_ptr<CounterBank> counters,
					std::unique_ptr<BlocklistPolicy> policy);
	AdmissionEngine(const AdmissionEngine &) = delete;
	AdmissionEngine &operator=(const AdmissionEngine &) = delete;

	Decision Classify(const HeaderView &view, uint64_t now_ns);

	// raw frame entry points, anything that does not parse is passed through
	Decision ClassifyFrame(const u_char *frame, size_t len, uint64_t now_ns);
	Decision ClassifyIpPacket(const u_char *packet, size_t len, uint64_t now_ns);

	const FlowTable &Flows() const { return m_flows; }
	const BlocklistPolicy &Policy() const { return *m_policy; }
	const AdmissionConfig &Config() const { return m_config; }
	std::shared_ptr<CounterBank> Counters() const { return m_counters; }

	std::vector<uint32_t> BlockedSources() const;

private:
	Decision _ClassifySyn(uint32_t src_ip, uint64_t now_ns);
	Decision _ClassifyOther(uint32_t src_ip, uint64_t now_ns);
	Decision _OnParsed(ParseStatus status, const HeaderView &view, uint64_t now_ns);

	const AdmissionConfig m_config;
	std::shared_ptr<CounterBank> m_counters;
	std::unique_ptr<BlocklistPolicy> m_policy;
	FlowTable m_flows;
	std::atomic<bool> m_table_full_logged{false};
};

// monotonic clock in nanoseconds, same base as bpf_ktime_get_ns
uint64_t MonotonicNowNs();
