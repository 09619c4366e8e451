#pragma once
#include "define.h"
#include "DataLoader.h"
#include "MetricsSampler.h"

const char* const SYNGUARD_CHAIN = "SYNGUARD";

struct FirewallRule
{
	std::string match;   // iptables match arguments
	std::string target;  // ACCEPT / DROP
};

// Firewall-rule realization of the admission contract. A sequential rule
// table can only express check-then-enforce through ordering:
//   1. SYN within the per-source rate limit -> ACCEPT
//   2. any other SYN                        -> DROP
//   3. everything else                      -> ACCEPT
// The rules live in their own chain, jumped to from the top of INPUT.
class RuleTable
{
public:
	RuleTable(const AdmissionConfig& config, uint16_t server_port);

	const std::vector<FirewallRule>& Rules() const { return m_rules; }

	// shell commands in execution order
	std::vector<std::string> SetupCommands() const;
	std::vector<std::string> CleanupCommands() const;

	bool Apply();
	void Cleanup();

	// "iptables -L SYNGUARD -v -n -x" output -> packet counters of rule 1 and 2
	static bool ParseCounters(const std::string& listing, uint64_t& accepted, uint64_t& dropped);

	// hashlimit rate for threshold SYN per window, per minute, rounded up
	static uint64_t RatePerMinute(uint64_t threshold, uint64_t window_ns);

private:
	static bool _Run(const std::string& cmd);

	std::vector<FirewallRule> m_rules;
	bool m_applied{false};
};

class IptablesCounterSource : public CounterSource
{
public:
	const char* Name() const override { return "iptables"; }
	bool Read(CounterSnapshot& out) override;
};
