#include "RuleTable.h"
#include "Logger.h"
#include <cstdio>
#include <cstdlib>
#include <sstream>

RuleTable::RuleTable(const AdmissionConfig& config, uint16_t server_port)
{
	std::string syn = "-p tcp --syn";
	if (server_port != 0)
		syn += " --dport " + std::to_string(server_port);

	std::string limit = " -m hashlimit --hashlimit-mode srcip --hashlimit-name synguard"
						" --hashlimit-upto " + std::to_string(RatePerMinute(config.threshold, config.window_ns)) + "/minute"
						" --hashlimit-burst " + std::to_string(config.threshold) +
						" --hashlimit-htable-size " + std::to_string(config.table_capacity) +
						" --hashlimit-htable-max " + std::to_string(config.table_capacity);

	m_rules.push_back({syn + limit, "ACCEPT"});
	m_rules.push_back({syn, "DROP"});
	m_rules.push_back({"", "ACCEPT"});
}

uint64_t RuleTable::RatePerMinute(uint64_t threshold, uint64_t window_ns)
{
	const uint64_t minute_ns = 60ULL * 1000000000ULL;
	if (window_ns == 0)
		return threshold;
	// threshold * minute / window, rounded up; split to stay clear of overflow
	uint64_t whole = (minute_ns / window_ns) * threshold;
	uint64_t rest = (minute_ns % window_ns) * threshold;
	uint64_t rate = whole + (rest + window_ns - 1) / window_ns;
	return rate == 0 ? 1 : rate;
}

std::vector<std::string> RuleTable::SetupCommands() const
{
	std::vector<std::string> cmds;
	cmds.push_back(std::string("iptables -N ") + SYNGUARD_CHAIN);
	for (const auto& rule : m_rules)
	{
		std::string cmd = std::string("iptables -A ") + SYNGUARD_CHAIN;
		if (!rule.match.empty())
			cmd += " " + rule.match;
		cmd += " -j " + rule.target;
		cmds.push_back(cmd);
	}
	cmds.push_back(std::string("iptables -I INPUT 1 -j ") + SYNGUARD_CHAIN);
	return cmds;
}

std::vector<std::string> RuleTable::CleanupCommands() const
{
	return {
		std::string("iptables -D INPUT -j ") + SYNGUARD_CHAIN,
		std::string("iptables -F ") + SYNGUARD_CHAIN,
		std::string("iptables -X ") + SYNGUARD_CHAIN,
	};
}

bool RuleTable::Apply()
{
	// leftovers of a previous run that was killed
	Cleanup();

	for (const auto& cmd : SetupCommands())
	{
		LogMsg(LOG_INFO, "[System] Setting up iptables: %s", cmd.c_str());
		if (!_Run(cmd))
		{
			LogMsg(LOG_ERROR, "[System] Failed to set iptables rule. Check root privileges.");
			m_applied = true;
			Cleanup();
			return false;
		}
	}
	m_applied = true;
	return true;
}

void RuleTable::Cleanup()
{
	for (const auto& cmd : CleanupCommands())
	{
		// quiet when the chain is not there
		if (!_Run(cmd + " 2>/dev/null") && m_applied)
			LogMsg(LOG_WARN, "[System] iptables cleanup step failed: %s", cmd.c_str());
	}
	if (m_applied)
		LogMsg(LOG_INFO, "[System] iptables rules removed");
	m_applied = false;
}

bool RuleTable::_Run(const std::string& cmd)
{
	return system(cmd.c_str()) == 0;
}

bool RuleTable::ParseCounters(const std::string& listing, uint64_t& accepted, uint64_t& dropped)
{
	std::istringstream in(listing);
	std::string line;
	bool in_rules = false;
	int rule_no = 0;
	bool have_accept = false, have_drop = false;

	while (std::getline(in, line))
	{
		std::istringstream fields(line);
		std::string first;
		if (!(fields >> first))
			continue;

		if (!in_rules)
		{
			// column header precedes the rules
			if (first == "pkts")
				in_rules = true;
			continue;
		}

		uint64_t pkts = 0, bytes = 0;
		std::string target;
		try
		{
			size_t used = 0;
			pkts = std::stoull(first, &used);
			if (used != first.size())
				return false;
		}
		catch (const std::exception&)
		{
			return false;
		}
		if (!(fields >> bytes >> target))
			return false;

		++rule_no;
		if (rule_no == 1 && target == "ACCEPT")
		{
			accepted = pkts;
			have_accept = true;
		}
		else if (rule_no == 2 && target == "DROP")
		{
			dropped = pkts;
			have_drop = true;
		}
	}
	return have_accept && have_drop;
}

bool IptablesCounterSource::Read(CounterSnapshot& out)
{
	std::string cmd = std::string("iptables -L ") + SYNGUARD_CHAIN + " -v -n -x 2>/dev/null";
	FILE* pipe = popen(cmd.c_str(), "r");
	if (!pipe)
		return false;

	std::string listing;
	char buf[512];
	while (fgets(buf, sizeof(buf), pipe) != nullptr)
		listing += buf;

	if (pclose(pipe) != 0)
		return false;

	uint64_t accepted = 0, dropped = 0;
	if (!RuleTable::ParseCounters(listing, accepted, dropped))
		return false;

	out = CounterSnapshot{};
	out.syn_total = accepted + dropped;
	out.syn_dropped = dropped;
	return true;
}
