#include <gtest/gtest.h>
#include "RuleTable.h"

namespace
{

const char *kListing =
	"Chain SYNGUARD (1 references)\n"
	"    pkts      bytes target     prot opt in     out     source               destination\n"
	"     120     7200 ACCEPT     6    --  *      *       0.0.0.0/0            0.0.0.0/0            tcp dpt:25000 flags:0x17/0x02 limit: up to 300/min burst 10 mode srcip\n"
	"     880    52800 DROP       6    --  *      *       0.0.0.0/0            0.0.0.0/0            tcp dpt:25000 flags:0x17/0x02\n"
	"    5000   300000 ACCEPT     0    --  *      *       0.0.0.0/0            0.0.0.0/0\n";

} // namespace

TEST(RuleTableTest, RateLimitRuleComesBeforeDrop)
{
	AdmissionConfig config;
	RuleTable table(config, 25000);

	const auto &rules = table.Rules();
	ASSERT_EQ(rules.size(), 3u);

	EXPECT_EQ(rules[0].target, "ACCEPT");
	EXPECT_NE(rules[0].match.find("--syn"), std::string::npos);
	EXPECT_NE(rules[0].match.find("--dport 25000"), std::string::npos);
	EXPECT_NE(rules[0].match.find("--hashlimit-mode srcip"), std::string::npos);
	EXPECT_NE(rules[0].match.find("--hashlimit-upto 300/minute"), std::string::npos);
	EXPECT_NE(rules[0].match.find("--hashlimit-burst 10"), std::string::npos);

	EXPECT_EQ(rules[1].target, "DROP");
	EXPECT_EQ(rules[1].match, "-p tcp --syn --dport 25000");

	EXPECT_EQ(rules[2].target, "ACCEPT");
	EXPECT_TRUE(rules[2].match.empty());
}

TEST(RuleTableTest, NoPortMatchesEveryTcpPort)
{
	AdmissionConfig config;
	RuleTable table(config, 0);
	EXPECT_EQ(table.Rules()[1].match, "-p tcp --syn");
	EXPECT_EQ(table.Rules()[0].match.find("--dport"), std::string::npos);
}

TEST(RuleTableTest, SetupCommandsUseOwnChain)
{
	AdmissionConfig config;
	RuleTable table(config, 80);

	auto cmds = table.SetupCommands();
	ASSERT_EQ(cmds.size(), 5u);
	EXPECT_EQ(cmds.front(), "iptables -N SYNGUARD");
	EXPECT_EQ(cmds[2], "iptables -A SYNGUARD -p tcp --syn --dport 80 -j DROP");
	EXPECT_EQ(cmds[3], "iptables -A SYNGUARD -j ACCEPT");
	EXPECT_EQ(cmds.back(), "iptables -I INPUT 1 -j SYNGUARD");

	// nothing flushes INPUT itself
	for (const auto &cmd : table.CleanupCommands())
		EXPECT_EQ(cmd.find("-F INPUT"), std::string::npos);
	EXPECT_EQ(table.CleanupCommands().front(), "iptables -D INPUT -j SYNGUARD");
}

TEST(RuleTableTest, RatePerMinute)
{
	EXPECT_EQ(RuleTable::RatePerMinute(10, 2000000000ULL), 300u);
	EXPECT_EQ(RuleTable::RatePerMinute(1, 60000000000ULL), 1u);
	// 7 per 3s = 140/min
	EXPECT_EQ(RuleTable::RatePerMinute(7, 3000000000ULL), 140u);
	// 1 per 7s = 8.57/min, rounded up
	EXPECT_EQ(RuleTable::RatePerMinute(1, 7000000000ULL), 9u);
	// longer than a minute never rounds to zero
	EXPECT_EQ(RuleTable::RatePerMinute(1, 600000000000ULL), 1u);
}

TEST(RuleTableTest, ParsesCounterListing)
{
	uint64_t accepted = 0, dropped = 0;
	ASSERT_TRUE(RuleTable::ParseCounters(kListing, accepted, dropped));
	EXPECT_EQ(accepted, 120u);
	EXPECT_EQ(dropped, 880u);
}

TEST(RuleTableTest, RejectsForeignListing)
{
	uint64_t accepted = 0, dropped = 0;
	EXPECT_FALSE(RuleTable::ParseCounters("", accepted, dropped));
	EXPECT_FALSE(RuleTable::ParseCounters("iptables: No chain/target/match by that name.\n", accepted, dropped));

	// rules in the wrong order
	const char *swapped =
		"Chain SYNGUARD (1 references)\n"
		"    pkts      bytes target     prot opt in     out     source               destination\n"
		"     880    52800 DROP       6    --  *      *       0.0.0.0/0            0.0.0.0/0\n"
		"     120     7200 ACCEPT     6    --  *      *       0.0.0.0/0            0.0.0.0/0\n";
	EXPECT_FALSE(RuleTable::ParseCounters(swapped, accepted, dropped));
}
