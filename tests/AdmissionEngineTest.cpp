#include <gtest/gtest.h>
#include "AdmissionEngine.h"
#include "MetricsSampler.h"
#include "SummaryReporter.h"
#include "Logger.h"
#include "TestFrames.h"

using namespace testframes;

namespace
{

const uint64_t SEC = 1000000000ULL;

class IdleCpu : public CpuProbe
{
public:
	double Sample() override { return 0.0; }
};

class AdmissionEngineTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		InitLogger(LOG_ERROR);
		counters = std::make_shared<CounterBank>();
	}

	std::unique_ptr<AdmissionEngine> MakeEngine(eBlockMode policy = eBlockMode::TRANSIENT,
												eBlockScope scope = eBlockScope::SYN_ONLY,
												uint64_t ttl_ns = 0)
	{
		config.policy = policy;
		config.block_scope = scope;
		config.block_ttl_ns = ttl_ns;
		return std::make_unique<AdmissionEngine>(config, counters);
	}

	Verdict Syn(AdmissionEngine &engine, uint32_t src, uint64_t now)
	{
		auto frame = SynFrame(src);
		return engine.ClassifyFrame(frame.data(), frame.size(), now).verdict;
	}

	// one sampler tick over the engine's counters, summarized
	SummaryReport SampleAndSummarize()
	{
		MetricsSampler sampler(std::make_shared<BankCounterSource>(counters), std::make_shared<IdleCpu>());
		sampler.SetLogTicks(false);
		sampler.SampleOnce();
		return SummaryReporter::Summarize(sampler.Samples());
	}

	Verdict Ack(AdmissionEngine &engine, uint32_t src, uint64_t now)
	{
		auto frame = TcpFrame(src, FLAG_ACK);
		return engine.ClassifyFrame(frame.data(), frame.size(), now).verdict;
	}

	AdmissionConfig config;
	std::shared_ptr<CounterBank> counters;
	const uint32_t attacker = Ip("203.0.113.7");
};

} // namespace

TEST_F(AdmissionEngineTest, TenPassEleventhDrops)
{
	auto engine = MakeEngine();

	for (int i = 0; i < 10; ++i)
		EXPECT_EQ(Syn(*engine, attacker, SEC + i), Verdict::PASS) << "syn #" << i + 1;

	EXPECT_EQ(Syn(*engine, attacker, SEC + 10), Verdict::DROP);
	EXPECT_EQ(Syn(*engine, attacker, SEC + 11), Verdict::DROP);

	CounterSnapshot snap = counters->Snapshot();
	EXPECT_EQ(snap.syn_total, 12u);
	EXPECT_EQ(snap.syn_dropped, 2u);
}

TEST_F(AdmissionEngineTest, TransientWindowResetsAfterExpiry)
{
	auto engine = MakeEngine();
	const uint64_t start = 5 * SEC;

	for (int i = 0; i < 11; ++i)
		Syn(*engine, attacker, start);
	EXPECT_EQ(Syn(*engine, attacker, start + config.window_ns), Verdict::DROP);

	// first SYN after the window opens a new one
	EXPECT_EQ(Syn(*engine, attacker, start + config.window_ns + 1), Verdict::PASS);

	FlowState state;
	ASSERT_TRUE(engine->Flows().Lookup(attacker, state));
	EXPECT_EQ(state.count_in_window, 1u);
	EXPECT_EQ(state.last_window_start, start + config.window_ns + 1);
	EXPECT_FALSE(state.blocked);
}

TEST_F(AdmissionEngineTest, EarlierTimestampStaysInWindow)
{
	auto engine = MakeEngine();

	Syn(*engine, attacker, 10 * SEC);
	// a queue thread that stamped before the first one but locked after it
	for (int i = 0; i < 9; ++i)
		EXPECT_EQ(Syn(*engine, attacker, 9 * SEC), Verdict::PASS);
	EXPECT_EQ(Syn(*engine, attacker, 9 * SEC), Verdict::DROP);
}

TEST_F(AdmissionEngineTest, OnlyPureSynIsCounted)
{
	auto engine = MakeEngine();

	for (int i = 0; i < 50; ++i)
	{
		auto synack = TcpFrame(attacker, FLAG_SYN | FLAG_ACK);
		EXPECT_EQ(engine->ClassifyFrame(synack.data(), synack.size(), SEC).verdict, Verdict::PASS);
		EXPECT_EQ(Ack(*engine, attacker, SEC), Verdict::PASS);
	}

	EXPECT_EQ(counters->Snapshot().syn_total, 0u);
	EXPECT_EQ(engine->Flows().Size(), 0u);
}

TEST_F(AdmissionEngineTest, MalformedIsCountedAndPassed)
{
	auto engine = MakeEngine();
	auto frame = SynFrame(attacker);

	EXPECT_EQ(engine->ClassifyFrame(frame.data(), 40, SEC).verdict, Verdict::PASS);
	EXPECT_EQ(engine->ClassifyFrame(frame.data(), 10, SEC).verdict, Verdict::PASS);

	CounterSnapshot snap = counters->Snapshot();
	EXPECT_EQ(snap.malformed, 2u);
	EXPECT_EQ(snap.syn_total, 0u);
}

TEST_F(AdmissionEngineTest, LaterFragmentsNeverCountAsSyn)
{
	auto engine = MakeEngine(eBlockMode::PERSISTENT);
	auto frame = SynFrame(attacker);
	frame[sizeof(EtherHeader) + 7] = 0xB9;

	for (int i = 0; i < 20; ++i)
		EXPECT_EQ(engine->ClassifyFrame(frame.data(), frame.size(), SEC).verdict, Verdict::PASS);

	EXPECT_EQ(counters->Snapshot().syn_total, 0u);
	EXPECT_TRUE(engine->BlockedSources().empty());
}

TEST_F(AdmissionEngineTest, NonTcpPassesUncounted)
{
	auto engine = MakeEngine();
	auto frame = SynFrame(attacker);
	frame[sizeof(EtherHeader) + 9] = 17;

	EXPECT_EQ(engine->ClassifyFrame(frame.data(), frame.size(), SEC).verdict, Verdict::PASS);
	CounterSnapshot snap = counters->Snapshot();
	EXPECT_EQ(snap.malformed, 0u);
	EXPECT_EQ(snap.syn_total, 0u);
}

TEST_F(AdmissionEngineTest, PersistentBlockOutlivesWindow)
{
	auto engine = MakeEngine(eBlockMode::PERSISTENT);

	Decision last;
	for (int i = 0; i < 11; ++i)
	{
		auto frame = SynFrame(attacker);
		last = engine->ClassifyFrame(frame.data(), frame.size(), SEC);
		if (i < 10)
			EXPECT_FALSE(last.newly_blocked);
	}
	EXPECT_EQ(last.verdict, Verdict::DROP);
	EXPECT_TRUE(last.newly_blocked);
	EXPECT_EQ(counters->Snapshot().blocked_sources, 1u);

	// an hour later still blocked, and not reported as new
	auto frame = SynFrame(attacker);
	Decision later = engine->ClassifyFrame(frame.data(), frame.size(), 3600 * SEC);
	EXPECT_EQ(later.verdict, Verdict::DROP);
	EXPECT_FALSE(later.newly_blocked);
	EXPECT_EQ(counters->Snapshot().blocked_sources, 1u);

	auto blocked = engine->BlockedSources();
	ASSERT_EQ(blocked.size(), 1u);
	EXPECT_EQ(blocked[0], attacker);
}

TEST_F(AdmissionEngineTest, PersistentBlockExpiresAfterTtl)
{
	auto engine = MakeEngine(eBlockMode::PERSISTENT, eBlockScope::SYN_ONLY, 30 * SEC);

	for (int i = 0; i < 11; ++i)
		Syn(*engine, attacker, SEC);
	ASSERT_EQ(counters->Snapshot().blocked_sources, 1u);

	EXPECT_EQ(Syn(*engine, attacker, 20 * SEC), Verdict::DROP);
	EXPECT_EQ(Syn(*engine, attacker, 32 * SEC), Verdict::PASS);
	EXPECT_EQ(counters->Snapshot().blocked_sources, 0u);
	EXPECT_TRUE(engine->BlockedSources().empty());
}

TEST_F(AdmissionEngineTest, SynOnlyScopeLetsEstablishedTrafficThrough)
{
	auto engine = MakeEngine(eBlockMode::PERSISTENT, eBlockScope::SYN_ONLY);
	for (int i = 0; i < 11; ++i)
		Syn(*engine, attacker, SEC);

	EXPECT_EQ(Ack(*engine, attacker, 2 * SEC), Verdict::PASS);
	EXPECT_EQ(counters->Snapshot().other_dropped, 0u);
}

TEST_F(AdmissionEngineTest, AllTrafficScopeDropsEverythingFromBlockedSource)
{
	auto engine = MakeEngine(eBlockMode::PERSISTENT, eBlockScope::ALL_TRAFFIC);
	const uint32_t client = Ip("198.51.100.1");

	EXPECT_EQ(Ack(*engine, attacker, SEC), Verdict::PASS);
	for (int i = 0; i < 11; ++i)
		Syn(*engine, attacker, SEC);

	EXPECT_EQ(Ack(*engine, attacker, 2 * SEC), Verdict::DROP);
	EXPECT_EQ(Ack(*engine, client, 2 * SEC), Verdict::PASS);

	CounterSnapshot snap = counters->Snapshot();
	EXPECT_EQ(snap.other_dropped, 1u);
	// non-SYN drops are not part of the SYN counters
	EXPECT_EQ(snap.syn_total, 11u);
	EXPECT_EQ(snap.syn_dropped, 1u);
}

TEST_F(AdmissionEngineTest, AllTrafficScopeHasNoEffectWhenTransient)
{
	auto engine = MakeEngine(eBlockMode::TRANSIENT, eBlockScope::ALL_TRAFFIC);
	for (int i = 0; i < 11; ++i)
		Syn(*engine, attacker, SEC);

	EXPECT_EQ(Ack(*engine, attacker, SEC), Verdict::PASS);
}

TEST_F(AdmissionEngineTest, SingleSourceFloodSuccessRate)
{
	auto engine = MakeEngine();
	int passed = 0, dropped = 0;
	// 50 SYN spread over one second
	for (int i = 0; i < 50; ++i)
		(Syn(*engine, attacker, SEC + i * (SEC / 50)) == Verdict::PASS ? passed : dropped)++;
	EXPECT_EQ(passed, 10);
	EXPECT_EQ(dropped, 40);

	SummaryReport report = SampleAndSummarize();
	EXPECT_EQ(report.syn_total, 50u);
	EXPECT_EQ(report.syn_blocked, 40u);
	EXPECT_EQ(report.syn_accepted, 10u);
	EXPECT_DOUBLE_EQ(report.success_rate_pct, 20.0);
}

TEST_F(AdmissionEngineTest, DistinctSourcesAllPass)
{
	auto engine = MakeEngine();
	for (int s = 1; s <= 5; ++s)
		EXPECT_EQ(Syn(*engine, htonl(0xC6336400u + s), SEC + s * (SEC / 5)), Verdict::PASS);

	SummaryReport report = SampleAndSummarize();
	EXPECT_EQ(report.syn_total, 5u);
	EXPECT_EQ(report.syn_blocked, 0u);
	EXPECT_EQ(report.syn_accepted, 5u);
	EXPECT_DOUBLE_EQ(report.success_rate_pct, 100.0);
}

TEST_F(AdmissionEngineTest, HugeTableCapacityStillLimits)
{
	config.table_capacity = SIZE_MAX;
	auto engine = MakeEngine();
	for (int i = 0; i < 50; ++i)
		Syn(*engine, attacker, SEC + i * 1000);

	CounterSnapshot snap = counters->Snapshot();
	EXPECT_EQ(snap.syn_dropped, 40u);
	EXPECT_EQ(snap.table_full, 0u);
}

TEST_F(AdmissionEngineTest, SourcesAreLimitedIndependently)
{
	auto engine = MakeEngine();
	for (int s = 1; s <= 5; ++s)
	{
		uint32_t src = htonl(0x0A000000u + s);
		for (int i = 0; i < 10; ++i)
			EXPECT_EQ(Syn(*engine, src, SEC), Verdict::PASS);
	}

	CounterSnapshot snap = counters->Snapshot();
	EXPECT_EQ(snap.syn_total, 50u);
	EXPECT_EQ(snap.syn_dropped, 0u);
	EXPECT_EQ(engine->Flows().Size(), 5u);
}

TEST_F(AdmissionEngineTest, ConcurrentSynsFromOneSourceShareOneRow)
{
	config.threshold = 1000000;
	auto engine = MakeEngine();
	const int threads = 8;
	const int per_thread = 500;

	std::vector<std::thread> pool;
	for (int t = 0; t < threads; ++t)
	{
		pool.emplace_back([&]
						  {
							  auto frame = SynFrame(attacker);
							  for (int i = 0; i < per_thread; ++i)
								  engine->ClassifyFrame(frame.data(), frame.size(), SEC);
						  });
	}
	for (auto &t : pool)
		t.join();

	EXPECT_EQ(engine->Flows().Size(), 1u);
	FlowState state;
	ASSERT_TRUE(engine->Flows().Lookup(attacker, state));
	EXPECT_EQ(state.count_in_window, (uint64_t)threads * per_thread);
	EXPECT_EQ(counters->SynTotal(), (uint64_t)threads * per_thread);
}

TEST_F(AdmissionEngineTest, ConcurrentFloodDropsExactlyOverThreshold)
{
	auto engine = MakeEngine();
	const int threads = 4;
	const int per_thread = 100;

	std::vector<std::thread> pool;
	for (int t = 0; t < threads; ++t)
	{
		pool.emplace_back([&]
						  {
							  for (int i = 0; i < per_thread; ++i)
								  Syn(*engine, attacker, SEC);
						  });
	}
	for (auto &t : pool)
		t.join();

	CounterSnapshot snap = counters->Snapshot();
	EXPECT_EQ(snap.syn_total, 400u);
	EXPECT_EQ(snap.syn_dropped, 390u);
}

TEST_F(AdmissionEngineTest, FullTableFailsOpen)
{
	config.table_capacity = NUM_FLOW_SHARDS;
	config.on_table_full = eTableFullPolicy::FAIL_OPEN;
	auto engine = MakeEngine();

	for (uint32_t s = 1; s <= 1000; ++s)
		EXPECT_EQ(Syn(*engine, htonl(0x0A000000u + s), SEC), Verdict::PASS);

	CounterSnapshot snap = counters->Snapshot();
	EXPECT_GT(snap.table_full, 0u);
	EXPECT_EQ(snap.syn_dropped, 0u);
	EXPECT_LE(engine->Flows().Size(), engine->Flows().Capacity());
}

TEST_F(AdmissionEngineTest, FullTableEvictsOldest)
{
	config.table_capacity = NUM_FLOW_SHARDS;
	config.on_table_full = eTableFullPolicy::EVICT_OLDEST;
	auto engine = MakeEngine();

	for (uint32_t s = 1; s <= 1000; ++s)
		Syn(*engine, htonl(0x0A000000u + s), SEC);

	CounterSnapshot snap = counters->Snapshot();
	EXPECT_EQ(snap.table_full, 0u);
	EXPECT_EQ(snap.syn_total, 1000u);
	EXPECT_LE(engine->Flows().Size(), engine->Flows().Capacity());
}

TEST_F(AdmissionEngineTest, EvictingBlockedSourceReleasesGauge)
{
	config.table_capacity = NUM_FLOW_SHARDS;
	config.on_table_full = eTableFullPolicy::EVICT_OLDEST;
	auto engine = MakeEngine(eBlockMode::PERSISTENT);

	for (int i = 0; i < 11; ++i)
		Syn(*engine, attacker, SEC);
	ASSERT_EQ(counters->Snapshot().blocked_sources, 1u);

	// one flow per shard, a newcomer in the attacker's shard pushes it out
	FlowState state;
	for (uint32_t s = 1; s <= 1000 && engine->Flows().Lookup(attacker, state); ++s)
		Syn(*engine, htonl(0x0A000000u + s), 2 * SEC);

	EXPECT_FALSE(engine->Flows().Lookup(attacker, state));
	EXPECT_EQ(counters->Snapshot().blocked_sources, 0u);
}

TEST_F(AdmissionEngineTest, IpPacketEntryPoint)
{
	auto engine = MakeEngine();
	auto packet = TcpPacket(attacker, FLAG_SYN);

	for (int i = 0; i < 10; ++i)
		EXPECT_EQ(engine->ClassifyIpPacket(packet.data(), packet.size(), SEC).verdict, Verdict::PASS);
	EXPECT_EQ(engine->ClassifyIpPacket(packet.data(), packet.size(), SEC).verdict, Verdict::DROP);
}

TEST_F(AdmissionEngineTest, CustomThresholdAndWindow)
{
	config.threshold = 3;
	config.window_ns = 100;
	auto engine = MakeEngine();

	for (int i = 0; i < 3; ++i)
		EXPECT_EQ(Syn(*engine, attacker, 1000), Verdict::PASS);
	EXPECT_EQ(Syn(*engine, attacker, 1050), Verdict::DROP);
	EXPECT_EQ(Syn(*engine, attacker, 1101), Verdict::PASS);
}

TEST_F(AdmissionEngineTest, MonotonicClockAdvances)
{
	uint64_t a = MonotonicNowNs();
	std::this_thread::sleep_for(std::chrono::milliseconds(2));
	EXPECT_GT(MonotonicNowNs(), a);
}
