#pragma once
#include "define.h"
#include "CounterBank.h"
#include "CpuMonitor.h"

// one row per sampling tick
struct MetricsSample
{
	double offset_sec{};      // since Start()
	uint64_t syn_total{};     // cumulative
	uint64_t syn_dropped{};   // cumulative
	double cpu_pct{};
	uint64_t pps{};           // syn_total delta since the previous tick
	uint64_t blocked_sources{};
};

// Where the sampler reads the two monotonic counters from.
class CounterSource
{
public:
	virtual ~CounterSource() = default;
	virtual const char *Name() const = 0;
	virtual bool Read(CounterSnapshot &out) = 0;
};

// counters of the in-process engine (pcap, netfilter)
class BankCounterSource : public CounterSource
{
public:
	explicit BankCounterSource(std::shared_ptr<CounterBank> bank) : m_bank(std::move(bank)) {}

	const char *Name() const override { return "engine"; }
	bool Read(CounterSnapshot &out) override
	{
		out = m_bank->Snapshot();
		return true;
	}

private:
	std::shared_ptr<CounterBank> m_bank;
};

enum class eSamplerState
{
	IDLE,
	RUNNING,
	STOPPED
};

// Periodic poll of a CounterSource plus host CPU on its own thread.
// Idle -> Running on Start(), Running -> Stopped on Stop(); nothing else
// ends a run. Stop() only cancels future ticks, samples already taken are kept.
class MetricsSampler
{
public:
	MetricsSampler(std::shared_ptr<CounterSource> source, std::shared_ptr<CpuProbe> cpu,
				   std::chrono::milliseconds interval = std::chrono::milliseconds(1000));
	~MetricsSampler();
	MetricsSampler(const MetricsSampler &) = delete;
	MetricsSampler &operator=(const MetricsSampler &) = delete;

	bool Start();
	bool Stop();

	// One tick: read counters and CPU, derive PPS, append a sample.
	// Called by the sampling thread; tests drive it directly on an idle sampler.
	MetricsSample SampleOnce();

	eSamplerState State() const { return m_state.load(); }
	size_t SampleCount() const { return m_sample_count.load(); }

	// the full series, read once the sampler is stopped (or never started)
	const std::vector<MetricsSample> &Samples() const { return m_samples; }

	void SetLogTicks(bool enable) { m_log_ticks = enable; }

private:
	void _Run();

	std::shared_ptr<CounterSource> m_source;
	std::shared_ptr<CpuProbe> m_cpu;
	std::chrono::milliseconds m_interval;

	std::atomic<eSamplerState> m_state{eSamplerState::IDLE};
	std::thread m_thread;
	std::mutex m_mutex;
	std::condition_variable m_cv;
	bool m_stop_requested{false};

	std::chrono::steady_clock::time_point m_start_time;
	CounterSnapshot m_prev;
	bool m_log_ticks{true};

	std::vector<MetricsSample> m_samples;
	std::atomic<size_t> m_sample_count{0};
};
