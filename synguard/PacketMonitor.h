#pragma once
#include "define.h"
#include "DataLoader.h"
#include "SharedContext.h"
#include "MetricsSampler.h"
#include "SummaryReporter.h"

class PacketCapture;
class BpfLoader;
class RuleTable;

// Runs one protection session: brings the configured backend up, samples its
// counters until SIGINT/SIGTERM or the duration elapses, tears the backend
// down and reports.
class PacketMonitor
{
public:
	PacketMonitor(const NetworkConfig &config);
	~PacketMonitor();

	bool Initialize();

	// blocks until stopped; duration 0 = until a signal
	bool Run(std::chrono::seconds duration = std::chrono::seconds(0));

	void RequestStop();


	static void signal_handler(int signal);

private:
	bool _StartBackend();
	void _StopBackend();
	std::shared_ptr<CounterSource> _CreateCounterSource();
	void _Report();

	static PacketMonitor *instance;

	unique_ptr<SharedContext> m_context;
	unique_ptr<PacketCapture> m_packetCapture;
	unique_ptr<BpfLoader> m_bpfLoader;
	unique_ptr<RuleTable> m_ruleTable;
	unique_ptr<MetricsSampler> m_sampler;

	NetworkConfig m_config;
	SummaryReport m_report;
	eMode m_mode;
};
