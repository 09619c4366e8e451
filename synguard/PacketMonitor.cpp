#include "PacketMonitor.h"
#include "Logger.h"
#include "Util.h"
#include "PacketCapture.h"
#include "BpfLoader.h"
#include "RuleTable.h"
#include "CpuMonitor.h"
#include <csignal>

PacketMonitor *PacketMonitor::instance = nullptr;

PacketMonitor::PacketMonitor(const NetworkConfig &config)
	: m_config(config), m_mode(config.mode)
{
}

PacketMonitor::~PacketMonitor()
{
	_StopBackend();
	if (instance == this)
		instance = nullptr;
}

bool PacketMonitor::Initialize()
{
	instance = this;
	std::signal(SIGINT, PacketMonitor::signal_handler);
	std::signal(SIGTERM, PacketMonitor::signal_handler);

	// pcap and xdp need an interface, pick one interactively if none is set
	if (m_config.device_name.empty() && (m_mode == MODE_PCAP || m_mode == MODE_XDP))
	{
		if (!PcapManager::SelectDevice(m_config.device_name))
			return false;
	}

	m_context = make_unique<SharedContext>(m_config);
	return true;
}

bool PacketMonitor::Run(std::chrono::seconds duration)
{
	if (!m_context)
	{
		LogMsg(LOG_ERROR, "[System] Run() before Initialize()");
		return false;
	}
	LogMsg(LOG_INFO, "[System] starting in %s mode", ModeToString(m_mode));

	if (!_StartBackend())
	{
		_StopBackend();
		return false;
	}

	auto source = _CreateCounterSource();
	m_sampler = make_unique<MetricsSampler>(source, std::make_shared<ProcStatCpuProbe>(),
											std::chrono::milliseconds(m_context->config.sampler.interval_ms));
	m_sampler->Start();

	// main thread only waits, capture runs on its own threads / in the kernel
	auto deadline = std::chrono::steady_clock::now() + duration;
	while (m_context->running)
	{
		if (duration.count() > 0 && std::chrono::steady_clock::now() >= deadline)
		{
			LogMsg(LOG_INFO, "[System] duration of %llds reached", (long long)duration.count());
			break;
		}
		std::this_thread::sleep_for(std::chrono::milliseconds(100));
	}

	LogMsg(LOG_INFO, "[System] stop requested, cleaning up...");
	m_sampler->Stop();
	_StopBackend();
	_Report();
	return true;
}

void PacketMonitor::RequestStop()
{
	if (m_context)
		m_context->running = false;
}

bool PacketMonitor::_StartBackend()
{
	const NetworkConfig &config = m_context->config;

	switch (m_mode)
	{
	case MODE_PCAP:
	case MODE_NETFILTER:
		m_packetCapture = make_unique<PacketCapture>(*m_context, m_mode);
		return m_packetCapture->Start();

	case MODE_XDP:
	{
		m_bpfLoader = make_unique<BpfLoader>(config);
		if (!m_bpfLoader->LoadXDP())
		{
			LogMsg(LOG_ERROR, "XDP Load Failed!");
			return false;
		}
		return true;
	}

	case MODE_IPTABLES:
		m_ruleTable = make_unique<RuleTable>(config.admission, config.server_port);
		if (config.admission.policy == eBlockMode::PERSISTENT)
			LogMsg(LOG_WARN, "[System] iptables mode has no persistent blocklist, running transient");
		return m_ruleTable->Apply();
	}
	return false;
}

void PacketMonitor::_StopBackend()
{
	if (m_sampler)
		m_sampler->Stop();
	if (m_packetCapture)
		m_packetCapture->Stop();
	if (m_bpfLoader)
		m_bpfLoader->UnloadXDP();
	if (m_ruleTable)
		m_ruleTable->Cleanup();
}

std::shared_ptr<CounterSource> PacketMonitor::_CreateCounterSource()
{
	switch (m_mode)
	{
	case MODE_XDP:
		return std::make_shared<XdpCounterSource>(m_bpfLoader->StatsMapFd(), m_bpfLoader->BlockedMapFd(),
												  m_context->config.admission.table_capacity);
	case MODE_IPTABLES:
		return std::make_shared<IptablesCounterSource>();
	default:
		return std::make_shared<BankCounterSource>(m_context->counters);
	}
}

void PacketMonitor::_Report()
{
	const SamplerConfig &sampler = m_context->config.sampler;
	const std::vector<MetricsSample> &samples = m_sampler->Samples();

	m_report = SummaryReporter::Summarize(samples);
	SummaryReporter::Print(m_report, std::string("SYN guard summary (") + ModeToString(m_mode) + ")");

	if (!sampler.csv_path.empty())
		SummaryReporter::WriteCsv(sampler.csv_path, samples);
	if (!sampler.report_path.empty())
		SummaryReporter::WriteJson(sampler.report_path, m_report);

	// in-process engines know who they blocked
	if (m_context->engine)
	{
		CounterSnapshot snap = m_context->counters->Snapshot();
		if (snap.malformed || snap.table_full || snap.other_dropped)
			LogMsg(LOG_INFO, "[Report] malformed=%llu table_full=%llu other_dropped=%llu",
				   (unsigned long long)snap.malformed, (unsigned long long)snap.table_full,
				   (unsigned long long)snap.other_dropped);

		for (uint32_t ip : m_context->engine->BlockedSources())
			LogMsg(LOG_INFO, "[Report] blocked source: %s", IpToString(ip).c_str());
	}
}

void PacketMonitor::signal_handler(int signal)
{
	(void)signal;
	// only flips the flag, the main thread does the teardown
	if (instance)
		instance->RequestStop();
}
