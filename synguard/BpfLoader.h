#pragma once
#include "define.h"
#include "DataLoader.h"
#include "MetricsSampler.h"

struct bpf_object;

// Loads syn_filter.bpf.o, pushes the admission limits into its config_map
// and attaches it to one interface. Detached again by Unload() / destructor.
class BpfLoader
{
public:
	explicit BpfLoader(const NetworkConfig &config);
	~BpfLoader();
	BpfLoader(const BpfLoader &) = delete;
	BpfLoader &operator=(const BpfLoader &) = delete;

	bool LoadXDP();
	void UnloadXDP();

	int StatsMapFd() const { return m_stats_map_fd; }
	int BlockedMapFd() const { return m_blocked_map_fd; }

private:
	bool _WriteConfig();

	const NetworkConfig &m_config;
	bpf_object *m_bpf_obj{nullptr};
	int m_ifindex{0};
	int m_stats_map_fd{-1};
	int m_blocked_map_fd{-1};
	bool m_attached{false};
};

// stats_map / ip_blocked_map of the attached program
class XdpCounterSource : public CounterSource
{
public:
	XdpCounterSource(int stats_map_fd, int blocked_map_fd, size_t max_blocked)
		: m_stats_map_fd(stats_map_fd), m_blocked_map_fd(blocked_map_fd), m_max_blocked(max_blocked) {}

	const char *Name() const override { return "xdp"; }
	bool Read(CounterSnapshot &out) override;

private:
	int m_stats_map_fd;
	int m_blocked_map_fd;
	size_t m_max_blocked;
};
