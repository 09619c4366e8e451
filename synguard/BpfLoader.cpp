#include "BpfLoader.h"
#include "Logger.h"
#include "bpf/syn_filter_maps.h"
#include <bpf/libbpf.h>
#include <bpf/bpf.h>
#include <linux/if_link.h>
#include <cerrno>
#include <cstring>

BpfLoader::BpfLoader(const NetworkConfig &config) : m_config(config)
{
}

BpfLoader::~BpfLoader()
{
	UnloadXDP();
}

bool BpfLoader::LoadXDP()
{
	const char *if_name = m_config.device_name.c_str();

	// 1. interface first, nothing to clean up if it does not exist
	m_ifindex = if_nametoindex(if_name);
	if (m_ifindex == 0)
	{
		LogMsg(LOG_ERROR, "[XDP] unknown interface: '%s'", if_name);
		return false;
	}

	// 2. open the object file and size the flow maps before loading
	m_bpf_obj = bpf_object__open_file(m_config.bpf_object.c_str(), NULL);
	if (!m_bpf_obj)
	{
		LogMsg(LOG_ERROR, "[XDP] can not open %s: %s", m_config.bpf_object.c_str(), strerror(errno));
		return false;
	}

	for (const char *name : {"rate_limit_map", "ip_blocked_map"})
	{
		struct bpf_map *map = bpf_object__find_map_by_name(m_bpf_obj, name);
		if (map && bpf_map__set_max_entries(map, (__u32)m_config.admission.table_capacity) != 0)
			LogMsg(LOG_WARN, "[XDP] can not resize %s, keeping the built-in size", name);
	}

	if (bpf_object__load(m_bpf_obj))
	{
		LogMsg(LOG_ERROR, "[XDP] verifier rejected %s: %s", m_config.bpf_object.c_str(), strerror(errno));
		bpf_object__close(m_bpf_obj);
		m_bpf_obj = nullptr;
		return false;
	}

	// 3. program fd
	struct bpf_program *prog = bpf_object__find_program_by_name(m_bpf_obj, m_config.bpf_program.c_str());
	if (!prog)
	{
		LogMsg(LOG_ERROR, "[XDP] program '%s' not found in %s", m_config.bpf_program.c_str(), m_config.bpf_object.c_str());
		bpf_object__close(m_bpf_obj);
		m_bpf_obj = nullptr;
		return false;
	}
	int prog_fd = bpf_program__fd(prog);

	// 4. map fds, limits in before the first packet arrives
	m_stats_map_fd = bpf_object__find_map_fd_by_name(m_bpf_obj, "stats_map");
	m_blocked_map_fd = bpf_object__find_map_fd_by_name(m_bpf_obj, "ip_blocked_map");
	if (m_stats_map_fd < 0 || !_WriteConfig())
	{
		LogMsg(LOG_ERROR, "[XDP] stats_map/config_map missing in %s", m_config.bpf_object.c_str());
		bpf_object__close(m_bpf_obj);
		m_bpf_obj = nullptr;
		return false;
	}

	// 5. attach
	if (bpf_xdp_attach(m_ifindex, prog_fd, XDP_FLAGS_UPDATE_IF_NOEXIST, NULL) < 0)
	{
		LogMsg(LOG_ERROR, "[XDP] Failed to attach XDP to %s: %s", if_name, strerror(errno));
		bpf_object__close(m_bpf_obj);
		m_bpf_obj = nullptr;
		return false;
	}
	m_attached = true;

	LogMsg(LOG_INFO, "[System] XDP filter attached to %s (stats map FD: %d)", if_name, m_stats_map_fd);
	return true;
}

bool BpfLoader::_WriteConfig()
{
	int cfg_fd = bpf_object__find_map_fd_by_name(m_bpf_obj, "config_map");
	if (cfg_fd < 0)
		return false;

	const AdmissionConfig &a = m_config.admission;
	__u64 values[CFG_MAX] = {0};
	values[CFG_THRESHOLD] = a.threshold;
	values[CFG_WINDOW_NS] = a.window_ns;
	values[CFG_PERSISTENT] = a.policy == eBlockMode::PERSISTENT ? 1 : 0;
	values[CFG_ALL_TRAFFIC] = a.block_scope == eBlockScope::ALL_TRAFFIC ? 1 : 0;
	values[CFG_BLOCK_TTL_NS] = a.block_ttl_ns;

	for (__u32 key = 0; key < CFG_MAX; ++key)
	{
		if (bpf_map_update_elem(cfg_fd, &key, &values[key], BPF_ANY) != 0)
		{
			LogMsg(LOG_ERROR, "[XDP] Failed to update config_map[%u]", key);
			return false;
		}
	}
	return true;
}

void BpfLoader::UnloadXDP()
{
	if (m_attached)
	{
		if (bpf_xdp_detach(m_ifindex, 0, NULL) < 0)
			LogMsg(LOG_WARN, "[XDP] detach failed on %s: %s", m_config.device_name.c_str(), strerror(errno));
		else
			LogMsg(LOG_INFO, "[System] XDP filter successfully detached from %s", m_config.device_name.c_str());
		m_attached = false;
	}

	if (m_bpf_obj)
	{
		bpf_object__close(m_bpf_obj);
		m_bpf_obj = nullptr;
		m_stats_map_fd = -1;
		m_blocked_map_fd = -1;
	}
}

bool XdpCounterSource::Read(CounterSnapshot &out)
{
	__u32 key = STAT_SYN_TOTAL;
	__u64 total = 0, dropped = 0, other = 0;

	if (bpf_map_lookup_elem(m_stats_map_fd, &key, &total) != 0)
		return false;
	key = STAT_SYN_DROPPED;
	if (bpf_map_lookup_elem(m_stats_map_fd, &key, &dropped) != 0)
		return false;
	key = STAT_OTHER_DROPPED;
	if (bpf_map_lookup_elem(m_stats_map_fd, &key, &other) != 0)
		other = 0;

	out = CounterSnapshot{};
	out.syn_total = total;
	out.syn_dropped = dropped;
	out.other_dropped = other;

	// blocked sources = entries of ip_blocked_map, walk bounded by the map size
	if (m_blocked_map_fd >= 0)
	{
		__u32 cur = 0, next = 0;
		__u32 *prev = nullptr;
		size_t count = 0;
		while (count < m_max_blocked && bpf_map_get_next_key(m_blocked_map_fd, prev, &next) == 0)
		{
			++count;
			cur = next;
			prev = &cur;
		}
		out.blocked_sources = count;
	}
	return true;
}
