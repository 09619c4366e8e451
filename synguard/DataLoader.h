#pragma once
#include "define.h"
#include "Logger.h"
#include "FlowTable.h"
#include "BlocklistPolicy.h"

struct AdmissionConfig {
    uint64_t threshold{DEFAULT_SYN_THRESHOLD};  // SYN allowed per window, the next one is dropped
    uint64_t window_ns{DEFAULT_SYN_WINDOW_NS};
    eBlockMode policy{eBlockMode::TRANSIENT};
    eBlockScope block_scope{eBlockScope::SYN_ONLY};
    uint64_t block_ttl_ns{0};                   // persistent only, 0 = never expires
    size_t table_capacity{DEFAULT_TABLE_CAPACITY};
    eTableFullPolicy on_table_full{eTableFullPolicy::FAIL_OPEN};
};

struct SamplerConfig {
    uint32_t interval_ms{1000};
    std::string csv_path;     // sample series, empty = not written
    std::string report_path;  // flat json report, empty = not written
};

struct NetworkConfig {
    eMode mode{MODE_NETFILTER};

    // 1. capture / attach target
    std::string device_name;  // empty -> pick interactively (pcap)
    uint16_t server_port{0};  // 0 = every TCP port

    // 2. netfilter queues
    int num_queues{4};
    int queue_base{0};

    // 3. kernel object for xdp mode
    std::string bpf_object{"syn_filter.bpf.o"};
    std::string bpf_program{"xdp_syn_filter"};

    AdmissionConfig admission;
    SamplerConfig sampler;

    eLogLevel log_level{LOG_INFO};
    std::string log_file;
};

class DataLoader
{
public:
	static bool Load(const std::string& path, NetworkConfig& out_config);
	static bool LoadFromString(const std::string& text, NetworkConfig& out_config);
private:

	static bool _Validate(const NetworkConfig& config);
};
