#include "DataLoader.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
using json = nlohmann::json;

namespace {

// Integer field of obj inside [lo, hi]. An absent key keeps value.
bool ReadInt(const json& obj, const char* section, const char* key, int64_t lo, int64_t hi, int64_t& value)
{
    if (!obj.contains(key))
        return true;

    const json& v = obj[key];
    if (!v.is_number_integer()) {
        LogMsg(LOG_ERROR, "[Config] %s.%s must be an integer", section, key);
        return false;
    }

    // unsigned values past INT64_MAX would wrap on the signed read
    if ((v.is_number_unsigned() && v.get<uint64_t>() > (uint64_t)hi) ||
        v.get<int64_t>() < lo || v.get<int64_t>() > hi) {
        LogMsg(LOG_ERROR, "[Config] %s.%s out of range [%lld, %lld]", section, key,
               (long long)lo, (long long)hi);
        return false;
    }

    value = v.get<int64_t>();
    return true;
}

} // namespace

const char* ModeToString(eMode mode)
{
    switch (mode)
    {
    case MODE_PCAP:
        return "pcap";
    case MODE_NETFILTER:
        return "netfilter";
    case MODE_XDP:
        return "xdp";
    case MODE_IPTABLES:
        return "iptables";
    }
    return "unknown";
}

bool ModeFromString(const std::string& text, eMode& out_mode)
{
    if (text == "pcap")
        out_mode = MODE_PCAP;
    else if (text == "netfilter")
        out_mode = MODE_NETFILTER;
    else if (text == "xdp")
        out_mode = MODE_XDP;
    else if (text == "iptables")
        out_mode = MODE_IPTABLES;
    else
        return false;
    return true;
}

bool DataLoader::Load(const std::string& path, NetworkConfig& out_config) {
    std::ifstream file(path);

    if (!file.is_open()) {
        LogMsg(LOG_ERROR, "[Config] file not found: %s", path.c_str());
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (!LoadFromString(buffer.str(), out_config))
        return false;

    LogMsg(LOG_INFO, "[Config] loaded %s (mode=%s, threshold=%llu, window=%llums, policy=%s)",
           path.c_str(), ModeToString(out_config.mode),
           (unsigned long long)out_config.admission.threshold,
           (unsigned long long)(out_config.admission.window_ns / 1000000ULL),
           BlockModeToString(out_config.admission.policy));
    return true;
}

bool DataLoader::LoadFromString(const std::string& text, NetworkConfig& out_config) {
    NetworkConfig config = out_config;

    try {
        json j = json::parse(text);

        // 1. mode / interface / port
        if (j.contains("mode")) {
            std::string mode = j["mode"];
            if (!ModeFromString(mode, config.mode)) {
                LogMsg(LOG_ERROR, "[Config] unknown mode: %s", mode.c_str());
                return false;
            }
        }
        if (j.contains("network_interface"))
            config.device_name = j["network_interface"].value("device", config.device_name);
        if (j.contains("server_info")) {
            int64_t port = config.server_port;
            if (!ReadInt(j["server_info"], "server_info", "port", 0, 65535, port))
                return false;
            config.server_port = (uint16_t)port;
        }

        // 2. admission control
        if (j.contains("admission")) {
            const json& a = j["admission"];
            int64_t threshold = (int64_t)config.admission.threshold;
            int64_t window_ms = (int64_t)(config.admission.window_ns / 1000000ULL);
            int64_t ttl_ms = (int64_t)(config.admission.block_ttl_ns / 1000000ULL);
            int64_t capacity = (int64_t)config.admission.table_capacity;

            if (!ReadInt(a, "admission", "threshold", 1, (int64_t)MAX_SYN_THRESHOLD, threshold) ||
                !ReadInt(a, "admission", "window_ms", 1, (int64_t)MAX_SYN_WINDOW_MS, window_ms) ||
                !ReadInt(a, "admission", "block_ttl_ms", 0, (int64_t)MAX_BLOCK_TTL_MS, ttl_ms) ||
                !ReadInt(a, "admission", "table_capacity", 1, (int64_t)MAX_TABLE_CAPACITY, capacity))
                return false;

            config.admission.threshold = (uint64_t)threshold;
            config.admission.window_ns = (uint64_t)window_ms * 1000000ULL;
            config.admission.block_ttl_ns = (uint64_t)ttl_ms * 1000000ULL;
            config.admission.table_capacity = (size_t)capacity;

            std::string policy = a.value("policy", std::string(BlockModeToString(config.admission.policy)));
            if (!BlockModeFromString(policy, config.admission.policy)) {
                LogMsg(LOG_ERROR, "[Config] unknown admission.policy: %s", policy.c_str());
                return false;
            }

            std::string scope = a.value("block_scope", std::string(BlockScopeToString(config.admission.block_scope)));
            if (!BlockScopeFromString(scope, config.admission.block_scope)) {
                LogMsg(LOG_ERROR, "[Config] unknown admission.block_scope: %s", scope.c_str());
                return false;
            }

            std::string on_full = a.value("on_table_full", std::string("fail_open"));
            if (on_full == "fail_open")
                config.admission.on_table_full = eTableFullPolicy::FAIL_OPEN;
            else if (on_full == "evict_oldest")
                config.admission.on_table_full = eTableFullPolicy::EVICT_OLDEST;
            else {
                LogMsg(LOG_ERROR, "[Config] unknown admission.on_table_full: %s", on_full.c_str());
                return false;
            }
        }

        // 3. backends
        if (j.contains("netfilter")) {
            int64_t queues = config.num_queues;
            int64_t base = config.queue_base;
            if (!ReadInt(j["netfilter"], "netfilter", "queues", 1, 65536, queues) ||
                !ReadInt(j["netfilter"], "netfilter", "queue_base", 0, 65535, base))
                return false;
            config.num_queues = (int)queues;
            config.queue_base = (int)base;
        }
        if (j.contains("xdp")) {
            config.bpf_object = j["xdp"].value("object", config.bpf_object);
            config.bpf_program = j["xdp"].value("program", config.bpf_program);
        }

        // 4. sampler / log
        if (j.contains("sampler")) {
            int64_t interval = config.sampler.interval_ms;
            if (!ReadInt(j["sampler"], "sampler", "interval_ms", 1, (int64_t)MAX_SAMPLER_INTERVAL_MS, interval))
                return false;
            config.sampler.interval_ms = (uint32_t)interval;
            config.sampler.csv_path = j["sampler"].value("csv_path", config.sampler.csv_path);
            config.sampler.report_path = j["sampler"].value("report_path", config.sampler.report_path);
        }
        if (j.contains("log")) {
            std::string level = j["log"].value("level", std::string("info"));
            if (!LogLevelFromString(level, config.log_level)) {
                LogMsg(LOG_ERROR, "[Config] unknown log.level: %s", level.c_str());
                return false;
            }
            config.log_file = j["log"].value("file", config.log_file);
        }
    }
    catch (const json::exception& e) {
        LogMsg(LOG_ERROR, "[Config] parse error: %s", e.what());
        return false;
    }

    if (!_Validate(config))
        return false;

    out_config = config;
    return true;
}

bool DataLoader::_Validate(const NetworkConfig& config)
{
    const AdmissionConfig& a = config.admission;
    if (a.threshold == 0 || a.threshold > MAX_SYN_THRESHOLD) {
        LogMsg(LOG_ERROR, "[Config] admission.threshold must be in [1, %llu]", (unsigned long long)MAX_SYN_THRESHOLD);
        return false;
    }
    if (a.window_ns == 0 || a.window_ns > MAX_SYN_WINDOW_MS * 1000000ULL) {
        LogMsg(LOG_ERROR, "[Config] admission.window_ms must be in [1, %llu]", (unsigned long long)MAX_SYN_WINDOW_MS);
        return false;
    }
    if (a.block_ttl_ns > MAX_BLOCK_TTL_MS * 1000000ULL) {
        LogMsg(LOG_ERROR, "[Config] admission.block_ttl_ms must be at most %llu", (unsigned long long)MAX_BLOCK_TTL_MS);
        return false;
    }
    if (a.table_capacity == 0 || a.table_capacity > MAX_TABLE_CAPACITY) {
        LogMsg(LOG_ERROR, "[Config] admission.table_capacity must be in [1, %zu]", MAX_TABLE_CAPACITY);
        return false;
    }
    if (config.sampler.interval_ms == 0 || config.sampler.interval_ms > MAX_SAMPLER_INTERVAL_MS) {
        LogMsg(LOG_ERROR, "[Config] sampler.interval_ms must be in [1, %llu]", (unsigned long long)MAX_SAMPLER_INTERVAL_MS);
        return false;
    }
    if (config.num_queues < 1 || config.queue_base < 0 || config.queue_base + config.num_queues > 65536) {
        LogMsg(LOG_ERROR, "[Config] netfilter queue range is invalid");
        return false;
    }
    return true;
}
