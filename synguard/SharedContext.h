#pragma once
#include "define.h"
#include "DataLoader.h"
#include "CounterBank.h"
#include "AdmissionEngine.h"

// Everything the capture threads share. One per run, owned by PacketMonitor.
struct SharedContext {
    // 1. config, fixed for the whole run
    const NetworkConfig config;

    // 2. counters, read by the sampler thread while the capture threads write
    std::shared_ptr<CounterBank> counters;

    // 3. the decision engine, internally synchronized.
    //    only pcap / netfilter classify in userspace, null for xdp and iptables
    std::unique_ptr<AdmissionEngine> engine;

    // cleared by the signal handler / duration timer, polled by every loop
    std::atomic<bool> running{true};

    SharedContext(const NetworkConfig& cfg)
        : config(cfg), counters(std::make_shared<CounterBank>()) {
        if (cfg.mode == MODE_PCAP || cfg.mode == MODE_NETFILTER)
            engine = std::make_unique<AdmissionEngine>(cfg.admission, counters);
    }

    SharedContext(const SharedContext&) = delete;
    SharedContext& operator=(const SharedContext&) = delete;
};
