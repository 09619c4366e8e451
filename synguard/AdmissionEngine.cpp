#include "AdmissionEngine.h"
#include "Logger.h"
#include "Util.h"

uint64_t MonotonicNowNs()
{
    return (uint64_t)std::chrono::duration_cast<std::chrono::nanoseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

AdmissionEngine::AdmissionEngine(const AdmissionConfig &config, std::shared_ptr<CounterBank> counters)
    : AdmissionEngine(config, std::move(counters), CreateBlocklistPolicy(config.policy, config.block_ttl_ns))
{
}

AdmissionEngine::AdmissionEngine(const AdmissionConfig &config, std::shared_ptr<CounterBank> counters,
                                 std::unique_ptr<BlocklistPolicy> policy)
    : m_config(config),
      m_counters(counters ? std::move(counters) : std::make_shared<CounterBank>()),
      m_policy(policy ? std::move(policy) : std::make_unique<TransientPolicy>()),
      m_flows(config.table_capacity, config.on_table_full)
{
    LogMsg(LOG_INFO, "[Engine] threshold=%llu SYN / %llums, policy=%s, scope=%s, capacity=%zu",
           (unsigned long long)m_config.threshold,
           (unsigned long long)(m_config.window_ns / 1000000ULL),
           m_policy->Name(), BlockScopeToString(m_config.block_scope), m_flows.Capacity());
}

Decision AdmissionEngine::Classify(const HeaderView &view, uint64_t now_ns)
{
    // [1] only pure SYN is rate limited
    if (view.IsPureSyn())
        return _ClassifySyn(view.srcIp, now_ns);

    // [2] established traffic of a blocked source, when the block covers everything
    if (m_config.block_scope == eBlockScope::ALL_TRAFFIC && m_policy->Mode() == eBlockMode::PERSISTENT)
        return _ClassifyOther(view.srcIp, now_ns);

    return Decision{};
}

Decision AdmissionEngine::ClassifyFrame(const u_char *frame, size_t len, uint64_t now_ns)
{
    HeaderView view;
    ParseStatus status = HeaderView::Parse(frame, len, view);
    return _OnParsed(status, view, now_ns);
}

Decision AdmissionEngine::ClassifyIpPacket(const u_char *packet, size_t len, uint64_t now_ns)
{
    HeaderView view;
    ParseStatus status = HeaderView::ParseIp(packet, len, view);
    return _OnParsed(status, view, now_ns);
}

Decision AdmissionEngine::_OnParsed(ParseStatus status, const HeaderView &view, uint64_t now_ns)
{
    if (status == ParseStatus::MALFORMED)
    {
        m_counters->AddMalformed();
        return Decision{};
    }
    if (status == ParseStatus::NOT_APPLICABLE)
        return Decision{};

    return Classify(view, now_ns);
}

Decision AdmissionEngine::_ClassifySyn(uint32_t src_ip, uint64_t now_ns)
{
    m_counters->AddSynTotal();

    Decision decision;
    bool lifted = false;
    bool over_limit = false;
    FlowState evicted;

    UpsertStatus status = m_flows.Upsert(
        src_ip,
        [&](FlowState &state, bool created)
        {
            if (created)
            {
                state.last_window_start = now_ns;
                state.count_in_window = 1;
                return;
            }

            if (m_policy->CheckBlocked(state, now_ns, lifted))
            {
                decision.verdict = Verdict::DROP;
                return;
            }

            // fixed bucket: reset on the first SYN after it expired, not a sliding window.
            // now_ns can trail last_window_start when another queue stamped later but locked first.
            if (now_ns > state.last_window_start && now_ns - state.last_window_start > m_config.window_ns)
            {
                state.last_window_start = now_ns;
                state.count_in_window = 1;
                return;
            }

            state.count_in_window++;
            if (state.count_in_window > m_config.threshold)
            {
                decision.verdict = Verdict::DROP;
                decision.newly_blocked = m_policy->OnOverLimit(state, now_ns);
                over_limit = (state.count_in_window == m_config.threshold + 1);
            }
        },
        &evicted);

    if (lifted)
    {
        m_counters->RemoveBlockedSource();
        LogMsg(LOG_INFO, "[Engine] block expired for %s", IpToString(src_ip).c_str());
    }

    if (status == UpsertStatus::TABLE_FULL)
    {
        // fail-open: an untracked source can not be limited
        m_counters->AddTableFull();
        if (!m_table_full_logged.exchange(true))
            LogMsg(LOG_WARN, "[Engine] flow table full (%zu entries), new sources pass unchecked",
                   m_flows.Capacity());
        return decision;
    }
    if (status == UpsertStatus::EVICTED && evicted.blocked)
        m_counters->RemoveBlockedSource();

    if (decision.newly_blocked)
    {
        m_counters->AddBlockedSource();
        LogMsg(LOG_WARN, "[BLOCK] SYN flood detected from %s, source blocked", IpToString(src_ip).c_str());
    }
    else if (over_limit)
    {
        LogMsg(LOG_DEBUG, "[Engine] %s over %llu SYN in window, dropping until it expires",
               IpToString(src_ip).c_str(), (unsigned long long)m_config.threshold);
    }

    if (decision.verdict == Verdict::DROP)
        m_counters->AddSynDropped();

    return decision;
}

Decision AdmissionEngine::_ClassifyOther(uint32_t src_ip, uint64_t now_ns)
{
    Decision decision;
    bool lifted = false;

    m_flows.Visit(src_ip,
                  [&](FlowState &state)
                  {
                      if (m_policy->CheckBlocked(state, now_ns, lifted))
                          decision.verdict = Verdict::DROP;
                  });

    if (lifted)
        m_counters->RemoveBlockedSource();
    if (decision.verdict == Verdict::DROP)
        m_counters->AddOtherDropped();

    return decision;
}

std::vector<uint32_t> AdmissionEngine::BlockedSources() const
{
    std::vector<uint32_t> blocked;
    m_flows.ForEach([&](uint32_t key, const FlowState &state)
                    {
                        if (state.blocked)
                            blocked.push_back(key);
                    });
    return blocked;
}
