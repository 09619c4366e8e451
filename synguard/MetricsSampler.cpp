#include "MetricsSampler.h"
#include "Logger.h"

MetricsSampler::MetricsSampler(std::shared_ptr<CounterSource> source, std::shared_ptr<CpuProbe> cpu,
                               std::chrono::milliseconds interval)
    : m_source(std::move(source)), m_cpu(std::move(cpu)), m_interval(interval),
      m_start_time(std::chrono::steady_clock::now())
{
    if (m_interval.count() <= 0)
        m_interval = std::chrono::milliseconds(1000);
}

MetricsSampler::~MetricsSampler()
{
    Stop();
}

bool MetricsSampler::Start()
{
    eSamplerState expected = eSamplerState::IDLE;
    if (!m_state.compare_exchange_strong(expected, eSamplerState::RUNNING))
    {
        LogMsg(LOG_WARN, "[Sampler] Start() ignored, sampler already used");
        return false;
    }

    m_start_time = std::chrono::steady_clock::now();
    // baseline for the first CPU delta
    if (m_cpu)
        m_cpu->Sample();

    m_thread = std::thread(&MetricsSampler::_Run, this);
    LogMsg(LOG_INFO, "[Sampler] polling %s counters every %lldms", m_source->Name(),
           (long long)m_interval.count());
    return true;
}

bool MetricsSampler::Stop()
{
    if (m_state.load() != eSamplerState::RUNNING)
        return false;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stop_requested = true;
    }
    m_cv.notify_all();

    if (m_thread.joinable())
        m_thread.join();

    m_state = eSamplerState::STOPPED;
    LogMsg(LOG_INFO, "[Sampler] stopped after %zu samples", m_samples.size());
    return true;
}

void MetricsSampler::_Run()
{
    auto next_tick = std::chrono::steady_clock::now() + m_interval;

    std::unique_lock<std::mutex> lock(m_mutex);
    while (true)
    {
        if (m_cv.wait_until(lock, next_tick, [&]
                            { return m_stop_requested; }))
            break;

        lock.unlock();
        SampleOnce();
        lock.lock();

        // a slow tick (iptables listing, loaded host) does not cause a burst of catch-up ticks
        next_tick += m_interval;
        auto now = std::chrono::steady_clock::now();
        if (next_tick < now)
            next_tick = now + m_interval;
    }
}

MetricsSample MetricsSampler::SampleOnce()
{
    MetricsSample sample;
    sample.offset_sec = std::chrono::duration<double>(std::chrono::steady_clock::now() - m_start_time).count();
    sample.cpu_pct = m_cpu ? m_cpu->Sample() : 0.0;

    CounterSnapshot cur;
    if (!m_source->Read(cur))
    {
        // keep the series regular, carry the last values forward
        LogMsg(LOG_WARN, "[Sampler] reading %s counters failed, repeating previous values", m_source->Name());
        cur = m_prev;
    }

    sample.syn_total = cur.syn_total;
    sample.syn_dropped = cur.syn_dropped;
    sample.blocked_sources = cur.blocked_sources;
    // a source that was reset (flushed rule table) restarts from zero instead of going negative
    sample.pps = cur.syn_total >= m_prev.syn_total ? cur.syn_total - m_prev.syn_total : cur.syn_total;
    m_prev = cur;

    m_samples.push_back(sample);
    m_sample_count.store(m_samples.size());

    if (m_log_ticks)
        LogMsg(LOG_INFO, "Time: %.1fs | SYN Total: %llu | SYN Drop: %llu | CPU: %.1f%% | PPS: %llu",
               sample.offset_sec, (unsigned long long)sample.syn_total,
               (unsigned long long)sample.syn_dropped, sample.cpu_pct, (unsigned long long)sample.pps);

    return sample;
}
