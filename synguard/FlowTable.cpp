#include "FlowTable.h"

FlowTable::FlowTable(size_t capacity, eTableFullPolicy on_full, int shards)
    : m_on_full(on_full)
{
    if (shards < 1)
        shards = 1;
    if (capacity < (size_t)shards)
        capacity = shards;
    if (capacity > MAX_TABLE_CAPACITY)
        capacity = MAX_TABLE_CAPACITY;

    // rounded up, total capacity is never below the requested one
    m_shard_capacity = capacity / shards + (capacity % shards != 0);

    for (int i = 0; i < shards; ++i)
    {
        m_shards.push_back(std::make_unique<Shard>());
        m_shards.back()->flows.reserve(m_shard_capacity);
    }
}

FlowTable::Shard &FlowTable::_ShardFor(uint32_t key) const
{
    // addresses arrive in network order, the low bits are the first octet.
    // multiply-shift spreads the whole address before picking a shard.
    uint64_t mixed = ((uint64_t)key * 0x9E3779B97F4A7C15ULL) >> 32;
    return *m_shards[mixed % m_shards.size()];
}

bool FlowTable::Lookup(uint32_t key, FlowState &out) const
{
    Shard &shard = _ShardFor(key);
    std::lock_guard<std::mutex> lock(shard.m);

    auto it = shard.flows.find(key);
    if (it == shard.flows.end())
        return false;

    out = it->second.state;
    return true;
}

size_t FlowTable::Size() const
{
    size_t total = 0;
    for (const auto &shard : m_shards)
    {
        std::lock_guard<std::mutex> lock(shard->m);
        total += shard->flows.size();
    }
    return total;
}
