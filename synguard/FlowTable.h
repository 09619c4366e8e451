#pragma once
#include "define.h"

// Rate-limit state of one source address. Timestamps are monotonic nanoseconds.
struct FlowState
{
	uint64_t last_window_start{};
	uint64_t count_in_window{};
	bool blocked{false};
	uint64_t blocked_since{};
};

enum class UpsertStatus
{
	FOUND,
	CREATED,
	EVICTED,    // created after dropping the least recently used flow of the shard
	TABLE_FULL  // not created, the shard is at capacity and fail-open is configured
};

enum class eTableFullPolicy
{
	FAIL_OPEN,
	EVICT_OLDEST
};

// Source address -> FlowState, split into independently locked shards.
// Every mutation of a flow runs under the lock of its shard, so two
// classifications of the same source are serialized while different
// shards proceed in parallel. Size is bounded by capacity.
class FlowTable
{
public:
	FlowTable(size_t capacity, eTableFullPolicy on_full, int shards = NUM_FLOW_SHARDS);
	FlowTable(const FlowTable &) = delete;
	FlowTable &operator=(const FlowTable &) = delete;

	// Finds or creates the flow for key and runs fn(FlowState&, bool created)
	// under the shard lock. On TABLE_FULL fn is not called. When an entry had
	// to be evicted its last state is copied to evicted_out (if given).
	template <typename Fn>
	UpsertStatus Upsert(uint32_t key, Fn &&fn, FlowState *evicted_out = nullptr);

	// Runs fn(FlowState&) only when the flow exists. Never inserts.
	template <typename Fn>
	bool Visit(uint32_t key, Fn &&fn);

	bool Lookup(uint32_t key, FlowState &out) const;

	// fn(uint32_t key, const FlowState&) for every flow, one shard locked at a time
	template <typename Fn>
	void ForEach(Fn &&fn) const;

	size_t Size() const;
	size_t Capacity() const { return m_shard_capacity * m_shards.size(); }
	eTableFullPolicy OnFull() const { return m_on_full; }

private:
	struct Entry
	{
		FlowState state;
		std::list<uint32_t>::iterator lru_pos;
	};

	struct Shard
	{
		mutable std::mutex m;
		std::unordered_map<uint32_t, Entry> flows;
		std::list<uint32_t> lru;  // most recently used at front
	};

	Shard &_ShardFor(uint32_t key) const;

	std::vector<std::unique_ptr<Shard>> m_shards;
	size_t m_shard_capacity;
	eTableFullPolicy m_on_full;
};

template <typename Fn>
UpsertStatus FlowTable::Upsert(uint32_t key, Fn &&fn, FlowState *evicted_out)
{
	Shard &shard = _ShardFor(key);
	std::lock_guard<std::mutex> lock(shard.m);

	auto it = shard.flows.find(key);
	if (it != shard.flows.end())
	{
		shard.lru.splice(shard.lru.begin(), shard.lru, it->second.lru_pos);
		fn(it->second.state, false);
		return UpsertStatus::FOUND;
	}

	UpsertStatus status = UpsertStatus::CREATED;
	if (shard.flows.size() >= m_shard_capacity)
	{
		if (m_on_full == eTableFullPolicy::FAIL_OPEN || shard.lru.empty())
			return UpsertStatus::TABLE_FULL;

		auto victim = shard.flows.find(shard.lru.back());
		if (evicted_out)
			*evicted_out = victim->second.state;
		shard.flows.erase(victim);
		shard.lru.pop_back();
		status = UpsertStatus::EVICTED;
	}

	shard.lru.push_front(key);
	auto [nit, inserted] = shard.flows.emplace(key, Entry{FlowState{}, shard.lru.begin()});
	fn(nit->second.state, true);
	return status;
}

template <typename Fn>
bool FlowTable::Visit(uint32_t key, Fn &&fn)
{
	Shard &shard = _ShardFor(key);
	std::lock_guard<std::mutex> lock(shard.m);

	auto it = shard.flows.find(key);
	if (it == shard.flows.end())
		return false;

	shard.lru.splice(shard.lru.begin(), shard.lru, it->second.lru_pos);
	fn(it->second.state);
	return true;
}

template <typename Fn>
void FlowTable::ForEach(Fn &&fn) const
{
	for (const auto &shard : m_shards)
	{
		std::lock_guard<std::mutex> lock(shard->m);
		for (const auto &[key, entry] : shard->flows)
			fn(key, entry.state);
	}
}
