#pragma once
#include "define.h"
#include "FlowTable.h"

enum class eBlockMode
{
	TRANSIENT,  // the open window itself is the penalty, re-admitted when it expires
	PERSISTENT  // first violation sets a block flag that outlives the window
};

enum class eBlockScope
{
	SYN_ONLY,    // a blocked source still gets its non-SYN traffic through
	ALL_TRAFFIC  // every TCP packet of a blocked source is dropped
};

// Decides what a rate-limit violation does to a source.
// Both calls run under the shard lock of the flow.
class BlocklistPolicy
{
public:
	virtual ~BlocklistPolicy() = default;

	virtual eBlockMode Mode() const = 0;
	virtual const char *Name() const = 0;

	// true when the source must be dropped before the window logic runs.
	// A block whose TTL ran out is cleared here and lifted is set.
	virtual bool CheckBlocked(FlowState &state, uint64_t now_ns, bool &lifted) = 0;

	// The SYN that pushed count_in_window over the threshold.
	// Returns true when this call blocked the source.
	virtual bool OnOverLimit(FlowState &state, uint64_t now_ns) = 0;
};

class TransientPolicy : public BlocklistPolicy
{
public:
	eBlockMode Mode() const override { return eBlockMode::TRANSIENT; }
	const char *Name() const override { return "transient"; }

	bool CheckBlocked(FlowState &, uint64_t, bool &lifted) override
	{
		lifted = false;
		return false;
	}
	bool OnOverLimit(FlowState &, uint64_t) override { return false; }
};

class PersistentPolicy : public BlocklistPolicy
{
public:
	// block_ttl_ns 0: a block lasts as long as the table entry
	explicit PersistentPolicy(uint64_t block_ttl_ns = 0) : m_block_ttl_ns(block_ttl_ns) {}

	eBlockMode Mode() const override { return eBlockMode::PERSISTENT; }
	const char *Name() const override { return "persistent"; }

	bool CheckBlocked(FlowState &state, uint64_t now_ns, bool &lifted) override;
	bool OnOverLimit(FlowState &state, uint64_t now_ns) override;

	uint64_t BlockTtlNs() const { return m_block_ttl_ns; }

private:
	uint64_t m_block_ttl_ns;
};

std::unique_ptr<BlocklistPolicy> CreateBlocklistPolicy(eBlockMode mode, uint64_t block_ttl_ns);

const char *BlockModeToString(eBlockMode mode);
bool BlockModeFromString(const std::string &text, eBlockMode &out_mode);
const char *BlockScopeToString(eBlockScope scope);
bool BlockScopeFromString(const std::string &text, eBlockScope &out_scope);
