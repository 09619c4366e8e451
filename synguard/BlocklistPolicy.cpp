#include "BlocklistPolicy.h"

bool PersistentPolicy::CheckBlocked(FlowState &state, uint64_t now_ns, bool &lifted)
{
    lifted = false;
    if (!state.blocked)
        return false;

    if (m_block_ttl_ns != 0 && now_ns > state.blocked_since &&
        now_ns - state.blocked_since > m_block_ttl_ns)
    {
        // the source starts over with an empty bucket at its next SYN
        state.blocked = false;
        state.blocked_since = 0;
        state.count_in_window = 0;
        state.last_window_start = 0;
        lifted = true;
        return false;
    }
    return true;
}

bool PersistentPolicy::OnOverLimit(FlowState &state, uint64_t now_ns)
{
    if (state.blocked)
        return false;

    state.blocked = true;
    state.blocked_since = now_ns;
    return true;
}

std::unique_ptr<BlocklistPolicy> CreateBlocklistPolicy(eBlockMode mode, uint64_t block_ttl_ns)
{
    if (mode == eBlockMode::PERSISTENT)
        return std::make_unique<PersistentPolicy>(block_ttl_ns);
    return std::make_unique<TransientPolicy>();
}

const char *BlockModeToString(eBlockMode mode)
{
    return mode == eBlockMode::PERSISTENT ? "persistent" : "transient";
}

bool BlockModeFromString(const std::string &text, eBlockMode &out_mode)
{
    if (text == "transient")
        out_mode = eBlockMode::TRANSIENT;
    else if (text == "persistent")
        out_mode = eBlockMode::PERSISTENT;
    else
        return false;
    return true;
}

const char *BlockScopeToString(eBlockScope scope)
{
    return scope == eBlockScope::ALL_TRAFFIC ? "all_traffic" : "syn_only";
}

bool BlockScopeFromString(const std::string &text, eBlockScope &out_scope)
{
    if (text == "syn_only")
        out_scope = eBlockScope::SYN_ONLY;
    else if (text == "all_traffic")
        out_scope = eBlockScope::ALL_TRAFFIC;
    else
        return false;
    return true;
}
