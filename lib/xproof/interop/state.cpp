/* This file is part of xproof project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "state.hpp"

namespace xproof::interop {
    void pending_transition_t::to_bytes(encoder &enc) const
    {
        enc.uint_fixed(8, chain_id);
        enc.process_bytes_fixed(pre_root);
        enc.process_bytes_fixed(claimed_root);
        enc.process_bytes_fixed(derived_root);
        enc.uint_fixed(1, static_cast<uint8_t>(status));
    }

    void transition_state_t::to_bytes(encoder &enc) const
    {
        enc.uint_fixed(1, commitment_version);
        const auto pre_bytes = pre_state.encode();
        enc.process_bytes(pre_bytes);
        enc.uint_fixed(8, timestamp);
        enc.process_array(pending);
        enc.uint_fixed(8, passes);
    }

    hash_t transition_state_t::commitment() const
    {
        return crypto::keccak::digest(interop::to_bytes(*this));
    }

    const pending_transition_t *transition_state_t::find(const chain_id_t chain_id) const noexcept
    {
        const auto it = std::lower_bound(pending.begin(), pending.end(), chain_id, [](const auto &t, const auto id) {
            return t.chain_id < id;
        });
        if (it != pending.end() && it->chain_id == chain_id)
            return &*it;
        return nullptr;
    }

    const pending_transition_t &transition_state_t::at(const chain_id_t chain_id) const
    {
        if (const auto *t = find(chain_id); t) [[likely]]
            return *t;
        throw error(fmt::format("chain {} is not a part of the transition", chain_id));
    }

    pending_transition_t &transition_state_t::at(const chain_id_t chain_id)
    {
        return const_cast<pending_transition_t &>(static_cast<const transition_state_t &>(*this).at(chain_id));
    }

    size_t transition_state_t::num_with_status(const status_t status) const noexcept
    {
        return std::count_if(pending.begin(), pending.end(), [status](const auto &t) {
            return t.status == status;
        });
    }
}
