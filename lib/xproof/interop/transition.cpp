/* This file is part of xproof project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <xproof/common/logger.hpp>
#include "transition.hpp"

namespace xproof::interop {
    machine_t::machine_t(oracle_client_t &oracle, const registry_t &registry, derivation_t &derivation):
        _oracle { oracle },
        _registry { registry },
        _derivation { derivation },
        _data { _oracle },
        _resolver { _data, _registry }
    {
    }

    outcome_t machine_t::run(const claim_t &claim)
    {
        outcome_t res {};
        auto &state = res.state;
        state.pre_state = super_root_t::decode(_oracle.fetch(hint_kind_t::agreed_pre_state, claim.pre_hash));
        state.timestamp = claim.timestamp;
        logger::info("consolidating {} chains from {} at {} to {} at {}", state.pre_state.chains.size(), claim.pre_hash,
            state.pre_state.timestamp, claim.post_hash, claim.timestamp);
        if (claim.timestamp <= state.pre_state.timestamp) {
            res.reason = fmt::format("the claimed timestamp {} does not advance the agreed timestamp {}", claim.timestamp, state.pre_state.timestamp);
            logger::info("verdict: {}: {}", res.verdict, res.reason);
            return res;
        }
        if (claim.claimed.size() != state.pre_state.chains.size()) {
            res.reason = fmt::format("the claim has {} chains while the agreed state has {}", claim.claimed.size(), state.pre_state.chains.size());
            logger::info("verdict: {}: {}", res.verdict, res.reason);
            return res;
        }
        for (size_t i = 0; i < claim.claimed.size(); ++i) {
            const auto &pre = state.pre_state.chains[i];
            const auto &claimed = claim.claimed[i];
            if (claimed.chain_id != pre.chain_id) {
                res.reason = fmt::format("the claimed chain {} differs from the agreed chain {}", claimed.chain_id, pre.chain_id);
                logger::info("verdict: {}: {}", res.verdict, res.reason);
                return res;
            }
            // unknown chains are fatal
            if (!_registry.find(pre.chain_id)) [[unlikely]]
                throw err_unknown_chain_t(fmt::format("chain {} of the agreed state is not registered", pre.chain_id));
            state.pending.push_back(pending_transition_t { pre.chain_id, pre.root, claimed.root,
                _derivation.derive(pre.chain_id, pre.root, claim.timestamp) });
        }

        // every pass either resolves at least one transition or ends the run
        const auto max_passes = state.pending.size() + 1;
        while (!state.resolved()) {
            if (state.passes >= max_passes) [[unlikely]]
                throw error(fmt::format("internal error: the transition did not converge within {} passes", max_passes));
            const auto progress = _pass(state);
            logger::debug("pass {}: resolved {} pending {} commitment {}", state.passes, progress,
                state.num_with_status(status_t::pending), state.commitment());
            if (progress == 0) {
                res.reason = fmt::format("no progress in pass {} with {} transitions pending", state.passes, state.num_with_status(status_t::pending));
                logger::info("verdict: {}: {}", res.verdict, res.reason);
                return res;
            }
        }

        if (const auto num_invalid = state.num_with_status(status_t::invalid); num_invalid > 0) {
            res.reason = fmt::format("{} chain transitions are invalid", num_invalid);
            logger::info("verdict: {}: {}", res.verdict, res.reason);
            return res;
        }
        try {
            _verify_aggregate(claim, state);
            res.verdict = verdict_t::valid;
        } catch (const err_aggregate_mismatch_t &ex) {
            res.reason = ex.what();
        }
        logger::info("verdict: {} after {} passes {}", res.verdict, state.passes, res.reason);
        return res;
    }

    size_t machine_t::_pass(transition_state_t &state)
    {
        pass_t pass { ++state.passes };
        size_t progress = 0;
        for (auto &t: state.pending) {
            if (t.status != status_t::pending)
                continue;
            const auto res = _resolver.resolve(pass, state, t.chain_id, t.derived_root);
            switch (res.status) {
                case resolution_status_t::valid:
                    if (t.derived_root == t.claimed_root) {
                        t.status = status_t::valid;
                    } else {
                        logger::debug("chain {}: the derived output root {} differs from the claimed {}", t.chain_id, t.derived_root, t.claimed_root);
                        t.status = status_t::invalid;
                    }
                    ++progress;
                    break;
                case resolution_status_t::invalid:
                    logger::debug("chain {}: invalid: {}", t.chain_id, res.reason);
                    t.status = status_t::invalid;
                    ++progress;
                    break;
                case resolution_status_t::unresolved:
                    break;
                [[unlikely]] default:
                    throw error(fmt::format("unsupported resolution status: {}", static_cast<int>(res.status)));
            }
        }
        return progress;
    }

    void machine_t::_verify_aggregate(const claim_t &claim, const transition_state_t &state) const
    {
        super_root_t post { super_root_t::version_v1, claim.timestamp, {} };
        for (const auto &t: state.pending)
            post.chains.push_back(chain_root_t { t.chain_id, t.claimed_root });
        if (const auto post_hash = post.hash(); post_hash != claim.post_hash)
            throw err_aggregate_mismatch_t(fmt::format("the aggregate super root hashes to {} but the claim is {}", post_hash, claim.post_hash));
    }
}
