#pragma once
/* This file is part of xproof project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "claim.hpp"
#include "resolver.hpp"

namespace xproof::interop {
    // The per-chain block derivation pipeline
    struct derivation_t {
        virtual ~derivation_t() = default;
        [[nodiscard]] virtual output_root_t derive(chain_id_t chain_id, const output_root_t &agreed_pre_root, uint64_t timestamp) = 0;
    };

    struct outcome_t {
        verdict_t verdict = verdict_t::invalid;
        std::string reason {};
        transition_state_t state {};
    };

    // Drives the pending transitions of all chains to a fixed point and decides the verdict on a claim
    struct machine_t {
        machine_t(oracle_client_t &oracle, const registry_t &registry, derivation_t &derivation);

        // throws only fatal errors: err_preimage_unavailable_t, err_malformed_super_root_t, err_malformed_preimage_t, err_unknown_chain_t
        [[nodiscard]] outcome_t run(const claim_t &claim);
    private:
        oracle_client_t &_oracle;
        const registry_t &_registry;
        derivation_t &_derivation;
        chain_data_t _data;
        resolver_t _resolver;

        // returns the number of transitions that left the pending status
        size_t _pass(transition_state_t &state);
        void _verify_aggregate(const claim_t &claim, const transition_state_t &state) const;
    };
}
