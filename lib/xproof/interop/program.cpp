/* This file is part of xproof project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <xproof/common/logger.hpp>
#include "program.hpp"

namespace xproof::interop::program {
    game_output_t run(const claim_t &claim, oracle_client_t &oracle, const registry_t &registry, derivation_t &derivation)
    {
        machine_t machine { oracle, registry, derivation };
        const auto outcome = machine.run(claim);
        const auto output = classify(outcome.verdict, claim.direction);
        logger::info("claim {} at {}: verdict {} direction {} output {} state commitment {}",
            claim.post_hash, claim.timestamp, outcome.verdict,
            claim.direction == direction_t::asserts_valid ? "asserts-valid" : "asserts-invalid",
            output, outcome.state.commitment());
        return output;
    }

    game_output_t run(const buffer claim_bytes, oracle_client_t &oracle, const registry_t &registry, derivation_t &derivation)
    {
        return run(claim_t::decode(claim_bytes), oracle, registry, derivation);
    }
}
