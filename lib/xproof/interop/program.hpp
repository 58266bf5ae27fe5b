#pragma once
/* This file is part of xproof project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "classifier.hpp"
#include "transition.hpp"

namespace xproof::interop::program {
    // Decides a claim and maps the verdict to the dispute game's output. Fatal errors propagate to the caller.
    [[nodiscard]] extern game_output_t run(const claim_t &claim, oracle_client_t &oracle, const registry_t &registry, derivation_t &derivation);
    [[nodiscard]] extern game_output_t run(buffer claim_bytes, oracle_client_t &oracle, const registry_t &registry, derivation_t &derivation);
}
