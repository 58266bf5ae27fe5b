#pragma once
/* This file is part of xproof project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "types.hpp"

namespace xproof::interop {
    enum class direction_t: uint8_t {
        asserts_valid = 0,
        asserts_invalid = 1
    };

    // The boot input of a run: the agreed pre-state, the claimed post-state and which side the claimant takes
    struct claim_t {
        hash_t pre_hash {};
        hash_t post_hash {};
        uint64_t timestamp = 0;
        // ascending by chain id
        chain_roots_t claimed {};
        direction_t direction = direction_t::asserts_valid;

        static claim_t from_bytes(decoder &dec);
        // throws err_malformed_super_root_t
        static claim_t decode(buffer bytes);

        void to_bytes(encoder &enc) const;
        [[nodiscard]] uint8_vector encode() const;
        [[nodiscard]] const output_root_t *find(chain_id_t chain_id) const noexcept;
        bool operator==(const claim_t &o) const = default;
    };
}
