#pragma once
/* This file is part of xproof project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "super-root.hpp"

namespace xproof::interop {
    struct pending_transition_t {
        chain_id_t chain_id = 0;
        output_root_t pre_root {};
        output_root_t claimed_root {};
        output_root_t derived_root {};
        status_t status = status_t::pending;

        void to_bytes(encoder &enc) const;
        bool operator==(const pending_transition_t &o) const = default;
    };

    // The record of one consolidation run. Owned by the state machine and passed explicitly to the resolver.
    struct transition_state_t {
        static constexpr uint8_t commitment_version = 0xFF;

        super_root_t pre_state {};
        uint64_t timestamp = 0;
        // ascending by chain id
        std::vector<pending_transition_t> pending {};
        uint64_t passes = 0;

        // 0xFF || len || pre super root || timestamp || count || { chain_id || pre || claimed || derived || status }* || passes
        void to_bytes(encoder &enc) const;
        [[nodiscard]] hash_t commitment() const;

        [[nodiscard]] const pending_transition_t &at(chain_id_t chain_id) const;
        [[nodiscard]] pending_transition_t &at(chain_id_t chain_id);
        [[nodiscard]] const pending_transition_t *find(chain_id_t chain_id) const noexcept;
        [[nodiscard]] size_t num_with_status(status_t status) const noexcept;

        [[nodiscard]] bool resolved() const noexcept
        {
            return num_with_status(status_t::pending) == 0;
        }

        bool operator==(const transition_state_t &o) const = default;
    };
}
