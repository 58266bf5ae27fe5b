#pragma once
/* This file is part of xproof project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "types.hpp"

namespace xproof::interop {
    // An aggregate commitment over the output roots of all chains of an interop set at a shared timestamp.
    // Layout (OP Stack super root v1): 0x01 || timestamp || { chain_id as a 32-byte big-endian || output root }*
    struct super_root_t {
        static constexpr uint8_t version_v1 = 1;
        static constexpr size_t chain_id_bytes = 32;

        uint8_t version = version_v1;
        uint64_t timestamp = 0;
        chain_roots_t chains {};

        static super_root_t from_bytes(decoder &dec);
        static super_root_t decode(buffer bytes);

        void to_bytes(encoder &enc) const;
        [[nodiscard]] uint8_vector encode() const;
        [[nodiscard]] hash_t hash() const;
        // throws err_malformed_super_root_t when the structural invariants do not hold
        void validate() const;
        [[nodiscard]] const output_root_t *find(chain_id_t chain_id) const noexcept;
        bool operator==(const super_root_t &o) const = default;
    };
}
