#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <initializer_list>
#include <memory>
#include <xproof/common/bytes.hpp>

namespace xproof::crypto::keccak {
    using hash_t = byte_array<32>;

    // Ethereum keccak-256, which pads differently from the NIST SHA3-256
    struct hasher_t {
        hasher_t();
        ~hasher_t();

        hasher_t &update(buffer data);
        [[nodiscard]] hash_t finish();
    private:
        struct impl;
        std::unique_ptr<impl> _impl;
    };

    [[nodiscard]] extern hash_t digest(buffer in);
    // the digest of the concatenation of the parts
    [[nodiscard]] extern hash_t digest(std::initializer_list<buffer> parts);
}
