/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <hash-library/keccak.h>
#include "keccak.hpp"

namespace xproof::crypto::keccak {
    struct hasher_t::impl {
        Keccak state { Keccak::Keccak256 };
    };

    hasher_t::hasher_t():
        _impl { std::make_unique<impl>() }
    {
    }

    hasher_t::~hasher_t() =default;

    hasher_t &hasher_t::update(const buffer data)
    {
        _impl->state.add(data.data(), data.size());
        return *this;
    }

    hash_t hasher_t::finish()
    {
        hash_t out {};
        _impl->state.getHashBin(out);
        return out;
    }

    hash_t digest(const buffer in)
    {
        return hasher_t {}.update(in).finish();
    }

    hash_t digest(const std::initializer_list<buffer> parts)
    {
        hasher_t h {};
        for (const auto &p: parts)
            h.update(p);
        return h.finish();
    }
}
