/* This file is part of xproof project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <xproof/common/logger.hpp>
#include "oracle.hpp"

namespace xproof::interop {
    preimage_key_t keccak_key(const hash_t &hash)
    {
        preimage_key_t key { hash };
        key[0] = oracle_client_t::keccak_key_type;
        return key;
    }

    oracle_client_t::oracle_client_t(preimage_channel_t &channel, storage::db_ptr_t cache):
        _channel { channel },
        _cache { std::move(cache) }
    {
        if (!_cache) [[unlikely]]
            throw error("oracle_client_t requires a preimage cache");
    }

    void oracle_client_t::hint(const hint_kind_t kind, const buffer params)
    {
        _channel.hint(fmt::format("{} 0x{}", hint_name(kind), params));
    }

    uint8_vector oracle_client_t::fetch(const hash_t &hash)
    {
        if (auto cached = _cache->get(hash); cached)
            return std::move(*cached);
        const auto key = keccak_key(hash);
        for (size_t attempt = 1; attempt <= max_attempts; ++attempt) {
            auto resp = _channel.get(key);
            if (!resp) {
                logger::warn("preimage {} attempt {}/{}: no response", hash, attempt, max_attempts);
                continue;
            }
            if (const auto act_hash = crypto::keccak::digest(*resp); act_hash != hash) {
                logger::warn("preimage {} attempt {}/{}: the response hashes to {}", hash, attempt, max_attempts, act_hash);
                continue;
            }
            _cache->set(hash, *resp);
            return std::move(*resp);
        }
        throw err_preimage_unavailable_t(fmt::format("the preimage of {} is unavailable after {} attempts", hash, max_attempts));
    }

    uint8_vector oracle_client_t::fetch(const hint_kind_t kind, const hash_t &hash)
    {
        hint(kind, hash);
        return fetch(hash);
    }
}
