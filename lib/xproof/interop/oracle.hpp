#pragma once
/* This file is part of xproof project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <optional>
#include <string>
#include <xproof/storage/memory.hpp>
#include "types.hpp"

namespace xproof::interop {
    using preimage_key_t = byte_array<32>;

    // The transport to the host's preimage store
    struct preimage_channel_t {
        virtual ~preimage_channel_t() = default;
        virtual void hint(std::string_view hint) = 0;
        // an empty result means that the host could not produce the preimage
        [[nodiscard]] virtual std::optional<uint8_vector> get(const preimage_key_t &key) = 0;
    };

    // keccak-256 preimages are addressed by the hash with the first byte replaced by the key type
    extern preimage_key_t keccak_key(const hash_t &hash);

    struct oracle_client_t {
        static constexpr uint8_t keccak_key_type = 0x02;
        static constexpr size_t max_attempts = 2;

        explicit oracle_client_t(preimage_channel_t &channel, storage::db_ptr_t cache=std::make_shared<storage::memory::db_t>());

        void hint(hint_kind_t kind, buffer params);
        // returns bytes whose keccak-256 hash equals the requested one or throws err_preimage_unavailable_t
        [[nodiscard]] uint8_vector fetch(const hash_t &hash);
        [[nodiscard]] uint8_vector fetch(hint_kind_t kind, const hash_t &hash);

        [[nodiscard]] const storage::db_t &cache() const noexcept
        {
            return *_cache;
        }
    private:
        preimage_channel_t &_channel;
        storage::db_ptr_t _cache;
    };
}
