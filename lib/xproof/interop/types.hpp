#pragma once
/* This file is part of xproof project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cstdint>
#include <limits>
#include <vector>
#include <xproof/crypto/keccak.hpp>
#include "encoding.hpp"
#include "errors.hpp"

namespace xproof::interop {
    using chain_id_t = uint64_t;
    using hash_t = crypto::keccak::hash_t;
    using output_root_t = hash_t;
    using block_hash_t = hash_t;

    template<typename T, size_t MIN=0, size_t MAX=std::numeric_limits<uint32_t>::max()>
    struct sequence_t: std::vector<T> {
        static constexpr size_t min_size = MIN;
        static constexpr size_t max_size = MAX;
        static_assert(MIN <= MAX);
        using base_type = std::vector<T>;
        using base_type::base_type;

        void serialize(auto &archive)
        {
            archive.process_array(*this, MIN, MAX);
        }
    };

    // OP Stack output root, version 0
    struct output_root_preimage_t {
        hash_t version {};
        hash_t state_root {};
        hash_t message_passer_storage_root {};
        block_hash_t block_hash {};

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("version"sv, version);
            archive.process("state_root"sv, state_root);
            archive.process("message_passer_storage_root"sv, message_passer_storage_root);
            archive.process("block_hash"sv, block_hash);
        }

        [[nodiscard]] output_root_t hash() const;
        bool operator==(const output_root_preimage_t &o) const = default;
    };

    struct block_header_t {
        chain_id_t chain_id = 0;
        uint64_t number = 0;
        uint64_t timestamp = 0;
        block_hash_t parent_hash {};
        hash_t messages_root {};

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("chain_id"sv, chain_id);
            archive.process("number"sv, number);
            archive.process("timestamp"sv, timestamp);
            archive.process("parent_hash"sv, parent_hash);
            archive.process("messages_root"sv, messages_root);
        }

        [[nodiscard]] block_hash_t hash() const;
        bool operator==(const block_header_t &o) const = default;
    };

    // points to an initiating message: the log index is the message's position in its origin block
    struct message_id_t {
        chain_id_t origin = 0;
        uint64_t block_number = 0;
        uint64_t timestamp = 0;
        uint32_t log_index = 0;

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("origin"sv, origin);
            archive.process("block_number"sv, block_number);
            archive.process("timestamp"sv, timestamp);
            archive.process("log_index"sv, log_index);
        }

        bool operator==(const message_id_t &o) const = default;
    };

    struct initiating_message_t {
        uint32_t log_index = 0;
        hash_t payload_hash {};

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("log_index"sv, log_index);
            archive.process("payload_hash"sv, payload_hash);
        }

        bool operator==(const initiating_message_t &o) const = default;
    };

    struct executing_message_t {
        message_id_t id {};
        hash_t payload_hash {};

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("id"sv, id);
            archive.process("payload_hash"sv, payload_hash);
        }

        bool operator==(const executing_message_t &o) const = default;
    };

    struct message_log_t {
        sequence_t<initiating_message_t> initiating {};
        sequence_t<executing_message_t> executing {};

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("initiating"sv, initiating);
            archive.process("executing"sv, executing);
        }

        [[nodiscard]] const initiating_message_t *find(uint32_t log_index) const noexcept;
        [[nodiscard]] hash_t hash() const;
        bool operator==(const message_log_t &o) const = default;
    };

    struct chain_root_t {
        chain_id_t chain_id = 0;
        output_root_t root {};

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("chain_id"sv, chain_id);
            archive.process("root"sv, root);
        }

        bool operator==(const chain_root_t &o) const = default;
    };
    using chain_roots_t = sequence_t<chain_root_t>;

    enum class hint_kind_t: uint8_t {
        agreed_pre_state,
        l2_output_root,
        l2_block_header,
        l2_block_messages
    };

    enum class status_t: uint8_t {
        pending = 0,
        valid = 1,
        invalid = 2
    };

    enum class verdict_t: uint8_t {
        valid = 0,
        invalid = 1
    };

    extern std::string_view hint_name(hint_kind_t kind);
    extern std::string_view status_name(status_t status);
    extern std::string_view verdict_name(verdict_t verdict);
}

namespace fmt {
    template<>
    struct formatter<xproof::interop::status_t>: formatter<std::string_view> {
        template<typename FormatContext>
        auto format(const xproof::interop::status_t &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return formatter<std::string_view>::format(xproof::interop::status_name(v), ctx);
        }
    };

    template<>
    struct formatter<xproof::interop::verdict_t>: formatter<std::string_view> {
        template<typename FormatContext>
        auto format(const xproof::interop::verdict_t &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return formatter<std::string_view>::format(xproof::interop::verdict_name(v), ctx);
        }
    };
}
