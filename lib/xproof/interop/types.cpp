/* This file is part of xproof project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "types.hpp"

namespace xproof::interop {
    output_root_t output_root_preimage_t::hash() const
    {
        return crypto::keccak::digest(to_bytes(*this));
    }

    block_hash_t block_header_t::hash() const
    {
        return crypto::keccak::digest(to_bytes(*this));
    }

    const initiating_message_t *message_log_t::find(const uint32_t log_index) const noexcept
    {
        for (const auto &m: initiating) {
            if (m.log_index == log_index)
                return &m;
        }
        return nullptr;
    }

    hash_t message_log_t::hash() const
    {
        return crypto::keccak::digest(to_bytes(*this));
    }

    std::string_view hint_name(const hint_kind_t kind)
    {
        using namespace std::string_view_literals;
        switch (kind) {
            case hint_kind_t::agreed_pre_state: return "agreed-pre-state"sv;
            case hint_kind_t::l2_output_root: return "l2-output-root"sv;
            case hint_kind_t::l2_block_header: return "l2-block-header"sv;
            case hint_kind_t::l2_block_messages: return "l2-block-messages"sv;
            [[unlikely]] default: throw error(fmt::format("unsupported hint kind: {}", static_cast<int>(kind)));
        }
    }

    std::string_view status_name(const status_t status)
    {
        using namespace std::string_view_literals;
        switch (status) {
            case status_t::pending: return "pending"sv;
            case status_t::valid: return "valid"sv;
            case status_t::invalid: return "invalid"sv;
            [[unlikely]] default: throw error(fmt::format("unsupported transition status: {}", static_cast<int>(status)));
        }
    }

    std::string_view verdict_name(const verdict_t verdict)
    {
        using namespace std::string_view_literals;
        switch (verdict) {
            case verdict_t::valid: return "valid"sv;
            case verdict_t::invalid: return "invalid"sv;
            [[unlikely]] default: throw error(fmt::format("unsupported verdict: {}", static_cast<int>(verdict)));
        }
    }
}
