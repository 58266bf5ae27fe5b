/* This file is part of xproof project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "provider.hpp"

namespace xproof::interop {
    namespace {
        template<typename T>
        T decode_preimage(const buffer bytes, const hash_t &hash)
        {
            try {
                return from_bytes<T>(bytes);
            } catch (const error &ex) {
                throw err_malformed_preimage_t(fmt::format("the preimage of {} cannot be decoded as {}", hash, typeid(T).name()), ex);
            }
        }
    }

    chain_data_t::chain_data_t(oracle_client_t &oracle):
        _oracle { oracle }
    {
    }

    output_root_preimage_t chain_data_t::output_root(const output_root_t &root)
    {
        const auto bytes = _oracle.fetch(hint_kind_t::l2_output_root, root);
        auto res = decode_preimage<output_root_preimage_t>(bytes, root);
        if (res.version != hash_t {}) [[unlikely]]
            throw err_malformed_preimage_t(fmt::format("unsupported output root version {} in {}", res.version, root));
        return res;
    }

    block_header_t chain_data_t::header(const block_hash_t &hash)
    {
        const auto bytes = _oracle.fetch(hint_kind_t::l2_block_header, hash);
        return decode_preimage<block_header_t>(bytes, hash);
    }

    block_header_t chain_data_t::head(const output_root_t &root)
    {
        return header(output_root(root).block_hash);
    }

    message_log_t chain_data_t::messages(const block_header_t &hdr)
    {
        const auto bytes = _oracle.fetch(hint_kind_t::l2_block_messages, hdr.messages_root);
        return decode_preimage<message_log_t>(bytes, hdr.messages_root);
    }

    std::optional<block_header_t> chain_data_t::header_at(const block_header_t &head, const uint64_t number, const uint64_t min_timestamp)
    {
        if (number > head.number)
            return {};
        auto hdr = head;
        while (hdr.number > number) {
            // timestamps strictly increase, so the requested block is older than min_timestamp
            if (hdr.timestamp <= min_timestamp)
                return {};
            auto parent = header(hdr.parent_hash);
            if (parent.chain_id != hdr.chain_id || parent.number + 1 != hdr.number || parent.timestamp >= hdr.timestamp) [[unlikely]]
                throw err_malformed_preimage_t(fmt::format("block {} of chain {} at {} has an inconsistent parent: block {} of chain {} at {}",
                    hdr.number, hdr.chain_id, hdr.timestamp, parent.number, parent.chain_id, parent.timestamp));
            hdr = std::move(parent);
        }
        return hdr;
    }
}
