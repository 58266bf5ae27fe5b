/* This file is part of xproof project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "super-root.hpp"

namespace xproof::interop {
    namespace {
        constexpr size_t chain_entry_bytes = super_root_t::chain_id_bytes + sizeof(output_root_t);

        void validate_chains(const chain_roots_t &chains)
        {
            if (chains.empty()) [[unlikely]]
                throw err_malformed_super_root_t("a super root must contain at least one chain");
            for (size_t i = 1; i < chains.size(); ++i) {
                if (chains[i - 1].chain_id >= chains[i].chain_id) [[unlikely]]
                    throw err_malformed_super_root_t(fmt::format("chain ids must be strictly ascending but got {} followed by {}",
                        chains[i - 1].chain_id, chains[i].chain_id));
            }
        }
    }

    super_root_t super_root_t::from_bytes(decoder &dec)
    {
        super_root_t res {};
        try {
            res.version = dec.uint_fixed<uint8_t>(1);
            if (res.version != version_v1) [[unlikely]]
                throw err_malformed_super_root_t(fmt::format("unsupported super root version: {}", res.version));
            res.timestamp = dec.uint_fixed<uint64_t>(8);
            if (dec.size() % chain_entry_bytes != 0) [[unlikely]]
                throw err_malformed_super_root_t(fmt::format("the chain list of {} bytes is not a multiple of {}", dec.size(), chain_entry_bytes));
            while (!dec.empty()) {
                auto &c = res.chains.emplace_back();
                const auto id_bytes = dec.next_bytes(chain_id_bytes);
                for (size_t i = 0; i < chain_id_bytes - sizeof(chain_id_t); ++i) {
                    if (id_bytes[i] != 0) [[unlikely]]
                        throw err_malformed_super_root_t(fmt::format("chain id {} does not fit into 64 bits", id_bytes));
                }
                decoder id_dec { id_bytes.subbuf(chain_id_bytes - sizeof(chain_id_t)) };
                c.chain_id = id_dec.uint_fixed<chain_id_t>(sizeof(chain_id_t));
                dec.process_bytes_fixed(c.root);
            }
        } catch (const err_malformed_super_root_t &) {
            throw;
        } catch (const error &ex) {
            throw err_malformed_super_root_t("a truncated super root", ex);
        }
        validate_chains(res.chains);
        return res;
    }

    super_root_t super_root_t::decode(const buffer bytes)
    {
        return interop::from_bytes<super_root_t>(bytes);
    }

    void super_root_t::to_bytes(encoder &enc) const
    {
        validate();
        enc.uint_fixed(1, version);
        enc.uint_fixed(8, timestamp);
        for (const auto &c: chains) {
            enc.uint_fixed(chain_id_bytes - sizeof(chain_id_t), 0);
            enc.uint_fixed(sizeof(chain_id_t), c.chain_id);
            enc.process_bytes_fixed(c.root);
        }
    }

    uint8_vector super_root_t::encode() const
    {
        return interop::to_bytes(*this);
    }

    hash_t super_root_t::hash() const
    {
        return crypto::keccak::digest(encode());
    }

    void super_root_t::validate() const
    {
        if (version != version_v1) [[unlikely]]
            throw err_malformed_super_root_t(fmt::format("unsupported super root version: {}", version));
        validate_chains(chains);
    }

    const output_root_t *super_root_t::find(const chain_id_t chain_id) const noexcept
    {
        const auto it = std::lower_bound(chains.begin(), chains.end(), chain_id, [](const auto &c, const auto id) {
            return c.chain_id < id;
        });
        if (it != chains.end() && it->chain_id == chain_id)
            return &it->root;
        return nullptr;
    }
}
