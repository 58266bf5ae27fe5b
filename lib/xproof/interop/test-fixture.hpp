#pragma once
/* This file is part of xproof project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <deque>
#include <limits>
#include <map>
#include <random>
#include <boost/container/flat_set.hpp>
#include <xproof/common/test.hpp>
#include "program.hpp"

namespace xproof::interop {
    // An in-memory preimage host that can be instructed to drop or corrupt the next responses
    struct fixture_channel_t: preimage_channel_t {
        std::vector<std::string> hints {};
        size_t num_gets = 0;
        size_t fail_next = 0;
        size_t corrupt_next = 0;

        hash_t put(const buffer preimage)
        {
            const auto hash = crypto::keccak::digest(preimage);
            _store.insert_or_assign(keccak_key(hash), uint8_vector { preimage });
            return hash;
        }

        // stores bytes that do not hash to the key
        void put_raw(const hash_t &hash, const buffer bytes)
        {
            _store.insert_or_assign(keccak_key(hash), uint8_vector { bytes });
        }

        void hint(const std::string_view h) override
        {
            hints.emplace_back(h);
        }

        std::optional<uint8_vector> get(const preimage_key_t &key) override
        {
            ++num_gets;
            if (fail_next > 0) {
                --fail_next;
                return {};
            }
            const auto it = _store.find(key);
            if (it == _store.end())
                return {};
            if (corrupt_next > 0) {
                --corrupt_next;
                auto bytes = it->second;
                bytes << uint8_t { 0x00 };
                return bytes;
            }
            return it->second;
        }
    private:
        std::map<preimage_key_t, uint8_vector> _store {};
    };

    struct fixture_derivation_t: derivation_t {
        std::map<chain_id_t, output_root_t> roots {};

        output_root_t derive(const chain_id_t chain_id, const output_root_t &, const uint64_t) override
        {
            if (const auto it = roots.find(chain_id); it != roots.end())
                return it->second;
            throw error(fmt::format("no derived output root for chain {}", chain_id));
        }
    };

    struct block_ref_t {
        block_header_t header {};
        message_log_t log {};
        output_root_t root {};
    };

    // Produces a linear chain of blocks and publishes their preimages to a fixture channel
    struct chain_builder_t {
        chain_builder_t(fixture_channel_t &channel, const chain_id_t chain_id, const uint64_t genesis_time, const uint64_t block_time):
            _channel { channel },
            _chain_id { chain_id },
            _block_time { block_time }
        {
            _blocks.emplace_back(_publish(block_header_t { chain_id, 0, genesis_time, {}, {} }, {}));
        }

        const block_ref_t &add(message_log_t log={})
        {
            const auto &prev = tip().header;
            return _blocks.emplace_back(_publish(block_header_t { _chain_id, prev.number + 1, prev.timestamp + _block_time, prev.hash(), {} }, std::move(log)));
        }

        [[nodiscard]] const block_ref_t &tip() const
        {
            return _blocks.back();
        }

        [[nodiscard]] const block_ref_t &at(const uint64_t number) const
        {
            return _blocks.at(number);
        }

        [[nodiscard]] chain_config_t config(const uint64_t expiry_window) const
        {
            const auto &g = _blocks.front().header;
            return { _chain_id, _block_time, expiry_window, {}, genesis_t { g.number, g.timestamp, g.hash() } };
        }

        [[nodiscard]] chain_id_t id() const noexcept
        {
            return _chain_id;
        }
    private:
        fixture_channel_t &_channel;
        chain_id_t _chain_id;
        uint64_t _block_time;
        std::deque<block_ref_t> _blocks {};

        block_ref_t _publish(block_header_t hdr, message_log_t log)
        {
            hdr.messages_root = _channel.put(to_bytes(log));
            const auto block_hash = _channel.put(to_bytes(hdr));
            const auto state_root = crypto::keccak::digest({ static_cast<buffer>(block_hash), buffer { std::string_view { "state" } } });
            const output_root_preimage_t oroot { {}, state_root, {}, block_hash };
            const auto root = _channel.put(to_bytes(oroot));
            return { std::move(hdr), std::move(log), root };
        }
    };

    // A set of chains sharing one preimage host
    struct fixture_world_t {
        static constexpr uint64_t genesis_time = 1'000'000;
        static constexpr uint64_t block_time = 2;

        fixture_channel_t channel {};
        fixture_derivation_t derivation {};
        std::map<chain_id_t, chain_builder_t> chains {};
        uint64_t expiry_window = 3600;
        std::map<chain_id_t, std::optional<uint64_t>> interop_times {};
        // registry overrides of the genesis hashes
        std::map<chain_id_t, block_hash_t> genesis_hashes {};

        chain_builder_t &add_chain(const chain_id_t chain_id, const uint64_t chain_block_time=block_time)
        {
            return chains.try_emplace(chain_id, channel, chain_id, genesis_time, chain_block_time).first->second;
        }

        chain_builder_t &chain(const chain_id_t chain_id)
        {
            return chains.at(chain_id);
        }

        [[nodiscard]] registry_t registry() const
        {
            std::vector<chain_config_t> cfgs {};
            for (const auto &[id, c]: chains) {
                auto &cfg = cfgs.emplace_back(c.config(expiry_window));
                if (const auto it = interop_times.find(id); it != interop_times.end())
                    cfg.interop_time = it->second;
                if (const auto it = genesis_hashes.find(id); it != genesis_hashes.end())
                    cfg.genesis.hash = it->second;
            }
            return registry_t { cfgs };
        }

        [[nodiscard]] super_root_t tips(const uint64_t timestamp) const
        {
            super_root_t sr { super_root_t::version_v1, timestamp, {} };
            for (const auto &[id, c]: chains)
                sr.chains.push_back(chain_root_t { id, c.tip().root });
            return sr;
        }

        // publishes the current tips as the agreed pre-state
        hash_t agree()
        {
            return channel.put(tips(chains.begin()->second.tip().header.timestamp).encode());
        }

        // derives the current tips and claims them
        claim_t claim(const hash_t &pre_hash, const direction_t direction=direction_t::asserts_valid)
        {
            const auto timestamp = chains.begin()->second.tip().header.timestamp;
            const auto post = tips(timestamp);
            for (const auto &c: post.chains)
                derivation.roots.insert_or_assign(c.chain_id, c.root);
            return { pre_hash, post.hash(), timestamp, post.chains, direction };
        }

        outcome_t run(const claim_t &claim)
        {
            const auto reg = registry();
            oracle_client_t oracle { channel };
            machine_t machine { oracle, reg, derivation };
            return machine.run(claim);
        }
    };

    inline initiating_message_t init_msg(const uint32_t log_index, const std::string_view payload)
    {
        return { log_index, crypto::keccak::digest(buffer { payload }) };
    }

    inline executing_message_t exec_msg(const block_ref_t &origin, const uint32_t log_index, const std::string_view payload)
    {
        return { message_id_t { origin.header.chain_id, origin.header.number, origin.header.timestamp, log_index }, crypto::keccak::digest(buffer { payload }) };
    }

    inline hash_t random_hash(std::mt19937_64 &rng)
    {
        hash_t h {};
        for (auto &b: h)
            b = static_cast<uint8_t>(rng());
        return h;
    }

    // ascending chain roots with random ids, optionally including the extreme ids
    inline chain_roots_t random_chain_roots(std::mt19937_64 &rng, const size_t num_chains, const bool with_zero, const bool with_max)
    {
        boost::container::flat_set<chain_id_t> ids {};
        if (with_zero)
            ids.emplace(0);
        if (with_max && ids.size() < num_chains)
            ids.emplace(std::numeric_limits<chain_id_t>::max());
        while (ids.size() < num_chains)
            ids.emplace(rng());
        chain_roots_t roots {};
        for (const auto id: ids)
            roots.push_back(chain_root_t { id, random_hash(rng) });
        return roots;
    }
}
