/* This file is part of xproof project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <xproof/common/logger.hpp>
#include "resolver.hpp"

namespace xproof::interop {
    bool pass_t::reaches(const chain_id_t from, const chain_id_t to) const
    {
        boost::container::flat_set<chain_id_t> seen {};
        std::vector<chain_id_t> stack { from };
        while (!stack.empty()) {
            const auto cur = stack.back();
            stack.pop_back();
            if (cur == to)
                return true;
            if (!seen.emplace(cur).second)
                continue;
            if (const auto it = waits.find(cur); it != waits.end()) {
                for (const auto next: it->second)
                    stack.emplace_back(next);
            }
        }
        return false;
    }

    resolver_t::resolver_t(chain_data_t &data, const registry_t &registry):
        _data { data },
        _registry { registry }
    {
    }

    resolution_t resolver_t::resolve(pass_t &pass, const transition_state_t &state, const chain_id_t chain_id, const output_root_t &derived_root) const
    {
        const auto &exec_cfg = _registry.at(chain_id);
        const auto block = _data.head(derived_root);
        if (block.chain_id != chain_id) [[unlikely]]
            throw err_malformed_preimage_t(fmt::format("the output root {} of chain {} commits to a block of chain {}", derived_root, chain_id, block.chain_id));
        const auto log = _data.messages(block);
        if (!log.executing.empty() && !exec_cfg.interop_active(block.timestamp))
            return { resolution_status_t::invalid, fmt::format("block {} of chain {} executes messages before the interop activation", block.number, chain_id) };
        std::optional<std::string> unresolved {};
        for (const auto &msg: log.executing) {
            std::optional<std::string> invalid {};
            dependency_err_t::catch_into(
                [&] {
                    _check_message(pass, state, block, exec_cfg, msg);
                },
                [&](dependency_err_t err) {
                    if (err.invalid()) {
                        invalid.emplace(err.what());
                    } else if (!unresolved) {
                        unresolved.emplace(err.what());
                    }
                }
            );
            // an invalid message makes the whole block invalid
            if (invalid) {
                logger::debug("pass {}: chain {} block {}: {}", pass.index, chain_id, block.number, *invalid);
                return { resolution_status_t::invalid, std::move(*invalid) };
            }
        }
        if (unresolved) {
            logger::debug("pass {}: chain {} block {}: {}", pass.index, chain_id, block.number, *unresolved);
            return { resolution_status_t::unresolved, std::move(*unresolved) };
        }
        return { resolution_status_t::valid, {} };
    }

    void resolver_t::_check_message(pass_t &pass, const transition_state_t &state, const block_header_t &block, const chain_config_t &exec_cfg,
        const executing_message_t &msg) const
    {
        const auto &id = msg.id;
        const auto *origin_cfg = _registry.find(id.origin);
        if (!origin_cfg || !state.find(id.origin))
            throw err_dependency_invalid_t(fmt::format("origin chain {} is not a part of the interop set", id.origin));
        if (id.timestamp > block.timestamp)
            throw err_dependency_invalid_t(fmt::format("the initiating message at {} is newer than its executing block at {}", id.timestamp, block.timestamp));
        if (block.timestamp - id.timestamp > exec_cfg.message_expiry_window)
            throw err_dependency_invalid_t(fmt::format("the initiating message at {} has expired by the time {}: the expiry window is {}",
                id.timestamp, block.timestamp, exec_cfg.message_expiry_window));
        if (!origin_cfg->interop_active(id.timestamp))
            throw err_dependency_invalid_t(fmt::format("the initiating message at {} predates the interop activation of chain {}", id.timestamp, id.origin));
        if (id.block_number < origin_cfg->genesis.number || id.timestamp < origin_cfg->genesis.timestamp)
            throw err_dependency_invalid_t(fmt::format("the initiating message block {} at {} predates the genesis of chain {}",
                id.block_number, id.timestamp, id.origin));
        const auto origin_block = _locate_origin(pass, state, block, id);
        if (origin_block.number == origin_cfg->genesis.number && origin_block.hash() != origin_cfg->genesis.hash) [[unlikely]]
            throw err_invalid_registry_t(fmt::format("the genesis block {} of chain {} has hash {} but the registry expects {}",
                origin_block.number, id.origin, origin_block.hash(), origin_cfg->genesis.hash));
        if (origin_block.timestamp != id.timestamp)
            throw err_dependency_invalid_t(fmt::format("block {} of chain {} has timestamp {} but the message references {}",
                origin_block.number, id.origin, origin_block.timestamp, id.timestamp));
        const auto origin_log = _data.messages(origin_block);
        const auto *init = origin_log.find(id.log_index);
        if (!init)
            throw err_dependency_invalid_t(fmt::format("block {} of chain {} has no initiating message with log index {}",
                origin_block.number, id.origin, id.log_index));
        if (init->payload_hash != msg.payload_hash)
            throw err_dependency_invalid_t(fmt::format("the payload hash {} of message {} in block {} of chain {} does not match the executing message's {}",
                init->payload_hash, id.log_index, origin_block.number, id.origin, msg.payload_hash));
    }

    block_header_t resolver_t::_locate_origin(pass_t &pass, const transition_state_t &state, const block_header_t &block, const message_id_t &id) const
    {
        // the message timestamp is already known to be within the expiry window
        const auto walk_from = [&](const block_header_t &head) {
            auto hdr = _data.header_at(head, id.block_number, id.timestamp);
            if (!hdr)
                throw err_dependency_invalid_t(fmt::format("block {} of chain {} at {} is not reachable from block {}",
                    id.block_number, id.origin, id.timestamp, head.number));
            return std::move(*hdr);
        };
        // messages of the same chain including the executing block itself
        if (id.origin == block.chain_id)
            return walk_from(block);
        const auto &origin = state.at(id.origin);
        const auto pre_head = _data.head(origin.pre_root);
        if (id.block_number <= pre_head.number)
            return walk_from(pre_head);
        const auto derived_head = _data.head(origin.derived_root);
        if (id.block_number > derived_head.number)
            throw err_dependency_invalid_t(fmt::format("block {} of chain {} is ahead of its derived head {}", id.block_number, id.origin, derived_head.number));
        switch (origin.status) {
            case status_t::valid:
                return walk_from(derived_head);
            case status_t::invalid:
                throw err_dependency_invalid_t(fmt::format("block {} of chain {} belongs to an invalid transition", id.block_number, id.origin));
            case status_t::pending: {
                pass.waits[block.chain_id].emplace(id.origin);
                if (pass.reaches(id.origin, block.chain_id))
                    throw err_unresolved_dependency_t(fmt::format("a dependency cycle between chains {} and {} at block {}", block.chain_id, id.origin, id.block_number));
                throw err_unresolved_dependency_t(fmt::format("chain {} waits for the pending transition of chain {}", block.chain_id, id.origin));
            }
            [[unlikely]] default:
                throw error(fmt::format("unsupported transition status: {}", static_cast<int>(origin.status)));
        }
    }
}
