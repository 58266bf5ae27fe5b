#pragma once
/* This file is part of xproof project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <map>
#include <string>
#include <boost/container/flat_set.hpp>
#include "provider.hpp"
#include "registry.hpp"
#include "state.hpp"

namespace xproof::interop {
    enum class resolution_status_t: uint8_t {
        valid,
        invalid,
        unresolved
    };

    struct resolution_t {
        resolution_status_t status = resolution_status_t::valid;
        std::string reason {};

        bool operator==(const resolution_t &o) const = default;
    };

    // The bookkeeping of one pass over the pending transitions
    struct pass_t {
        uint64_t index = 0;
        // pending dependency edges: a chain to the chains whose same-window blocks it waits for
        std::map<chain_id_t, boost::container::flat_set<chain_id_t>> waits {};

        // whether a chain of pending dependencies leads from one chain to another
        [[nodiscard]] bool reaches(chain_id_t from, chain_id_t to) const;
    };

    // Validates the executing messages of the block committed by a chain's derived output root
    struct resolver_t {
        resolver_t(chain_data_t &data, const registry_t &registry);

        [[nodiscard]] resolution_t resolve(pass_t &pass, const transition_state_t &state, chain_id_t chain_id, const output_root_t &derived_root) const;
    private:
        chain_data_t &_data;
        const registry_t &_registry;

        void _check_message(pass_t &pass, const transition_state_t &state, const block_header_t &block, const chain_config_t &exec_cfg,
            const executing_message_t &msg) const;
        [[nodiscard]] block_header_t _locate_origin(pass_t &pass, const transition_state_t &state, const block_header_t &block,
            const message_id_t &id) const;
    };
}
