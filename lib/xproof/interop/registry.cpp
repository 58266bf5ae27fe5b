/* This file is part of xproof project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <xproof/codec/json.hpp>
#include <xproof/common/logger.hpp>
#include "registry.hpp"

namespace xproof::interop {
    registry_t registry_t::from_json(const boost::json::value &j)
    {
        using namespace std::string_view_literals;
        std::vector<chain_config_t> chains {};
        try {
            codec::json::decoder dec { j };
            dec.push("chains"sv);
            dec.process_array(chains);
            dec.pop();
        } catch (const std::exception &ex) {
            throw err_invalid_registry_t("failed to parse the chain registry", ex);
        }
        return registry_t { chains };
    }

    registry_t registry_t::load(const std::string &path)
    {
        logger::debug("loading the chain registry from {}", path);
        boost::json::value j {};
        try {
            j = codec::json::load(path);
        } catch (const std::exception &ex) {
            throw err_invalid_registry_t(fmt::format("failed to load the chain registry from {}", path), ex);
        }
        return from_json(j);
    }

    registry_t::registry_t(const std::vector<chain_config_t> &chains)
    {
        for (const auto &c: chains) {
            if (c.block_time == 0) [[unlikely]]
                throw err_invalid_registry_t(fmt::format("chain {} has a zero block time", c.chain_id));
            if (const auto [it, created] = _chains.try_emplace(c.chain_id, c); !created) [[unlikely]]
                throw err_invalid_registry_t(fmt::format("chain {} is registered more than once", c.chain_id));
        }
    }

    const chain_config_t &registry_t::at(const chain_id_t chain_id) const
    {
        if (const auto *cfg = find(chain_id); cfg) [[likely]]
            return *cfg;
        throw err_unknown_chain_t(fmt::format("chain {} is not registered", chain_id));
    }

    const chain_config_t *registry_t::find(const chain_id_t chain_id) const noexcept
    {
        if (const auto it = _chains.find(chain_id); it != _chains.end())
            return &it->second;
        return nullptr;
    }
}
