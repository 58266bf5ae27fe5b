#pragma once
/* This file is part of xproof project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <map>
#include <optional>
#include <string>
#include <boost/json.hpp>
#include "types.hpp"

namespace xproof::interop {
    struct genesis_t {
        uint64_t number = 0;
        uint64_t timestamp = 0;
        block_hash_t hash {};

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("number"sv, number);
            archive.process("timestamp"sv, timestamp);
            archive.process("hash"sv, hash);
        }

        bool operator==(const genesis_t &o) const = default;
    };

    struct chain_config_t {
        chain_id_t chain_id = 0;
        // seconds
        uint64_t block_time = 0;
        // the maximum age of an initiating message in seconds
        uint64_t message_expiry_window = 0;
        std::optional<uint64_t> interop_time {};
        genesis_t genesis {};

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("chain_id"sv, chain_id);
            archive.process("block_time"sv, block_time);
            archive.process("message_expiry_window"sv, message_expiry_window);
            archive.process("interop_time"sv, interop_time);
            archive.process("genesis"sv, genesis);
        }

        [[nodiscard]] bool interop_active(uint64_t timestamp) const noexcept
        {
            return !interop_time || timestamp >= *interop_time;
        }

        bool operator==(const chain_config_t &o) const = default;
    };

    // Read-only static parameters of the chains of an interop set
    struct registry_t {
        using map_t = std::map<chain_id_t, chain_config_t>;

        static registry_t from_json(const boost::json::value &j);
        static registry_t load(const std::string &path);

        explicit registry_t(const std::vector<chain_config_t> &chains);

        // throws err_unknown_chain_t
        [[nodiscard]] const chain_config_t &at(chain_id_t chain_id) const;
        [[nodiscard]] const chain_config_t *find(chain_id_t chain_id) const noexcept;

        [[nodiscard]] size_t size() const noexcept
        {
            return _chains.size();
        }

        [[nodiscard]] const map_t &chains() const noexcept
        {
            return _chains;
        }
    private:
        map_t _chains {};
    };
}
