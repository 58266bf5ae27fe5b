#pragma once
/* This file is part of xproof project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <optional>
#include "oracle.hpp"

namespace xproof::interop {
    // Typed access to chain data reachable from an output root.
    // Everything is fetched starting from agreed or derived roots, so undecodable data is fatal.
    struct chain_data_t {
        explicit chain_data_t(oracle_client_t &oracle);

        [[nodiscard]] output_root_preimage_t output_root(const output_root_t &root);
        [[nodiscard]] block_header_t header(const block_hash_t &hash);
        // the block committed by an output root
        [[nodiscard]] block_header_t head(const output_root_t &root);
        [[nodiscard]] message_log_t messages(const block_header_t &hdr);
        // walks parent hashes back from the head, returns an empty value if the number is ahead of the head
        // or the walk would have to go past blocks older than min_timestamp
        [[nodiscard]] std::optional<block_header_t> header_at(const block_header_t &head, uint64_t number, uint64_t min_timestamp);
    private:
        oracle_client_t &_oracle;
    };
}
