/* This file is part of xproof project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "test-fixture.hpp"

namespace {
    using namespace xproof;
    using namespace xproof::interop;

    // chain 2 executes a message initiated by chain 1 in the same window
    claim_t two_chain_scenario(fixture_world_t &w, const uint32_t init_log_index, const direction_t direction)
    {
        w.add_chain(1);
        w.add_chain(2);
        const auto pre = w.agree();
        const auto &b1 = w.chain(1).add({ { init_msg(init_log_index, "deposit") }, {} });
        const auto payload = init_msg(0, "deposit").payload_hash;
        w.chain(2).add({ {}, { executing_message_t { message_id_t { 1, b1.header.number, b1.header.timestamp, 0 }, payload } } });
        return w.claim(pre, direction);
    }

    game_output_t run(fixture_world_t &w, const claim_t &claim)
    {
        const auto reg = w.registry();
        oracle_client_t oracle { w.channel };
        return program::run(claim.encode(), oracle, reg, w.derivation);
    }
}

suite xproof_interop_program_suite = [] {
    "xproof::interop::program"_test = [] {
        "two chains with a cross-chain message"_test = [] {
            fixture_world_t w {};
            const auto claim = two_chain_scenario(w, 0, direction_t::asserts_valid);
            expect(run(w, claim) == game_output_t::agree);
            auto opposite = claim;
            opposite.direction = direction_t::asserts_invalid;
            expect(run(w, opposite) == game_output_t::disagree);
        };
        "a mutated initiating message nonce"_test = [] {
            fixture_world_t w {};
            const auto claim = two_chain_scenario(w, 1, direction_t::asserts_valid);
            expect(run(w, claim) == game_output_t::disagree);
            auto opposite = claim;
            opposite.direction = direction_t::asserts_invalid;
            expect(run(w, opposite) == game_output_t::agree);
        };
        "the outcome does not depend on transient channel failures"_test = [] {
            fixture_world_t w {};
            const auto claim = two_chain_scenario(w, 0, direction_t::asserts_valid);
            w.channel.fail_next = 1;
            expect(run(w, claim) == game_output_t::agree);
        };
        "malformed claims are fatal"_test = [] {
            fixture_world_t w {};
            const auto claim = two_chain_scenario(w, 0, direction_t::asserts_valid);
            auto bytes = claim.encode();
            bytes.pop_back();
            const auto reg = w.registry();
            oracle_client_t oracle { w.channel };
            expect(throws<err_malformed_super_root_t>([&] { static_cast<void>(program::run(bytes, oracle, reg, w.derivation)); }));
        };
    };
};
