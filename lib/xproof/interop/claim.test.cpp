/* This file is part of xproof project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "test-fixture.hpp"

namespace {
    using namespace xproof;
    using namespace xproof::interop;

    claim_t sample_claim()
    {
        return {
            hash_t::from_hex("AA00000000000000000000000000000000000000000000000000000000000001"),
            hash_t::from_hex("BB00000000000000000000000000000000000000000000000000000000000002"),
            1700000000,
            { chain_root_t { 1, hash_t::from_hex("CC00000000000000000000000000000000000000000000000000000000000003") },
              chain_root_t { 2, hash_t::from_hex("DD00000000000000000000000000000000000000000000000000000000000004") } },
            direction_t::asserts_invalid
        };
    }
}

suite xproof_interop_claim_suite = [] {
    "xproof::interop::claim"_test = [] {
        "encoding"_test = [] {
            const auto c = sample_claim();
            const auto bytes = c.encode();
            expect_equal(size_t { 32 + 32 + 8 + 4 + 2 * 40 + 1 }, bytes.size());
            expect_equal(uint8_t { 0x01 }, bytes.back());
            expect_equal(uint8_vector::from_hex("000000006553F10000000002"), uint8_vector { static_cast<buffer>(bytes).subbuf(64, 12) });
            expect(claim_t::decode(bytes) == c);
            expect(c.find(2) != nullptr && *c.find(2) == c.claimed[1].root);
            expect(c.find(3) == nullptr);
        };
        "generated round trips"_test = [] {
            std::mt19937_64 rng { 0x5EED0002 };
            std::uniform_int_distribution<size_t> num_chains { 1, 24 };
            for (size_t i = 0; i < 512; ++i) {
                const claim_t c {
                    random_hash(rng), random_hash(rng), rng(),
                    random_chain_roots(rng, num_chains(rng), i % 3 == 0, i % 4 == 0),
                    rng() % 2 == 0 ? direction_t::asserts_valid : direction_t::asserts_invalid
                };
                const auto bytes = c.encode();
                expect_equal(size_t { 32 + 32 + 8 + 4 + c.claimed.size() * 40 + 1 }, bytes.size());
                expect(claim_t::decode(bytes) == c) << fmt::format("iteration {}: {}", i, bytes);
            }
        };
        "malformed claims"_test = [] {
            const auto bytes = sample_claim().encode();
            {
                auto b = bytes;
                b.back() = 0x02;
                expect(throws<err_malformed_super_root_t>([&] { static_cast<void>(claim_t::decode(b)); }));
            }
            {
                auto b = bytes;
                b << uint8_t { 0 };
                expect(throws<err_malformed_super_root_t>([&] { static_cast<void>(claim_t::decode(b)); }));
            }
            {
                auto b = bytes;
                b.resize(b.size() - 2);
                expect(throws<err_malformed_super_root_t>([&] { static_cast<void>(claim_t::decode(b)); }));
            }
            auto c = sample_claim();
            std::swap(c.claimed[0], c.claimed[1]);
            expect(throws<err_malformed_super_root_t>([&] { static_cast<void>(c.encode()); }));
            c.claimed.clear();
            expect(throws<err_malformed_super_root_t>([&] { static_cast<void>(c.encode()); }));
        };
        "classifier"_test = [] {
            expect(classify(verdict_t::valid, direction_t::asserts_valid) == game_output_t::agree);
            expect(classify(verdict_t::invalid, direction_t::asserts_valid) == game_output_t::disagree);
            expect(classify(verdict_t::valid, direction_t::asserts_invalid) == game_output_t::disagree);
            expect(classify(verdict_t::invalid, direction_t::asserts_invalid) == game_output_t::agree);
            expect_equal(uint8_t { 0x00 }, static_cast<uint8_t>(game_output_t::agree));
            expect_equal(uint8_t { 0x01 }, static_cast<uint8_t>(game_output_t::disagree));
        };
    };
};
