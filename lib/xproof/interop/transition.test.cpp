/* This file is part of xproof project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "test-fixture.hpp"

namespace {
    using namespace xproof;
    using namespace xproof::interop;

    void expect_verdict(const verdict_t exp, const outcome_t &out, const std::source_location &loc=std::source_location::current())
    {
        expect(out.verdict == exp, loc) << fmt::format("expected verdict {} but got {}: {}", exp, out.verdict, out.reason);
    }
}

suite xproof_interop_transition_suite = [] {
    "xproof::interop::transition"_test = [] {
        "single chain without messages"_test = [] {
            fixture_world_t w {};
            w.add_chain(10);
            const auto pre = w.agree();
            w.chain(10).add();
            const auto claim = w.claim(pre);
            const auto out = w.run(claim);
            expect_verdict(verdict_t::valid, out);
            expect_equal(uint64_t { 1 }, out.state.passes);
            expect(out.state.at(10).status == status_t::valid);

            // a different claimed root while the derivation does not change
            auto bad_claim = claim;
            bad_claim.claimed[0].root = w.chain(10).at(0).root;
            bad_claim.post_hash = super_root_t { super_root_t::version_v1, claim.timestamp, bad_claim.claimed }.hash();
            const auto bad_out = w.run(bad_claim);
            expect_verdict(verdict_t::invalid, bad_out);
            expect(bad_out.state.at(10).status == status_t::invalid);
        };
        "a dependency on a higher chain takes two passes"_test = [] {
            fixture_world_t w {};
            w.add_chain(1);
            w.add_chain(2);
            const auto pre = w.agree();
            const auto &b2 = w.chain(2).add({ { init_msg(0, "from 2") }, {} });
            w.chain(1).add({ {}, { exec_msg(b2, 0, "from 2") } });
            const auto out = w.run(w.claim(pre));
            expect_verdict(verdict_t::valid, out);
            expect_equal(uint64_t { 2 }, out.state.passes);
        };
        "expiry flips the verdict"_test = [] {
            fixture_world_t w {};
            w.add_chain(1);
            w.add_chain(2);
            const auto pre = w.agree();
            const auto &b1 = w.chain(1).add({ { init_msg(0, "msg") }, {} });
            w.chain(2).add();
            w.chain(1).add();
            w.chain(2).add({ {}, { exec_msg(b1, 0, "msg") } });
            const auto claim = w.claim(pre);
            w.expiry_window = 2;
            expect_verdict(verdict_t::valid, w.run(claim));
            w.expiry_window = 1;
            const auto out = w.run(claim);
            expect_verdict(verdict_t::invalid, out);
            expect(out.state.at(1).status == status_t::valid);
            expect(out.state.at(2).status == status_t::invalid);
        };
        "chains with different block times"_test = [] {
            fixture_world_t w {};
            auto &fast = w.add_chain(1, 2);
            auto &slow = w.add_chain(2, 12);
            const auto pre = w.agree();
            const auto &origin = fast.add({ { init_msg(0, "fast") }, {} });
            for (size_t i = 0; i < 10; ++i)
                fast.add();
            slow.add({ {}, { exec_msg(origin, 0, "fast") } });
            const auto claim = w.claim(pre);
            expect_equal(fixture_world_t::genesis_time + 22, claim.timestamp);
            // the message is 10 seconds old when executed while the origin head is 10 blocks further
            w.expiry_window = 10;
            const auto out = w.run(claim);
            expect_verdict(verdict_t::valid, out);
            expect(out.state.at(1).status == status_t::valid);
            expect(out.state.at(2).status == status_t::valid);
            w.expiry_window = 9;
            const auto expired = w.run(claim);
            expect_verdict(verdict_t::invalid, expired);
            expect(expired.state.at(2).status == status_t::invalid);
        };
        "a dependency cycle terminates with an invalid verdict"_test = [] {
            fixture_world_t w {};
            auto &c1 = w.add_chain(1);
            auto &c2 = w.add_chain(2);
            const auto pre = w.agree();
            const auto ts = c1.tip().header.timestamp + fixture_world_t::block_time;
            c1.add({ { init_msg(0, "a") }, { executing_message_t { message_id_t { 2, 1, ts, 0 }, init_msg(0, "b").payload_hash } } });
            c2.add({ { init_msg(0, "b") }, { executing_message_t { message_id_t { 1, 1, ts, 0 }, init_msg(0, "a").payload_hash } } });
            const auto out = w.run(w.claim(pre));
            expect_verdict(verdict_t::invalid, out);
            expect_equal(uint64_t { 1 }, out.state.passes);
            expect_equal(size_t { 2 }, out.state.num_with_status(status_t::pending));
        };
        "an invalid origin invalidates its dependents"_test = [] {
            fixture_world_t w {};
            w.add_chain(1);
            w.add_chain(2);
            const auto pre = w.agree();
            const auto &b1 = w.chain(1).add({ { init_msg(0, "msg") }, {} });
            w.chain(2).add({ {}, { exec_msg(b1, 0, "msg") } });
            auto claim = w.claim(pre);
            // chain 1 derives a different root than claimed
            w.derivation.roots[1] = w.chain(1).at(0).root;
            const auto out = w.run(claim);
            expect_verdict(verdict_t::invalid, out);
            expect(out.state.at(1).status == status_t::invalid);
            expect(out.state.at(2).status == status_t::invalid);
        };
        "a tampered aggregate is invalid"_test = [] {
            fixture_world_t w {};
            w.add_chain(1);
            w.add_chain(2);
            const auto pre = w.agree();
            w.chain(1).add();
            w.chain(2).add();
            auto claim = w.claim(pre);
            claim.post_hash = super_root_t { super_root_t::version_v1, claim.timestamp + 1, claim.claimed }.hash();
            const auto out = w.run(claim);
            expect_verdict(verdict_t::invalid, out);
            expect(out.state.resolved());
            expect_equal(size_t { 2 }, out.state.num_with_status(status_t::valid));
        };
        "claims inconsistent with the agreed state"_test = [] {
            fixture_world_t w {};
            w.add_chain(1);
            w.add_chain(2);
            const auto pre = w.agree();
            w.chain(1).add();
            w.chain(2).add();
            const auto claim = w.claim(pre);
            {
                auto c = claim;
                c.timestamp = fixture_world_t::genesis_time;
                expect_verdict(verdict_t::invalid, w.run(c));
            }
            {
                auto c = claim;
                c.claimed.pop_back();
                expect_verdict(verdict_t::invalid, w.run(c));
            }
            {
                auto c = claim;
                c.claimed[1].chain_id = 3;
                expect_verdict(verdict_t::invalid, w.run(c));
            }
        };
        "fatal errors propagate"_test = [] {
            fixture_world_t w {};
            w.add_chain(1);
            const auto pre = w.agree();
            w.chain(1).add();
            const auto claim = w.claim(pre);
            {
                auto c = claim;
                c.pre_hash = crypto::keccak::digest(buffer { std::string_view { "unknown" } });
                expect(throws<err_preimage_unavailable_t>([&] { static_cast<void>(w.run(c)); }));
            }
            {
                auto c = claim;
                c.pre_hash = w.channel.put(uint8_vector::from_hex("02"));
                expect(throws<err_malformed_super_root_t>([&] { static_cast<void>(w.run(c)); }));
            }
            {
                auto c = claim;
                c.pre_hash = w.channel.put(super_root_t { super_root_t::version_v1, fixture_world_t::genesis_time, { chain_root_t { 5, {} } } }.encode());
                c.claimed = { chain_root_t { 5, {} } };
                expect(throws<err_unknown_chain_t>([&] { static_cast<void>(w.run(c)); }));
            }
        };
        "commitments are deterministic"_test = [] {
            fixture_world_t w {};
            w.add_chain(1);
            w.add_chain(2);
            const auto pre = w.agree();
            const auto &b2 = w.chain(2).add({ { init_msg(0, "x") }, {} });
            w.chain(1).add({ {}, { exec_msg(b2, 0, "x") } });
            const auto claim = w.claim(pre);
            const auto a = w.run(claim);
            const auto b = w.run(claim);
            expect(a.state == b.state);
            expect_equal(a.state.commitment(), b.state.commitment());
            auto c = a.state;
            c.passes++;
            expect(c.commitment() != a.state.commitment());
        };
    };
};
