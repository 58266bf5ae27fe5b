/* This file is part of xproof project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "test-fixture.hpp"

namespace {
    using namespace xproof;
    using namespace xproof::interop;
    using namespace std::string_view_literals;
}

suite xproof_interop_provider_suite = [] {
    "xproof::interop::provider"_test = [] {
        fixture_channel_t ch {};
        chain_builder_t chain { ch, 7, 1000, 2 };
        for (size_t i = 0; i < 5; ++i)
            chain.add({ { init_msg(static_cast<uint32_t>(i), "m") }, {} });
        oracle_client_t oracle { ch };
        chain_data_t data { oracle };
        "head and messages"_test = [&] {
            const auto head = data.head(chain.tip().root);
            expect(head == chain.tip().header);
            expect(data.messages(head) == chain.tip().log);
            expect_equal(size_t { 3 }, ch.hints.size());
            expect(ch.hints.at(0).starts_with("l2-output-root 0x"));
            expect(ch.hints.at(1).starts_with("l2-block-header 0x"));
            expect(ch.hints.at(2).starts_with("l2-block-messages 0x"));
        };
        "walk back"_test = [&] {
            const auto &head = chain.tip().header;
            const auto hdr = data.header_at(head, 2, chain.at(2).header.timestamp);
            expect(hdr && *hdr == chain.at(2).header);
            expect(data.header_at(head, 5, std::numeric_limits<uint64_t>::max()) == head);
            expect(data.header_at(head, 0, 0) == chain.at(0).header);
            // block 1 is older than the lower timestamp bound
            expect(!data.header_at(head, 1, chain.at(2).header.timestamp));
            // ahead of the head
            expect(!data.header_at(head, 6, 0));
        };
        "inconsistent parents"_test = [&] {
            auto fake = chain.tip().header;
            fake.parent_hash = chain.at(2).header.hash();
            expect(throws<err_malformed_preimage_t>([&] { static_cast<void>(data.header_at(fake, 1, 0)); }));
            // a parent that is not older than its child
            auto same_time = chain.at(3).header;
            same_time.timestamp = chain.at(2).header.timestamp;
            expect(throws<err_malformed_preimage_t>([&] { static_cast<void>(data.header_at(same_time, 1, 0)); }));
        };
        "malformed preimages"_test = [&] {
            const auto junk = ch.put(uint8_vector { "junk"sv });
            expect(throws<err_malformed_preimage_t>([&] { static_cast<void>(data.header(junk)); }));
            expect(throws<err_malformed_preimage_t>([&] { static_cast<void>(data.output_root(junk)); }));
            output_root_preimage_t v1 { hash_t::from_hex("0000000000000000000000000000000000000000000000000000000000000001"), {}, {}, {} };
            const auto v1_root = ch.put(to_bytes(v1));
            expect(throws<err_malformed_preimage_t>([&] { static_cast<void>(data.output_root(v1_root)); }));
        };
    };
};
