/* This file is part of xproof project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <xproof/codec/json.hpp>
#include <xproof/common/test.hpp>
#include "registry.hpp"

namespace {
    using namespace xproof;
    using namespace xproof::interop;

    const std::string_view registry_json = R"({
        "chains": [
            {
                "chain_id": 10,
                "block_time": 2,
                "message_expiry_window": 604800,
                "genesis": { "number": 105235063, "timestamp": 1686068903, "hash": "0x7CA38A1916C42007829C55E69D3E9A73265554B586A499015373241B8A3FA48B" }
            },
            {
                "chain_id": 8453,
                "block_time": 2,
                "message_expiry_window": 3600,
                "interop_time": 1700000000,
                "genesis": { "number": 0, "timestamp": 1686789347, "hash": "0xF712AA9241CC24369B143CF6DCE85F0902A9731E70D66818A3A5845B296C73DD" }
            }
        ]
    })";
}

suite xproof_interop_registry_suite = [] {
    "xproof::interop::registry"_test = [] {
        "from_json"_test = [] {
            const auto reg = registry_t::from_json(codec::json::parse(registry_json));
            expect_equal(size_t { 2 }, reg.size());
            const auto &op = reg.at(10);
            expect_equal(uint64_t { 2 }, op.block_time);
            expect_equal(uint64_t { 604800 }, op.message_expiry_window);
            expect(!op.interop_time);
            expect_equal(uint64_t { 105235063 }, op.genesis.number);
            expect_equal(block_hash_t::from_hex("7CA38A1916C42007829C55E69D3E9A73265554B586A499015373241B8A3FA48B"), op.genesis.hash);
            const auto &base = reg.at(8453);
            expect(base.interop_time && *base.interop_time == 1700000000);
            expect(!base.interop_active(1699999999));
            expect(base.interop_active(1700000000));
            expect(op.interop_active(0));
        };
        "load"_test = [] {
            file::tmp t { "xproof-registry-test.json" };
            file::write(t.path(), registry_json);
            const auto reg = registry_t::load(t.path());
            expect(reg.find(8453) != nullptr);
            expect(throws<err_invalid_registry_t>([] { static_cast<void>(registry_t::load("/nonexistent/xproof-registry.json")); }));
        };
        "unknown chains"_test = [] {
            const auto reg = registry_t::from_json(codec::json::parse(registry_json));
            expect(reg.find(1) == nullptr);
            expect(throws<err_unknown_chain_t>([&] { static_cast<void>(reg.at(1)); }));
        };
        "the widest expiry window"_test = [] {
            const auto reg = registry_t::from_json(codec::json::parse(std::string_view { R"({"chains":[{"chain_id":1,"block_time":1,"message_expiry_window":18446744073709551615,)"
                R"("genesis":{"number":0,"timestamp":0,"hash":"0x0000000000000000000000000000000000000000000000000000000000000000"}}]})" }));
            expect_equal(std::numeric_limits<uint64_t>::max(), reg.at(1).message_expiry_window);
            expect_equal(uint64_t { 1 }, reg.at(1).block_time);
        };
        "invalid registries"_test = [] {
            // a required field is missing
            expect(throws<err_invalid_registry_t>([] {
                static_cast<void>(registry_t::from_json(codec::json::parse(std::string_view { R"({"chains":[{"chain_id":1,"block_time":2,"genesis":{"number":0,"timestamp":0,"hash":"0x0000000000000000000000000000000000000000000000000000000000000000"}}]})" })));
            }));
            // no chain list
            expect(throws<err_invalid_registry_t>([] {
                static_cast<void>(registry_t::from_json(codec::json::parse(std::string_view { R"({})" })));
            }));
            chain_config_t cfg { 1, 2, 60, {}, {} };
            expect(throws<err_invalid_registry_t>([&] { registry_t { std::vector { cfg, cfg } }; }));
            cfg.block_time = 0;
            expect(throws<err_invalid_registry_t>([&] { registry_t { std::vector { cfg } }; }));
        };
    };
};
