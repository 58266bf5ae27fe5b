/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "test.hpp"
#include "numeric-cast.hpp"

namespace {
    using namespace xproof;
}

suite xproof_common_numeric_cast_suite = [] {
    "xproof::common::numeric_cast"_test = [] {
        "counts fit into u32"_test = [] {
            expect_equal(uint32_t { 0 }, numeric_cast<uint32_t>(size_t { 0 }));
            expect_equal(std::numeric_limits<uint32_t>::max(), numeric_cast<uint32_t>(size_t { std::numeric_limits<uint32_t>::max() }));
            expect_throws_with<error>([] { static_cast<void>(numeric_cast<uint32_t>(size_t { 1 } << 32)); }, "4294967296");
        };
        "decoded bytes"_test = [] {
            expect_equal(uint8_t { 0xFF }, numeric_cast<uint8_t>(uint64_t { 0xFF }));
            expect_throws_with<error>([] { static_cast<void>(numeric_cast<uint8_t>(uint64_t { 0x100 })); }, "[0, 255]");
        };
        "signed values"_test = [] {
            expect_equal(uint64_t { std::numeric_limits<int64_t>::max() }, numeric_cast<uint64_t>(std::numeric_limits<int64_t>::max()));
            expect_throws_with<error>([] { static_cast<void>(numeric_cast<uint64_t>(int64_t { -1 })); }, "-1");
            expect_throws_with<error>([] { static_cast<void>(numeric_cast<int64_t>(std::numeric_limits<uint64_t>::max())); }, "18446744073709551615");
        };
    };
};
