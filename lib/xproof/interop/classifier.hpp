#pragma once
/* This file is part of xproof project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "claim.hpp"

namespace xproof::interop {
    // the exit status of the fault-proof program
    enum class game_output_t: uint8_t {
        agree = 0x00,
        disagree = 0x01
    };

    [[nodiscard]] extern game_output_t classify(verdict_t verdict, direction_t direction) noexcept;
}

namespace fmt {
    template<>
    struct formatter<xproof::interop::game_output_t>: formatter<std::string_view> {
        template<typename FormatContext>
        auto format(const xproof::interop::game_output_t &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            using namespace std::string_view_literals;
            return formatter<std::string_view>::format(v == xproof::interop::game_output_t::agree ? "agree"sv : "disagree"sv, ctx);
        }
    };
}
