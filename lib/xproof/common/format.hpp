#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cstdint>
#include <span>
#include <fmt/core.h>
#include <fmt/format.h>

namespace fmt {
    // byte strings are always printed as uppercase hex without a prefix
    template<>
    struct formatter<std::span<const uint8_t>> {
        constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin())
        {
            return ctx.begin();
        }

        template<typename FormatContext>
        auto format(const std::span<const uint8_t> &data, FormatContext &ctx) const -> decltype(ctx.out())
        {
            auto out_it = ctx.out();
            for (const uint8_t v: data) {
                out_it = fmt::format_to(out_it, "{:02X}", v);
            }
            return out_it;
        }
    };
}
